#include <algorithm>
#include <cstdlib>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <opencv2/core.hpp>

#include <anycard/config.hpp>
#include <anycard/image.hpp>
#include <anycard/layout/layout_plan.hpp>
#include <anycard/layout/text_measurer.hpp>
#include <anycard/pdf/backend.hpp>
#include <anycard/pdf/generate.hpp>

#include "fixed_width_measurer.hpp"

using Catch::Matchers::WithinAbs;

// Records draw calls instead of producing a file
class RecordingPage final : public PdfPage
{
  public:
    struct DrawnLine
    {
        LineData m_Line;
        bool m_Dashed;
    };

    virtual void DrawSolidLine(LineData data, LineStyle /*style*/) override
    {
        m_Lines.push_back({ data, false });
    }

    virtual void DrawDashedLine(LineData data, DashedLineStyle /*style*/) override
    {
        m_Lines.push_back({ data, true });
    }

    virtual void DrawImage(ImageData data) override
    {
        m_Images.push_back(data.m_Rect);
    }

    virtual void DrawText(TextData data) override
    {
        m_Texts.push_back(std::string{ data.m_Text });
        m_TextPositions.push_back(data.m_Pos);
    }

    virtual void Finish() override
    {
        m_Finished = true;
    }

    size_t CountLines(bool dashed) const
    {
        return std::ranges::count(m_Lines, dashed, &DrawnLine::m_Dashed);
    }

    Size m_Size;
    std::vector<DrawnLine> m_Lines;
    std::vector<Rect> m_Images;
    std::vector<std::string> m_Texts;
    std::vector<Position> m_TextPositions;
    bool m_Finished{ false };
};

class RecordingDocument final : public PdfDocument
{
  public:
    virtual PdfPage* NextPage(Size page_size) override
    {
        auto& page{ m_Pages.emplace_back(std::make_unique<RecordingPage>()) };
        page->m_Size = page_size;
        return page.get();
    }

    virtual const TextMeasurer& GetTextMeasurer() override
    {
        return m_Measurer;
    }

    virtual fs::path Write(fs::path path) override
    {
        m_WrittenPath = path;
        return path;
    }

    std::vector<std::unique_ptr<RecordingPage>> m_Pages;
    FixedWidthMeasurer m_Measurer{};
    fs::path m_WrittenPath;
};

static Image MakeArtwork()
{
    return Image{ cv::Mat(400, 300, CV_8UC3, cv::Scalar(60, 140, 200)) };
}

static LayoutPlan MakePlan(std::string text, const TextMeasurer& measurer, const Config& config)
{
    const PageGeometry page{ 11_in, 8.5_in };
    const MessageSpec message{
        .m_Text{ std::move(text) },
        .m_FontTier{ FontTier::Medium },
        .m_MarginInset{ 20_mm },
    };
    return BuildLayoutPlan(page, ImageSpec{ 300_pix, 400_pix }, message, measurer, config.m_LayoutOptions);
}

TEST_CASE("Card has an outside and an inside page", "[pdf_pages]")
{
    const Config config{};
    RecordingDocument document{};
    const auto plan{ MakePlan("Happy Birthday!", document.m_Measurer, config) };

    const auto path{ GenerateCardPdf(plan, MakeArtwork(), config, document, "card.pdf") };
    REQUIRE(path == "card.pdf");
    REQUIRE(document.m_WrittenPath == "card.pdf");
    REQUIRE(document.m_Pages.size() == 2);

    for (const auto& page : document.m_Pages)
    {
        REQUIRE(page->m_Finished);
        REQUIRE_THAT(page->m_Size.x / 1_in, WithinAbs(11.0, 1e-4));
        REQUIRE_THAT(page->m_Size.y / 1_in, WithinAbs(8.5, 1e-4));
    }
}

TEST_CASE("Outside page shows artwork, branding and fold", "[pdf_outside]")
{
    const Config config{};
    RecordingDocument document{};
    const auto plan{ MakePlan("Hi", document.m_Measurer, config) };
    (void)GenerateCardPdf(plan, MakeArtwork(), config, document, "card.pdf");

    const auto& outside{ *document.m_Pages[0] };
    REQUIRE(outside.CountLines(true) == 1);
    REQUIRE(outside.CountLines(false) == 0);
    REQUIRE_THAT(outside.m_Lines[0].m_Line.m_From.x / 1_in, WithinAbs(5.5, 1e-4));

    REQUIRE(outside.m_Images.size() == 1);
    REQUIRE(outside.m_Images[0] == plan.m_Outside.m_FrontImage);

    REQUIRE(outside.m_Texts.size() == 1);
    REQUIRE(outside.m_Texts[0] == config.m_BrandingText);
    REQUIRE(outside.m_TextPositions[0].x == plan.m_Outside.m_BrandingAnchor.x);
    REQUIRE(outside.m_TextPositions[0].y == plan.m_Outside.m_BrandingAnchor.y);
}

TEST_CASE("Empty branding text is not drawn", "[pdf_no_branding]")
{
    Config config{};
    config.m_BrandingText = "";
    RecordingDocument document{};
    const auto plan{ MakePlan("Hi", document.m_Measurer, config) };
    (void)GenerateCardPdf(plan, MakeArtwork(), config, document, "card.pdf");

    REQUIRE(document.m_Pages[0]->m_Texts.empty());
}

TEST_CASE("Inside page shows the message", "[pdf_inside_text]")
{
    const Config config{};
    RecordingDocument document{};
    const auto plan{ MakePlan("Happy Birthday!\n\nLove, Sam", document.m_Measurer, config) };
    (void)GenerateCardPdf(plan, MakeArtwork(), config, document, "card.pdf");

    const auto& inside{ *document.m_Pages[1] };

    // One dashed fold plus two strokes for each corner flourish
    REQUIRE(inside.CountLines(true) == 1);
    REQUIRE(inside.CountLines(false) == 4);

    REQUIRE(inside.m_Texts == std::vector<std::string>{ "Happy Birthday!", "Love, Sam" });

    const auto& text_block{ std::get<TextBlock>(plan.m_Inside.m_Message) };
    REQUIRE(inside.m_TextPositions[0].x == text_block.m_Lines[0].m_X);
    REQUIRE_THAT(inside.m_TextPositions[0].y / 1_mm,
                 WithinAbs((text_block.LineTop(0) + text_block.m_FontSize) / 1_mm, 1e-4));
}

TEST_CASE("Blank message draws writing lines", "[pdf_inside_lines]")
{
    const Config config{};
    RecordingDocument document{};
    const auto plan{ MakePlan("  \n ", document.m_Measurer, config) };
    (void)GenerateCardPdf(plan, MakeArtwork(), config, document, "card.pdf");

    const auto& inside{ *document.m_Pages[1] };
    const auto& writing_lines{ std::get<WritingLines>(plan.m_Inside.m_Message) };
    REQUIRE(inside.m_Texts.empty());
    REQUIRE(inside.CountLines(false) == 4 + writing_lines.m_Ys.size());
}

TEST_CASE("Truncated message ends in an ellipsis", "[pdf_inside_ellipsis]")
{
    const Config config{};
    RecordingDocument document{};

    std::string long_text;
    for (int i = 0; i < 40; ++i)
    {
        long_text += "A line of its own\n";
    }
    const auto plan{ MakePlan(long_text, document.m_Measurer, config) };
    (void)GenerateCardPdf(plan, MakeArtwork(), config, document, "card.pdf");

    const auto& text_block{ std::get<TextBlock>(plan.m_Inside.m_Message) };
    REQUIRE(text_block.m_Truncated);

    const auto& inside{ *document.m_Pages[1] };
    REQUIRE(inside.m_Texts.size() == text_block.m_Lines.size() + 1);
    REQUIRE(inside.m_Texts.back() == "...");

    const auto anchor{ text_block.m_EllipsisAnchor.value() };
    const auto ellipsis_width{ document.m_Measurer.MeasureText("...", text_block.m_FontSize) };
    REQUIRE_THAT(inside.m_TextPositions.back().x / 1_mm,
                 WithinAbs((anchor.x - ellipsis_width / 2) / 1_mm, 1e-4));
}

TEST_CASE("Invalid artwork is rejected", "[pdf_no_artwork]")
{
    const Config config{};
    RecordingDocument document{};
    const auto plan{ MakePlan("Hi", document.m_Measurer, config) };
    REQUIRE_THROWS_AS(GenerateCardPdf(plan, Image{}, config, document, "card.pdf"), std::logic_error);
    REQUIRE(document.m_Pages.empty());
}

TEST_CASE("PoDoFo measures text by font size", "[pdf_measure]")
{
    const Config config{};
    const auto document{ CreatePdfDocument(config) };
    const auto& measurer{ document->GetTextMeasurer() };

    REQUIRE(measurer.MeasureText("", 14_pts) == 0_pts);

    const auto small{ measurer.MeasureText("Happy Birthday!", 10_pts) };
    const auto large{ measurer.MeasureText("Happy Birthday!", 20_pts) };
    REQUIRE(small > 0_pts);
    REQUIRE_THAT(large / small, WithinAbs(2.0, 1e-3));
    REQUIRE(measurer.MeasureText("Happy Birthday! Love, Sam", 10_pts) > small);
}

TEST_CASE("Generate card pdf", "[pdf_generate]")
{
    Config config{};
    config.m_DeterministicPdfOutput = true;

    for (const auto image_format : { ImageFormat::Jpg, ImageFormat::Png })
    {
        config.m_PdfImageFormat = image_format;

        const auto document{ CreatePdfDocument(config) };
        const auto plan{ MakePlan("Happy Birthday!\nLove, Sam", document->GetTextMeasurer(), config) };
        const auto path{ GenerateCardPdf(plan, MakeArtwork(), config, *document, "pdf_tests_card.pdf") };

        REQUIRE(fs::exists(path));
        REQUIRE(fs::file_size(path) > 0);
    }

    std::atexit(
        []()
        {
            fs::remove("pdf_tests_card.pdf");
        });
}
