#include <anycard/pdf/generate.hpp>

#include <stdexcept>
#include <variant>

#include <anycard/config.hpp>
#include <anycard/image.hpp>
#include <anycard/layout/layout_plan.hpp>
#include <anycard/layout/text_measurer.hpp>
#include <anycard/pdf/backend.hpp>
#include <anycard/util/log.hpp>

inline constexpr std::string_view c_Ellipsis{ "..." };

static void DrawFoldLine(PdfPage& page, const LineSegment& fold_line, const CardStyle& style)
{
    const PdfPage::DashedLineStyle fold_line_style{
        {
            style.m_FoldLineWidth,
            ColorToFloat(style.m_FoldLineColor),
        },
        style.m_FoldLineDash,
        style.m_FoldLineDash,
    };
    page.DrawDashedLine(PdfPage::LineData{ fold_line.m_From, fold_line.m_To }, fold_line_style);
}

static void DrawOutsidePage(PdfPage& page,
                            const OutsidePage& outside,
                            const Image& artwork,
                            const Config& config)
{
    DrawFoldLine(page, outside.m_FoldLine, config.m_Style);

    if (!config.m_BrandingText.empty())
    {
        page.DrawText(PdfPage::TextData{
            .m_Text{ config.m_BrandingText },
            .m_Pos{ outside.m_BrandingAnchor },
            .m_FontSize{ config.m_Style.m_BrandingFontSize },
            .m_Color{ ColorToFloat(config.m_Style.m_BrandingColor) },
        });
    }

    page.DrawImage(PdfPage::ImageData{
        .m_Image{ artwork },
        .m_Rect{ outside.m_FrontImage },
    });
}

static void DrawTextBlock(PdfPage& page,
                          const TextBlock& text_block,
                          const TextMeasurer& measurer,
                          const CardStyle& style)
{
    const auto color{ ColorToFloat(style.m_MessageColor) };
    for (size_t i = 0; i < text_block.m_Lines.size(); ++i)
    {
        const auto& line{ text_block.m_Lines[i] };
        if (line.m_Text.empty())
        {
            continue;
        }

        // Baseline one font size below the line top leaves room for descenders
        const Position baseline{ line.m_X, text_block.LineTop(i) + text_block.m_FontSize };
        page.DrawText(PdfPage::TextData{
            .m_Text{ line.m_Text },
            .m_Pos{ baseline },
            .m_FontSize{ text_block.m_FontSize },
            .m_Color{ color },
        });
    }

    if (text_block.m_Truncated && text_block.m_EllipsisAnchor.has_value())
    {
        const auto anchor{ text_block.m_EllipsisAnchor.value() };
        const auto width{ measurer.MeasureText(c_Ellipsis, text_block.m_FontSize) };
        page.DrawText(PdfPage::TextData{
            .m_Text{ c_Ellipsis },
            .m_Pos{ anchor.x - width / 2, anchor.y },
            .m_FontSize{ text_block.m_FontSize },
            .m_Color{ color },
        });
    }
}

static void DrawWritingLines(PdfPage& page,
                             const WritingLines& writing_lines,
                             const CardStyle& style)
{
    const PdfPage::LineStyle line_style{
        style.m_WritingLineWidth,
        ColorToFloat(style.m_WritingLineColor),
    };
    for (const auto y : writing_lines.m_Ys)
    {
        page.DrawSolidLine(PdfPage::LineData{ { writing_lines.m_FromX, y }, { writing_lines.m_ToX, y } }, line_style);
    }
}

static void DrawInsidePage(PdfPage& page,
                           const InsidePage& inside,
                           const TextMeasurer& measurer,
                           const Config& config)
{
    const auto& style{ config.m_Style };
    DrawFoldLine(page, inside.m_FoldLine, style);

    const PdfPage::LineStyle flourish_style{
        style.m_FlourishWidth,
        ColorToFloat(style.m_FlourishColor),
    };
    for (const auto& flourish : inside.m_Flourishes)
    {
        page.DrawCorner(PdfPage::CornerData{ flourish.m_Vertex, flourish.m_Reach }, flourish_style);
    }

    if (const auto* text_block{ std::get_if<TextBlock>(&inside.m_Message) })
    {
        DrawTextBlock(page, *text_block, measurer, style);
    }
    else
    {
        DrawWritingLines(page, std::get<WritingLines>(inside.m_Message), style);
    }
}

fs::path GenerateCardPdf(const LayoutPlan& plan,
                         const Image& artwork,
                         const Config& config,
                         PdfDocument& document,
                         const fs::path& file_path)
{
    if (!artwork.Valid())
    {
        throw std::logic_error{ "Can not generate a card without artwork" };
    }

    const Size page_size{ plan.m_Page.m_Width, plan.m_Page.m_Height };

    LogInfo("Drawing outside page...");
    {
        auto* page{ document.NextPage(page_size) };
        DrawOutsidePage(*page, plan.m_Outside, artwork, config);
        page->Finish();
    }

    LogInfo("Drawing inside page...");
    {
        auto* page{ document.NextPage(page_size) };
        DrawInsidePage(*page, plan.m_Inside, document.GetTextMeasurer(), config);
        page->Finish();
    }

    return document.Write(file_path);
}
