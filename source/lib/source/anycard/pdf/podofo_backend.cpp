#include <anycard/pdf/podofo_backend.hpp>

#include <array>

#include <podofo/podofo.h>

#include <anycard/config.hpp>
#include <anycard/image.hpp>
#include <anycard/util/log.hpp>

inline double ToPoDoFoPoints(Length l)
{
    return static_cast<double>(l / 1_pts);
}

inline PoDoFo::PdfColor ToPoDoFoColor(const ColorRGB32f& color)
{
    return PoDoFo::PdfColor{ color.r, color.g, color.b };
}

// Keeps painter state changes local to one draw call
class PainterStateGuard
{
  public:
    explicit PainterStateGuard(PoDoFo::PdfPainter& painter)
        : m_Painter{ painter }
    {
        m_Painter.Save();
    }
    ~PainterStateGuard()
    {
        m_Painter.Restore();
    }

    PainterStateGuard(const PainterStateGuard&) = delete;
    PainterStateGuard& operator=(const PainterStateGuard&) = delete;

  private:
    PoDoFo::PdfPainter& m_Painter;
};

PoDoFoTextMeasurer::PoDoFoTextMeasurer(const PoDoFo::PdfFont& font)
    : m_Font{ font }
{
}

Length PoDoFoTextMeasurer::MeasureText(std::string_view text, Length font_size) const
{
    PoDoFo::PdfTextState text_state{};
    text_state.Font = &m_Font;
    text_state.FontSize = ToPoDoFoPoints(font_size);
    return static_cast<float>(m_Font.GetStringLength(text, text_state)) * 1_pts;
}

PoDoFoPage::PoDoFoPage(PoDoFo::PdfPage* page,
                       PoDoFo::PdfPainter* painter,
                       PoDoFoDocument* document,
                       Length page_height)
    : m_Page{ page }
    , m_Painter{ painter }
    , m_Document{ document }
    , m_PageHeight{ page_height }
{
    m_Painter->SetCanvas(*m_Page, PoDoFo::PdfPainterFlags::NoSaveRestorePrior);
}

double PoDoFoPage::FlipY(Length y) const
{
    return ToPoDoFoPoints(m_PageHeight - y);
}

void PoDoFoPage::DrawSolidLine(LineData data, LineStyle style)
{
    const auto real_fx{ ToPoDoFoPoints(data.m_From.x) };
    const auto real_fy{ FlipY(data.m_From.y) };
    const auto real_tx{ ToPoDoFoPoints(data.m_To.x) };
    const auto real_ty{ FlipY(data.m_To.y) };
    const auto line_width{ ToPoDoFoPoints(style.m_Thickness) };

    PainterStateGuard guard{ *m_Painter };
    m_Painter->GraphicsState.SetLineWidth(line_width);
    m_Painter->GraphicsState.SetStrokingColor(ToPoDoFoColor(style.m_Color));
    m_Painter->SetStrokeStyle(PoDoFo::PdfStrokeStyle::Solid);
    m_Painter->DrawLine(real_fx, real_fy, real_tx, real_ty);
}

void PoDoFoPage::DrawDashedLine(LineData data, DashedLineStyle style)
{
    if (style.m_DashSize <= 0_mm || style.m_GapSize <= 0_mm)
    {
        DrawSolidLine(data, style);
        return;
    }

    const auto real_fx{ ToPoDoFoPoints(data.m_From.x) };
    const auto real_fy{ FlipY(data.m_From.y) };
    const auto real_tx{ ToPoDoFoPoints(data.m_To.x) };
    const auto real_ty{ FlipY(data.m_To.y) };
    const auto line_width{ ToPoDoFoPoints(style.m_Thickness) };
    const std::array dash{
        ToPoDoFoPoints(style.m_DashSize),
        ToPoDoFoPoints(style.m_GapSize),
    };

    PainterStateGuard guard{ *m_Painter };
    m_Painter->GraphicsState.SetLineWidth(line_width);
    m_Painter->GraphicsState.SetStrokingColor(ToPoDoFoColor(style.m_Color));
    m_Painter->SetStrokeStyle(dash, 0.0);
    m_Painter->DrawLine(real_fx, real_fy, real_tx, real_ty);
}

void PoDoFoPage::DrawImage(ImageData data)
{
    const auto& [x, y]{ data.m_Rect.m_Position.pod() };
    const auto& [w, h]{ data.m_Rect.m_Size.pod() };

    const auto real_x{ ToPoDoFoPoints(x) };
    const auto real_y{ FlipY(y + h) };
    const auto real_w{ ToPoDoFoPoints(w) };
    const auto real_h{ ToPoDoFoPoints(h) };

    auto* image{ m_Document->MakeImage(data.m_Image) };
    const auto w_scale{ real_w / image->GetWidth() };
    const auto h_scale{ real_h / image->GetHeight() };

    PainterStateGuard guard{ *m_Painter };
    auto lock{ m_Document->AquireDocumentLock() };
    m_Painter->DrawImage(*image, real_x, real_y, w_scale, h_scale);
}

void PoDoFoPage::DrawText(TextData data)
{
    auto& font{ m_Document->GetFont() };

    PainterStateGuard guard{ *m_Painter };
    m_Painter->TextState.SetFont(font, ToPoDoFoPoints(data.m_FontSize));
    m_Painter->GraphicsState.SetNonStrokingColor(ToPoDoFoColor(data.m_Color));
    m_Painter->DrawText(data.m_Text,
                        ToPoDoFoPoints(data.m_Pos.x),
                        FlipY(data.m_Pos.y));
}

void PoDoFoPage::Finish()
{
    m_Painter->FinishDrawing();
}

PoDoFoDocument::PoDoFoDocument(const Config& config)
    : m_Config{ config }
{
    m_TextMeasurer = std::make_unique<PoDoFoTextMeasurer>(GetFont());
}

PoDoFoPage* PoDoFoDocument::NextPage(Size page_size)
{
    auto lock{ AquireDocumentLock() };

    const auto [page_width, page_height]{ page_size.pod() };
    const auto new_page_idx{ static_cast<unsigned>(m_Pages.size()) };
    auto* page{
        &m_Document.GetPages().CreatePageAt(
            new_page_idx,
            PoDoFo::Rect(
                0.0,
                0.0,
                ToPoDoFoPoints(page_width),
                ToPoDoFoPoints(page_height))),
    };

    auto* painter{ m_Painters.emplace_back(new PoDoFo::PdfPainter).get() };

    auto& new_page{ m_Pages.emplace_back(new PoDoFoPage{ page, painter, this, page_height }) };
    return new_page.get();
}

const TextMeasurer& PoDoFoDocument::GetTextMeasurer()
{
    return *m_TextMeasurer;
}

fs::path PoDoFoDocument::Write(fs::path path)
{
    try
    {
        const auto pdf_path{ fs::path{ path }.replace_extension(".pdf") };
        const auto pdf_path_string{ pdf_path.string() };
        LogInfo("Saving to {}...", pdf_path_string);

        auto lock{ AquireDocumentLock() };

        if (m_Config.m_DeterministicPdfOutput)
        {
            auto& trailer{ m_Document.GetTrailer() };
            if (const auto* info{ trailer.GetDictionary().GetKey("Info") })
            {
                auto* obj{ m_Document.GetObjects().GetObject(info->GetReference()) };
                obj->GetDictionary().RemoveKey("CreationDate");
            }

            m_Document.Save(pdf_path_string, PoDoFo::PdfSaveOptions::NoMetadataUpdate);
        }
        else
        {
            m_Document.Save(pdf_path_string);
        }

        return pdf_path;
    }
    catch (const PoDoFo::PdfError& e)
    {
        // Rethrow as a std::exception so the agnostic code can catch it
        throw std::logic_error{ e.what() };
    }
}

PoDoFo::PdfFont& PoDoFoDocument::GetFont()
{
    auto lock{ AquireDocumentLock() };
    return m_Document
        .GetFonts()
        .GetStandard14Font(PoDoFo::PdfStandard14FontType::Helvetica);
}

PoDoFo::PdfImage* PoDoFoDocument::MakeImage(const Image& image)
{
    const auto encoded_image{
        m_Config.m_PdfImageFormat == ImageFormat::Png
            ? image.EncodePng(m_Config.m_PngCompression)
            : image.EncodeJpg(m_Config.m_JpgQuality)
    };
    if (encoded_image.empty())
    {
        throw std::logic_error{ "Failed encoding artwork for the pdf" };
    }

    auto lock{ AquireDocumentLock() };

    try
    {
        std::unique_ptr podofo_image{ m_Document.CreateImage() };
        podofo_image->LoadFromBuffer(
            PoDoFo::bufferview{
                reinterpret_cast<const char*>(encoded_image.data()),
                encoded_image.size(),
            });
        return m_Images.emplace_back(std::move(podofo_image)).get();
    }
    catch (const PoDoFo::PdfError& e)
    {
        throw std::logic_error{ e.what() };
    }
}

std::lock_guard<std::mutex> PoDoFoDocument::AquireDocumentLock()
{
    return std::lock_guard{ m_Mutex };
}
