#pragma once

#include <memory>
#include <string_view>

#include <anycard/color.hpp>
#include <anycard/layout/fold_geometry.hpp>
#include <anycard/util.hpp>

class Image;
class TextMeasurer;
struct Config;

// All positions are in page space, origin top-left and y pointing down
class PdfPage
{
  public:
    virtual ~PdfPage() = default;

    struct LineData
    {
        Position m_From;
        Position m_To;
    };

    struct LineStyle
    {
        Length m_Thickness{ 0.2_mm };
        ColorRGB32f m_Color;
    };

    struct DashedLineStyle : LineStyle
    {
        Length m_DashSize{ 2_mm };
        Length m_GapSize{ 2_mm };
    };

    struct CornerData
    {
        Position m_Vertex;
        Position m_Reach;
    };

    struct ImageData
    {
        const Image& m_Image;
        Rect m_Rect;
    };

    struct TextData
    {
        std::string_view m_Text;

        // Left end of the baseline
        Position m_Pos;
        Length m_FontSize;
        ColorRGB32f m_Color;
    };

    virtual void DrawSolidLine(LineData data, LineStyle style) = 0;

    virtual void DrawDashedLine(LineData data, DashedLineStyle style) = 0;

    // One horizontal and one vertical stroke, both starting at the vertex
    virtual void DrawCorner(CornerData data, LineStyle style);

    virtual void DrawImage(ImageData data) = 0;

    virtual void DrawText(TextData data) = 0;

    virtual void Finish() = 0;
};

class PdfDocument
{
  public:
    virtual ~PdfDocument() = default;

    virtual PdfPage* NextPage(Size page_size) = 0;

    // Measures text exactly as DrawText will render it
    virtual const TextMeasurer& GetTextMeasurer() = 0;

    virtual fs::path Write(fs::path path) = 0;
};

std::unique_ptr<PdfDocument> CreatePdfDocument(const Config& config);
