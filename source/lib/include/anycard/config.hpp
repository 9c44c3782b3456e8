#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <anycard/color.hpp>
#include <anycard/layout/layout_plan.hpp>
#include <anycard/units.hpp>
#include <anycard/util.hpp>

enum class ImageFormat
{
    Png,
    Jpg,
};

enum class PageOrientation
{
    Portrait,
    Landscape,
};

// Colors and strokes the renderer uses, lengths in page space
struct CardStyle
{
    ColorRGB8 m_FoldLineColor{ 230, 230, 230 };
    Length m_FoldLineWidth{ 0.2_mm };
    Length m_FoldLineDash{ 2_mm };

    ColorRGB8 m_BrandingColor{ 200, 200, 200 };
    Length m_BrandingFontSize{ 8_pts };

    ColorRGB8 m_FlourishColor{ 245, 200, 200 };
    Length m_FlourishWidth{ 0.3_mm };

    ColorRGB8 m_WritingLineColor{ 240, 240, 240 };
    Length m_WritingLineWidth{ 0.2_mm };

    ColorRGB8 m_MessageColor{ 60, 60, 60 };
};

struct Config
{
    std::string m_DefaultPageFormat{ "A5" };
    Unit m_BaseUnit{ Unit::Millimeter };
    ImageFormat m_PdfImageFormat{ ImageFormat::Jpg };
    std::optional<int> m_PngCompression{ std::nullopt };
    std::optional<int> m_JpgQuality{ std::nullopt };
    bool m_DeterministicPdfOutput{ false };

    std::string m_BrandingText{ "made with AnyCard" };
    Length m_DefaultMarginInset{ 20_mm };

    LayoutOptions m_LayoutOptions{};
    CardStyle m_Style{};

    struct SizeInfo
    {
        Size m_Dimensions;
        Unit m_BaseUnit;
        uint32_t m_Decimals;
    };

    // Portrait dimensions, rotated when a landscape card is requested
    inline static const std::map<std::string, SizeInfo> g_DefaultPageFormats{
        { "A5", { { 148_mm, 210_mm }, Unit::Millimeter, 0u } },
        { "Letter", { { 8.5_in, 11_in }, Unit::Inches, 1u } },
    };
    std::map<std::string, SizeInfo> m_PageFormats{ g_DefaultPageFormats };

    std::optional<Size> FindPageFormat(std::string_view name) const;
    std::string_view GetFirstValidPageFormat() const;
};

Config LoadConfig(const fs::path& config_path = "config.ini"_p);
void SaveConfig(const Config& config, const fs::path& config_path = "config.ini"_p);

extern Config g_Cfg;
