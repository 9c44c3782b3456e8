#include <anycard/config.hpp>

#include <algorithm>
#include <charconv>
#include <ranges>
#include <string>
#include <vector>

#include <QFile>
#include <QSettings>

#include <fmt/format.h>
#include <magic_enum/magic_enum.hpp>

#include <anycard/qt_util.hpp>
#include <anycard/util/log.hpp>
#include <anycard/version.hpp>

Config g_Cfg{};

static std::vector<std::string_view> SplitParts(std::string_view str)
{
    return str |
           std::views::split(' ') |
           std::views::transform(
               [](auto part)
               { return std::string_view(part.data(), part.size()); }) |
           std::views::filter(
               [](std::string_view part)
               { return !part.empty(); }) |
           std::ranges::to<std::vector>();
}

static std::optional<float> ParseFloat(std::string_view str)
{
    float val;
#ifdef __clang__
    // Clang and AppleClang do not support std::from_chars overloads with floating points
    try
    {
        val = std::stof(std::string{ str });
    }
    catch (const std::exception&)
    {
        return std::nullopt;
    }
#else
    const auto [ptr, ec]{ std::from_chars(str.data(), str.data() + str.size(), val) };
    if (ec != std::errc{} || ptr != str.data() + str.size())
    {
        return std::nullopt;
    }
#endif
    return val;
}

static uint32_t GetDecimals(std::string_view str)
{
    const auto dot{ str.find('.') };
    return dot == std::string_view::npos
               ? 0u
               : static_cast<uint32_t>(str.size() - dot - 1);
}

// Parses e.g. "148 x 210 mm"
static std::optional<Config::SizeInfo> ParseSize(std::string str)
{
    std::ranges::replace(str, ',', '.');

    const auto parts{ SplitParts(str) };
    if (parts.size() != 4 || parts[1] != "x")
    {
        return std::nullopt;
    }

    const auto base_unit{ UnitFromName(parts.back()) };
    const auto width{ ParseFloat(parts[0]) };
    const auto height{ ParseFloat(parts[2]) };
    if (!base_unit || !width || !height)
    {
        return std::nullopt;
    }

    const auto unit_value{ UnitValue(base_unit.value()) };
    return Config::SizeInfo{
        { width.value() * unit_value, height.value() * unit_value },
        base_unit.value(),
        std::max(GetDecimals(parts[0]), GetDecimals(parts[2])),
    };
}

// Parses e.g. "20 mm"
static std::optional<Length> ParseLength(std::string str)
{
    std::ranges::replace(str, ',', '.');

    const auto parts{ SplitParts(str) };
    if (parts.size() != 2)
    {
        return std::nullopt;
    }

    const auto base_unit{ UnitFromName(parts.back()) };
    const auto length{ ParseFloat(parts[0]) };
    if (!base_unit || !length)
    {
        return std::nullopt;
    }

    return length.value() * UnitValue(base_unit.value());
}

static std::string FormatSize(const Config::SizeInfo& info)
{
    const auto& [size, base_unit, decimals]{ info };
    const auto [width, height]{ (size / UnitValue(base_unit)).pod() };
    return fmt::format("{0:.{2}f} x {1:.{2}f} {3}", width, height, decimals, UnitShortName(base_unit));
}

std::optional<Size> Config::FindPageFormat(std::string_view name) const
{
    const auto it{ m_PageFormats.find(std::string{ name }) };
    if (it == m_PageFormats.end())
    {
        return std::nullopt;
    }
    return it->second.m_Dimensions;
}

std::string_view Config::GetFirstValidPageFormat() const
{
    if (m_PageFormats.contains(m_DefaultPageFormat))
    {
        return m_DefaultPageFormat;
    }
    return m_PageFormats.begin()->first;
}

Config LoadConfig(const fs::path& config_path)
{
    Config config{};

    const auto q_config_path{ ToQString(config_path) };
    if (!QFile::exists(q_config_path))
    {
        LogInfo("No config found at {}, writing defaults", config_path.string());
        SaveConfig(config, config_path);
        return config;
    }

    QSettings settings(q_config_path, QSettings::IniFormat);
    if (settings.status() != QSettings::Status::NoError)
    {
        LogError("Failed reading config {}, using defaults", config_path.string());
        return config;
    }

    const auto read_length{
        [&](const char* key, Length& length)
        {
            const auto value{ settings.value(key) };
            if (!value.isValid())
            {
                return;
            }

            if (auto parsed{ ParseLength(value.toString().toStdString()) })
            {
                length = parsed.value();
            }
            else
            {
                LogWarning("Config value {}=\"{}\" is not a length", key, value.toString().toStdString());
            }
        }
    };
    const auto read_color{
        [&](const char* key, ColorRGB8& color)
        {
            const auto value{ settings.value(key) };
            if (!value.isValid())
            {
                return;
            }

            if (auto parsed{ ColorFromHex(value.toString().toStdString()) })
            {
                color = parsed.value();
            }
            else
            {
                LogWarning("Config value {}=\"{}\" is not a color", key, value.toString().toStdString());
            }
        }
    };

    {
        settings.beginGroup("DEFAULT");

        const auto format_version{ settings.value("Format.Version").toString().toStdString() };
        if (!format_version.empty() && format_version != ConfigFormatVersion())
        {
            LogWarning("Config format {} differs from {}, unknown keys are ignored", format_version, ConfigFormatVersion());
        }

        config.m_DefaultPageFormat = settings.value("Page.Format", "A5").toString().toStdString();
        config.m_DeterministicPdfOutput = settings.value("Deterministic.Output", false).toBool();

        {
            const auto pdf_image_format{ settings.value("PDF.Image.Format", "Jpg").toString().toStdString() };
            config.m_PdfImageFormat = magic_enum::enum_cast<ImageFormat>(pdf_image_format)
                                          .value_or(ImageFormat::Jpg);
        }

        {
            auto png_compression{ settings.value("PDF.Png.Compression") };
            if (png_compression.isValid())
            {
                config.m_PngCompression = std::clamp(png_compression.toInt(), 0, 9);
            }
        }

        {
            auto jpg_quality{ settings.value("PDF.Jpg.Quality") };
            if (jpg_quality.isValid())
            {
                config.m_JpgQuality = std::clamp(jpg_quality.toInt(), 0, 100);
            }
        }

        {
            auto base_unit{ settings.value("Base.Unit") };
            if (base_unit.isValid())
            {
                config.m_BaseUnit = UnitFromName(base_unit.toString().toStdString())
                                        .value_or(Unit::Millimeter);
            }
        }

        settings.endGroup();
    }

    {
        settings.beginGroup("PAGE_FORMATS");

        for (const auto& key : settings.allKeys())
        {
            if (auto info{ ParseSize(settings.value(key).toString().toStdString()) })
            {
                config.m_PageFormats[key.toStdString()] = std::move(info).value();
            }
            else
            {
                LogWarning("Ignoring malformed page format {}", key.toStdString());
            }
        }

        settings.endGroup();
    }

    {
        settings.beginGroup("FONT_TIERS");

        auto& font_sizes{ config.m_LayoutOptions.m_Message.m_FontSizes };
        for (auto [tier, size] : {
                 std::pair{ FontTier::Small, &font_sizes.m_Small },
                 std::pair{ FontTier::Medium, &font_sizes.m_Medium },
                 std::pair{ FontTier::Large, &font_sizes.m_Large },
             })
        {
            const auto key{ ToQString(magic_enum::enum_name(tier)) };
            const auto points{ settings.value(key, *size / 1_pts).toFloat() };
            if (points > 0.0f)
            {
                *size = points * 1_pts;
            }
        }

        settings.endGroup();
    }

    {
        settings.beginGroup("LAYOUT");

        auto& message_options{ config.m_LayoutOptions.m_Message };
        message_options.m_LineHeightFactor = std::max(settings.value("Line.Height.Factor", 1.4f).toFloat(), 0.1f);
        message_options.m_WritingLineCount = settings.value("Writing.Line.Count", 10).toUInt();
        read_length("Top.Bottom.Margin", message_options.m_TopBottomMargin);
        read_length("Writing.Lines.Top", message_options.m_WritingLinesTop);
        read_length("Writing.Line.Spacing", message_options.m_WritingLineSpacing);
        read_length("Margin.Inset", config.m_DefaultMarginInset);
        read_length("Flourish.Inset", config.m_LayoutOptions.m_FlourishInset);
        read_length("Flourish.Reach", config.m_LayoutOptions.m_FlourishReach);
        read_length("Branding.Offset.X", config.m_LayoutOptions.m_BrandingOffset.x);
        read_length("Branding.Offset.Y", config.m_LayoutOptions.m_BrandingOffset.y);
        config.m_BrandingText = settings.value("Branding.Text", ToQString(config.m_BrandingText)).toString().toStdString();

        settings.endGroup();
    }

    {
        settings.beginGroup("STYLE");

        auto& style{ config.m_Style };
        read_color("Fold.Line.Color", style.m_FoldLineColor);
        read_length("Fold.Line.Width", style.m_FoldLineWidth);
        read_length("Fold.Line.Dash", style.m_FoldLineDash);
        read_color("Branding.Color", style.m_BrandingColor);
        read_length("Branding.Font.Size", style.m_BrandingFontSize);
        read_color("Flourish.Color", style.m_FlourishColor);
        read_length("Flourish.Width", style.m_FlourishWidth);
        read_color("Writing.Line.Color", style.m_WritingLineColor);
        read_length("Writing.Line.Width", style.m_WritingLineWidth);
        read_color("Message.Color", style.m_MessageColor);

        settings.endGroup();
    }

    return config;
}

void SaveConfig(const Config& config, const fs::path& config_path)
{
    QSettings settings(ToQString(config_path), QSettings::IniFormat);
    if (settings.status() != QSettings::Status::NoError)
    {
        LogError("Failed writing config {}", config_path.string());
        return;
    }

    const auto write_length{
        [&](const char* key, Length length)
        {
            settings.setValue(key, ToQString(FormatLength(length, config.m_BaseUnit, 3)));
        }
    };
    const auto write_color{
        [&](const char* key, const ColorRGB8& color)
        {
            settings.setValue(key, ToQString(ColorToHex(color)));
        }
    };

    {
        settings.beginGroup("DEFAULT");

        settings.setValue("Format.Version", ToQString(ConfigFormatVersion()));
        settings.setValue("Page.Format", ToQString(config.m_DefaultPageFormat));
        settings.setValue("Deterministic.Output", config.m_DeterministicPdfOutput);
        settings.setValue("PDF.Image.Format", ToQString(magic_enum::enum_name(config.m_PdfImageFormat)));

        if (config.m_PngCompression.has_value())
        {
            settings.setValue("PDF.Png.Compression", config.m_PngCompression.value());
        }

        if (config.m_JpgQuality.has_value())
        {
            settings.setValue("PDF.Jpg.Quality", config.m_JpgQuality.value());
        }

        settings.setValue("Base.Unit", ToQString(UnitName(config.m_BaseUnit)));

        settings.endGroup();
    }

    {
        settings.beginGroup("PAGE_FORMATS");

        for (const auto& [name, info] : config.m_PageFormats)
        {
            settings.setValue(ToQString(name), ToQString(FormatSize(info)));
        }

        settings.endGroup();
    }

    {
        settings.beginGroup("FONT_TIERS");

        const auto& font_sizes{ config.m_LayoutOptions.m_Message.m_FontSizes };
        settings.setValue("Small", font_sizes.m_Small / 1_pts);
        settings.setValue("Medium", font_sizes.m_Medium / 1_pts);
        settings.setValue("Large", font_sizes.m_Large / 1_pts);

        settings.endGroup();
    }

    {
        settings.beginGroup("LAYOUT");

        const auto& message_options{ config.m_LayoutOptions.m_Message };
        settings.setValue("Line.Height.Factor", message_options.m_LineHeightFactor);
        settings.setValue("Writing.Line.Count", message_options.m_WritingLineCount);
        write_length("Top.Bottom.Margin", message_options.m_TopBottomMargin);
        write_length("Writing.Lines.Top", message_options.m_WritingLinesTop);
        write_length("Writing.Line.Spacing", message_options.m_WritingLineSpacing);
        write_length("Margin.Inset", config.m_DefaultMarginInset);
        write_length("Flourish.Inset", config.m_LayoutOptions.m_FlourishInset);
        write_length("Flourish.Reach", config.m_LayoutOptions.m_FlourishReach);
        write_length("Branding.Offset.X", config.m_LayoutOptions.m_BrandingOffset.x);
        write_length("Branding.Offset.Y", config.m_LayoutOptions.m_BrandingOffset.y);
        settings.setValue("Branding.Text", ToQString(config.m_BrandingText));

        settings.endGroup();
    }

    {
        settings.beginGroup("STYLE");

        const auto& style{ config.m_Style };
        write_color("Fold.Line.Color", style.m_FoldLineColor);
        write_length("Fold.Line.Width", style.m_FoldLineWidth);
        write_length("Fold.Line.Dash", style.m_FoldLineDash);
        write_color("Branding.Color", style.m_BrandingColor);
        write_length("Branding.Font.Size", style.m_BrandingFontSize);
        write_color("Flourish.Color", style.m_FlourishColor);
        write_length("Flourish.Width", style.m_FlourishWidth);
        write_color("Writing.Line.Color", style.m_WritingLineColor);
        write_length("Writing.Line.Width", style.m_WritingLineWidth);
        write_color("Message.Color", style.m_MessageColor);

        settings.endGroup();
    }

    settings.sync();
}
