#include <anycard/color.hpp>

#include <charconv>

#include <fmt/format.h>

std::string ColorToHex(const ColorRGB8& color)
{
    return fmt::format("#{:02x}{:02x}{:02x}", color.r, color.g, color.b);
}

std::optional<ColorRGB8> ColorFromHex(std::string_view hex)
{
    if (hex.starts_with('#'))
    {
        hex.remove_prefix(1);
    }

    if (hex.size() != 6)
    {
        return std::nullopt;
    }

    uint32_t value{};
    const auto [ptr, ec]{ std::from_chars(hex.data(), hex.data() + hex.size(), value, 16) };
    if (ec != std::errc{} || ptr != hex.data() + hex.size())
    {
        return std::nullopt;
    }

    return ColorRGB8{
        static_cast<uint8_t>((value >> 16) & 0xff),
        static_cast<uint8_t>((value >> 8) & 0xff),
        static_cast<uint8_t>(value & 0xff),
    };
}

ColorRGB32f ColorToFloat(const ColorRGB8& color)
{
    return ColorRGB32f{
        static_cast<float>(color.r) / 255.0f,
        static_cast<float>(color.g) / 255.0f,
        static_cast<float>(color.b) / 255.0f,
    };
}
