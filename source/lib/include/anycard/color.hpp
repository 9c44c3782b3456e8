#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <dla/vector.h>

using ColorRGB8 = dla::tvec3<uint8_t>;
using ColorRGB32f = dla::tvec3<float>;

std::string ColorToHex(const ColorRGB8& color);
std::optional<ColorRGB8> ColorFromHex(std::string_view hex);

ColorRGB32f ColorToFloat(const ColorRGB8& color);
