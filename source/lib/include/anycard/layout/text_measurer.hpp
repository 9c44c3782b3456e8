#pragma once

#include <string_view>

#include <anycard/util.hpp>

// Measures rendered text width, implemented by whatever writes the text later on
class TextMeasurer
{
  public:
    virtual ~TextMeasurer() = default;

    virtual Length MeasureText(std::string_view text, Length font_size) const = 0;
};
