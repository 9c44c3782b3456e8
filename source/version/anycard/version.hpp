#pragma once

#include <string_view>

std::string_view AnyCardVersion();
std::string_view AnyCardBuildTime();

consteval std::string_view JsonFormatVersion()
{
    return "ACD00001";
}

consteval std::string_view ConfigFormatVersion()
{
    return "ACD00001";
}
