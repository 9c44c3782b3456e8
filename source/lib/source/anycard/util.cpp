#include <anycard/util.hpp>

std::string_view TrimWhitespace(std::string_view str)
{
    static constexpr std::string_view c_Whitespace{ " \t\n\r\f\v" };

    const auto first{ str.find_first_not_of(c_Whitespace) };
    if (first == std::string_view::npos)
    {
        return {};
    }
    const auto last{ str.find_last_not_of(c_Whitespace) };
    return str.substr(first, last - first + 1);
}

bool IsBlank(std::string_view str)
{
    return TrimWhitespace(str).empty();
}
