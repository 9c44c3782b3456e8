#include <anycard/units.hpp>

#include <fmt/format.h>

std::string FormatLength(Length length, Unit unit, uint32_t decimals)
{
    const float value{ length / UnitValue(unit) };
    return fmt::format("{0:.{1}f} {2}", value, decimals, UnitShortName(unit));
}
