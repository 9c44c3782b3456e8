#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

#include <anycard/util.hpp>

enum class Unit
{
    Millimeter,
    Centimeter,
    Inches,
    Points,
};

struct UnitInfo
{
    Unit m_Unit;
    Length m_Value;
    std::string_view m_Name;
    std::string_view m_ShortName;

    constexpr std::string_view GetName() const
    {
        return m_Name;
    }
};

inline constexpr std::array c_Units{
    UnitInfo{ Unit::Millimeter, 1_mm, "mm", "mm" },
    UnitInfo{ Unit::Centimeter, 1_cm, "cm", "cm" },
    UnitInfo{ Unit::Inches, 1_in, "inches", "in" },
    UnitInfo{ Unit::Points, 1_pts, "points", "pts" },
};

constexpr const UnitInfo& GetUnitInfo(Unit unit);

constexpr Length UnitValue(Unit unit);
constexpr std::string_view UnitName(Unit unit);
constexpr std::string_view UnitShortName(Unit unit);

// Accepts both the long and the short name
constexpr std::optional<Unit> UnitFromName(std::string_view unit_name);

// Formats e.g. "5.50 in"
std::string FormatLength(Length length, Unit unit, uint32_t decimals = 2);

#include <anycard/units.inl>
