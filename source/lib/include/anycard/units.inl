#include <anycard/units.hpp>

#include <utility>

constexpr const UnitInfo& GetUnitInfo(Unit unit)
{
    for (const auto& info : c_Units)
    {
        if (info.m_Unit == unit)
        {
            return info;
        }
    }

    std::unreachable();
}

constexpr Length UnitValue(Unit unit)
{
    return GetUnitInfo(unit).m_Value;
}
constexpr std::string_view UnitName(Unit unit)
{
    return GetUnitInfo(unit).m_Name;
}
constexpr std::string_view UnitShortName(Unit unit)
{
    return GetUnitInfo(unit).m_ShortName;
}

constexpr std::optional<Unit> UnitFromName(std::string_view unit_name)
{
    for (const auto& info : c_Units)
    {
        if (info.m_Name == unit_name || info.m_ShortName == unit_name)
        {
            return info.m_Unit;
        }
    }
    return std::nullopt;
}
