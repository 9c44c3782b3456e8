#include <anycard/layout/fold_geometry.hpp>

#include <fmt/format.h>

#include <anycard/layout/layout_errors.hpp>
#include <anycard/units.hpp>

Length Rect::Left() const
{
    return m_Position.x;
}
Length Rect::Top() const
{
    return m_Position.y;
}
Length Rect::Right() const
{
    return m_Position.x + m_Size.x;
}
Length Rect::Bottom() const
{
    return m_Position.y + m_Size.y;
}

bool Rect::Contains(const Rect& other, Length tolerance) const
{
    return other.Left() >= Left() - tolerance &&
           other.Top() >= Top() - tolerance &&
           other.Right() <= Right() + tolerance &&
           other.Bottom() <= Bottom() + tolerance;
}

Length PageGeometry::PanelWidth() const
{
    return m_Width / 2;
}

bool PageGeometry::IsLandscape() const
{
    return m_Width > m_Height;
}

LineSegment FoldGeometry::FoldLine() const
{
    return LineSegment{
        .m_From{ m_FoldX, m_LeftPanel.Top() },
        .m_To{ m_FoldX, m_LeftPanel.Bottom() },
    };
}

void ValidatePageGeometry(const PageGeometry& page)
{
    if (page.m_Width <= 0_mm || page.m_Height <= 0_mm)
    {
        throw InvalidGeometry{
            fmt::format("Page dimensions must be positive, got {} x {}",
                        FormatLength(page.m_Width, Unit::Millimeter),
                        FormatLength(page.m_Height, Unit::Millimeter)),
        };
    }
}

FoldGeometry ComputeFoldGeometry(const PageGeometry& page)
{
    ValidatePageGeometry(page);

    const auto fold_x{ page.PanelWidth() };
    const Size panel_size{ fold_x, page.m_Height };
    return FoldGeometry{
        .m_FoldX{ fold_x },
        .m_LeftPanel{
            .m_Position{ 0_mm, 0_mm },
            .m_Size{ panel_size },
        },
        .m_RightPanel{
            .m_Position{ fold_x, 0_mm },
            .m_Size{ panel_size },
        },
    };
}
