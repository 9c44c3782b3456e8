#pragma once

#include <anycard/util.hpp>

// Page coordinates have their origin in the top-left corner, y grows downwards
struct Rect
{
    Position m_Position;
    Size m_Size;

    Length Left() const;
    Length Top() const;
    Length Right() const;
    Length Bottom() const;

    bool Contains(const Rect& other, Length tolerance = 0.001_mm) const;

    bool operator==(const Rect&) const = default;
};

struct LineSegment
{
    Position m_From;
    Position m_To;

    bool operator==(const LineSegment&) const = default;
};

// A landscape sheet that is folded in half along its vertical midline
struct PageGeometry
{
    Length m_Width;
    Length m_Height;

    Length PanelWidth() const;
    bool IsLandscape() const;

    bool operator==(const PageGeometry&) const = default;
};

struct FoldGeometry
{
    Length m_FoldX;
    Rect m_LeftPanel;
    Rect m_RightPanel;

    LineSegment FoldLine() const;

    bool operator==(const FoldGeometry&) const = default;
};

// Throws InvalidGeometry on non-positive dimensions
void ValidatePageGeometry(const PageGeometry& page);

FoldGeometry ComputeFoldGeometry(const PageGeometry& page);
