#pragma once

#include <array>

#include <anycard/layout/fit_rect.hpp>
#include <anycard/layout/fold_geometry.hpp>
#include <anycard/layout/message_layout.hpp>
#include <anycard/util.hpp>

class TextMeasurer;

struct LayoutOptions
{
    MessageLayoutOptions m_Message{};

    // Measured from the back panel's bottom-left corner, x to the right and y upwards
    Size m_BrandingOffset{ 10_mm, 8_mm };

    // Flourish vertices sit this far in from their corner, arms end this far in
    Length m_FlourishInset{ 5_mm };
    Length m_FlourishReach{ 20_mm };

    bool operator==(const LayoutOptions&) const = default;
};

// Two perpendicular strokes from m_Vertex, one horizontal ending at m_Reach.x
// and one vertical ending at m_Reach.y
struct CornerFlourish
{
    Position m_Vertex;
    Position m_Reach;

    bool operator==(const CornerFlourish&) const = default;
};

// Page 1, back | front
struct OutsidePage
{
    FoldGeometry m_Fold;
    LineSegment m_FoldLine;
    Rect m_FrontImage;
    Position m_BrandingAnchor;

    bool operator==(const OutsidePage&) const = default;
};

// Page 2, inside-left | inside-right
struct InsidePage
{
    FoldGeometry m_Fold;
    LineSegment m_FoldLine;
    std::array<CornerFlourish, 2> m_Flourishes;
    MessageLayout m_Message;

    bool operator==(const InsidePage&) const = default;
};

struct LayoutPlan
{
    PageGeometry m_Page;
    OutsidePage m_Outside;
    InsidePage m_Inside;

    bool operator==(const LayoutPlan&) const = default;
};

// Validates all inputs up front, so nothing is computed for a bad request
LayoutPlan BuildLayoutPlan(const PageGeometry& page,
                           const ImageSpec& image,
                           const MessageSpec& message,
                           const TextMeasurer& measurer,
                           const LayoutOptions& options = {});
