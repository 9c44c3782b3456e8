#include <anycard/layout/layout_plan.hpp>

#include <anycard/layout/text_measurer.hpp>

static std::array<CornerFlourish, 2> ComputeFlourishes(const Rect& panel, const LayoutOptions& options)
{
    const Position inset{ options.m_FlourishInset, options.m_FlourishInset };
    const Position reach{ options.m_FlourishReach, options.m_FlourishReach };

    const Position top_left{ panel.Left(), panel.Top() };
    const Position bottom_right{ panel.Right(), panel.Bottom() };
    return {
        CornerFlourish{
            .m_Vertex{ top_left + inset },
            .m_Reach{ top_left + reach },
        },
        CornerFlourish{
            .m_Vertex{ bottom_right - inset },
            .m_Reach{ bottom_right - reach },
        },
    };
}

LayoutPlan BuildLayoutPlan(const PageGeometry& page,
                           const ImageSpec& image,
                           const MessageSpec& message,
                           const TextMeasurer& measurer,
                           const LayoutOptions& options)
{
    ValidateMessageSpec(message);
    ValidatePageGeometry(page);
    ValidateImageSpec(image);

    // Both pages share the same fold
    const auto fold{ ComputeFoldGeometry(page) };
    const auto fold_line{ fold.FoldLine() };

    const auto& back_panel{ fold.m_LeftPanel };
    const Position branding_anchor{
        back_panel.Left() + options.m_BrandingOffset.x,
        back_panel.Bottom() - options.m_BrandingOffset.y,
    };

    return LayoutPlan{
        .m_Page{ page },
        .m_Outside{
            .m_Fold{ fold },
            .m_FoldLine{ fold_line },
            .m_FrontImage{ ComputeFitRect(image, fold.m_RightPanel) },
            .m_BrandingAnchor{ branding_anchor },
        },
        .m_Inside{
            .m_Fold{ fold },
            .m_FoldLine{ fold_line },
            .m_Flourishes{ ComputeFlourishes(fold.m_LeftPanel, options) },
            .m_Message{ LayoutMessage(message, fold.m_RightPanel, measurer, options.m_Message) },
        },
    };
}
