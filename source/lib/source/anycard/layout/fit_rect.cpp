#include <anycard/layout/fit_rect.hpp>

#include <fmt/format.h>

#include <anycard/layout/layout_errors.hpp>

float ImageSpec::AspectRatio() const
{
    return m_Width / m_Height;
}

void ValidateImageSpec(const ImageSpec& image)
{
    if (image.m_Width <= 0_pix || image.m_Height <= 0_pix)
    {
        throw InvalidImageSpec{
            fmt::format("Image dimensions must be positive, got {} x {} pixels",
                        image.m_Width.value,
                        image.m_Height.value),
        };
    }
}

Rect ComputeFitRect(const ImageSpec& image, const Rect& target)
{
    ValidateImageSpec(image);

    const auto [target_width, target_height]{ target.m_Size.pod() };
    if (target_width <= 0_mm || target_height <= 0_mm)
    {
        throw InvalidGeometry{ "Target rectangle for image fit must have a positive size" };
    }

    const auto image_ratio{ image.AspectRatio() };
    const auto target_ratio{ target_width / target_height };

    Size draw_size;
    Position offset{ 0_mm, 0_mm };
    if (image_ratio > target_ratio)
    {
        // Width constrained, center vertically
        draw_size = Size{ target_width, target_width / image_ratio };
        offset.y = (target_height - draw_size.y) / 2;
    }
    else
    {
        // Height constrained, center horizontally
        draw_size = Size{ target_height * image_ratio, target_height };
        offset.x = (target_width - draw_size.x) / 2;
    }

    return Rect{
        .m_Position{ target.m_Position + offset },
        .m_Size{ draw_size },
    };
}
