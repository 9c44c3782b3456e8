#pragma once

#include <anycard/layout/fold_geometry.hpp>
#include <anycard/util.hpp>

// Native pixel dimensions of an already decoded artwork
struct ImageSpec
{
    Pixel m_Width;
    Pixel m_Height;

    float AspectRatio() const;

    bool operator==(const ImageSpec&) const = default;
};

// Throws InvalidImageSpec on non-positive dimensions
void ValidateImageSpec(const ImageSpec& image);

// Aspect-fit ("contain"): the result is centered in target, fills it along one
// axis and keeps the image's aspect ratio
Rect ComputeFitRect(const ImageSpec& image, const Rect& target);
