#pragma once

#include <stdexcept>

// Input validation failures of the layout engine, thrown before any geometry is computed
class LayoutError : public std::logic_error
{
  public:
    using std::logic_error::logic_error;
};

// Non-positive page dimensions or a degenerate target rectangle
class InvalidGeometry final : public LayoutError
{
  public:
    using LayoutError::LayoutError;
};

// Non-positive intrinsic image dimensions
class InvalidImageSpec final : public LayoutError
{
  public:
    using LayoutError::LayoutError;
};

// Unrecognized font tier or an unusable margin inset
class InvalidMessageSpec final : public LayoutError
{
  public:
    using LayoutError::LayoutError;
};
