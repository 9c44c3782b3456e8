#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include <opencv2/core/mat.hpp>

#include <anycard/color.hpp>
#include <anycard/util.hpp>

struct ImageSpec;

using EncodedImage = std::vector<std::byte>;

// Decoded artwork, owns its pixels
class [[nodiscard]] Image
{
  public:
    Image() = default;
    Image(cv::Mat impl);
    ~Image() = default;

    Image(Image&& rhs) = default;
    Image(const Image& rhs);

    Image& operator=(Image&& rhs) = default;
    Image& operator=(const Image& rhs);

    static Image Read(const fs::path& path);

    EncodedImage EncodePng(std::optional<int32_t> compression = std::nullopt) const;
    EncodedImage EncodeJpg(std::optional<int32_t> quality = std::nullopt) const;

    // Blends any alpha channel onto a solid background, leaves three channels
    Image FlattenAlpha(const ColorRGB8& background) const;

    explicit operator bool() const;
    bool Valid() const;

    Pixel Width() const;
    Pixel Height() const;
    PixelSize Size() const;
    ImageSpec Spec() const;

  private:
    cv::Mat m_Impl{};
};
