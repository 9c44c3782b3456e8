#include <anycard/image.hpp>

#include <cstring>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <anycard/layout/fit_rect.hpp>

static EncodedImage Encode(const cv::Mat& impl, const char* ext, const std::vector<int>& params)
{
    if (impl.empty())
    {
        return {};
    }

    std::vector<uchar> cv_buffer;
    if (!cv::imencode(ext, impl, cv_buffer, params))
    {
        return {};
    }

    EncodedImage out_buffer(cv_buffer.size(), std::byte{});
    std::memcpy(out_buffer.data(), cv_buffer.data(), cv_buffer.size());
    return out_buffer;
}

static std::vector<int> PngParams(std::optional<int32_t> compression)
{
    if (!compression.has_value())
    {
        return {};
    }

    return {
        cv::IMWRITE_PNG_COMPRESSION,
        compression.value(),
        cv::IMWRITE_PNG_STRATEGY,
        cv::IMWRITE_PNG_STRATEGY_DEFAULT,
    };
}

static std::vector<int> JpgParams(std::optional<int32_t> quality)
{
    if (!quality.has_value())
    {
        return {};
    }

    return {
        cv::IMWRITE_JPEG_QUALITY,
        quality.value(),
    };
}

Image::Image(cv::Mat impl)
    : m_Impl{ std::move(impl) }
{
}

Image::Image(const Image& rhs)
    : m_Impl{ rhs.m_Impl.clone() }
{
}

Image& Image::operator=(const Image& rhs)
{
    m_Impl = rhs.m_Impl.clone();
    return *this;
}

Image Image::Read(const fs::path& path)
{
    return Image{ cv::imread(path.string().c_str(), cv::IMREAD_UNCHANGED) };
}

EncodedImage Image::EncodePng(std::optional<int32_t> compression) const
{
    return Encode(m_Impl, ".png", PngParams(compression));
}

EncodedImage Image::EncodeJpg(std::optional<int32_t> quality) const
{
    // Jpg has no alpha channel
    if (m_Impl.channels() == 4)
    {
        return FlattenAlpha(ColorRGB8{ 255, 255, 255 }).EncodeJpg(quality);
    }
    return Encode(m_Impl, ".jpg", JpgParams(quality));
}

Image Image::FlattenAlpha(const ColorRGB8& background) const
{
    if (m_Impl.channels() != 4)
    {
        return *this;
    }

    cv::Mat source{ m_Impl };
    if (source.depth() != CV_8U)
    {
        const double scale{ source.depth() == CV_16U ? 1.0 / 257.0 : 1.0 };
        source.convertTo(source, CV_8UC4, scale);
    }

    const auto [r, g, b]{ ColorToFloat(background).pod() };
    const cv::Vec3f background_bgr{ b, g, r };

    cv::Mat flat{ source.rows, source.cols, CV_8UC3 };
    for (int y = 0; y < source.rows; ++y)
    {
        for (int x = 0; x < source.cols; ++x)
        {
            const auto& src{ source.at<cv::Vec4b>(y, x) };
            const float alpha{ src[3] / 255.0f };

            auto& dst{ flat.at<cv::Vec3b>(y, x) };
            for (int c = 0; c < 3; ++c)
            {
                const float blended{ src[c] * alpha + background_bgr[c] * 255.0f * (1.0f - alpha) };
                dst[c] = cv::saturate_cast<uchar>(blended);
            }
        }
    }
    return Image{ std::move(flat) };
}

Image::operator bool() const
{
    return !m_Impl.empty();
}

bool Image::Valid() const
{
    return static_cast<bool>(*this);
}

Pixel Image::Width() const
{
    return Size().x;
}

Pixel Image::Height() const
{
    return Size().y;
}

PixelSize Image::Size() const
{
    return PixelSize{
        Pixel(static_cast<float>(m_Impl.cols)),
        Pixel(static_cast<float>(m_Impl.rows)),
    };
}

ImageSpec Image::Spec() const
{
    return ImageSpec{
        .m_Width{ Width() },
        .m_Height{ Height() },
    };
}
