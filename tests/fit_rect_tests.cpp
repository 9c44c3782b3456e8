#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <dla/scalar_math.h>

#include <anycard/layout/fit_rect.hpp>
#include <anycard/layout/layout_errors.hpp>

using Catch::Matchers::WithinAbs;

static const Rect c_LetterRightPanel{
    .m_Position{ 5.5_in, 0_in },
    .m_Size{ 5.5_in, 8.5_in },
};

TEST_CASE("Portrait artwork is width constrained on a letter panel", "[fit_width_constrained]")
{
    const ImageSpec image{ 1000_pix, 1500_pix };
    const auto fit{ ComputeFitRect(image, c_LetterRightPanel) };

    REQUIRE_THAT(fit.m_Size.x / 1_in, WithinAbs(5.5, 1e-4));
    REQUIRE_THAT(fit.m_Size.y / 1_in, WithinAbs(8.25, 1e-4));
    REQUIRE_THAT(fit.Left() / 1_in, WithinAbs(5.5, 1e-4));
    REQUIRE_THAT(fit.Top() / 1_in, WithinAbs(0.125, 1e-4));
}

TEST_CASE("Tall artwork is height constrained and centered horizontally", "[fit_height_constrained]")
{
    const ImageSpec image{ 500_pix, 2000_pix };
    const auto fit{ ComputeFitRect(image, c_LetterRightPanel) };

    REQUIRE_THAT(fit.m_Size.y / 1_in, WithinAbs(8.5, 1e-4));
    REQUIRE_THAT(fit.m_Size.x / 1_in, WithinAbs(2.125, 1e-4));
    REQUIRE_THAT(fit.Left() / 1_in, WithinAbs(5.5 + 1.6875, 1e-4));
    REQUIRE_THAT(fit.Top() / 1_in, WithinAbs(0.0, 1e-4));
}

TEST_CASE("Artwork with the panel's aspect ratio fills it", "[fit_exact]")
{
    const ImageSpec image{ 550_pix, 850_pix };
    const auto fit{ ComputeFitRect(image, c_LetterRightPanel) };

    REQUIRE_THAT(fit.m_Size.x / 1_in, WithinAbs(5.5, 1e-4));
    REQUIRE_THAT(fit.m_Size.y / 1_in, WithinAbs(8.5, 1e-4));
    REQUIRE(c_LetterRightPanel.Contains(fit));
}

TEST_CASE("Fit rect is contained, keeps the ratio and fills one axis", "[fit_properties]")
{
    const Rect a6_panel{
        .m_Position{ 105_mm, 0_mm },
        .m_Size{ 105_mm, 148_mm },
    };

    for (const ImageSpec image : { ImageSpec{ 1_pix, 1_pix },
                                   ImageSpec{ 1024_pix, 1024_pix },
                                   ImageSpec{ 1920_pix, 1080_pix },
                                   ImageSpec{ 1080_pix, 1920_pix },
                                   ImageSpec{ 37_pix, 4000_pix } })
    {
        const auto fit{ ComputeFitRect(image, a6_panel) };
        REQUIRE(a6_panel.Contains(fit));
        REQUIRE_THAT(fit.m_Size.x / fit.m_Size.y, WithinAbs(image.AspectRatio(), 1e-3));

        const bool fills_width{ dla::math::abs(fit.m_Size.x - a6_panel.m_Size.x) < 0.001_mm };
        const bool fills_height{ dla::math::abs(fit.m_Size.y - a6_panel.m_Size.y) < 0.001_mm };
        REQUIRE((fills_width || fills_height));
    }
}

TEST_CASE("Fit rect rejects degenerate artwork", "[fit_invalid_image]")
{
    REQUIRE_THROWS_AS(ComputeFitRect(ImageSpec{ 1000_pix, 0_pix }, c_LetterRightPanel), InvalidImageSpec);
    REQUIRE_THROWS_AS(ComputeFitRect(ImageSpec{ 0_pix, 1000_pix }, c_LetterRightPanel), InvalidImageSpec);
    REQUIRE_THROWS_AS(ComputeFitRect(ImageSpec{ -5_pix, 1000_pix }, c_LetterRightPanel), InvalidImageSpec);
}

TEST_CASE("Fit rect rejects degenerate targets", "[fit_invalid_target]")
{
    const Rect empty_target{
        .m_Position{ 0_mm, 0_mm },
        .m_Size{ 0_mm, 100_mm },
    };
    REQUIRE_THROWS_AS(ComputeFitRect(ImageSpec{ 100_pix, 100_pix }, empty_target), InvalidGeometry);
}
