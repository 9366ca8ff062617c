/// @file test_image_raster.cpp
/// @brief Unit tests for PixelRaster and bilinear red-channel sampling.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "core/error.hpp"
#include "sky/image_raster.hpp"

#include <vector>

using namespace zenith;
using namespace zenith::sky;

/// 2×1 raster: red 0 on the left texel, 1 on the right.
static PixelRaster two_texel_ramp()
{
    return PixelRaster(2, 1, {Vec4f{0.0f, 0.0f, 0.0f, 1.0f}, Vec4f{1.0f, 0.0f, 0.0f, 1.0f}});
}

TEST_CASE("Raster construction checks its size")
{
    CHECK_THROWS_AS(PixelRaster(0, 4, {}), core::InvalidArgument);
    CHECK_THROWS_AS(PixelRaster(2, 2, std::vector<Vec4f>(3)), core::InvalidArgument);
    CHECK_NOTHROW(PixelRaster(2, 2, std::vector<Vec4f>(4)));
}

TEST_CASE("Pixel access outside the raster throws")
{
    const PixelRaster raster = two_texel_ramp();
    CHECK(raster.pixel(1, 0).r == 1.0f);
    CHECK_THROWS_AS((void)raster.pixel(2, 0), core::InvalidArgument);
    CHECK_THROWS_AS((void)raster.pixel(0, 1), core::InvalidArgument);
}

TEST_CASE("Clear raster is a single transparent texel")
{
    const TextureHandle clear = PixelRaster::clear();
    CHECK(clear->width() == 1);
    CHECK(clear->height() == 1);
    CHECK(clear->pixel(0, 0) == Vec4f{0.0f});
    CHECK(sample_red(*clear, Vec2f{0.3f, 0.8f}) == 0.0f);
}

TEST_CASE("Sampling at texel centers returns the texel")
{
    const PixelRaster raster = two_texel_ramp();
    CHECK(sample_red(raster, Vec2f{0.25f, 0.5f}) == doctest::Approx(0.0f));
    CHECK(sample_red(raster, Vec2f{0.75f, 0.5f}) == doctest::Approx(1.0f));
}

TEST_CASE("Sampling between texel centers interpolates linearly")
{
    const PixelRaster raster = two_texel_ramp();
    CHECK(sample_red(raster, Vec2f{0.5f, 0.5f}) == doctest::Approx(0.5f));
    CHECK(sample_red(raster, Vec2f{0.375f, 0.5f}) == doctest::Approx(0.25f));
}

TEST_CASE("Sampling wraps across the texture edges")
{
    const PixelRaster raster = two_texel_ramp();
    // u = 0 lies halfway between the right texel (wrapped) and the left one
    CHECK(sample_red(raster, Vec2f{0.0f, 0.5f}) == doctest::Approx(0.5f));
    CHECK(sample_red(raster, Vec2f{1.25f, 0.5f}) == doctest::Approx(0.0f));
    CHECK(sample_red(raster, Vec2f{-0.25f, 0.5f}) == doctest::Approx(1.0f));
}

TEST_CASE("Filled raster samples to its color everywhere")
{
    const TextureHandle gray = PixelRaster::filled(3, 5, Vec4f{0.4f, 0.1f, 0.1f, 1.0f});
    for (f32 u : {0.0f, 0.33f, 0.9f}) {
        CHECK(sample_red(*gray, Vec2f{u, 1.0f - u}) == doctest::Approx(0.4f));
    }
}
