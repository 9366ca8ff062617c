/// @file test_cloud_layer.cpp
/// @brief Unit tests for zenith::sky::CloudLayer.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "core/error.hpp"
#include "sky/cloud_layer.hpp"
#include "sky/sky_material.hpp"

#include "test_support.hpp"

#include <cmath>
#include <memory>

using namespace zenith;
using namespace zenith::sky;

static SkyMaterialConfig two_layer_config()
{
    return SkyMaterialConfig{
        .max_objects = 0,
        .max_cloud_layers = 2,
        .textures = std::make_shared<test::UniformTextures>(0.5f),
    };
}

TEST_CASE("Layer index must fit the material")
{
    SkyMaterial material(two_layer_config());
    CHECK_NOTHROW(CloudLayer(material, 1));
    CHECK_THROWS_AS(CloudLayer(material, 2), core::InvalidArgument);
}

TEST_CASE("Odd and even layers have their own default motion")
{
    SkyMaterial material(two_layer_config());
    const CloudLayer even(material, 0);
    const CloudLayer odd(material, 1);

    CHECK(even.u0() == doctest::Approx(0.4f));
    CHECK(even.v0() == doctest::Approx(0.3f));
    CHECK(even.u_rate() == doctest::Approx(-0.0005f));
    CHECK(even.v_rate() == doctest::Approx(0.003f));

    CHECK(odd.u0() == 0.0f);
    CHECK(odd.v0() == 0.0f);
    CHECK(odd.u_rate() == doctest::Approx(0.0003f));
    CHECK(odd.v_rate() == doctest::Approx(0.001f));
}

TEST_CASE("Adjacent layers drift apart in u")
{
    SkyMaterial material(two_layer_config());
    CloudLayer even(material, 0);
    CloudLayer odd(material, 1);
    even.clear_texture();
    odd.clear_texture();

    even.update_offset(100.0f);
    odd.update_offset(100.0f);

    CHECK(material.clouds_offset(0).x == doctest::Approx(0.35f));
    CHECK(material.clouds_offset(0).y == doctest::Approx(0.6f));
    CHECK(material.clouds_offset(1).x == doctest::Approx(0.03f));
    CHECK(material.clouds_offset(1).y == doctest::Approx(0.1f));
}

TEST_CASE("Offsets wrap into [0, 1)")
{
    SkyMaterial material(two_layer_config());
    CloudLayer layer(material, 0);
    layer.clear_texture();
    layer.set_motion(0.0f, -0.01f, 0.0f, 0.02f);
    layer.update_offset(125.0f);

    const Vec2f offset = material.clouds_offset(0);
    CHECK(offset.x == doctest::Approx(0.75f));
    CHECK(offset.y == doctest::Approx(0.5f));
}

TEST_CASE("Updating an unbound layer is an illegal state")
{
    SkyMaterial material(two_layer_config());
    CloudLayer layer(material, 0);
    CHECK_THROWS_AS(layer.update_offset(1.0f), core::IllegalState);
    CHECK_THROWS_AS(layer.set_color(Vec3f{1.0f}), core::IllegalState);
}

TEST_CASE("Opacity is validated and becomes the color's alpha")
{
    SkyMaterial material(two_layer_config());
    CloudLayer layer(material, 0);
    layer.set_texture("clouds.png");

    CHECK_THROWS_AS(layer.set_opacity(1.5f), core::InvalidArgument);
    CHECK_THROWS_AS(layer.set_opacity(-0.1f), core::InvalidArgument);
    CHECK(layer.opacity() == 0.0f);

    layer.set_opacity(0.6f);
    layer.set_color(Vec3f{0.2f, 0.3f, 0.4f});
    const Vec4f color = material.clouds_color(0);
    CHECK(color.r == doctest::Approx(0.2f));
    CHECK(color.a == doctest::Approx(0.6f));
}

TEST_CASE("Binding a texture applies its scale")
{
    SkyMaterial material(two_layer_config());
    CloudLayer layer(material, 1);

    CHECK_THROWS_AS(layer.set_texture("clouds.png", 0.0f), core::InvalidArgument);
    CHECK_FALSE(material.is_clouds_added(1));

    layer.set_texture("clouds.png");
    CHECK(material.is_clouds_added(1));
    CHECK(material.clouds_scale(1) == doctest::Approx(CloudLayer::kDefaultScale));

    layer.set_glow(Vec3f{0.1f});
    CHECK(material.clouds_glow(1) == Vec4f{0.1f, 0.1f, 0.1f, 1.0f});
}

TEST_CASE("Clearing the texture makes the layer fully transmissive")
{
    SkyMaterial material(two_layer_config());
    CloudLayer layer(material, 0);
    layer.set_texture("clouds.png");
    layer.set_opacity(1.0f);
    layer.set_color(Vec3f{1.0f});
    CHECK(material.transmission(Vec2f{0.5f}) == doctest::Approx(0.5f));

    layer.clear_texture();
    CHECK(material.transmission(Vec2f{0.5f}) == doctest::Approx(1.0f));
}

TEST_CASE("Layers with opposite drift separate after 1000 s")
{
    SkyMaterial material(two_layer_config());
    CloudLayer first(material, 0);
    CloudLayer second(material, 1);
    first.clear_texture();
    second.clear_texture();
    first.set_motion(0.0f, 0.0002f, 0.0f, 0.0f);
    second.set_motion(0.0f, -0.0002f, 0.0f, 0.0f);

    first.update_offset(1000.0f);
    second.update_offset(1000.0f);
    CHECK(material.clouds_offset(0).x == doctest::Approx(0.2f));
    CHECK(material.clouds_offset(1).x == doctest::Approx(0.8f));
    CHECK(std::abs(material.clouds_offset(0).x - material.clouds_offset(1).x) > 0.1f);
}
