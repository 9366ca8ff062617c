/// @file test_sky_material.cpp
/// @brief Unit tests for zenith::sky::SkyMaterial and shape selection.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "core/error.hpp"
#include "sky/sky_material.hpp"

#include "test_support.hpp"

#include <memory>
#include <vector>

using namespace zenith;
using namespace zenith::sky;

static SkyMaterialConfig config_with(u32 objects, u32 layers, f32 cloud_red = 1.0f)
{
    return SkyMaterialConfig{
        .max_objects = objects,
        .max_cloud_layers = layers,
        .textures = std::make_shared<test::UniformTextures>(cloud_red),
    };
}

/// Sink that stores every parameter it receives.
class CollectingSink final : public MaterialSink
{
public:
    void apply(const ParameterKey& key, const ParameterValue& value) override
    {
        received[key] = value;
    }

    ParameterMap received;
};

// =================================================================
// Shapes
// =================================================================

TEST_CASE("Smallest fitting shape is selected")
{
    CHECK(select_shape(0, 0) == MaterialShape::Dome02);
    CHECK(select_shape(0, 2) == MaterialShape::Dome02);
    CHECK(select_shape(1, 0) == MaterialShape::Dome20);
    CHECK(select_shape(2, 1) == MaterialShape::Dome22);
    CHECK(select_shape(0, 5) == MaterialShape::Dome06);
    CHECK(select_shape(6, 0) == MaterialShape::Dome60);
    CHECK(select_shape(3, 3) == MaterialShape::Dome66);
    CHECK(shape_name(MaterialShape::Dome66) == "dome66");
    CHECK(shape_capacity(MaterialShape::Dome22).objects == 2);
}

TEST_CASE("Too many slots overflow every shape")
{
    CHECK_THROWS_AS((void)select_shape(7, 0), core::ConfigurationOverflow);
    CHECK_THROWS_AS((void)select_shape(0, 7), core::ConfigurationOverflow);
    CHECK_THROWS_AS(SkyMaterial(config_with(7, 7)), core::ConfigurationOverflow);
}

TEST_CASE("Slot counts follow the configuration")
{
    const SkyMaterial material(config_with(3, 1));
    CHECK(material.shape() == MaterialShape::Dome66);
    CHECK(material.max_objects() == 3);
    CHECK(material.max_cloud_layers() == 1);
}

// =================================================================
// Objects
// =================================================================

TEST_CASE("Objects must be added before use")
{
    SkyMaterial material(config_with(2, 0));
    CHECK_FALSE(material.is_object_added(0));
    CHECK_THROWS_AS(material.set_object_transform(0, Vec2f{0.5f}, 1.0f), core::IllegalState);
    CHECK_THROWS_AS(material.hide_object(0), core::IllegalState);
    CHECK_THROWS_AS((void)material.object_color(0), core::IllegalState);
    CHECK_THROWS_AS(material.add_object(2, "sun.png"), core::InvalidArgument);
}

TEST_CASE("First bind is white, unglowing and centered at the top")
{
    SkyMaterial material(config_with(2, 0));
    material.add_object(1, "moon.png");

    CHECK(material.is_object_added(1));
    CHECK(material.is_object_visible(1));
    CHECK(material.object_color(1) == Vec4f{1.0f});
    CHECK(material.object_glow(1) == Vec4f{0.0f, 0.0f, 0.0f, 1.0f});

    const auto center = material.object_center(1);
    REQUIRE(center.has_value());
    CHECK(center->x == doctest::Approx(0.5f));
    CHECK(center->y == doctest::Approx(0.5f));
}

TEST_CASE("Rebinding a texture keeps the object's colors and placement")
{
    SkyMaterial material(config_with(1, 0));
    material.add_object(0, "a.png");
    material.set_object_color(0, Vec4f{0.2f, 0.3f, 0.4f, 1.0f});
    material.hide_object(0);

    material.add_object(0, "b.png");
    CHECK(material.object_color(0) == Vec4f{0.2f, 0.3f, 0.4f, 1.0f});
    CHECK_FALSE(material.is_object_visible(0));
}

TEST_CASE("Hiding and showing an object round-trips")
{
    SkyMaterial material(config_with(2, 0));
    material.add_object(0, "sun.png");

    material.hide_object(0);
    CHECK_FALSE(material.is_object_visible(0));
    CHECK_FALSE(material.object_center(0).has_value());

    material.set_object_transform(0, Vec2f{0.3f, 0.6f}, 0.1f, Vec2f{1.0f, 1.0f});
    CHECK(material.is_object_visible(0));
    REQUIRE(material.object_center(0).has_value());
    CHECK(material.object_center(0)->x == doctest::Approx(0.3f));

    const ObjectTransform shown = *material.object_transform(0);
    material.hide_object(0);
    material.set_object_transform(0, Vec2f{0.3f, 0.6f}, 0.1f, Vec2f{1.0f, 1.0f});
    const ObjectTransform again = *material.object_transform(0);
    CHECK(again.center == shown.center);
    CHECK(again.transform_u == shown.transform_u);
    CHECK(again.transform_v == shown.transform_v);
    CHECK(again.rotation == shown.rotation);
}

TEST_CASE("Transform arguments are validated before anything changes")
{
    SkyMaterial material(config_with(1, 0));
    material.add_object(0, "sun.png");
    material.set_object_transform(0, Vec2f{0.4f, 0.4f}, 0.5f);

    CHECK_THROWS_AS(material.set_object_transform(0, Vec2f{1.1f, 0.5f}, 1.0f), core::InvalidArgument);
    CHECK_THROWS_AS(material.set_object_transform(0, Vec2f{0.5f}, 0.0f), core::InvalidArgument);
    CHECK_THROWS_AS(material.set_object_transform(0, Vec2f{0.5f}, 1.0f, Vec2f{0.0f}), core::InvalidArgument);

    CHECK(material.object_center(0)->x == doctest::Approx(0.4f));
}

TEST_CASE("Object at the top: basis is the identity divided by scale")
{
    SkyMaterial material(config_with(1, 0));
    material.add_object(0, "sun.png");
    material.set_object_transform(0, Vec2f{0.5f}, 0.25f);

    const auto transform = material.object_transform(0);
    REQUIRE(transform.has_value());
    CHECK(transform->transform_u.x == doctest::Approx(4.0f));
    CHECK(transform->transform_u.y == doctest::Approx(0.0f));
    CHECK(transform->transform_v.x == doctest::Approx(0.0f));
    CHECK(transform->transform_v.y == doctest::Approx(4.0f));
}

TEST_CASE("Off-center objects are stretched along the tangent")
{
    SkyMaterial material(config_with(1, 0));
    material.add_object(0, "sun.png");
    material.set_object_transform(0, Vec2f{0.94f, 0.5f}, 1.0f);

    const auto transform = material.object_transform(0);
    REQUIRE(transform.has_value());
    // Radial row is untouched, the tangential row shrinks by 1 + k·d²
    CHECK(transform->transform_v.x == doctest::Approx(1.0f));
    CHECK(transform->transform_v.y == doctest::Approx(0.0f));
    const f32 stretch = 1.0f + sky_constants::kStretchCoefficient * 0.44f * 0.44f;
    CHECK(transform->transform_u.y == doctest::Approx(-1.0f / stretch));
    CHECK(stretch == doctest::Approx(sky_constants::kHalfPi));
}

TEST_CASE("Rotation is stored normalized")
{
    SkyMaterial material(config_with(1, 0));
    material.add_object(0, "moon.png");
    material.set_object_transform(0, Vec2f{0.6f, 0.5f}, 1.0f, Vec2f{0.0f, 3.0f});

    const auto transform = material.object_transform(0);
    REQUIRE(transform.has_value());
    REQUIRE(transform->rotation.has_value());
    CHECK(transform->rotation->y == doctest::Approx(1.0f));
    CHECK(glm::length(transform->transform_u) > 0.0f);
}

TEST_CASE("Missing textures are resource errors and leave the slot unbound")
{
    auto textures = std::make_shared<test::UniformTextures>();
    textures->missing.insert("gone.png");
    SkyMaterial material({.max_objects = 1, .max_cloud_layers = 1, .textures = textures});

    CHECK_THROWS_AS(material.add_object(0, "gone.png"), core::ResourceError);
    CHECK_FALSE(material.is_object_added(0));
    CHECK_THROWS_AS(material.add_object(0, ""), core::InvalidArgument);
    CHECK_THROWS_AS(material.add_object(0, TextureHandle{}), core::InvalidArgument);
}

TEST_CASE("Path binds need a texture source")
{
    SkyMaterial material({.max_objects = 1, .max_cloud_layers = 0});
    CHECK_THROWS_AS(material.add_object(0, "sun.png"), core::IllegalState);
    CHECK_NOTHROW(material.add_object(0, PixelRaster::filled(1, 1, Vec4f{1.0f})));
}

// =================================================================
// Clouds and transmission
// =================================================================

TEST_CASE("Transmission is 1 without cloud layers")
{
    SkyMaterial material(config_with(1, 2));
    material.add_object(0, "sun.png");
    CHECK(material.transmission(0u) == doctest::Approx(1.0f));
    CHECK(material.transmission(Vec2f{0.1f, 0.9f}) == doctest::Approx(1.0f));
}

TEST_CASE("Layers multiply their transmission")
{
    SkyMaterial material(config_with(1, 2, 0.5f));
    material.add_clouds(0, "clouds.png");
    material.add_clouds(1, "clouds.png");
    material.set_clouds_color(0, Vec4f{1.0f, 1.0f, 1.0f, 1.0f});
    material.set_clouds_color(1, Vec4f{1.0f, 1.0f, 1.0f, 0.5f});

    // (1 - 0.5·1)·(1 - 0.5·0.5)
    CHECK(material.transmission(Vec2f{0.25f, 0.75f}) == doctest::Approx(0.375f));
}

TEST_CASE("Transmission stays in [0, 1] across the texture")
{
    SkyMaterial material(config_with(2, 2, 1.0f));
    material.add_clouds(0, "clouds.png");
    material.set_clouds_offset(0, 0.3f, 0.7f);
    material.set_clouds_scale(0, 1.5f);
    for (f32 u = 0.0f; u <= 1.0f; u += 0.125f) {
        const f32 t = material.transmission(Vec2f{u, 1.0f - u});
        CHECK(t >= 0.0f);
        CHECK(t <= 1.0f);
    }
}

TEST_CASE("Hidden objects report the transmission at UV (0, 0)")
{
    SkyMaterial material(config_with(1, 1));
    material.add_object(0, "sun.png");
    material.add_clouds(0, PixelRaster::filled(2, 2, Vec4f{0.8f}));
    material.hide_object(0);
    CHECK(material.transmission(0u) == doctest::Approx(material.transmission(Vec2f{0.0f})));
}

TEST_CASE("Cloud setters validate and wrap")
{
    SkyMaterial material(config_with(0, 1));
    CHECK_THROWS_AS(material.set_clouds_offset(0, 0.1f, 0.1f), core::IllegalState);
    material.add_clouds(0, "clouds.png");

    CHECK_THROWS_AS(material.set_clouds_color(0, Vec4f{1.0f, 1.0f, 1.0f, 1.2f}), core::InvalidArgument);
    CHECK_THROWS_AS(material.set_clouds_scale(0, -1.0f), core::InvalidArgument);
    CHECK_THROWS_AS(material.add_clouds(1, "clouds.png"), core::InvalidArgument);

    material.set_clouds_offset(0, 1.25f, -0.25f);
    CHECK(material.clouds_offset(0).x == doctest::Approx(0.25f));
    CHECK(material.clouds_offset(0).y == doctest::Approx(0.75f));
}

// =================================================================
// Shared parameters and renderer hand-off
// =================================================================

TEST_CASE("Haze binding resets the haze color; stars can be removed")
{
    SkyMaterial material(config_with(0, 0));
    material.set_haze_color(Vec4f{0.1f});
    material.add_haze("haze.png");
    CHECK(material.haze_color() == Vec4f{1.0f});

    CHECK_FALSE(material.has_stars());
    material.add_stars("stars.png");
    CHECK(material.has_stars());
    material.remove_stars();
    CHECK_FALSE(material.has_stars());
}

TEST_CASE("Collected parameters describe every bound slot")
{
    SkyMaterial material(config_with(2, 2));
    material.add_object(0, "sun.png");
    material.add_object(1, "moon.png");
    material.hide_object(1);
    material.add_clouds(0, "clouds.png");

    const ParameterMap parameters = material.collect_parameters();
    CHECK(parameters.count({kSharedSlot, ParameterKind::TopCoord}) == 1);
    CHECK(parameters.count({kSharedSlot, ParameterKind::StarsColorMap}) == 0);
    CHECK(std::get<bool>(parameters.at({0, ParameterKind::ObjectVisible})));
    CHECK_FALSE(std::get<bool>(parameters.at({1, ParameterKind::ObjectVisible})));
    CHECK(parameters.count({1, ParameterKind::ObjectCenter}) == 0);
    CHECK(parameters.count({0, ParameterKind::CloudsOffset}) == 1);
    CHECK(parameters.count({1, ParameterKind::CloudsOffset}) == 0);
}

TEST_CASE("Clear color and glow are published on the shared slot")
{
    SkyMaterial material(config_with(2, 2));
    const Vec4f color{0.4f, 0.6f, 1.0f, 0.5f};
    const Vec4f glow{0.1f, 0.2f, 0.3f, 1.0f};
    material.set_clear_color(color);
    material.set_clear_glow(glow);
    CHECK(material.clear_glow() == glow);

    const ParameterMap parameters = material.collect_parameters();
    CHECK(std::get<Vec4f>(parameters.at({kSharedSlot, ParameterKind::ClearColor})) == color);
    CHECK(std::get<Vec4f>(parameters.at({kSharedSlot, ParameterKind::ClearGlow})) == glow);
}

TEST_CASE("apply_to hands every parameter to the sink")
{
    SkyMaterial material(config_with(1, 1));
    material.add_object(0, "sun.png");
    material.add_clouds(0, "clouds.png");

    CollectingSink sink;
    material.apply_to(sink);
    CHECK(sink.received.size() == material.collect_parameters().size());
}

TEST_CASE("Parameter validation checks slot range and value type")
{
    const TextureHandle texture = PixelRaster::filled(1, 1, Vec4f{1.0f});

    CHECK_NOTHROW(SkyMaterial::validate_parameter(MaterialShape::Dome22, {1, ParameterKind::ObjectColorMap}, texture));
    CHECK_THROWS_AS(SkyMaterial::validate_parameter(MaterialShape::Dome22, {2, ParameterKind::ObjectColorMap}, texture),
                    core::InvalidArgument);
    CHECK_THROWS_AS(SkyMaterial::validate_parameter(MaterialShape::Dome02, {0, ParameterKind::ObjectColor}, Vec4f{1.0f}),
                    core::InvalidArgument);
    CHECK_THROWS_AS(SkyMaterial::validate_parameter(MaterialShape::Dome22, {0, ParameterKind::ObjectVisible}, 1.0f),
                    core::InvalidArgument);
    CHECK_THROWS_AS(SkyMaterial::validate_parameter(MaterialShape::Dome22, {0, ParameterKind::ClearColor}, Vec4f{1.0f}),
                    core::InvalidArgument);
    CHECK_THROWS_AS(SkyMaterial::validate_parameter(MaterialShape::Dome22, {0, ParameterKind::CloudsScale}, 0.0f),
                    core::InvalidArgument);
    CHECK_THROWS_AS(SkyMaterial::validate_parameter(MaterialShape::Dome22, {kSharedSlot, ParameterKind::HazeAlphaMap},
                                                    TextureHandle{}),
                    core::InvalidArgument);
}
