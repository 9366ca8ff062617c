// src/main.cpp - Zenith sky simulation demo
//
// Runs a sky through one simulated day:
//  1. Build a logger and a procedural texture source
//  2. Create and enable a sky with flattened clouds and moving stars
//  3. Step the hour and report the lighting handed to the scene

#include "core/error.hpp"
#include "core/logger.hpp"
#include "sky/lighting.hpp"
#include "sky/procedural_textures.hpp"
#include "sky/scene_attachment.hpp"
#include "sky/sky_control.hpp"

#include <spdlog/fmt/fmt.h>

#include <cstdlib>
#include <memory>
#include <string>
#include <utility>

using namespace zenith;

namespace
{

/// Scene that only logs what it is asked to do.
class ConsoleScene final : public sky::SceneAttachment
{
public:
    explicit ConsoleScene(std::shared_ptr<spdlog::logger> logger)
        : m_logger(std::move(logger))
    {
    }

    void attach(const sky::SkySubtree& subtree) override
    {
        for (const auto& geometry : subtree.geometries) {
            ZEN_INFO(m_logger, "attach '{}' ({} triangles)", geometry.name,
                     geometry.mesh ? geometry.mesh->triangle_count() : 0u);
        }
    }

    void detach() override { ZEN_INFO(m_logger, "detach sky"); }
    void fit_to_frustum() override { ZEN_DEBUG(m_logger, "fit sky to frustum"); }

private:
    std::shared_ptr<spdlog::logger> m_logger;
};

std::string format_color(const Vec4f& c)
{
    return fmt::format("({:.3f}, {:.3f}, {:.3f})", c.r, c.g, c.b);
}

} // namespace

int main()
{
    auto logger = core::Logger::create({.name = "ZENITH", .level = spdlog::level::info});

    try {
        auto textures = std::make_shared<sky::ProceduralTextureSource>(42);

        sky::SkyControl sky({
            .cloud_flattening = 0.9f,
            .star_motion = true,
            .bottom_dome = true,
            .cloud_layers = 2,
            .textures = textures,
            .logger = logger,
        });

        ConsoleScene scene(logger);
        sky::LightingUpdater updater;
        updater.add_listener([&logger](const sky::LightingSnapshot& snapshot) {
            ZEN_DEBUG(logger, "main light {} shadow {:.2f}", format_color(snapshot.main_color),
                      snapshot.shadow_intensity);
        });

        sky.set_scene(&scene);
        sky.set_lighting_sink(&updater);
        sky.set_cloudiness(0.6f);
        sky.set_phase(sky::LunarPhase::WaxingGibbous);
        sky.time_and_place().set_solar_longitude(6, 21);
        sky.set_enabled(true);

        ZEN_INFO(logger, "{}", sky.time_and_place().describe());

        for (int hour = 0; hour <= 24; hour += 2) {
            sky.time_and_place().set_hour(static_cast<f32>(hour));
            sky.update(60.0f);

            const auto& snapshot = updater.latest();
            if (!snapshot) {
                continue;
            }
            ZEN_INFO(logger, "{:02d}:00  sky {}  main {}  ambient {}  shadow {:.2f}  bloom {:.2f}",
                     hour, format_color(snapshot->background_color), format_color(snapshot->main_color),
                     format_color(snapshot->ambient_color), snapshot->shadow_intensity,
                     snapshot->bloom_intensity);
        }

        sky.set_enabled(false);
        ZEN_INFO(logger, "{} lighting updates delivered", updater.update_count());
    } catch (const core::Error& e) {
        ZEN_ERROR(logger, "sky demo failed: {}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
