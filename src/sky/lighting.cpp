/// @file lighting.cpp
/// @brief LightingUpdater implementation.

#include "sky/lighting.hpp"

#include "core/validate.hpp"

#include <utility>

namespace zenith::sky
{

using core::Validate;

void LightingUpdater::add_listener(Listener listener)
{
    m_listeners.push_back(std::move(listener));
}

void LightingUpdater::update(const LightingSnapshot& snapshot)
{
    Validate::unit_vector(snapshot.main_direction, "main light direction");
    Validate::fraction(snapshot.shadow_intensity, "shadow intensity");
    Validate::in_range(snapshot.bloom_intensity, "bloom intensity", 0.0, kMaxBloom);

    m_latest = snapshot;
    ++m_update_count;

    for (const Listener& listener : m_listeners) {
        listener(snapshot);
    }
}

} // namespace zenith::sky
