#pragma once

/// @file pcg_rng.hpp
/// @brief Small deterministic PCG-XSH-RR 32/64 generator.

#include "core/types.hpp"

namespace zenith::core
{
    /// @brief Seeded, reproducible pseudorandom numbers for procedural content.
    class PcgRng
    {
    public:
        explicit PcgRng(u64 seed, u64 stream = 1)
            : m_state(seed + (stream | 1))
            , m_inc((stream << 1) | 1)
        {
            next();
        }

        u32 next()
        {
            const u64 old = m_state;
            m_state = old * 6364136223846793005ULL + m_inc;
            const auto xorshifted = static_cast<u32>(((old >> 18u) ^ old) >> 27u);
            const auto rot = static_cast<u32>(old >> 59u);
            return (xorshifted >> rot) | (xorshifted << ((-rot) & 31));
        }

        /// Uniform in [0, 1)
        f32 next_unit()
        {
            return static_cast<f32>(next() >> 8) * (1.0f / 16777216.0f);
        }

        /// Uniform in [lo, hi)
        f32 next_in_range(f32 lo, f32 hi)
        {
            return lo + next_unit() * (hi - lo);
        }

    private:
        u64 m_state;
        u64 m_inc;
    };

} // namespace zenith::core
