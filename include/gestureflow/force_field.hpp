#pragma once

#include "config.hpp"
#include "particle_store.hpp"
#include "vec2.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace gestureflow
{
    struct ForceResult
    {
        std::size_t affected{ 0 };
        // Particles inside the touch radius, counted regardless of the effect radius.
        std::size_t touching{ 0 };
    };

    // Velocity-only force appliers. None of them move particles directly.
    class ForceField
    {
    public:
        ForceField() = default;

        explicit ForceField(ForceParameters parameters)
            : m_parameters{ parameters }
        {
        }

        // Inverse-distance push (repel) or pull toward (cx, cy); touching
        // particles also warm up.
        ForceResult apply_force(ParticleStore& store, float cx, float cy, float radius, float strength, bool repel) const
        {
            ForceResult result{};
            if (store.empty())
            {
                return result;
            }

            auto positions = store.positions();
            auto velocities = store.velocities();
            const float sign = repel ? 1.0f : -1.0f;

            for (std::size_t i = 0; i < store.size(); ++i)
            {
                const Vec2 offset{ positions[i].x - cx, positions[i].y - cy };
                const float distance = length(offset);

                if (distance < m_parameters.touch_radius)
                {
                    ++result.touching;
                    store.heat(i, m_parameters.touch_heat);
                }

                if (distance >= radius)
                {
                    continue;
                }

                ++result.affected;
                const float safe_distance = std::max(distance, 1.0f);
                const float magnitude = strength / (safe_distance * m_parameters.falloff + 1.0f);
                velocities[i] += offset * (sign * magnitude / safe_distance);
            }

            return result;
        }

        ForceResult explode(ParticleStore& store, float cx, float cy, float radius, float strength) const
        {
            return apply_force(store, cx, cy, radius, strength, true);
        }

        // Tangential swirl, strongest at the center and fading to zero at the radius.
        std::size_t apply_vortex(ParticleStore& store, float cx, float cy, float radius, float strength) const
        {
            if (store.empty() || !(radius > 0.0f))
            {
                return 0;
            }

            auto positions = store.positions();
            auto velocities = store.velocities();
            std::size_t affected = 0;

            for (std::size_t i = 0; i < store.size(); ++i)
            {
                const Vec2 offset{ positions[i].x - cx, positions[i].y - cy };
                const float distance = length(offset);
                if (distance >= radius)
                {
                    continue;
                }

                ++affected;
                const float safe_distance = std::max(distance, 1.0f);
                const float magnitude = strength * (1.0f - distance / radius);
                velocities[i] += perpendicular(offset) * (magnitude / safe_distance);
            }

            return affected;
        }

        // Uniform wind over every live particle; a zero direction is a no-op.
        std::size_t apply_directional_flow(ParticleStore& store, float dx, float dy, float strength) const
        {
            const Vec2 direction = normalise(Vec2{ dx, dy });
            if (store.empty() || (direction.x == 0.0f && direction.y == 0.0f))
            {
                return 0;
            }

            const Vec2 increment = direction * strength;
            for (auto& velocity : store.velocities())
            {
                velocity += increment;
            }
            return store.size();
        }

        // Two-hand gather: pulls particles near the midpoint of the two points
        // toward it and warms them.
        std::size_t attract_between_points(ParticleStore& store, float x1, float y1, float x2, float y2, float radius, float strength) const
        {
            if (store.empty())
            {
                return 0;
            }

            const float cx = (x1 + x2) * 0.5f;
            const float cy = (y1 + y2) * 0.5f;
            auto positions = store.positions();
            auto velocities = store.velocities();
            std::size_t affected = 0;

            for (std::size_t i = 0; i < store.size(); ++i)
            {
                const Vec2 offset{ positions[i].x - cx, positions[i].y - cy };
                const float distance = length(offset);
                if (distance >= radius)
                {
                    continue;
                }

                ++affected;
                const float safe_distance = std::max(distance, 1.0f);
                const float magnitude = strength / (safe_distance * m_parameters.pair_falloff + 1.0f);
                velocities[i] -= offset * (magnitude / safe_distance);
                store.heat(i, m_parameters.pair_heat);
            }

            return affected;
        }

        [[nodiscard]] const ForceParameters& parameters() const noexcept { return m_parameters; }

    private:
        ForceParameters m_parameters{};
    };
} // namespace gestureflow
