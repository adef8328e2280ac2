#pragma once

#include "config.hpp"
#include "particle_store.hpp"
#include "random_source.hpp"
#include "vec2.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numbers>
#include <span>
#include <vector>

namespace gestureflow
{
    // Autonomous screensaver motion: a few slowly wandering attractors that
    // pull distant particles in and set them orbiting.
    class IdleFlow
    {
    public:
        IdleFlow() = default;

        explicit IdleFlow(IdleParameters parameters)
            : m_parameters{ parameters }
        {
        }

        // Enabling an already enabled flow keeps its attractors.
        void set_enabled(bool enabled, float width, float height, RandomSource& rng)
        {
            if (enabled && !m_enabled)
            {
                m_attractors.clear();
                for (std::size_t i = 0; i < m_parameters.attractor_count; ++i)
                {
                    m_attractors.push_back(random_center(width, height, rng));
                }
                m_angle = 0.0f;
            }
            m_enabled = enabled;
        }

        // Returns the number of particle/attractor interactions applied.
        std::size_t update(ParticleStore& store, float dt, RandomSource& rng)
        {
            if (!m_enabled || store.empty() || m_attractors.empty())
            {
                return 0;
            }

            const float width = store.width();
            const float height = store.height();

            m_angle += m_parameters.angle_rate * dt;

            const float spacing = 2.0f * std::numbers::pi_v<float> / static_cast<float>(m_attractors.size());
            for (std::size_t i = 0; i < m_attractors.size(); ++i)
            {
                Vec2& center = m_attractors[i];
                const float phase = m_angle + static_cast<float>(i) * spacing;
                center.x = std::clamp(center.x + std::cos(phase) * m_parameters.drift_x, width * 0.1f, width * 0.9f);
                center.y = std::clamp(center.y + std::sin(phase) * m_parameters.drift_y, height * 0.1f, height * 0.9f);
            }

            const auto positions = store.positions();
            auto velocities = store.velocities();
            std::size_t interactions = 0;

            for (const auto& center : m_attractors)
            {
                for (std::size_t i = 0; i < store.size(); ++i)
                {
                    const Vec2 offset = positions[i] - center;
                    const float distance = length(offset);
                    if (distance <= m_parameters.dead_zone)
                    {
                        continue;
                    }

                    const float falloff = distance * m_parameters.falloff + 1.0f;
                    const Vec2 direction = offset * (1.0f / distance);
                    velocities[i] -= direction * (m_parameters.pull / falloff);
                    velocities[i] += perpendicular(direction) * (m_parameters.swirl / falloff);
                    ++interactions;
                }
            }

            if (rng.chance(m_parameters.jump_probability))
            {
                m_attractors[rng.pick(m_attractors.size())] = random_center(width, height, rng);
            }

            return interactions;
        }

        [[nodiscard]] bool enabled() const noexcept { return m_enabled; }
        [[nodiscard]] float angle() const noexcept { return m_angle; }
        [[nodiscard]] std::span<const Vec2> attractors() const noexcept { return m_attractors; }
        [[nodiscard]] const IdleParameters& parameters() const noexcept { return m_parameters; }

    private:
        static Vec2 random_center(float width, float height, RandomSource& rng)
        {
            const float x = rng.uniform(width * 0.2f, width * 0.8f);
            const float y = rng.uniform(height * 0.2f, height * 0.8f);
            return Vec2{ x, y };
        }

        IdleParameters m_parameters{};
        bool m_enabled{ false };
        float m_angle{ 0.0f };
        std::vector<Vec2> m_attractors{};
    };
} // namespace gestureflow
