#pragma once

#include "config.hpp"
#include "particle_store.hpp"
#include "random_source.hpp"
#include "vec2.hpp"

#include <cstddef>
#include <vector>

namespace gestureflow
{
    struct BubbleStats
    {
        std::size_t bubbles{ 0 };
        std::size_t popped{ 0 };
        std::size_t spawned{ 0 };
    };

    // Extra lift, slow shrink and occasional shedding of small children for
    // particles flagged as bubbles.
    class BubbleDynamics
    {
    public:
        BubbleDynamics() = default;

        explicit BubbleDynamics(BubbleParameters parameters)
            : m_parameters{ parameters }
        {
        }

        BubbleStats update(ParticleStore& store, float gravity_direction, RandomSource& rng)
        {
            BubbleStats stats{};

            m_bubbles.clear();
            const auto flags = store.bubble_flags();
            for (std::size_t i = 0; i < flags.size(); ++i)
            {
                if (flags[i] != 0)
                {
                    m_bubbles.push_back(i);
                }
            }

            if (m_bubbles.empty())
            {
                return stats;
            }
            stats.bubbles = m_bubbles.size();

            const float threshold = store.parameters().bubble_threshold;
            auto velocities = store.velocities();
            for (const auto i : m_bubbles)
            {
                velocities[i].y -= m_parameters.lift * gravity_direction;
                store.set_size(i, store.sizes()[i] - m_parameters.shrink_rate);
                if (store.sizes()[i] < threshold)
                {
                    store.set_bubble(i, false);
                    ++stats.popped;
                }
            }

            if (!rng.chance(m_parameters.spawn_probability))
            {
                return stats;
            }

            // The parent may have dropped its flag above and still shed a child.
            const auto parent = m_bubbles[rng.pick(m_bubbles.size())];
            if (store.sizes()[parent] <= m_parameters.spawn_min_size)
            {
                return stats;
            }

            const Vec2 origin = store.positions()[parent];
            const float x = origin.x + rng.uniform(-m_parameters.child_offset, m_parameters.child_offset);
            const float y = origin.y + rng.uniform(-m_parameters.child_offset, m_parameters.child_offset);

            SpawnOptions options{};
            options.velocity = Vec2{ rng.uniform(-m_parameters.child_speed, m_parameters.child_speed),
                                     rng.uniform(-m_parameters.child_speed, m_parameters.child_speed) };
            options.size = rng.uniform(m_parameters.child_size_min, m_parameters.child_size_max);

            if (store.spawn(x, y, rng, options))
            {
                ++stats.spawned;
            }
            store.set_size(parent, store.sizes()[parent] - m_parameters.size_cost);
            if (store.is_bubble(parent) && store.sizes()[parent] < threshold)
            {
                store.set_bubble(parent, false);
                ++stats.popped;
            }

            return stats;
        }

        [[nodiscard]] const BubbleParameters& parameters() const noexcept { return m_parameters; }

    private:
        BubbleParameters m_parameters{};
        std::vector<std::size_t> m_bubbles{};
    };
} // namespace gestureflow
