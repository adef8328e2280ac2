#pragma once

#include "config.hpp"
#include "particle_store.hpp"
#include "random_source.hpp"
#include "spatial_index.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace gestureflow
{
    struct MergeStats
    {
        std::size_t sampled{ 0 };
        std::size_t merges{ 0 };
        std::size_t new_bubbles{ 0 };
    };

    // Stochastic proximity consolidation. A pass samples a bounded subset of
    // particles, lets each absorb at most one overlapping neighbour with a
    // higher index, then batch-removes the absorbed rows.
    class MergeEngine
    {
    public:
        MergeEngine() = default;

        explicit MergeEngine(MergeParameters parameters)
            : m_parameters{ parameters }
        {
        }

        // Frame gate: a pass runs on roughly `probability` of all frames.
        bool should_run(RandomSource& rng) const
        {
            return rng.chance(m_parameters.probability);
        }

        MergeStats run_pass(ParticleStore& store, ProximityIndex& index, RandomSource& rng)
        {
            MergeStats stats{};
            const std::size_t count = store.size();
            if (count < 2)
            {
                return stats;
            }

            rebuild_index(store, index);

            m_consumed.assign(count, 0);
            m_removals.clear();

            const auto& parameters = store.parameters();
            const float search_radius = parameters.max_particle_size * m_parameters.search_radius_factor;
            const auto sample = rng.sample_indices(count, std::min(count, m_parameters.sample_limit));
            stats.sampled = sample.size();

            auto positions = store.positions();

            for (const auto i : sample)
            {
                if (m_consumed[i] != 0)
                {
                    continue;
                }

                m_hits.clear();
                index.query_radius(positions[i].x, positions[i].y, search_radius, m_hits);

                for (const auto& hit : m_hits)
                {
                    const auto j = hit.index;
                    if (j <= i || j >= count || m_consumed[j] != 0)
                    {
                        continue;
                    }

                    const auto sizes = store.sizes();
                    const float merge_threshold = (sizes[i] + sizes[j]) * 0.5f;
                    if (hit.distance >= merge_threshold)
                    {
                        continue;
                    }

                    if (absorb(store, i, j))
                    {
                        ++stats.new_bubbles;
                    }
                    m_consumed[j] = 1;
                    m_removals.push_back(j);
                    ++stats.merges;
                    break;
                }
            }

            if (!m_removals.empty())
            {
                store.remove(m_removals);
            }

            return stats;
        }

        [[nodiscard]] const MergeParameters& parameters() const noexcept { return m_parameters; }

    private:
        static void rebuild_index(const ParticleStore& store, ProximityIndex& index)
        {
            index.clear();
            const auto positions = store.positions();
            for (std::size_t i = 0; i < positions.size(); ++i)
            {
                index.insert(i, positions[i].x, positions[i].y);
            }
        }

        // Folds j into i. Returns true when i just became a bubble.
        bool absorb(ParticleStore& store, std::size_t i, std::size_t j) const
        {
            const auto masses = store.masses();
            const float mass_i = masses[i];
            const float mass_j = masses[j];
            const float total_mass = mass_i + mass_j;

            auto positions = store.positions();
            auto velocities = store.velocities();
            if (total_mass > 0.0f)
            {
                positions[i] = (positions[i] * mass_i + positions[j] * mass_j) * (1.0f / total_mass);
                velocities[i] = (velocities[i] * mass_i + velocities[j] * mass_j) * (1.0f / total_mass);
            }

            // Plain component average, hue included.
            auto colors = store.colors();
            colors[i] = Hsv{ (colors[i].hue + colors[j].hue) * 0.5f,
                             (colors[i].sat + colors[j].sat) * 0.5f,
                             (colors[i].val + colors[j].val) * 0.5f };

            const auto& parameters = store.parameters();
            const auto sizes = store.sizes();
            const float new_size = std::min(sizes[i] + sizes[j] * m_parameters.growth_factor, parameters.max_particle_size);
            store.set_size(i, new_size);

            if (new_size >= parameters.bubble_threshold)
            {
                const bool was_bubble = store.is_bubble(i);
                store.set_bubble(i, true);
                store.heat(i, m_parameters.bubble_heat);
                return !was_bubble;
            }
            return false;
        }

        MergeParameters m_parameters{};
        std::vector<std::uint8_t> m_consumed{};
        std::vector<std::size_t> m_removals{};
        std::vector<ProximityHit> m_hits{};
    };
} // namespace gestureflow
