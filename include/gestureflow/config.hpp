#pragma once

#include "color.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace gestureflow
{
    struct StoreParameters
    {
        float cell_size{ 50.0f };
        float mass_per_size{ 0.1f };
        float min_particle_size{ 1.0f };
        float max_particle_size{ 40.0f };
        float bubble_threshold{ 25.0f };
    };

    struct SpawnParameters
    {
        float size_min{ 4.0f };
        float size_max{ 12.0f };
        float drift_speed{ 0.5f };
        float cluster_speed{ 1.0f };
        float temperature_min{ 0.3f };
        float temperature_max{ 1.0f };
        float hue_jitter{ 15.0f };
        float tone_jitter{ 0.2f };
        // Initial seeding keeps this distance from every edge.
        float seed_margin{ 100.0f };
    };

    struct PhysicsParameters
    {
        float gravity{ 0.02f };
        float buoyancy{ 0.015f };
        float viscosity{ 0.95f };
        float cooling{ 0.999f };
        float temperature_floor{ 0.2f };
        float trail_speed_scale{ 0.5f };
        float trail_alpha_min{ 0.3f };
        float trail_alpha_max{ 1.0f };
    };

    struct BoundaryParameters
    {
        float margin{ 50.0f };
        float bounce{ 0.5f };
    };

    struct ForceParameters
    {
        float touch_radius{ 50.0f };
        float touch_heat{ 0.1f };
        float falloff{ 0.1f };
        float pair_falloff{ 0.05f };
        float pair_heat{ 0.05f };
    };

    struct MergeParameters
    {
        float probability{ 0.3f };
        std::size_t sample_limit{ 150 };
        float search_radius_factor{ 1.5f };
        float growth_factor{ 0.3f };
        float bubble_heat{ 0.2f };
    };

    struct ColorParameters
    {
        float shift_speed{ 0.1f };
        float retarget_threshold{ 5.0f };
        float retarget_hue_jitter{ 20.0f };

        [[nodiscard]] float step_fraction() const noexcept { return shift_speed * 0.01f; }
    };

    struct BubbleParameters
    {
        float lift{ 0.03f };
        float shrink_rate{ 0.01f };
        float spawn_probability{ 0.02f };
        float spawn_min_size{ 15.0f };
        float child_size_min{ 3.0f };
        float child_size_max{ 6.0f };
        float child_offset{ 10.0f };
        float child_speed{ 0.5f };
        float size_cost{ 2.0f };
    };

    struct IdleParameters
    {
        std::size_t attractor_count{ 3 };
        float angle_rate{ 0.005f };
        float drift_x{ 0.5f };
        float drift_y{ 0.3f };
        float dead_zone{ 50.0f };
        float pull{ 0.02f };
        float swirl{ 0.015f };
        float falloff{ 0.01f };
        float jump_probability{ 0.001f };
    };

    struct SimulationConfig
    {
        float width{ 1920.0f };
        float height{ 1080.0f };
        std::size_t max_particles{ 1500 };
        std::size_t initial_particles{ 500 };
        std::uint32_t seed{ 5489u };
        std::string palette{ "default" };
        bool verbose{ false };

        StoreParameters store{};
        SpawnParameters spawn{};
        PhysicsParameters physics{};
        BoundaryParameters boundary{};
        ForceParameters forces{};
        MergeParameters merge{};
        ColorParameters color{};
        BubbleParameters bubbles{};
        IdleParameters idle{};
        PaletteSet palettes{ PaletteSet::builtin() };

        void validate() const
        {
            if (!(width > 0.0f) || !(height > 0.0f))
            {
                throw std::invalid_argument("Simulation dimensions must be positive");
            }
            if (max_particles == 0)
            {
                throw std::invalid_argument("Particle capacity must be non-zero");
            }
            if (!(store.cell_size > 0.0f))
            {
                throw std::invalid_argument("Spatial index cell size must be positive");
            }
            if (!(store.mass_per_size > 0.0f))
            {
                throw std::invalid_argument("Mass per size must be positive");
            }
            if (!(store.min_particle_size > 0.0f) || store.min_particle_size > store.max_particle_size)
            {
                throw std::invalid_argument("Particle size bounds are inconsistent");
            }
            if (store.bubble_threshold > store.max_particle_size)
            {
                throw std::invalid_argument("Bubble threshold exceeds the maximum particle size");
            }
            if (spawn.size_min > spawn.size_max || spawn.size_min < store.min_particle_size || spawn.size_max > store.max_particle_size)
            {
                throw std::invalid_argument("Spawn size range must lie within the particle size bounds");
            }
            if (bubbles.child_size_min > bubbles.child_size_max || bubbles.child_size_min < store.min_particle_size)
            {
                throw std::invalid_argument("Bubble child size range is inconsistent");
            }
            if (spawn.temperature_min > spawn.temperature_max || spawn.temperature_max > 1.0f ||
                spawn.temperature_min < physics.temperature_floor)
            {
                throw std::invalid_argument("Spawn temperature range must lie within [floor, 1]");
            }
            if (!(physics.viscosity > 0.0f) || physics.viscosity > 1.0f)
            {
                throw std::invalid_argument("Viscosity must lie in (0, 1]");
            }
            if (physics.temperature_floor < 0.0f || physics.temperature_floor > 1.0f)
            {
                throw std::invalid_argument("Temperature floor must lie in [0, 1]");
            }
            if (boundary.bounce < 0.0f || boundary.bounce >= 1.0f)
            {
                throw std::invalid_argument("Boundary bounce must lie in [0, 1)");
            }
            if (boundary.margin < 0.0f)
            {
                throw std::invalid_argument("Boundary margin must be non-negative");
            }
            const auto is_probability = [](float p) { return p >= 0.0f && p <= 1.0f; };
            if (!is_probability(merge.probability) || !is_probability(bubbles.spawn_probability) || !is_probability(idle.jump_probability))
            {
                throw std::invalid_argument("Probabilities must lie in [0, 1]");
            }
            if (idle.dead_zone < 0.0f)
            {
                throw std::invalid_argument("Idle dead zone must be non-negative");
            }
            if (merge.sample_limit == 0)
            {
                throw std::invalid_argument("Merge sample limit must be non-zero");
            }
            if (palettes.empty())
            {
                throw std::invalid_argument("At least one palette is required");
            }
            for (const auto& entry : palettes.palettes())
            {
                if (entry.empty())
                {
                    throw std::invalid_argument("Palette '" + entry.name + "' has no colors");
                }
            }
            if (palettes.find(palette) == nullptr)
            {
                throw std::invalid_argument("Unknown initial palette '" + palette + "'");
            }
        }
    };
} // namespace gestureflow
