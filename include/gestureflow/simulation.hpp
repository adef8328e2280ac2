#pragma once

#include "boundary.hpp"
#include "bubble_dynamics.hpp"
#include "color.hpp"
#include "color_drift.hpp"
#include "config.hpp"
#include "detail/scope_timer.hpp"
#include "force_field.hpp"
#include "idle_flow.hpp"
#include "merge_engine.hpp"
#include "particle_store.hpp"
#include "random_source.hpp"
#include "spatial_index.hpp"
#include "vec2.hpp"

#include <safe_io/utils.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace gestureflow
{
    struct FrameStats
    {
        std::uint64_t frame{ 0 };
        std::size_t particle_count{ 0 };
        std::size_t merges{ 0 };
        std::size_t new_bubbles{ 0 };
        std::size_t bubbles_spawned{ 0 };
        std::size_t boundary_contacts{ 0 };
        bool merge_ran{ false };
        double idle_seconds{ 0.0 };
        double integration_seconds{ 0.0 };
        double merge_seconds{ 0.0 };
        double color_seconds{ 0.0 };
        double bubble_seconds{ 0.0 };

        [[nodiscard]] double total_seconds() const noexcept
        {
            return idle_seconds + integration_seconds + merge_seconds + color_seconds + bubble_seconds;
        }
    };

    // Owns the whole particle world: the store, its spatial index, the single
    // random stream and every per-frame subsystem. Nothing here is global;
    // independent instances never share state.
    class Simulation
    {
    public:
        Simulation()
            : Simulation(SimulationConfig{})
        {
        }

        explicit Simulation(SimulationConfig config)
            : m_config{ validated(std::move(config)) },
              m_rng{ m_config.seed },
              m_store{ m_config.max_particles,
                       m_config.width,
                       m_config.height,
                       m_config.store,
                       m_config.spawn,
                       *m_config.palettes.find(m_config.palette) },
              m_index{ m_config.width, m_config.height, m_config.store.cell_size },
              m_forces{ m_config.forces },
              m_merge{ m_config.merge },
              m_color{ m_config.color },
              m_bubbles{ m_config.bubbles },
              m_boundary{ m_config.boundary },
              m_idle{ m_config.idle },
              m_palette_name{ m_config.palette }
        {
            seed_initial_particles();
            safe_io::info("Simulation ready: {} particles (capacity {}) in {}x{} world, palette '{}', seed {}",
                          m_store.size(),
                          m_store.capacity(),
                          m_config.width,
                          m_config.height,
                          m_palette_name,
                          m_config.seed);
        }

        // Advances one frame; dt is in units of a 60 fps frame.
        FrameStats update(float dt = 1.0f)
        {
            ++m_frame;
            m_merge_count = 0;

            FrameStats stats{};
            stats.frame = m_frame;

            if (m_store.empty())
            {
                return stats;
            }

            if (m_idle.enabled())
            {
                detail::AccumulatingScopeTimer timer(stats.idle_seconds);
                m_idle.update(m_store, dt, m_rng);
            }

            {
                detail::AccumulatingScopeTimer timer(stats.integration_seconds);
                integrate(dt);
                stats.boundary_contacts = m_boundary.apply(m_store);
                settle();
            }

            if (m_merge.should_run(m_rng))
            {
                detail::AccumulatingScopeTimer timer(stats.merge_seconds);
                const auto merge = m_merge.run_pass(m_store, m_index, m_rng);
                stats.merge_ran = true;
                stats.merges = merge.merges;
                stats.new_bubbles = merge.new_bubbles;
                m_merge_count = merge.merges;
                if (m_config.verbose)
                {
                    safe_io::debug("Frame {}: merge pass sampled {} of {}, {} merge(s), {} new bubble(s)",
                                   m_frame,
                                   merge.sampled,
                                   m_store.size() + merge.merges,
                                   merge.merges,
                                   merge.new_bubbles);
                }
            }

            {
                detail::AccumulatingScopeTimer timer(stats.color_seconds);
                m_color.update(m_store, m_rng);
            }

            {
                detail::AccumulatingScopeTimer timer(stats.bubble_seconds);
                const auto bubbles = m_bubbles.update(m_store, m_gravity_direction, m_rng);
                stats.bubbles_spawned = bubbles.spawned;
            }

            track_capacity();
            stats.particle_count = m_store.size();
            return stats;
        }

        bool spawn(float x, float y, const SpawnOptions& options = {})
        {
            const bool spawned = m_store.spawn(x, y, m_rng, options);
            track_capacity();
            return spawned;
        }

        std::size_t spawn_cluster(float x, float y, std::size_t count, float spread)
        {
            const std::size_t spawned = m_store.spawn_cluster(x, y, count, spread, m_rng);
            track_capacity();
            return spawned;
        }

        ForceResult apply_force(float cx, float cy, float radius, float strength, bool repel)
        {
            return m_forces.apply_force(m_store, cx, cy, radius, strength, repel);
        }

        ForceResult explode(float cx, float cy, float radius, float strength)
        {
            return m_forces.explode(m_store, cx, cy, radius, strength);
        }

        std::size_t apply_vortex(float cx, float cy, float radius, float strength)
        {
            return m_forces.apply_vortex(m_store, cx, cy, radius, strength);
        }

        std::size_t apply_directional_flow(float dx, float dy, float strength)
        {
            return m_forces.apply_directional_flow(m_store, dx, dy, strength);
        }

        std::size_t attract_between_points(float x1, float y1, float x2, float y2, float radius, float strength)
        {
            return m_forces.attract_between_points(m_store, x1, y1, x2, y2, radius, strength);
        }

        // Runs one merge pass immediately, bypassing the per-frame gate.
        MergeStats merge_now()
        {
            const auto merge = m_merge.run_pass(m_store, m_index, m_rng);
            m_merge_count += merge.merges;
            track_capacity();
            return merge;
        }

        bool resize(float width, float height)
        {
            if (!m_store.resize(width, height))
            {
                safe_io::warn("Ignoring resize to {}x{}: dimensions must be positive", width, height);
                return false;
            }
            m_index.resize(width, height);
            safe_io::debug("World resized to {}x{}", width, height);
            return true;
        }

        // Any positive value means down, any negative value up, zero disables gravity.
        void set_gravity_direction(float direction)
        {
            const float normalised = (direction > 0.0f) ? 1.0f : ((direction < 0.0f) ? -1.0f : 0.0f);
            if (normalised != m_gravity_direction)
            {
                m_gravity_direction = normalised;
                safe_io::debug("Gravity direction set to {}", m_gravity_direction);
            }
        }

        bool set_palette(const std::string& name)
        {
            const Palette* palette = m_config.palettes.find(name);
            if (palette == nullptr)
            {
                safe_io::warn("Unknown palette '{}'", name);
                return false;
            }
            m_store.set_palette(*palette, m_rng);
            m_palette_name = palette->name;
            safe_io::info("Palette switched to '{}'", m_palette_name);
            return true;
        }

        const std::string& next_palette()
        {
            const Palette* next = m_config.palettes.next_after(m_palette_name);
            set_palette(next->name);
            return m_palette_name;
        }

        [[nodiscard]] std::vector<std::string> palette_names() const { return m_config.palettes.names(); }

        void set_idle_mode(bool enabled)
        {
            if (enabled == m_idle.enabled())
            {
                return;
            }
            m_idle.set_enabled(enabled, m_store.width(), m_store.height(), m_rng);
            safe_io::info("Idle flow {}", enabled ? "enabled" : "disabled");
        }

        // Back to the freshly constructed state: same seed, same initial particles.
        void reset()
        {
            m_rng.reseed(m_config.seed);
            m_store.clear();
            if (m_store.width() != m_config.width || m_store.height() != m_config.height)
            {
                m_store.resize(m_config.width, m_config.height);
                m_index.resize(m_config.width, m_config.height);
            }
            if (m_palette_name != m_config.palette)
            {
                m_store.set_palette(*m_config.palettes.find(m_config.palette), m_rng);
                m_palette_name = m_config.palette;
            }
            m_idle = IdleFlow{ m_config.idle };
            m_gravity_direction = 1.0f;
            m_frame = 0;
            m_merge_count = 0;
            m_capacity_warned = false;
            seed_initial_particles();
            safe_io::info("Simulation reset: {} particles", m_store.size());
        }

        [[nodiscard]] ParticleSnapshot snapshot() const { return m_store.snapshot(); }

        [[nodiscard]] std::size_t size() const noexcept { return m_store.size(); }
        [[nodiscard]] std::uint64_t frame_index() const noexcept { return m_frame; }
        [[nodiscard]] std::size_t merge_count() const noexcept { return m_merge_count; }
        [[nodiscard]] float gravity_direction() const noexcept { return m_gravity_direction; }
        [[nodiscard]] bool idle_mode() const noexcept { return m_idle.enabled(); }
        [[nodiscard]] const std::string& palette_name() const noexcept { return m_palette_name; }
        [[nodiscard]] float width() const noexcept { return m_store.width(); }
        [[nodiscard]] float height() const noexcept { return m_store.height(); }

        [[nodiscard]] std::size_t bubble_count() const noexcept
        {
            const auto flags = m_store.bubble_flags();
            return static_cast<std::size_t>(std::count(flags.begin(), flags.end(), std::uint8_t{ 1 }));
        }

        [[nodiscard]] const SimulationConfig& config() const noexcept { return m_config; }
        [[nodiscard]] const ParticleStore& store() const noexcept { return m_store; }
        [[nodiscard]] ParticleStore& store() noexcept { return m_store; }
        [[nodiscard]] const IdleFlow& idle_flow() const noexcept { return m_idle; }
        [[nodiscard]] RandomSource& random() noexcept { return m_rng; }

    private:
        static SimulationConfig validated(SimulationConfig config)
        {
            config.validate();
            return config;
        }

        void seed_initial_particles()
        {
            const float margin_x = std::min(m_config.spawn.seed_margin, m_store.width() * 0.5f);
            const float margin_y = std::min(m_config.spawn.seed_margin, m_store.height() * 0.5f);
            const std::size_t count = std::min(m_config.initial_particles, m_store.capacity());

            for (std::size_t i = 0; i < count; ++i)
            {
                const float x = m_rng.uniform(margin_x, m_store.width() - margin_x);
                const float y = m_rng.uniform(margin_y, m_store.height() - margin_y);
                m_store.spawn(x, y, m_rng);
            }
            track_capacity();
        }

        void integrate(float dt)
        {
            const auto& physics = m_config.physics;
            const auto temperatures = m_store.temperatures();
            auto accelerations = m_store.accelerations();
            auto velocities = m_store.velocities();
            auto positions = m_store.positions();

            for (std::size_t i = 0; i < m_store.size(); ++i)
            {
                accelerations[i].y = physics.gravity * m_gravity_direction
                                     - physics.buoyancy * temperatures[i] * m_gravity_direction;
                velocities[i] += accelerations[i] * dt;
                velocities[i] *= physics.viscosity;
                positions[i] += velocities[i] * dt;
            }
        }

        // Post-boundary bookkeeping: clear forces, cool down, derive trail alpha.
        void settle()
        {
            const auto& physics = m_config.physics;
            auto accelerations = m_store.accelerations();
            auto temperatures = m_store.temperatures();
            auto trail_alpha = m_store.trail_alpha();
            const auto velocities = m_store.velocities();

            for (std::size_t i = 0; i < m_store.size(); ++i)
            {
                accelerations[i] = Vec2{};
                temperatures[i] = std::max(temperatures[i] * physics.cooling, physics.temperature_floor);
                trail_alpha[i] = std::clamp(length(velocities[i]) * physics.trail_speed_scale,
                                            physics.trail_alpha_min,
                                            physics.trail_alpha_max);
            }
        }

        void track_capacity()
        {
            if (m_store.full())
            {
                if (!m_capacity_warned)
                {
                    safe_io::warn("Particle store reached capacity ({})", m_store.capacity());
                    m_capacity_warned = true;
                }
            }
            else
            {
                m_capacity_warned = false;
            }
        }

        SimulationConfig m_config;
        RandomSource m_rng;
        ParticleStore m_store;
        SpatialHashGrid m_index;
        ForceField m_forces;
        MergeEngine m_merge;
        ColorDrift m_color;
        BubbleDynamics m_bubbles;
        Boundary m_boundary;
        IdleFlow m_idle;
        std::string m_palette_name;

        float m_gravity_direction{ 1.0f };
        std::uint64_t m_frame{ 0 };
        std::size_t m_merge_count{ 0 };
        bool m_capacity_warned{ false };
    };
} // namespace gestureflow
