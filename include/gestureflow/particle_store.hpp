#pragma once

#include "color.hpp"
#include "config.hpp"
#include "random_source.hpp"
#include "vec2.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace gestureflow
{
    using ParticleId = std::uint64_t;

    struct SpawnOptions
    {
        std::optional<Vec2> velocity{};
        std::optional<Hsv> color{};
        std::optional<float> size{};
    };

    // Read-only copy of the renderable columns, in store order.
    struct ParticleSnapshot
    {
        std::vector<Vec2> positions{};
        std::vector<Hsv> colors{};
        std::vector<float> sizes{};
        std::vector<float> trail_alpha{};
        std::vector<std::uint8_t> is_bubble{};
        std::vector<ParticleId> ids{};

        [[nodiscard]] std::size_t size() const noexcept { return positions.size(); }
        [[nodiscard]] bool empty() const noexcept { return positions.empty(); }
    };

    // Dense columnar particle table. Live particles always occupy [0, size());
    // removal swaps with the last row, so indices are not stable across a
    // removal. ParticleId follows its row and can be resolved with find().
    class ParticleStore
    {
    public:
        ParticleStore(std::size_t capacity,
                      float width,
                      float height,
                      StoreParameters store,
                      SpawnParameters spawn,
                      Palette palette)
            : m_capacity{ capacity },
              m_width{ width },
              m_height{ height },
              m_store{ store },
              m_spawn{ spawn },
              m_palette{ std::move(palette) }
        {
            m_positions.reserve(m_capacity);
            m_velocities.reserve(m_capacity);
            m_accelerations.reserve(m_capacity);
            m_colors.reserve(m_capacity);
            m_target_colors.reserve(m_capacity);
            m_sizes.reserve(m_capacity);
            m_masses.reserve(m_capacity);
            m_temperatures.reserve(m_capacity);
            m_trail_alpha.reserve(m_capacity);
            m_is_bubble.reserve(m_capacity);
            m_ids.reserve(m_capacity);
        }

        // Fails without touching the store when it is full.
        bool spawn(float x, float y, RandomSource& rng, const SpawnOptions& options = {})
        {
            if (full())
            {
                return false;
            }

            Vec2 velocity{};
            if (options.velocity)
            {
                velocity = *options.velocity;
            }
            else
            {
                velocity = Vec2{ rng.uniform(-m_spawn.drift_speed, m_spawn.drift_speed),
                                 rng.uniform(-m_spawn.drift_speed, m_spawn.drift_speed) };
            }

            Hsv color{};
            if (options.color)
            {
                color = *options.color;
                color.hue = wrap_hue(color.hue);
            }
            else
            {
                color = random_palette_color(rng, m_spawn.hue_jitter);
            }
            const Hsv target = random_palette_color(rng, m_spawn.hue_jitter);

            const float size = clamp_size(options.size ? *options.size : rng.uniform(m_spawn.size_min, m_spawn.size_max));
            const float temperature = rng.uniform(m_spawn.temperature_min, m_spawn.temperature_max);

            m_positions.push_back(Vec2{ x, y });
            m_velocities.push_back(velocity);
            m_accelerations.push_back(Vec2{});
            m_colors.push_back(color);
            m_target_colors.push_back(target);
            m_sizes.push_back(size);
            m_masses.push_back(size * m_store.mass_per_size);
            m_temperatures.push_back(temperature);
            m_trail_alpha.push_back(1.0f);
            m_is_bubble.push_back(0);
            m_ids.push_back(m_next_id++);
            return true;
        }

        // Gaussian scatter around (x, y); returns how many actually fit.
        std::size_t spawn_cluster(float x, float y, std::size_t count, float spread, RandomSource& rng)
        {
            std::size_t spawned = 0;
            for (std::size_t n = 0; n < count; ++n)
            {
                const float px = x + rng.gaussian(0.0f, spread);
                const float py = y + rng.gaussian(0.0f, spread);
                SpawnOptions options{};
                options.velocity = Vec2{ rng.uniform(-m_spawn.cluster_speed, m_spawn.cluster_speed),
                                         rng.uniform(-m_spawn.cluster_speed, m_spawn.cluster_speed) };
                if (spawn(px, py, rng, options))
                {
                    ++spawned;
                }
            }
            return spawned;
        }

        // Swap-with-last removal, highest index first so pending indices stay valid.
        // Duplicates and out-of-range indices are ignored.
        void remove(std::vector<std::size_t> indices)
        {
            std::sort(indices.begin(), indices.end(), std::greater<>{});
            indices.erase(std::unique(indices.begin(), indices.end()), indices.end());

            for (const auto index : indices)
            {
                if (index < size())
                {
                    swap_remove(index);
                }
            }
        }

        // Rescales live positions to the new world; a non-positive previous
        // dimension keeps that axis unscaled. Returns false for a non-positive
        // new size, which leaves the store untouched.
        bool resize(float new_width, float new_height)
        {
            if (!(new_width > 0.0f) || !(new_height > 0.0f))
            {
                return false;
            }

            const float scale_x = (m_width > 0.0f) ? new_width / m_width : 1.0f;
            const float scale_y = (m_height > 0.0f) ? new_height / m_height : 1.0f;

            for (auto& position : m_positions)
            {
                position.x *= scale_x;
                position.y *= scale_y;
            }

            m_width = new_width;
            m_height = new_height;
            return true;
        }

        void clear()
        {
            m_positions.clear();
            m_velocities.clear();
            m_accelerations.clear();
            m_colors.clear();
            m_target_colors.clear();
            m_sizes.clear();
            m_masses.clear();
            m_temperatures.clear();
            m_trail_alpha.clear();
            m_is_bubble.clear();
            m_ids.clear();
            m_next_id = 1;
        }

        // Re-targets every particle into the new palette; current colors are kept.
        void set_palette(Palette palette, RandomSource& rng)
        {
            m_palette = std::move(palette);
            for (auto& target : m_target_colors)
            {
                target = random_palette_color(rng, m_spawn.hue_jitter);
            }
        }

        [[nodiscard]] Hsv random_palette_color(RandomSource& rng, float hue_jitter) const
        {
            return jitter(m_palette.pick(rng), hue_jitter, m_spawn.tone_jitter, rng);
        }

        // Size is the only way to change mass; both stay within bounds.
        void set_size(std::size_t index, float size)
        {
            const float clamped = clamp_size(size);
            m_sizes[index] = clamped;
            m_masses[index] = clamped * m_store.mass_per_size;
        }

        void heat(std::size_t index, float amount)
        {
            m_temperatures[index] = std::min(m_temperatures[index] + amount, 1.0f);
        }

        void set_bubble(std::size_t index, bool bubble) { m_is_bubble[index] = bubble ? 1 : 0; }
        [[nodiscard]] bool is_bubble(std::size_t index) const { return m_is_bubble[index] != 0; }

        [[nodiscard]] std::optional<std::size_t> find(ParticleId id) const noexcept
        {
            const auto it = std::find(m_ids.begin(), m_ids.end(), id);
            if (it == m_ids.end())
            {
                return std::nullopt;
            }
            return static_cast<std::size_t>(std::distance(m_ids.begin(), it));
        }

        [[nodiscard]] ParticleSnapshot snapshot() const
        {
            ParticleSnapshot snap{};
            snap.positions = m_positions;
            snap.colors = m_colors;
            snap.sizes = m_sizes;
            snap.trail_alpha = m_trail_alpha;
            snap.is_bubble = m_is_bubble;
            snap.ids = m_ids;
            return snap;
        }

        [[nodiscard]] std::size_t size() const noexcept { return m_positions.size(); }
        [[nodiscard]] std::size_t capacity() const noexcept { return m_capacity; }
        [[nodiscard]] bool empty() const noexcept { return m_positions.empty(); }
        [[nodiscard]] bool full() const noexcept { return size() >= m_capacity; }

        [[nodiscard]] float width() const noexcept { return m_width; }
        [[nodiscard]] float height() const noexcept { return m_height; }
        [[nodiscard]] const StoreParameters& parameters() const noexcept { return m_store; }
        [[nodiscard]] const Palette& palette() const noexcept { return m_palette; }

        [[nodiscard]] std::span<Vec2> positions() noexcept { return m_positions; }
        [[nodiscard]] std::span<const Vec2> positions() const noexcept { return m_positions; }
        [[nodiscard]] std::span<Vec2> velocities() noexcept { return m_velocities; }
        [[nodiscard]] std::span<const Vec2> velocities() const noexcept { return m_velocities; }
        [[nodiscard]] std::span<Vec2> accelerations() noexcept { return m_accelerations; }
        [[nodiscard]] std::span<const Vec2> accelerations() const noexcept { return m_accelerations; }
        [[nodiscard]] std::span<Hsv> colors() noexcept { return m_colors; }
        [[nodiscard]] std::span<const Hsv> colors() const noexcept { return m_colors; }
        [[nodiscard]] std::span<Hsv> target_colors() noexcept { return m_target_colors; }
        [[nodiscard]] std::span<const Hsv> target_colors() const noexcept { return m_target_colors; }
        [[nodiscard]] std::span<float> temperatures() noexcept { return m_temperatures; }
        [[nodiscard]] std::span<const float> temperatures() const noexcept { return m_temperatures; }
        [[nodiscard]] std::span<float> trail_alpha() noexcept { return m_trail_alpha; }
        [[nodiscard]] std::span<const float> trail_alpha() const noexcept { return m_trail_alpha; }
        [[nodiscard]] std::span<const float> sizes() const noexcept { return m_sizes; }
        [[nodiscard]] std::span<const float> masses() const noexcept { return m_masses; }
        [[nodiscard]] std::span<const std::uint8_t> bubble_flags() const noexcept { return m_is_bubble; }
        [[nodiscard]] std::span<const ParticleId> ids() const noexcept { return m_ids; }

    private:
        [[nodiscard]] float clamp_size(float size) const noexcept
        {
            return std::clamp(size, m_store.min_particle_size, m_store.max_particle_size);
        }

        template <class T>
        static void swap_pop(std::vector<T>& column, std::size_t index)
        {
            if (index + 1 < column.size())
            {
                column[index] = column.back();
            }
            column.pop_back();
        }

        void swap_remove(std::size_t index)
        {
            swap_pop(m_positions, index);
            swap_pop(m_velocities, index);
            swap_pop(m_accelerations, index);
            swap_pop(m_colors, index);
            swap_pop(m_target_colors, index);
            swap_pop(m_sizes, index);
            swap_pop(m_masses, index);
            swap_pop(m_temperatures, index);
            swap_pop(m_trail_alpha, index);
            swap_pop(m_is_bubble, index);
            swap_pop(m_ids, index);
        }

        std::size_t m_capacity{ 0 };
        float m_width{ 0.0f };
        float m_height{ 0.0f };
        StoreParameters m_store{};
        SpawnParameters m_spawn{};
        Palette m_palette{};
        ParticleId m_next_id{ 1 };

        std::vector<Vec2> m_positions{};
        std::vector<Vec2> m_velocities{};
        std::vector<Vec2> m_accelerations{};
        std::vector<Hsv> m_colors{};
        std::vector<Hsv> m_target_colors{};
        std::vector<float> m_sizes{};
        std::vector<float> m_masses{};
        std::vector<float> m_temperatures{};
        std::vector<float> m_trail_alpha{};
        std::vector<std::uint8_t> m_is_bubble{};
        std::vector<ParticleId> m_ids{};
    };
} // namespace gestureflow
