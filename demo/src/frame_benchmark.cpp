#include <gestureflow/gestureflow.hpp>

#include <safe_io/utils.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <exception>
#include <limits>
#include <vector>

namespace
{
    using gestureflow::ParticleSnapshot;
    using gestureflow::Simulation;
    using gestureflow::SimulationConfig;

    // Soft real-time budget for one frame at the largest particle count.
    constexpr double frame_budget_ms = 33.0;

    SimulationConfig build_config(std::size_t particles)
    {
        SimulationConfig config{};
        config.max_particles = particles;
        config.initial_particles = particles;
        config.seed = 1234u;
        return config;
    }

    // Same interaction script for every run so seeded runs stay comparable.
    void drive(Simulation& simulation, std::size_t frame)
    {
        const float cx = simulation.width() * 0.5f;
        const float cy = simulation.height() * 0.5f;
        switch ((frame / 20) % 4)
        {
        case 0:
            simulation.apply_force(cx, cy, 200.0f, 0.8f, false);
            break;
        case 1:
            simulation.apply_vortex(cx, cy, 180.0f, 0.3f);
            break;
        case 2:
            simulation.apply_force(cx, cy, 250.0f, 1.2f, true);
            break;
        default:
            simulation.apply_directional_flow(1.0f, 0.2f, 0.5f);
            break;
        }
    }

    struct TimingSummary
    {
        ParticleSnapshot snapshot{};
        double average_ms{ 0.0 };
        double worst_ms{ 0.0 };
        double merge_ms{ 0.0 };
        std::size_t merges{ 0 };
    };

    TimingSummary run_frames(std::size_t particles, std::size_t frames)
    {
        Simulation simulation{ build_config(particles) };

        TimingSummary summary{};
        double total_ms = 0.0;

        for (std::size_t frame = 0; frame < frames; ++frame)
        {
            drive(simulation, frame);

            const auto start = std::chrono::steady_clock::now();
            const auto stats = simulation.update(1.0f);
            const auto end = std::chrono::steady_clock::now();

            const double elapsed_ms = std::chrono::duration<double, std::milli>(end - start).count();
            total_ms += elapsed_ms;
            summary.worst_ms = std::max(summary.worst_ms, elapsed_ms);
            summary.merge_ms += stats.merge_seconds * 1000.0;
            summary.merges += stats.merges;
        }

        summary.snapshot = simulation.snapshot();
        summary.average_ms = frames > 0 ? total_ms / static_cast<double>(frames) : 0.0;
        return summary;
    }

    double max_difference(const ParticleSnapshot& lhs, const ParticleSnapshot& rhs)
    {
        if (lhs.size() != rhs.size() || lhs.ids != rhs.ids)
        {
            return std::numeric_limits<double>::infinity();
        }

        double diff = 0.0;
        for (std::size_t i = 0; i < lhs.size(); ++i)
        {
            diff = std::max(diff, static_cast<double>(std::abs(lhs.positions[i].x - rhs.positions[i].x)));
            diff = std::max(diff, static_cast<double>(std::abs(lhs.positions[i].y - rhs.positions[i].y)));
            diff = std::max(diff, static_cast<double>(std::abs(lhs.sizes[i] - rhs.sizes[i])));
            diff = std::max(diff, static_cast<double>(std::abs(lhs.colors[i].hue - rhs.colors[i].hue)));
        }
        return diff;
    }
}

int main()
{
    safe_io::set_level(safe_io::Level::Warn);
    safe_io::configure_level_from_env();

    constexpr std::array<std::size_t, 3> particle_counts{ 250, 750, 1500 };
    constexpr std::size_t frames = 240;

    try
    {
        TimingSummary largest{};
        for (const auto particles : particle_counts)
        {
            largest = run_frames(particles, frames);
            safe_io::print(
                " {:>5} particles: average {:.3f} ms | worst {:.3f} ms | merge {:.3f} ms total | {} merges | {} alive",
                particles,
                largest.average_ms,
                largest.worst_ms,
                largest.merge_ms,
                largest.merges,
                largest.snapshot.size());
        }

        const auto replay = run_frames(particle_counts.back(), frames);
        const double diff = max_difference(largest.snapshot, replay.snapshot);
        if (diff != 0.0)
        {
            safe_io::print("Seeded runs diverged (max difference {:.3e}).", diff);
            return 1;
        }

        if (largest.average_ms > frame_budget_ms)
        {
            safe_io::print(
                "Average frame cost {:.3f} ms exceeds the {:.1f} ms budget.",
                largest.average_ms,
                frame_budget_ms);
            return 1;
        }

        safe_io::print("Seeded runs are identical. Average frame at {} particles: {:.3f} ms",
                       particle_counts.back(),
                       largest.average_ms);
    }
    catch (const std::exception& ex)
    {
        safe_io::eprint("gestureflow_benchmark failed: {}", ex.what());
        return 1;
    }

    return 0;
}
