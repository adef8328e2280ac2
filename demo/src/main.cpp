// Headless scripted session that drives the particle core through gesture commands
#include <gestureflow/gestureflow.hpp>
#include <safe_io/utils.hpp>

#include <cmath>
#include <cstddef>
#include <exception>
#include <iterator>
#include <vector>

namespace
{
    using gestureflow::Command;
    using gestureflow::Gesture;
    using gestureflow::HandSample;
    using gestureflow::Simulation;
    using gestureflow::SimulationConfig;

    // A scripted hand that orbits the screen center and changes gesture
    // every few dozen frames.
    std::vector<HandSample> script_hands(std::size_t frame, float width, float height)
    {
        constexpr Gesture sequence[] = {
            Gesture::OpenPalm,
            Gesture::Fist,
            Gesture::Pinch,
            Gesture::OpenPalm,
            Gesture::Wave,
            Gesture::Spread,
            Gesture::PalmUp,
            Gesture::PalmDown,
        };
        constexpr std::size_t phase_length = 40;

        const std::size_t phase = (frame / phase_length) % std::size(sequence);
        const float t = static_cast<float>(frame) * 0.02f;

        HandSample hand{};
        hand.palm = { width * 0.5f + std::cos(t) * width * 0.2f, height * 0.5f + std::sin(t) * height * 0.2f };
        hand.velocity = { -std::sin(t) * width * 0.2f * 0.02f * 60.0f, std::cos(t) * height * 0.2f * 0.02f * 60.0f };
        hand.gesture = sequence[phase];
        // Pinch spawns a cluster every frame it is held; thin it out.
        if (hand.gesture == Gesture::Pinch && frame % 10 != 0)
        {
            hand.gesture = Gesture::None;
        }
        hand.rotation = (phase % 3 == 0) ? 0.15f : 0.0f;

        std::vector<HandSample> hands{ hand };
        if (phase == 3)
        {
            HandSample second = hand;
            second.palm = { width - hand.palm.x, height - hand.palm.y };
            second.gesture = Gesture::None;
            second.rotation = 0.0f;
            hands.push_back(second);
        }
        return hands;
    }

    void run_demo()
    {
        SimulationConfig config{};
        config.width = 1280.0f;
        config.height = 720.0f;
        config.max_particles = 1200;
        config.initial_particles = 400;
        config.verbose = true;

        Simulation simulation{ config };

        const std::size_t total_frames = 360;
        std::size_t total_merges = 0;
        std::size_t total_spawned = 0;

        for (std::size_t frame = 0; frame < total_frames; ++frame)
        {
            const auto hands = script_hands(frame, simulation.width(), simulation.height());
            for (const Command& command : gestureflow::bind_hands(hands))
            {
                const auto feedback = gestureflow::dispatch(simulation, command);
                total_spawned += feedback.spawned;
            }

            if (frame == 180)
            {
                gestureflow::dispatch(simulation, gestureflow::commands::NextPalette{});
            }
            if (frame == 240)
            {
                gestureflow::dispatch(simulation, gestureflow::commands::SetIdle{ true });
            }

            const auto stats = simulation.update(1.0f);
            total_merges += stats.merges;

            if (frame % 30 == 0)
            {
                safe_io::print(
                    "frame {:>3}  particles={} merges={} bubbles={} contacts={} palette={} gravity={:+.0f}  {:.3f} ms",
                    stats.frame,
                    stats.particle_count,
                    stats.merges,
                    simulation.bubble_count(),
                    stats.boundary_contacts,
                    simulation.palette_name(),
                    simulation.gravity_direction(),
                    stats.total_seconds() * 1000.0);
            }
        }

        safe_io::print("Demo completed after {} frames: {} merges, {} particles spawned by gestures, {} alive.",
                       total_frames,
                       total_merges,
                       total_spawned,
                       simulation.size());
    }
} // namespace

int main()
{
    safe_io::configure_level_from_env();
    try
    {
        run_demo();
    }
    catch (const std::exception& ex)
    {
        safe_io::eprint("gestureflow_demo failed: {}", ex.what());
        return 1;
    }
    return 0;
}
