#pragma once

#include "simulation.hpp"
#include "vec2.hpp"

#include <cmath>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace gestureflow
{
    namespace commands
    {
        struct Attract
        {
            float x{ 0.0f };
            float y{ 0.0f };
            float radius{ 200.0f };
            float strength{ 0.8f };
        };

        struct Repel
        {
            float x{ 0.0f };
            float y{ 0.0f };
            float radius{ 250.0f };
            float strength{ 1.2f };
        };

        struct Explode
        {
            float x{ 0.0f };
            float y{ 0.0f };
            float radius{ 300.0f };
            float strength{ 3.0f };
        };

        struct Vortex
        {
            float x{ 0.0f };
            float y{ 0.0f };
            float radius{ 180.0f };
            float strength{ 0.0f };
        };

        struct Flow
        {
            float dx{ 0.0f };
            float dy{ 0.0f };
            float strength{ 0.5f };
        };

        struct PairAttract
        {
            float x1{ 0.0f };
            float y1{ 0.0f };
            float x2{ 0.0f };
            float y2{ 0.0f };
            float radius{ 0.0f };
            float strength{ 1.5f };
        };

        struct Spawn
        {
            float x{ 0.0f };
            float y{ 0.0f };
            SpawnOptions options{};
        };

        struct SpawnCluster
        {
            float x{ 0.0f };
            float y{ 0.0f };
            std::size_t count{ 15 };
            float spread{ 20.0f };
        };

        struct Resize
        {
            float width{ 0.0f };
            float height{ 0.0f };
        };

        struct SetGravity
        {
            float direction{ 1.0f };
        };

        struct SetPalette
        {
            std::string name{};
        };

        struct NextPalette
        {
        };

        struct SetIdle
        {
            bool enabled{ true };
        };

        struct Reset
        {
        };
    } // namespace commands

    using Command = std::variant<commands::Attract,
                                 commands::Repel,
                                 commands::Explode,
                                 commands::Vortex,
                                 commands::Flow,
                                 commands::PairAttract,
                                 commands::Spawn,
                                 commands::SpawnCluster,
                                 commands::Resize,
                                 commands::SetGravity,
                                 commands::SetPalette,
                                 commands::NextPalette,
                                 commands::SetIdle,
                                 commands::Reset>;

    // What a command did, for audio and HUD feedback.
    struct InteractionFeedback
    {
        std::size_t affected{ 0 };
        std::size_t touching{ 0 };
        std::size_t spawned{ 0 };
        bool accepted{ false };
    };

    namespace detail
    {
        struct CommandDispatcher
        {
            Simulation& simulation;

            InteractionFeedback operator()(const commands::Attract& c) const
            {
                return from_force(simulation.apply_force(c.x, c.y, c.radius, c.strength, false));
            }

            InteractionFeedback operator()(const commands::Repel& c) const
            {
                return from_force(simulation.apply_force(c.x, c.y, c.radius, c.strength, true));
            }

            InteractionFeedback operator()(const commands::Explode& c) const
            {
                return from_force(simulation.explode(c.x, c.y, c.radius, c.strength));
            }

            InteractionFeedback operator()(const commands::Vortex& c) const
            {
                return InteractionFeedback{ simulation.apply_vortex(c.x, c.y, c.radius, c.strength), 0, 0, true };
            }

            InteractionFeedback operator()(const commands::Flow& c) const
            {
                return InteractionFeedback{ simulation.apply_directional_flow(c.dx, c.dy, c.strength), 0, 0, true };
            }

            InteractionFeedback operator()(const commands::PairAttract& c) const
            {
                return InteractionFeedback{ simulation.attract_between_points(c.x1, c.y1, c.x2, c.y2, c.radius, c.strength), 0, 0, true };
            }

            InteractionFeedback operator()(const commands::Spawn& c) const
            {
                const bool spawned = simulation.spawn(c.x, c.y, c.options);
                return InteractionFeedback{ 0, 0, spawned ? std::size_t{ 1 } : std::size_t{ 0 }, spawned };
            }

            InteractionFeedback operator()(const commands::SpawnCluster& c) const
            {
                const std::size_t spawned = simulation.spawn_cluster(c.x, c.y, c.count, c.spread);
                return InteractionFeedback{ 0, 0, spawned, spawned > 0 };
            }

            InteractionFeedback operator()(const commands::Resize& c) const
            {
                return InteractionFeedback{ 0, 0, 0, simulation.resize(c.width, c.height) };
            }

            InteractionFeedback operator()(const commands::SetGravity& c) const
            {
                simulation.set_gravity_direction(c.direction);
                return InteractionFeedback{ 0, 0, 0, true };
            }

            InteractionFeedback operator()(const commands::SetPalette& c) const
            {
                return InteractionFeedback{ 0, 0, 0, simulation.set_palette(c.name) };
            }

            InteractionFeedback operator()(const commands::NextPalette&) const
            {
                simulation.next_palette();
                return InteractionFeedback{ 0, 0, 0, true };
            }

            InteractionFeedback operator()(const commands::SetIdle& c) const
            {
                simulation.set_idle_mode(c.enabled);
                return InteractionFeedback{ 0, 0, 0, true };
            }

            InteractionFeedback operator()(const commands::Reset&) const
            {
                simulation.reset();
                return InteractionFeedback{ 0, 0, simulation.size(), true };
            }

            static InteractionFeedback from_force(const ForceResult& result)
            {
                return InteractionFeedback{ result.affected, result.touching, 0, true };
            }
        };

        struct CommandNamer
        {
            std::string_view operator()(const commands::Attract&) const noexcept { return "Attract"; }
            std::string_view operator()(const commands::Repel&) const noexcept { return "Repel"; }
            std::string_view operator()(const commands::Explode&) const noexcept { return "Explode"; }
            std::string_view operator()(const commands::Vortex&) const noexcept { return "Vortex"; }
            std::string_view operator()(const commands::Flow&) const noexcept { return "Flow"; }
            std::string_view operator()(const commands::PairAttract&) const noexcept { return "PairAttract"; }
            std::string_view operator()(const commands::Spawn&) const noexcept { return "Spawn"; }
            std::string_view operator()(const commands::SpawnCluster&) const noexcept { return "SpawnCluster"; }
            std::string_view operator()(const commands::Resize&) const noexcept { return "Resize"; }
            std::string_view operator()(const commands::SetGravity&) const noexcept { return "SetGravity"; }
            std::string_view operator()(const commands::SetPalette&) const noexcept { return "SetPalette"; }
            std::string_view operator()(const commands::NextPalette&) const noexcept { return "NextPalette"; }
            std::string_view operator()(const commands::SetIdle&) const noexcept { return "SetIdle"; }
            std::string_view operator()(const commands::Reset&) const noexcept { return "Reset"; }
        };
    } // namespace detail

    // Single entry point from the input layer into the simulation.
    inline InteractionFeedback dispatch(Simulation& simulation, const Command& command)
    {
        return std::visit(detail::CommandDispatcher{ simulation }, command);
    }

    [[nodiscard]] inline std::string_view command_name(const Command& command) noexcept
    {
        return std::visit(detail::CommandNamer{}, command);
    }

    enum class Gesture
    {
        None,
        OpenPalm,
        Fist,
        Pinch,
        Spread,
        Wave,
        PalmUp,
        PalmDown
    };

    [[nodiscard]] inline std::string_view to_string(Gesture gesture) noexcept
    {
        switch (gesture)
        {
        case Gesture::None:
            return "none";
        case Gesture::OpenPalm:
            return "open_palm";
        case Gesture::Fist:
            return "fist";
        case Gesture::Pinch:
            return "pinch";
        case Gesture::Spread:
            return "spread";
        case Gesture::Wave:
            return "wave";
        case Gesture::PalmUp:
            return "palm_up";
        case Gesture::PalmDown:
            return "palm_down";
        }
        return "unknown";
    }

    // One tracked hand as reported by the gesture layer, in world coordinates.
    struct HandSample
    {
        Vec2 palm{};
        Vec2 velocity{};
        // Frame-to-frame palm rotation in radians.
        float rotation{ 0.0f };
        Gesture gesture{ Gesture::None };
        bool active{ true };
    };

    struct BindingParameters
    {
        float wave_scale{ 0.1f };
        float rotation_threshold{ 0.1f };
        float rotation_gain{ 2.0f };
        float pair_radius_scale{ 0.8f };
        // Two active hands closer than this gather particles between them.
        float pair_distance{ 400.0f };
    };

    [[nodiscard]] inline std::optional<Command> bind_gesture(Gesture gesture, const HandSample& hand, const BindingParameters& parameters = {})
    {
        const float x = hand.palm.x;
        const float y = hand.palm.y;

        switch (gesture)
        {
        case Gesture::OpenPalm:
            return commands::Attract{ x, y, 200.0f, 0.8f };
        case Gesture::Fist:
            return commands::Repel{ x, y, 250.0f, 1.2f };
        case Gesture::Pinch:
            return commands::SpawnCluster{ x, y, 15, 20.0f };
        case Gesture::Spread:
            return commands::Explode{ x, y, 300.0f, 3.0f };
        case Gesture::Wave:
            return commands::Flow{ hand.velocity.x * parameters.wave_scale, hand.velocity.y * parameters.wave_scale, 0.5f };
        case Gesture::PalmUp:
            return commands::SetGravity{ -1.0f };
        case Gesture::PalmDown:
            return commands::SetGravity{ 1.0f };
        case Gesture::None:
            break;
        }
        return std::nullopt;
    }

    [[nodiscard]] inline std::optional<Command> rotation_vortex(const HandSample& hand, const BindingParameters& parameters = {})
    {
        if (std::abs(hand.rotation) <= parameters.rotation_threshold)
        {
            return std::nullopt;
        }
        return commands::Vortex{ hand.palm.x, hand.palm.y, 180.0f, hand.rotation * parameters.rotation_gain };
    }

    [[nodiscard]] inline Command bind_two_hands(const HandSample& first, const HandSample& second, const BindingParameters& parameters = {})
    {
        const float distance = length(second.palm - first.palm);
        return commands::PairAttract{ first.palm.x, first.palm.y, second.palm.x, second.palm.y, distance * parameters.pair_radius_scale, 1.5f };
    }

    // Commands for one frame of tracked hands: the two-hand gather first,
    // then each active hand's gesture followed by its rotation vortex.
    [[nodiscard]] inline std::vector<Command> bind_hands(std::span<const HandSample> hands, const BindingParameters& parameters = {})
    {
        std::vector<Command> out;

        if (hands.size() >= 2 && hands[0].active && hands[1].active &&
            length(hands[1].palm - hands[0].palm) < parameters.pair_distance)
        {
            out.push_back(bind_two_hands(hands[0], hands[1], parameters));
        }

        for (const auto& hand : hands)
        {
            if (!hand.active)
            {
                continue;
            }
            if (auto command = bind_gesture(hand.gesture, hand, parameters))
            {
                out.push_back(std::move(*command));
            }
            if (auto command = rotation_vortex(hand, parameters))
            {
                out.push_back(std::move(*command));
            }
        }

        return out;
    }

    // Pointer fallback for running without a camera.
    struct PointerState
    {
        Vec2 position{};
        Vec2 previous{};
        bool left{ false };
        bool middle{ false };
        bool right{ false };
        bool rotate_ccw{ false };
        bool rotate_cw{ false };
    };

    struct PointerBindingParameters
    {
        float wave_speed{ 20.0f };
        float rotation_step{ 0.15f };
    };

    // Maps buttons and pointer speed onto a hand: both buttons spread, middle
    // pinches, right is a fist, left an open palm, a fast move waves. Returns
    // nothing while the pointer is idle with no button or rotation key held.
    [[nodiscard]] inline std::optional<HandSample> hand_from_pointer(const PointerState& pointer, const PointerBindingParameters& parameters = {})
    {
        HandSample hand{};
        hand.palm = pointer.position;
        hand.velocity = pointer.position - pointer.previous;

        if (pointer.left && pointer.right)
        {
            hand.gesture = Gesture::Spread;
        }
        else if (pointer.middle)
        {
            hand.gesture = Gesture::Pinch;
        }
        else if (pointer.right)
        {
            hand.gesture = Gesture::Fist;
        }
        else if (pointer.left)
        {
            hand.gesture = Gesture::OpenPalm;
        }
        else if (length(hand.velocity) > parameters.wave_speed)
        {
            hand.gesture = Gesture::Wave;
        }

        if (pointer.rotate_ccw)
        {
            hand.rotation = parameters.rotation_step;
        }
        else if (pointer.rotate_cw)
        {
            hand.rotation = -parameters.rotation_step;
        }

        const bool any_button = pointer.left || pointer.middle || pointer.right;
        if (hand.gesture == Gesture::None && !any_button && hand.rotation == 0.0f)
        {
            return std::nullopt;
        }
        return hand;
    }
} // namespace gestureflow
