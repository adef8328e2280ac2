#pragma once

#include "color.hpp"
#include "config.hpp"
#include "particle_store.hpp"
#include "random_source.hpp"

#include <cmath>
#include <cstddef>

namespace gestureflow
{
    // Moves every current color a fixed fraction toward its target, hue along
    // the shorter arc. Targets that have been reached are redrawn from the
    // active palette so the drift never settles.
    class ColorDrift
    {
    public:
        ColorDrift() = default;

        explicit ColorDrift(ColorParameters parameters)
            : m_parameters{ parameters }
        {
        }

        // Returns the number of particles that received a new target.
        std::size_t update(ParticleStore& store, RandomSource& rng) const
        {
            auto colors = store.colors();
            auto targets = store.target_colors();
            const float fraction = m_parameters.step_fraction();
            std::size_t retargeted = 0;

            for (std::size_t i = 0; i < store.size(); ++i)
            {
                Hsv& current = colors[i];
                const Hsv& target = targets[i];

                const float delta = hue_delta(current.hue, target.hue);
                current.hue = wrap_hue(current.hue + delta * fraction);
                current.sat += (target.sat - current.sat) * fraction;
                current.val += (target.val - current.val) * fraction;

                if (std::abs(delta) < m_parameters.retarget_threshold)
                {
                    targets[i] = store.random_palette_color(rng, m_parameters.retarget_hue_jitter);
                    ++retargeted;
                }
            }

            return retargeted;
        }

        [[nodiscard]] const ColorParameters& parameters() const noexcept { return m_parameters; }

    private:
        ColorParameters m_parameters{};
    };
} // namespace gestureflow
