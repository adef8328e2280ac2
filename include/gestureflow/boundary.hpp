#pragma once

#include "config.hpp"
#include "particle_store.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace gestureflow
{
    // Soft walls `margin` inside each edge. A particle past a wall is clamped
    // onto it and its normal velocity is turned inbound and damped.
    class Boundary
    {
    public:
        Boundary() = default;

        explicit Boundary(BoundaryParameters parameters)
            : m_parameters{ parameters }
        {
        }

        // Returns the number of axis contacts (a corner hit counts twice).
        std::size_t apply(ParticleStore& store) const
        {
            const float margin_x = effective_margin(store.width());
            const float margin_y = effective_margin(store.height());
            const float max_x = store.width() - margin_x;
            const float max_y = store.height() - margin_y;
            const float bounce = m_parameters.bounce;

            auto positions = store.positions();
            auto velocities = store.velocities();
            std::size_t contacts = 0;

            for (std::size_t i = 0; i < store.size(); ++i)
            {
                Vec2& p = positions[i];
                Vec2& v = velocities[i];

                if (p.x < margin_x)
                {
                    p.x = margin_x;
                    v.x = std::abs(v.x) * bounce;
                    ++contacts;
                }
                else if (p.x > max_x)
                {
                    p.x = max_x;
                    v.x = -std::abs(v.x) * bounce;
                    ++contacts;
                }

                if (p.y < margin_y)
                {
                    p.y = margin_y;
                    v.y = std::abs(v.y) * bounce;
                    ++contacts;
                }
                else if (p.y > max_y)
                {
                    p.y = max_y;
                    v.y = -std::abs(v.y) * bounce;
                    ++contacts;
                }
            }

            return contacts;
        }

        // A world narrower than two margins collapses the walls onto its center line.
        [[nodiscard]] float effective_margin(float dimension) const noexcept
        {
            return std::min(m_parameters.margin, std::max(dimension, 0.0f) * 0.5f);
        }

        [[nodiscard]] const BoundaryParameters& parameters() const noexcept { return m_parameters; }

    private:
        BoundaryParameters m_parameters{};
    };
} // namespace gestureflow
