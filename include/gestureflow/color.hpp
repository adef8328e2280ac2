#pragma once

#include "random_source.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gestureflow
{
    struct Hsv
    {
        float hue{ 0.0f }; // degrees, [0, 360)
        float sat{ 0.0f }; // [0, 1]
        float val{ 0.0f }; // [0, 1]

        friend bool operator==(const Hsv&, const Hsv&) = default;
    };

    struct Rgb
    {
        float r{ 0.0f };
        float g{ 0.0f };
        float b{ 0.0f };
    };

    [[nodiscard]] inline float wrap_hue(float hue) noexcept
    {
        float wrapped = std::fmod(hue, 360.0f);
        if (wrapped < 0.0f) wrapped += 360.0f;
        if (wrapped >= 360.0f) wrapped -= 360.0f;
        return wrapped;
    }

    // Signed hue step from -> to along the shorter arc of the color wheel.
    [[nodiscard]] inline float hue_delta(float from, float to) noexcept
    {
        float delta = to - from;
        if (delta > 180.0f) delta -= 360.0f;
        if (delta < -180.0f) delta += 360.0f;
        return delta;
    }

    // Hue moves by up to +-hue_jitter degrees, saturation and value are scaled
    // down by up to tone_jitter.
    [[nodiscard]] inline Hsv jitter(const Hsv& base, float hue_jitter, float tone_jitter, RandomSource& rng)
    {
        Hsv out{};
        out.hue = wrap_hue(base.hue + rng.uniform(-hue_jitter, hue_jitter));
        out.sat = std::clamp(base.sat * rng.uniform(1.0f - tone_jitter, 1.0f), 0.0f, 1.0f);
        out.val = std::clamp(base.val * rng.uniform(1.0f - tone_jitter, 1.0f), 0.0f, 1.0f);
        return out;
    }

    [[nodiscard]] inline Rgb to_rgb(const Hsv& color) noexcept
    {
        const float h = wrap_hue(color.hue) / 60.0f;
        const float s = std::clamp(color.sat, 0.0f, 1.0f);
        const float v = std::clamp(color.val, 0.0f, 1.0f);

        const float c = v * s;
        const float x = c * (1.0f - std::abs(std::fmod(h, 2.0f) - 1.0f));
        const float m = v - c;

        Rgb rgb{};
        switch (static_cast<int>(h))
        {
        case 0: rgb = { c, x, 0.0f }; break;
        case 1: rgb = { x, c, 0.0f }; break;
        case 2: rgb = { 0.0f, c, x }; break;
        case 3: rgb = { 0.0f, x, c }; break;
        case 4: rgb = { x, 0.0f, c }; break;
        default: rgb = { c, 0.0f, x }; break;
        }

        rgb.r += m;
        rgb.g += m;
        rgb.b += m;
        return rgb;
    }

    struct Palette
    {
        std::string name{};
        std::vector<Hsv> colors{};

        [[nodiscard]] bool empty() const noexcept { return colors.empty(); }

        [[nodiscard]] const Hsv& pick(RandomSource& rng) const
        {
            if (colors.empty())
            {
                throw std::logic_error("Cannot pick a color from an empty palette");
            }
            return colors[rng.pick(colors.size())];
        }
    };

    // Named palettes in a fixed order; the order drives next_after().
    class PaletteSet
    {
    public:
        PaletteSet() = default;

        explicit PaletteSet(std::vector<Palette> palettes)
            : m_palettes(std::move(palettes))
        {
        }

        static PaletteSet builtin()
        {
            return PaletteSet{ {
                { "default", { { 330.0f, 1.0f, 1.0f }, { 190.0f, 1.0f, 0.83f }, { 43.0f, 1.0f, 1.0f }, { 265.0f, 0.77f, 0.93f }, { 158.0f, 0.97f, 1.0f } } },
                { "sunset", { { 15.0f, 1.0f, 1.0f }, { 35.0f, 1.0f, 1.0f }, { 50.0f, 0.9f, 1.0f }, { 340.0f, 0.8f, 0.9f }, { 280.0f, 0.6f, 0.8f } } },
                { "ocean", { { 200.0f, 1.0f, 0.9f }, { 180.0f, 0.8f, 1.0f }, { 160.0f, 0.9f, 0.8f }, { 220.0f, 0.7f, 0.6f }, { 190.0f, 0.5f, 1.0f } } },
                { "aurora", { { 120.0f, 1.0f, 0.9f }, { 160.0f, 0.9f, 1.0f }, { 280.0f, 0.8f, 0.9f }, { 200.0f, 0.7f, 1.0f }, { 80.0f, 0.6f, 1.0f } } },
                { "monochrome", { { 0.0f, 0.0f, 1.0f }, { 0.0f, 0.0f, 0.8f }, { 0.0f, 0.0f, 0.6f }, { 0.0f, 0.0f, 0.9f }, { 0.0f, 0.0f, 0.7f } } },
            } };
        }

        [[nodiscard]] std::size_t size() const noexcept { return m_palettes.size(); }
        [[nodiscard]] bool empty() const noexcept { return m_palettes.empty(); }

        [[nodiscard]] const Palette* find(std::string_view name) const noexcept
        {
            const auto it = std::find_if(m_palettes.begin(), m_palettes.end(), [name](const Palette& palette) {
                return palette.name == name;
            });
            return (it == m_palettes.end()) ? nullptr : &(*it);
        }

        [[nodiscard]] std::vector<std::string> names() const
        {
            std::vector<std::string> out;
            out.reserve(m_palettes.size());
            for (const auto& palette : m_palettes)
            {
                out.push_back(palette.name);
            }
            return out;
        }

        // Cyclic successor; the first palette when name is unknown.
        [[nodiscard]] const Palette* next_after(std::string_view name) const noexcept
        {
            if (m_palettes.empty())
            {
                return nullptr;
            }

            for (std::size_t i = 0; i < m_palettes.size(); ++i)
            {
                if (m_palettes[i].name == name)
                {
                    return &m_palettes[(i + 1) % m_palettes.size()];
                }
            }
            return &m_palettes.front();
        }

        [[nodiscard]] const std::vector<Palette>& palettes() const noexcept { return m_palettes; }

    private:
        std::vector<Palette> m_palettes{};
    };
} // namespace gestureflow
