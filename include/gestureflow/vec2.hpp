#pragma once

#include <cmath>

namespace gestureflow
{
    struct Vec2
    {
        float x{ 0.0f };
        float y{ 0.0f };

        Vec2& operator+=(const Vec2& other) noexcept { x += other.x; y += other.y; return *this; }
        Vec2& operator-=(const Vec2& other) noexcept { x -= other.x; y -= other.y; return *this; }
        Vec2& operator*=(float s) noexcept { x *= s; y *= s; return *this; }

        friend bool operator==(const Vec2&, const Vec2&) = default;
    };

    [[nodiscard]] inline Vec2 operator+(Vec2 a, const Vec2& b) noexcept { a += b; return a; }
    [[nodiscard]] inline Vec2 operator-(Vec2 a, const Vec2& b) noexcept { a -= b; return a; }
    [[nodiscard]] inline Vec2 operator*(Vec2 a, float s) noexcept { a *= s; return a; }
    [[nodiscard]] inline Vec2 operator*(float s, Vec2 b) noexcept { b *= s; return b; }

    [[nodiscard]] inline float dot(const Vec2& a, const Vec2& b) noexcept { return a.x * b.x + a.y * b.y; }
    [[nodiscard]] inline float length_squared(const Vec2& v) noexcept { return dot(v, v); }
    [[nodiscard]] inline float length(const Vec2& v) noexcept { return std::sqrt(length_squared(v)); }

    // Rotates by +90 degrees in screen space.
    [[nodiscard]] inline Vec2 perpendicular(const Vec2& v) noexcept { return { -v.y, v.x }; }

    [[nodiscard]] inline Vec2 normalise(const Vec2& v) noexcept
    {
        const float len = length(v);
        if (len <= 0.0f) return {};
        return { v.x / len, v.y / len };
    }
} // namespace gestureflow
