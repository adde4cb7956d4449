#pragma once

/// @file math_types.hpp
/// @brief Lightweight 2D vector used for positions and knockback.

#include <cmath>

namespace cdp::combat {

/// Two-component floating-point vector.
struct Vector2 {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Vector2() = default;
    constexpr Vector2(float x, float y) : x(x), y(y) {}

    constexpr Vector2 operator+(const Vector2& rhs) const noexcept {
        return {x + rhs.x, y + rhs.y};
    }
    constexpr Vector2 operator-(const Vector2& rhs) const noexcept {
        return {x - rhs.x, y - rhs.y};
    }
    constexpr Vector2 operator*(float scalar) const noexcept {
        return {x * scalar, y * scalar};
    }

    constexpr Vector2& operator+=(const Vector2& rhs) noexcept {
        x += rhs.x;
        y += rhs.y;
        return *this;
    }

    [[nodiscard]] constexpr float Dot(const Vector2& rhs) const noexcept {
        return x * rhs.x + y * rhs.y;
    }

    [[nodiscard]] constexpr float LengthSquared() const noexcept { return Dot(*this); }

    [[nodiscard]] float Length() const noexcept { return std::sqrt(LengthSquared()); }

    constexpr bool operator==(const Vector2&) const = default;
};

}  // namespace cdp::combat
