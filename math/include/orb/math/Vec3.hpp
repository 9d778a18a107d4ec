/**
 * @file Vec3.hpp
 * @brief 3-component vector template for listener and source geometry.
 *
 * Coordinates follow the audio-graph convention: +x to the listener's
 * right, +y up, -z forward.
 *
 * @tparam T Floating-point scalar type.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ORB_MATH_VEC3_HPP
    #define ORB_MATH_VEC3_HPP

    #include <concepts>

namespace orb::math {

template <std::floating_point T>
struct Vec3 final {
    T x{};
    T y{};
    T z{};

    constexpr Vec3() = default;
    constexpr Vec3(T x, T y, T z);

    [[nodiscard]] constexpr Vec3 operator+(Vec3 rhs) const;
    [[nodiscard]] constexpr Vec3 operator-(Vec3 rhs) const;
    [[nodiscard]] constexpr Vec3 operator*(T scalar)  const;
    [[nodiscard]] constexpr Vec3 operator-()          const;

    [[nodiscard]] constexpr bool operator==(const Vec3 &rhs) const = default;

    [[nodiscard]] constexpr T    dot(Vec3 rhs)      const;
    [[nodiscard]] constexpr Vec3 cross(Vec3 rhs)    const;
    [[nodiscard]] constexpr T    lengthSquared()    const;
    [[nodiscard]] T              length()           const;

    /** @brief Unit vector, or zero for a zero-length input. */
    [[nodiscard]] Vec3           normalize()        const;

    static constexpr Vec3 zero();
};

using Vec3f  = Vec3<float>;

} // namespace orb::math

    #include "Vec3.inl"

#endif // ORB_MATH_VEC3_HPP
