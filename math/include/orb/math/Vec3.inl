/**
 * @file Vec3.inl
 * @brief Inline implementation of Vec3 operations.
 * @see   Vec3.hpp
 */

#ifndef ORB_MATH_VEC3_INL
    #define ORB_MATH_VEC3_INL

#include <cmath>

namespace orb::math {

template <std::floating_point T>
constexpr Vec3<T>::Vec3(T x_, T y_, T z_) : x(x_), y(y_), z(z_) {}

template <std::floating_point T>
constexpr Vec3<T> Vec3<T>::operator+(Vec3 rhs) const { return {x + rhs.x, y + rhs.y, z + rhs.z}; }

template <std::floating_point T>
constexpr Vec3<T> Vec3<T>::operator-(Vec3 rhs) const { return {x - rhs.x, y - rhs.y, z - rhs.z}; }

template <std::floating_point T>
constexpr Vec3<T> Vec3<T>::operator*(T s) const { return {x * s, y * s, z * s}; }

template <std::floating_point T>
constexpr Vec3<T> Vec3<T>::operator-() const { return {-x, -y, -z}; }

template <std::floating_point T>
constexpr T Vec3<T>::dot(Vec3 rhs) const { return x * rhs.x + y * rhs.y + z * rhs.z; }

template <std::floating_point T>
constexpr Vec3<T> Vec3<T>::cross(Vec3 rhs) const
{
    return {
        y * rhs.z - z * rhs.y,
        z * rhs.x - x * rhs.z,
        x * rhs.y - y * rhs.x
    };
}

template <std::floating_point T>
constexpr T Vec3<T>::lengthSquared() const { return dot(*this); }

template <std::floating_point T>
T Vec3<T>::length() const { return static_cast<T>(std::sqrt(lengthSquared())); }

template <std::floating_point T>
Vec3<T> Vec3<T>::normalize() const
{
    const T len = length();
    if (len <= T{})
        return zero();
    return *this * (T(1) / len);
}

template <std::floating_point T>
constexpr Vec3<T> Vec3<T>::zero() { return {T{}, T{}, T{}}; }

} // namespace orb::math

#endif // ORB_MATH_VEC3_INL
