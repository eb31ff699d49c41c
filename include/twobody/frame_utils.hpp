#pragma once

#include "twobody/types.hpp"

#include <cmath>
#include <numbers>

namespace twobody
{

    /// @brief Wrap an angle into [0, 2pi). Non-finite input maps to 0.
    template<class T>
    inline T wrap_angle_0_2pi(const T rad)
    {
        if (!std::isfinite(rad))
        {
            return T(0);
        }
        const T two_pi = T(2) * std::numbers::pi_v<T>;
        T x = std::fmod(rad, two_pi);
        if (x < T(0))
        {
            x += two_pi;
        }
        // A tiny negative remainder plus 2pi can round to exactly 2pi.
        if (x >= two_pi)
        {
            x = T(0);
        }
        return x;
    }

    template<class T>
    inline Vec3T<T> normalized_or(const Vec3T<T> &v, const Vec3T<T> &fallback_unit)
    {
        const T len2 = glm::dot(v, v);
        if (!(len2 > T(0)) || !std::isfinite(len2))
        {
            return fallback_unit;
        }
        return v / std::sqrt(len2);
    }

    template<class T>
    inline bool is_finite_vec(const Vec3T<T> &v)
    {
        return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
    }

    template<class T>
    inline bool is_nan_vec(const Vec3T<T> &v)
    {
        return std::isnan(v.x) && std::isnan(v.y) && std::isnan(v.z);
    }

    template<class T>
    inline bool has_nan_component(const Vec3T<T> &v)
    {
        return std::isnan(v.x) || std::isnan(v.y) || std::isnan(v.z);
    }

    /**
     * @brief Rotate vector about a unit axis by an angle (Rodrigues' rotation formula).
     *
     * @param v Vector to rotate.
     * @param axis_unit Rotation axis (must be unit length).
     * @param angle_rad Right-hand rotation angle about `axis_unit`.
     */
    template<class T>
    inline Vec3T<T> rotate_about_axis(const Vec3T<T> &v, const Vec3T<T> &axis_unit, const T angle_rad)
    {
        const T c = std::cos(angle_rad);
        const T s = std::sin(angle_rad);
        return v * c + glm::cross(axis_unit, v) * s + axis_unit * (glm::dot(axis_unit, v) * (T(1) - c));
    }

} // namespace twobody
