#pragma once

#include <twobody/twobody.hpp>

#include <algorithm>
#include <cmath>
#include <numbers>

inline bool near_abs(const double a, const double b, const double abs_tol) { return std::abs(a - b) <= abs_tol; }

inline bool near_rel(const double a, const double b, const double rel_tol, const double abs_floor = 0.0)
{
    const double scale = std::max(abs_floor, std::max(std::abs(a), std::abs(b)));
    return std::abs(a - b) <= rel_tol * scale;
}

inline bool near_vec_abs(const twobody::Vec3 &a, const twobody::Vec3 &b, const double abs_tol)
{
    return near_abs(a.x, b.x, abs_tol) && near_abs(a.y, b.y, abs_tol) && near_abs(a.z, b.z, abs_tol);
}

/// Component-wise closeness relative to the larger vector magnitude.
inline bool near_vec_rel(const twobody::Vec3 &a, const twobody::Vec3 &b, const double rel_tol)
{
    const double scale = std::max(glm::length(a), glm::length(b));
    return near_vec_abs(a, b, rel_tol * scale);
}

/// Smallest signed difference between two angles, in [-pi, pi].
inline double angle_diff(const double a, const double b)
{
    return std::remainder(a - b, 2.0 * std::numbers::pi);
}

inline bool near_angle(const double a, const double b, const double abs_tol)
{
    return std::abs(angle_diff(a, b)) <= abs_tol;
}
