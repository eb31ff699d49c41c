#pragma once

#include <numbers>

namespace twobody
{

    // All quantities are stored in SI units: m, m/s, m^3/s^2, kg, rad, s.
    // Names carry the unit as a suffix (`_m`, `_mps`, `_m3_s2`, `_kg`, `_rad`, `_s`).
    // The helpers below convert user-facing units into storage units and back.

    /// @brief Convert seconds to seconds (identity, for consistency).
    inline constexpr double seconds(const double s) { return s; }

    /// @brief Convert minutes to seconds.
    inline constexpr double minutes(const double m) { return m * 60.0; }

    /// @brief Convert hours to seconds.
    inline constexpr double hours(const double h) { return h * 3600.0; }

    /// @brief Convert days to seconds.
    inline constexpr double days(const double d) { return d * 86400.0; }

    /// @brief Convert kilometers to meters.
    inline constexpr double kilometers(const double km) { return km * 1.0e3; }

    /// @brief Convert km/s to m/s.
    inline constexpr double km_per_s(const double kmps) { return kmps * 1.0e3; }

    /// @brief Convert km^3/s^2 to m^3/s^2.
    inline constexpr double km3_per_s2(const double km3_s2) { return km3_s2 * 1.0e9; }

    /// @brief Convert degrees to radians.
    inline constexpr double degrees(const double deg) { return deg * (std::numbers::pi / 180.0); }

    inline constexpr double to_kilometers(const double m) { return m * 1.0e-3; }
    inline constexpr double to_km_per_s(const double mps) { return mps * 1.0e-3; }
    inline constexpr double to_km3_per_s2(const double m3_s2) { return m3_s2 * 1.0e-9; }
    inline constexpr double to_degrees(const double rad) { return rad * (180.0 / std::numbers::pi); }

} // namespace twobody
