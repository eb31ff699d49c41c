#pragma once

#include "twobody/celestial_body.hpp"
#include "twobody/orbit.hpp"
#include "twobody/types.hpp"

#include <cmath>

namespace twobody
{

    /// @brief Position and velocity of a circular orbit relative to the central body.
    template<class T>
    inline StateT<T> circular_orbit_relative_state(const CelestialBodyT<T> &body, const T orbital_radius_m,
                                                   const T inclination_rad = T(0), const T arg_latitude_rad = T(0))
    {
        const T v_circ = std::sqrt(body.mu_m3_s2() / orbital_radius_m);

        // Position in orbital plane (before inclination rotation):
        // At arg_latitude=0: position is along +X, velocity is along +Y.
        const T cos_u = std::cos(arg_latitude_rad);
        const T sin_u = std::sin(arg_latitude_rad);

        // Orbital plane position: r = R * [cos(u), sin(u), 0]
        // Orbital plane velocity: v = V_circ * [-sin(u), cos(u), 0]
        // Then rotate the Y-component by inclination into Y-Z plane.
        const T cos_i = std::cos(inclination_rad);
        const T sin_i = std::sin(inclination_rad);

        StateT<T> out;
        out.position_m = Vec3T<T>{orbital_radius_m * cos_u, orbital_radius_m * sin_u * cos_i,
                                  orbital_radius_m * sin_u * sin_i};
        out.velocity_mps = Vec3T<T>{-v_circ * sin_u, v_circ * cos_u * cos_i, v_circ * cos_u * sin_i};
        return out;
    }

    /**
     * @brief Circular orbit around `body`, ascending node on +X.
     * @param orbital_radius_m Orbital radius (distance from body center) [m].
     * @param inclination_rad Orbital inclination [rad]. 0 = equatorial, positive tilts velocity into +Z.
     * @param arg_latitude_rad Argument of latitude (angle from the ascending node in the orbital plane) [rad].
     */
    template<class T>
    inline OrbitT<T> circular_orbit(const CelestialBodyT<T> &body, const T orbital_radius_m,
                                    const T inclination_rad = T(0), const T arg_latitude_rad = T(0))
    {
        const StateT<T> s = circular_orbit_relative_state(body, orbital_radius_m, inclination_rad, arg_latitude_rad);
        return OrbitT<T>::from_cartesian(s.position_m, s.velocity_mps, body);
    }

} // namespace twobody
