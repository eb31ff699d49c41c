#pragma once

#include "twobody/conic.hpp"
#include "twobody/frame_utils.hpp"
#include "twobody/orbit.hpp"
#include "twobody/types.hpp"

#include <cmath>
#include <limits>
#include <numbers>

namespace twobody
{

    /**
     * @brief Anomalies matching a true anomaly.
     *
     * Exactly one of `eccentric_anomaly_rad` (Circular, Elliptical), `hyperbolic_anomaly_rad` (Hyperbolic)
     * or `parabolic_anomaly` (Parabolic, D = tan(nu/2)) is set; the others stay NaN.
     */
    template<class T>
    struct AnomalyResultT
    {
        T mean_anomaly_rad{std::numeric_limits<T>::quiet_NaN()};
        T eccentric_anomaly_rad{std::numeric_limits<T>::quiet_NaN()};
        T hyperbolic_anomaly_rad{std::numeric_limits<T>::quiet_NaN()};
        T parabolic_anomaly{std::numeric_limits<T>::quiet_NaN()};
        ConicSection conic{ConicSection::Invalid};
        bool valid{false};
    };

    using AnomalyResult = AnomalyResultT<double>;

    /**
     * @brief Convert a true anomaly to the regime's auxiliary and mean anomalies.
     * @param conic Regime, selects the formula.
     * @param e Eccentricity.
     * @param true_anomaly_rad True anomaly [rad].
     */
    template<class T>
    inline AnomalyResultT<T> anomalies_from_true_anomaly(const ConicSection conic, const T e, const T true_anomaly_rad)
    {
        AnomalyResultT<T> out;
        out.conic = conic;
        if (!(e >= T(0)) || !std::isfinite(e) || !std::isfinite(true_anomaly_rad))
        {
            return out;
        }

        const T half_nu = T(0.5) * true_anomaly_rad;
        switch (conic)
        {
            case ConicSection::Circular:
            case ConicSection::Elliptical:
            {
                // tan(nu/2) = sqrt((1+e)/(1-e)) * tan(E/2)
                const T k = std::sqrt((T(1) - e) / (T(1) + e));
                const T E = T(2) * std::atan2(k * std::sin(half_nu), std::cos(half_nu));
                out.eccentric_anomaly_rad = E;
                out.mean_anomaly_rad = E - e * std::sin(E);
                break;
            }
            case ConicSection::Hyperbolic:
            {
                // tanh(H/2) = sqrt((e-1)/(e+1)) * tan(nu/2)
                const T k = std::sqrt((e - T(1)) / (e + T(1)));
                const T H = T(2) * std::atanh(k * std::tan(half_nu));
                out.hyperbolic_anomaly_rad = H;
                out.mean_anomaly_rad = e * std::sinh(H) - H;
                break;
            }
            case ConicSection::Parabolic:
            {
                // Barker's equation.
                const T D = std::tan(half_nu);
                out.parabolic_anomaly = D;
                out.mean_anomaly_rad = D + (D * D * D) / T(3);
                break;
            }
            case ConicSection::Invalid:
                return out;
        }

        out.valid = std::isfinite(out.mean_anomaly_rad);
        return out;
    }

    template<class T>
    inline AnomalyResultT<T> anomalies(const OrbitT<T> &orbit)
    {
        return anomalies_from_true_anomaly(orbit.conic(), orbit.eccentricity(), orbit.true_anomaly_rad());
    }

    /**
     * @brief True anomaly from an eccentric (Circular/Elliptical), hyperbolic, or parabolic anomaly.
     * @return True anomaly wrapped to [0, 2pi), or NaN for Invalid.
     */
    template<class T>
    inline T true_anomaly_from_anomaly(const ConicSection conic, const T e, const T anomaly)
    {
        switch (conic)
        {
            case ConicSection::Circular:
            case ConicSection::Elliptical:
            {
                const T k = std::sqrt((T(1) + e) / (T(1) - e));
                return wrap_angle_0_2pi(T(2) * std::atan2(k * std::sin(T(0.5) * anomaly), std::cos(T(0.5) * anomaly)));
            }
            case ConicSection::Hyperbolic:
            {
                const T k = std::sqrt((e + T(1)) / (e - T(1)));
                return wrap_angle_0_2pi(T(2) * std::atan(k * std::tanh(T(0.5) * anomaly)));
            }
            case ConicSection::Parabolic:
                return wrap_angle_0_2pi(T(2) * std::atan(anomaly));
            case ConicSection::Invalid:
                break;
        }
        return std::numeric_limits<T>::quiet_NaN();
    }

    /// @brief Specific orbital energy v^2/2 - mu/r [m^2/s^2].
    template<class T>
    inline T specific_energy(const OrbitT<T> &orbit)
    {
        const T v2 = glm::dot(orbit.velocity_inertial_mps(), orbit.velocity_inertial_mps());
        return T(0.5) * v2 - orbit.body().mu_m3_s2() / glm::length(orbit.position_inertial_m());
    }

    /// @brief Specific angular momentum r x v [m^2/s].
    template<class T>
    inline Vec3T<T> angular_momentum_vector(const OrbitT<T> &orbit)
    {
        return glm::cross(orbit.position_inertial_m(), orbit.velocity_inertial_mps());
    }

    template<class T>
    inline T angular_momentum(const OrbitT<T> &orbit)
    {
        return glm::length(angular_momentum_vector(orbit));
    }

    /// @brief Eccentricity vector (points to periapsis, magnitude e).
    template<class T>
    inline Vec3T<T> eccentricity_vector(const OrbitT<T> &orbit)
    {
        const Vec3T<T> &r = orbit.position_inertial_m();
        const Vec3T<T> &v = orbit.velocity_inertial_mps();
        return (glm::cross(v, glm::cross(r, v)) / orbit.body().mu_m3_s2()) - (r / glm::length(r));
    }

    /// @brief Semi-latus rectum p = h^2 / mu [m].
    template<class T>
    inline T semi_latus_rectum(const OrbitT<T> &orbit)
    {
        const T h = angular_momentum(orbit);
        return (h * h) / orbit.body().mu_m3_s2();
    }

    template<class T>
    inline T periapsis_radius(const OrbitT<T> &orbit)
    {
        return semi_latus_rectum(orbit) / (T(1) + orbit.eccentricity());
    }

    /// @brief Apoapsis radius [m]; +infinity for open orbits, NaN for Invalid.
    template<class T>
    inline T apoapsis_radius(const OrbitT<T> &orbit)
    {
        if (orbit.conic() == ConicSection::Invalid)
        {
            return std::numeric_limits<T>::quiet_NaN();
        }
        if (!is_closed(orbit.conic()))
        {
            return std::numeric_limits<T>::infinity();
        }
        return semi_latus_rectum(orbit) / (T(1) - orbit.eccentricity());
    }

    /**
     * @brief Mean motion [rad/s].
     *
     * Closed: sqrt(mu/a^3). Hyperbolic: sqrt(mu/(-a)^3). Parabolic: 2 sqrt(mu/p^3), matching
     * M = D + D^3/3 in Barker's equation.
     */
    template<class T>
    inline T mean_motion(const OrbitT<T> &orbit)
    {
        const T mu = orbit.body().mu_m3_s2();
        const T a = orbit.semi_major_axis_m();
        switch (orbit.conic())
        {
            case ConicSection::Circular:
            case ConicSection::Elliptical:
                return std::sqrt(mu / (a * a * a));
            case ConicSection::Hyperbolic:
                return std::sqrt(mu / (-a * a * a));
            case ConicSection::Parabolic:
            {
                const T p = semi_latus_rectum(orbit);
                return T(2) * std::sqrt(mu / (p * p * p));
            }
            case ConicSection::Invalid:
                break;
        }
        return std::numeric_limits<T>::quiet_NaN();
    }

    /// @brief Orbital period [s]; +infinity for open orbits, NaN for Invalid.
    template<class T>
    inline T orbital_period(const OrbitT<T> &orbit)
    {
        if (orbit.conic() == ConicSection::Invalid)
        {
            return std::numeric_limits<T>::quiet_NaN();
        }
        if (!is_closed(orbit.conic()))
        {
            return std::numeric_limits<T>::infinity();
        }
        return T(2) * std::numbers::pi_v<T> / mean_motion(orbit);
    }

} // namespace twobody
