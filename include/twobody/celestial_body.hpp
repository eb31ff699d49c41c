#pragma once

#include "twobody/constants.hpp"
#include "twobody/types.hpp"
#include "twobody/units.hpp"

namespace twobody
{

    /**
     * @brief A gravitating body described by its mean radius and standard gravitational parameter.
     *
     * Immutable value type. Quantities are stored at precision `T` in SI units.
     * Inputs are assumed physically valid (finite, positive); nothing is rejected.
     */
    template<class T>
    class CelestialBodyT
    {
    public:
        using value_type = T;

        CelestialBodyT() = default;

        /// @brief Body from its mass; mu = G * mass.
        /// @param mass_kg Mass [kg].
        /// @param radius_m Mean radius [m].
        static constexpr CelestialBodyT from_mass(const T mass_kg, const T radius_m)
        {
            return CelestialBodyT(radius_m, static_cast<T>(kGravitationalConstant_SI * static_cast<double>(mass_kg)));
        }

        /// @brief Body from its gravitational parameter; `mu_m3_s2` is stored as given.
        /// @param radius_m Mean radius [m].
        /// @param mu_m3_s2 Gravitational parameter [m^3/s^2].
        static constexpr CelestialBodyT from_mu(const T radius_m, const T mu_m3_s2)
        {
            return CelestialBodyT(radius_m, mu_m3_s2);
        }

        constexpr T radius_m() const { return radius_m_; }
        constexpr T mu_m3_s2() const { return mu_m3_s2_; }
        constexpr T mass_kg() const { return static_cast<T>(static_cast<double>(mu_m3_s2_) / kGravitationalConstant_SI); }

        /// @brief Re-express this body at precision `U`.
        template<class U>
        constexpr CelestialBodyT<U> cast() const
        {
            return CelestialBodyT<U>::from_mu(static_cast<U>(radius_m_), static_cast<U>(mu_m3_s2_));
        }

        constexpr bool operator==(const CelestialBodyT &) const = default;

    private:
        constexpr CelestialBodyT(const T radius_m, const T mu_m3_s2) : radius_m_(radius_m), mu_m3_s2_(mu_m3_s2) {}

        T radius_m_{T(0)};
        T mu_m3_s2_{T(0)};
    };

    using CelestialBody = CelestialBodyT<double>;

    // Solar system catalog.
    // Masses: https://en.wikipedia.org/wiki/List_of_Solar_System_objects_by_size
    // Radii: astropy constants.

    inline constexpr CelestialBody kSun = CelestialBody::from_mass(1.98840987e30, kilometers(696342.0));
    inline constexpr CelestialBody kMercury = CelestialBody::from_mass(330.1e21, kilometers(2439.7));
    inline constexpr CelestialBody kVenus = CelestialBody::from_mass(4867.5e21, kilometers(6051.8));
    inline constexpr CelestialBody kEarth = CelestialBody::from_mass(5.97216787e24, kilometers(6371.0));
    inline constexpr CelestialBody kMoon = CelestialBody::from_mass(73.42e21, kilometers(1737.4));
    inline constexpr const CelestialBody &kLuna = kMoon;
    inline constexpr CelestialBody kMars = CelestialBody::from_mass(641.7e21, kilometers(3389.5));
    inline constexpr CelestialBody kJupiter = CelestialBody::from_mass(1.8981246e27, kilometers(69911.0));
    inline constexpr CelestialBody kSaturn = CelestialBody::from_mass(568340e21, kilometers(58232.0));
    inline constexpr CelestialBody kUranus = CelestialBody::from_mass(86813e21, kilometers(25362.0));
    inline constexpr CelestialBody kNeptune = CelestialBody::from_mass(102413e21, kilometers(24622.0));
    inline constexpr CelestialBody kPluto = CelestialBody::from_mass(13.03e21, kilometers(1188.3));

} // namespace twobody
