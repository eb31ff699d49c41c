#pragma once

#include <algorithm>
#include <cmath>
#include <limits>
#include <string_view>

namespace twobody
{

    /**
     * @brief Conic section of a two-body orbit.
     *
     * Closed set of regimes. Downstream formulas (anomaly conversion, propagation) switch on this tag.
     */
    enum class ConicSection
    {
        Circular,
        Elliptical,
        Parabolic,
        Hyperbolic,
        Invalid,
    };

    /**
     * @brief Eccentricity tolerances used by classify_conic().
     *
     * Exactly circular and exactly parabolic orbits do not survive floating-point round-off, so both
     * regimes are bands around e = 0 and e = 1.
     *
     * Orbits classify with tolerances_for<T>(), which never lets a band be narrower than the round-off of
     * the scalar type: at double precision the defaults below apply unchanged, at float precision both
     * bands widen to about 7.6e-6.
     */
    struct ConicTolerances
    {
        double circular_eccentricity{1e-10}; ///< e <= this is Circular
        double parabolic_eccentricity{1e-10}; ///< |e - 1| <= this is Parabolic
    };

    /// Smallest band width, in units of the machine epsilon of the orbit's scalar type.
    inline constexpr double kRoundoffBandEpsilons = 64.0;

    /// @brief Round-off floor for a tolerance at precision `T`.
    template<class T>
    inline constexpr double roundoff_floor()
    {
        return kRoundoffBandEpsilons * static_cast<double>(std::numeric_limits<T>::epsilon());
    }

    /// @brief `tol` with each band widened to at least the round-off floor of `T`.
    template<class T>
    inline constexpr ConicTolerances tolerances_for(const ConicTolerances &tol)
    {
        return ConicTolerances{.circular_eccentricity = std::max(tol.circular_eccentricity, roundoff_floor<T>()),
                               .parabolic_eccentricity = std::max(tol.parabolic_eccentricity, roundoff_floor<T>())};
    }

    /**
     * @brief Classify an orbit by eccentricity.
     *
     * Total over every input: validity is checked first, then NaN or negative eccentricity is Invalid.
     *
     * @param e Eccentricity.
     * @param valid False if any defining field of the orbit is NaN.
     * @param tol Regime tolerances.
     */
    inline ConicSection classify_conic(const double e, const bool valid = true, const ConicTolerances &tol = {})
    {
        if (!valid || !(e >= 0.0))
        {
            return ConicSection::Invalid;
        }
        if (e <= tol.circular_eccentricity)
        {
            return ConicSection::Circular;
        }
        if (std::abs(e - 1.0) <= tol.parabolic_eccentricity)
        {
            return ConicSection::Parabolic;
        }
        if (e < 1.0)
        {
            return ConicSection::Elliptical;
        }
        return ConicSection::Hyperbolic;
    }

    /// @brief True for bound orbits (Circular, Elliptical).
    inline constexpr bool is_closed(const ConicSection c)
    {
        return c == ConicSection::Circular || c == ConicSection::Elliptical;
    }

    inline constexpr std::string_view to_string(const ConicSection c)
    {
        switch (c)
        {
            case ConicSection::Circular:
                return "Circular";
            case ConicSection::Elliptical:
                return "Elliptical";
            case ConicSection::Parabolic:
                return "Parabolic";
            case ConicSection::Hyperbolic:
                return "Hyperbolic";
            case ConicSection::Invalid:
                return "Invalid";
        }
        return "Invalid";
    }

} // namespace twobody
