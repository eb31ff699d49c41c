#pragma once

#include "twobody/celestial_body.hpp"
#include "twobody/conic.hpp"
#include "twobody/frame_utils.hpp"
#include "twobody/types.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>
#include <utility>

namespace twobody
{

    /**
     * @brief Classical Keplerian elements.
     *
     * `semi_major_axis_m` is negative for hyperbolic orbits and +infinity for parabolic ones.
     */
    template<class T>
    struct KeplerianElementsT
    {
        T eccentricity{T(0)};
        T semi_major_axis_m{std::numeric_limits<T>::infinity()};
        T inclination_rad{T(0)}; ///< [0, pi]
        T raan_rad{T(0)}; ///< [0, 2pi)
        T arg_periapsis_rad{T(0)}; ///< [0, 2pi)
        T true_anomaly_rad{T(0)}; ///< [0, 2pi)
    };

    using KeplerianElements = KeplerianElementsT<double>;

    template<class T>
    class OrbitT;

    template<class T>
    inline bool is_invalid(const OrbitT<T> &orbit);

    template<class T>
    inline bool is_fully_defined(const OrbitT<T> &orbit);

    /**
     * @brief Two-body orbital state held in three consistent representations.
     *
     * An OrbitT is an immutable value. Each factory names its source of truth and derives the other
     * representations eagerly:
     * - from_cartesian(): inertial position/velocity; elements and perifocal state are derived.
     * - from_elements() / from_parabolic_elements(): elements; Cartesian states are derived.
     * - invalid(): the all-NaN sentinel returned by algorithms that cannot produce an orbit.
     *
     * Degenerate geometry uses canonical zero angles instead of NaN:
     * - Equatorial orbits: raan = 0 and arg_periapsis is measured from +X.
     * - Circular orbits: arg_periapsis = 0 and the true anomaly is measured from the ascending node
     *   (from +X when also equatorial).
     *
     * Non-physical input (non-finite values, zero radius, zero angular momentum, a point beyond a
     * hyperbola's asymptotes) yields the invalid sentinel; nothing throws.
     */
    template<class T>
    class OrbitT
    {
    public:
        using value_type = T;
        using Body = CelestialBodyT<T>;

        /**
         * @brief Orbit from an inertial Cartesian state relative to the body center.
         *
         * Inclination and RAAN reference the inertial XY plane (+Z is the pole).
         *
         * @param position_m Position [m].
         * @param velocity_mps Velocity [m/s].
         * @param body Central body.
         * @param tol Conic classification tolerances.
         */
        static OrbitT from_cartesian(const Vec3T<T> &position_m, const Vec3T<T> &velocity_mps, const Body &body,
                                     const ConicTolerances &tol = {})
        {
            const T mu = body.mu_m3_s2();
            if (!(mu > T(0)) || !std::isfinite(mu) || !is_finite_vec(position_m) || !is_finite_vec(velocity_mps))
            {
                return invalid(body);
            }

            const T r = glm::length(position_m);
            if (!(r > T(0)) || !std::isfinite(r))
            {
                return invalid(body);
            }

            const Vec3T<T> h = glm::cross(position_m, velocity_mps);
            const T hmag = glm::length(h);
            if (!(hmag > T(0)) || !std::isfinite(hmag))
            {
                // Rectilinear trajectory: no orbital plane.
                return invalid(body);
            }
            const Vec3T<T> hhat = h / hmag;

            const Vec3T<T> evec = (glm::cross(velocity_mps, h) / mu) - (position_m / r);
            const T e = glm::length(evec);
            const ConicSection conic = classify_conic(static_cast<double>(e), std::isfinite(e), tolerances_for<T>(tol));
            if (conic == ConicSection::Invalid)
            {
                return invalid(body);
            }

            const T p = (hmag * hmag) / mu;
            const T a = (conic == ConicSection::Parabolic) ? std::numeric_limits<T>::infinity()
                                                             : p / (T(1) - e * e);

            const Vec3T<T> k{T(0), T(0), T(1)};
            const Vec3T<T> ref_x{T(1), T(0), T(0)};
            const Vec3T<T> n = glm::cross(k, h);
            const T nmag = glm::length(n);
            const bool equatorial = !(nmag > kEquatorialSinTolerance * hmag);

            OrbitT out(body);
            out.conic_ = conic;
            out.e_ = e;
            out.a_m_ = a;
            // atan2 keeps full precision near i = 0 and i = pi, where acos(h_z / |h|) does not.
            out.i_rad_ = std::atan2(nmag, h.z);

            const Vec3T<T> nhat = equatorial ? ref_x : n / nmag;
            out.raan_rad_ = equatorial ? T(0) : wrap_angle_0_2pi(std::atan2(nhat.y, nhat.x));

            const Vec3T<T> rhat = position_m / r;
            if (conic == ConicSection::Circular)
            {
                out.argp_rad_ = T(0);
                out.nu_rad_ = wrap_angle_0_2pi(
                        std::atan2(glm::dot(glm::cross(nhat, rhat), hhat), glm::dot(rhat, nhat)));
            }
            else
            {
                const Vec3T<T> ehat = evec / e;
                out.argp_rad_ = wrap_angle_0_2pi(
                        std::atan2(glm::dot(glm::cross(nhat, ehat), hhat), glm::dot(ehat, nhat)));
                out.nu_rad_ = wrap_angle_0_2pi(
                        std::atan2(glm::dot(glm::cross(ehat, rhat), hhat), glm::dot(rhat, ehat)));
            }

            out.r_i_m_ = position_m;
            out.v_i_mps_ = velocity_mps;
            out.set_perifocal_(p);

            if (!out.fully_defined_())
            {
                return invalid(body);
            }
            return out;
        }

        /**
         * @brief Orbit from classical elements.
         *
         * The semi-latus rectum is a * (1 - e^2), so `a` must be finite; use from_parabolic_elements()
         * for parabolic orbits. Equatorial and circular element sets are rewritten into the canonical
         * convention so that from_cartesian(orbit.position, orbit.velocity) reproduces the same elements.
         */
        static OrbitT from_elements(const KeplerianElementsT<T> &el, const Body &body, const ConicTolerances &tol = {})
        {
            const T e = el.eccentricity;
            const T a = el.semi_major_axis_m;
            if (!std::isfinite(e) || !std::isfinite(a))
            {
                return invalid(body);
            }
            const T p = a * (T(1) - e * e);
            return from_semi_latus_rectum_(p, el, body, tol);
        }

        /**
         * @brief Parabolic orbit (e = 1) from its periapsis radius and orientation.
         * @param periapsis_radius_m Periapsis radius [m]; the semi-latus rectum is twice this.
         */
        static OrbitT from_parabolic_elements(const T periapsis_radius_m, const T inclination_rad, const T raan_rad,
                                              const T arg_periapsis_rad, const T true_anomaly_rad, const Body &body,
                                              const ConicTolerances &tol = {})
        {
            const KeplerianElementsT<T> el{.eccentricity = T(1),
                                           .semi_major_axis_m = std::numeric_limits<T>::infinity(),
                                           .inclination_rad = inclination_rad,
                                           .raan_rad = raan_rad,
                                           .arg_periapsis_rad = arg_periapsis_rad,
                                           .true_anomaly_rad = true_anomaly_rad};
            return from_semi_latus_rectum_(T(2) * periapsis_radius_m, el, body, tol);
        }

        /**
         * @brief Orbit assembled from precomputed representations, without re-deriving any of them.
         *
         * For converters that already hold every representation. The caller guarantees consistency.
         * Any NaN field tags the orbit Invalid; a partially NaN orbit is still distinct from the sentinel
         * (see is_invalid() and is_fully_defined()).
         */
        static OrbitT from_representations(const StateT<T> &inertial, const StateT<T> &perifocal,
                                           const KeplerianElementsT<T> &el, const Body &body,
                                           const ConicTolerances &tol = {})
        {
            OrbitT out(body);
            out.r_i_m_ = inertial.position_m;
            out.v_i_mps_ = inertial.velocity_mps;
            out.r_p_m_ = perifocal.position_m;
            out.v_p_mps_ = perifocal.velocity_mps;
            out.e_ = el.eccentricity;
            out.a_m_ = el.semi_major_axis_m;
            out.i_rad_ = el.inclination_rad;
            out.raan_rad_ = el.raan_rad;
            out.argp_rad_ = el.arg_periapsis_rad;
            out.nu_rad_ = el.true_anomaly_rad;
            out.conic_ = classify_conic(static_cast<double>(out.e_), out.fully_defined_(), tolerances_for<T>(tol));
            return out;
        }

        /// @brief The invalid sentinel: every vector and scalar field NaN, `body` kept.
        static OrbitT invalid(const Body &body) { return OrbitT(body); }

        ConicSection conic() const { return conic_; }
        const Body &body() const { return body_; }

        const Vec3T<T> &position_inertial_m() const { return r_i_m_; }
        const Vec3T<T> &velocity_inertial_mps() const { return v_i_mps_; }
        const Vec3T<T> &position_perifocal_m() const { return r_p_m_; }
        const Vec3T<T> &velocity_perifocal_mps() const { return v_p_mps_; }

        T eccentricity() const { return e_; }
        T semi_major_axis_m() const { return a_m_; }
        T inclination_rad() const { return i_rad_; }
        T raan_rad() const { return raan_rad_; }
        T arg_periapsis_rad() const { return argp_rad_; }
        T true_anomaly_rad() const { return nu_rad_; }

        StateT<T> inertial_state() const { return make_state(r_i_m_, v_i_mps_); }
        StateT<T> perifocal_state() const { return make_state(r_p_m_, v_p_mps_); }

        KeplerianElementsT<T> elements() const
        {
            return KeplerianElementsT<T>{.eccentricity = e_,
                                         .semi_major_axis_m = a_m_,
                                         .inclination_rad = i_rad_,
                                         .raan_rad = raan_rad_,
                                         .arg_periapsis_rad = argp_rad_,
                                         .true_anomaly_rad = nu_rad_};
        }

        /// @brief Re-express every quantity at precision `U`. The conic tag is kept.
        template<class U>
        OrbitT<U> cast() const
        {
            OrbitT<U> out(body_.template cast<U>());
            out.r_i_m_ = Vec3T<U>(r_i_m_);
            out.v_i_mps_ = Vec3T<U>(v_i_mps_);
            out.r_p_m_ = Vec3T<U>(r_p_m_);
            out.v_p_mps_ = Vec3T<U>(v_p_mps_);
            out.e_ = static_cast<U>(e_);
            out.a_m_ = static_cast<U>(a_m_);
            out.i_rad_ = static_cast<U>(i_rad_);
            out.raan_rad_ = static_cast<U>(raan_rad_);
            out.argp_rad_ = static_cast<U>(argp_rad_);
            out.nu_rad_ = static_cast<U>(nu_rad_);
            out.conic_ = conic_;
            return out;
        }

    private:
        template<class U>
        friend class OrbitT;

        friend bool is_invalid<T>(const OrbitT<T> &orbit);
        friend bool is_fully_defined<T>(const OrbitT<T> &orbit);

        /// sin(i) below this is treated as equatorial; never below the round-off of `T`.
        static constexpr T kEquatorialSinTolerance = static_cast<T>(std::max(1e-12, roundoff_floor<T>()));

        explicit OrbitT(const Body &body) : body_(body) {}

        static OrbitT from_semi_latus_rectum_(const T p, const KeplerianElementsT<T> &el, const Body &body,
                                              const ConicTolerances &tol)
        {
            const T mu = body.mu_m3_s2();
            const T e = el.eccentricity;
            const T pi = std::numbers::pi_v<T>;
            if (!(mu > T(0)) || !std::isfinite(mu) || !(p > T(0)) || !std::isfinite(p) || !std::isfinite(e) ||
                !std::isfinite(el.inclination_rad) || !std::isfinite(el.raan_rad) ||
                !std::isfinite(el.arg_periapsis_rad) || !std::isfinite(el.true_anomaly_rad))
            {
                return invalid(body);
            }
            if (el.inclination_rad < T(0) || el.inclination_rad > pi)
            {
                return invalid(body);
            }

            const ConicSection conic = classify_conic(static_cast<double>(e), true, tolerances_for<T>(tol));
            if (conic == ConicSection::Invalid)
            {
                return invalid(body);
            }

            OrbitT out(body);
            out.conic_ = conic;
            out.e_ = e;
            out.a_m_ = (conic == ConicSection::Parabolic) ? std::numeric_limits<T>::infinity()
                                                            : el.semi_major_axis_m;
            out.i_rad_ = el.inclination_rad;

            // Canonical angles for the undefined cases.
            T raan = el.raan_rad;
            T argp = el.arg_periapsis_rad;
            T nu = el.true_anomaly_rad;
            if (!(std::sin(el.inclination_rad) > kEquatorialSinTolerance))
            {
                // Prograde equatorial: argp' = raan + argp. Retrograde: the node direction flips sense.
                argp = (el.inclination_rad < T(0.5) * pi) ? (argp + raan) : (argp - raan);
                raan = T(0);
            }
            if (conic == ConicSection::Circular)
            {
                nu += argp;
                argp = T(0);
            }
            out.raan_rad_ = wrap_angle_0_2pi(raan);
            out.argp_rad_ = wrap_angle_0_2pi(argp);
            out.nu_rad_ = wrap_angle_0_2pi(nu);

            const T denom = T(1) + e * std::cos(out.nu_rad_);
            if (!(denom > T(0)))
            {
                // Beyond the asymptotes of a hyperbola (or the far branch of a parabola).
                return invalid(body);
            }

            out.set_perifocal_(p);

            // Basis vectors of the perifocal frame expressed in inertial coordinates.
            const T cO = std::cos(out.raan_rad_);
            const T sO = std::sin(out.raan_rad_);
            const T ci = std::cos(out.i_rad_);
            const T si = std::sin(out.i_rad_);
            const T cw = std::cos(out.argp_rad_);
            const T sw = std::sin(out.argp_rad_);

            const Vec3T<T> P{cO * cw - sO * sw * ci, sO * cw + cO * sw * ci, sw * si};
            const Vec3T<T> Q{-cO * sw - sO * cw * ci, -sO * sw + cO * cw * ci, cw * si};

            out.r_i_m_ = out.r_p_m_.x * P + out.r_p_m_.y * Q;
            out.v_i_mps_ = out.v_p_mps_.x * P + out.v_p_mps_.y * Q;

            if (!out.fully_defined_())
            {
                return invalid(body);
            }
            return out;
        }

        /// Perifocal (PQW) state from e_, nu_rad_ and the semi-latus rectum.
        void set_perifocal_(const T p)
        {
            const T c = std::cos(nu_rad_);
            const T s = std::sin(nu_rad_);
            const T r = p / (T(1) + e_ * c);
            const T sqrt_mu_over_p = std::sqrt(body_.mu_m3_s2() / p);
            r_p_m_ = Vec3T<T>{r * c, r * s, T(0)};
            v_p_mps_ = Vec3T<T>{-sqrt_mu_over_p * s, sqrt_mu_over_p * (e_ + c), T(0)};
        }

        bool all_nan_() const
        {
            return is_nan_vec(r_i_m_) && is_nan_vec(v_i_mps_) && std::isnan(e_) && std::isnan(a_m_) &&
                   std::isnan(i_rad_) && std::isnan(raan_rad_) && std::isnan(argp_rad_) && std::isnan(nu_rad_);
        }

        // Infinite `a` is allowed (parabolic).
        bool fully_defined_() const
        {
            return !has_nan_component(r_i_m_) && !has_nan_component(v_i_mps_) && !has_nan_component(r_p_m_) &&
                   !has_nan_component(v_p_mps_) && !std::isnan(e_) && !std::isnan(a_m_) && !std::isnan(i_rad_) &&
                   !std::isnan(raan_rad_) && !std::isnan(argp_rad_) && !std::isnan(nu_rad_);
        }

        static constexpr T kNaN = std::numeric_limits<T>::quiet_NaN();

        Vec3T<T> r_i_m_{kNaN, kNaN, kNaN};
        Vec3T<T> v_i_mps_{kNaN, kNaN, kNaN};
        Vec3T<T> r_p_m_{kNaN, kNaN, kNaN};
        Vec3T<T> v_p_mps_{kNaN, kNaN, kNaN};

        T e_{kNaN};
        T a_m_{kNaN};
        T i_rad_{kNaN};
        T raan_rad_{kNaN};
        T argp_rad_{kNaN};
        T nu_rad_{kNaN};

        Body body_{};
        ConicSection conic_{ConicSection::Invalid};
    };

    using Orbit = OrbitT<double>;
    using Orbitf = OrbitT<float>;

    /// @brief The invalid sentinel for `body`. Used by solvers that fail to converge.
    template<class T>
    inline OrbitT<T> invalid_orbit(const CelestialBodyT<T> &body)
    {
        return OrbitT<T>::invalid(body);
    }

    /**
     * @brief True iff every defining field {r_i, v_i, e, a, i, raan, argp, nu} is NaN.
     *
     * A partially NaN orbit is not the sentinel and reports false; see is_fully_defined().
     */
    template<class T>
    inline bool is_invalid(const OrbitT<T> &orbit)
    {
        return orbit.all_nan_();
    }

    /// @brief Exact opposite of is_invalid().
    template<class T>
    inline bool is_valid(const OrbitT<T> &orbit)
    {
        return !is_invalid(orbit);
    }

    /// @brief True iff no defining field is NaN.
    template<class T>
    inline bool is_fully_defined(const OrbitT<T> &orbit)
    {
        return orbit.fully_defined_();
    }

    /// @brief Convert two orbits to the wider of their precisions.
    template<class A, class B>
    inline std::pair<OrbitT<promote_t<A, B>>, OrbitT<promote_t<A, B>>> promote(const OrbitT<A> &a,
                                                                               const OrbitT<B> &b)
    {
        using C = promote_t<A, B>;
        return {a.template cast<C>(), b.template cast<C>()};
    }

    /// @brief Convert two bodies to the wider of their precisions.
    template<class A, class B>
    inline std::pair<CelestialBodyT<promote_t<A, B>>, CelestialBodyT<promote_t<A, B>>>
    promote(const CelestialBodyT<A> &a, const CelestialBodyT<B> &b)
    {
        using C = promote_t<A, B>;
        return {a.template cast<C>(), b.template cast<C>()};
    }

} // namespace twobody
