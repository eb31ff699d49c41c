#pragma once

#include "twobody/conic.hpp"
#include "twobody/orbit.hpp"
#include "twobody/types.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>

namespace twobody
{
    /** @brief Options for Kepler solver and propagator Newton iteration. */
    struct KeplerOptions
    {
        int max_iterations{64};       ///< Maximum Newton iterations
        double abs_tolerance{1e-12};  ///< Absolute convergence tolerance on the Newton step
        double rel_tolerance{1e-12};  ///< Step tolerance relative to the anomaly magnitude
    };

    /** @brief Result of solving Kepler's equation. */
    struct KeplerSolveResult
    {
        double anomaly_rad{std::numeric_limits<double>::quiet_NaN()}; ///< Eccentric or hyperbolic anomaly
        bool converged{false};  ///< True if Newton iteration converged
        int iterations{0};      ///< Number of iterations used
    };

    namespace detail
    {
        /// Value and derivative of a scalar equation at the current iterate.
        struct Residual
        {
            double value;
            double derivative;
        };

        /**
         * Newton iteration on `residual(x) = 0` starting from `x0`. Converged once the step falls under
         * `abs_tolerance + rel_tolerance * |x|`; stops early on a flat or non-finite derivative.
         */
        template<class ResidualFn>
        inline KeplerSolveResult newton_solve(double x, ResidualFn &&residual, const KeplerOptions &opt)
        {
            KeplerSolveResult out;
            const int max_iter = std::max(1, opt.max_iterations);
            while (out.iterations < max_iter)
            {
                ++out.iterations;
                const Residual res = residual(x);
                if (res.value == 0.0)
                {
                    out.converged = true;
                    break;
                }
                if (!std::isfinite(res.value) || !std::isfinite(res.derivative) || res.derivative == 0.0)
                {
                    break;
                }

                const double step = res.value / res.derivative;
                x -= step;
                if (!std::isfinite(x))
                {
                    break;
                }
                if (std::abs(step) <= opt.abs_tolerance + opt.rel_tolerance * std::abs(x))
                {
                    out.converged = true;
                    break;
                }
            }
            out.anomaly_rad = x;
            return out;
        }
    } // namespace detail

    /**
     * @brief Solve Kepler's equation for the eccentric (e < 1) or hyperbolic (e > 1) anomaly.
     *
     * Elliptic: M = E - e sin(E). Hyperbolic: M = e sinh(H) - H.
     * Parabolic eccentricities have no such equation (use Barker's equation) and report not converged.
     *
     * @param mean_anomaly_rad Mean anomaly [rad].
     * @param e Eccentricity.
     * @param opt Solver options.
     */
    inline KeplerSolveResult solve_kepler(const double mean_anomaly_rad, const double e, const KeplerOptions &opt = {})
    {
        if (!std::isfinite(mean_anomaly_rad) || !(e >= 0.0) || !std::isfinite(e) || e == 1.0)
        {
            return {};
        }

        if (e > 1.0)
        {
            const double M = mean_anomaly_rad;
            return detail::newton_solve(std::asinh(M / e),
                                        [&](const double H) {
                                            return detail::Residual{e * std::sinh(H) - H - M, e * std::cosh(H) - 1.0};
                                        },
                                        opt);
        }

        // E(M + 2pi k) = E(M) + 2pi k, so the elliptic solve runs on M in [-pi, pi].
        const double two_pi = 2.0 * std::numbers::pi;
        const double revolutions = std::round(mean_anomaly_rad / two_pi);
        const double M = mean_anomaly_rad - revolutions * two_pi;

        // Highly eccentric ellipses start from +-pi.
        const double E0 = (e < 0.8) ? M : std::copysign(std::numbers::pi, M);
        KeplerSolveResult out = detail::newton_solve(
                E0, [&](const double E) { return detail::Residual{E - e * std::sin(E) - M, 1.0 - e * std::cos(E)}; },
                opt);
        out.anomaly_rad += revolutions * two_pi;
        return out;
    }

    /** @brief Stumpff functions C(z) and S(z) of the universal-variable formulation. */
    struct Stumpff
    {
        double c;
        double s;
    };

    /**
     * @brief Evaluate C(z) and S(z).
     *
     * z > 0: C = (1 - cos sqrt(z)) / z, S = (sqrt(z) - sin sqrt(z)) / z^(3/2).
     * z < 0: C = (cosh sqrt(-z) - 1) / (-z), S = (sinh sqrt(-z) - sqrt(-z)) / (-z)^(3/2).
     * Near z = 0 the closed forms cancel, so a Taylor series is used there.
     */
    inline Stumpff stumpff(const double z)
    {
        if (std::abs(z) < 1e-3)
        {
            // Horner form of the alternating series 1/(2k+2)! and 1/(2k+3)!.
            const double c = 1.0 / 2.0 - z * (1.0 / 24.0 - z * (1.0 / 720.0 - z * (1.0 / 40320.0 - z / 3628800.0)));
            const double s = 1.0 / 6.0 - z * (1.0 / 120.0 - z * (1.0 / 5040.0 - z * (1.0 / 362880.0 - z / 39916800.0)));
            return {c, s};
        }

        const double w = std::sqrt(std::abs(z));
        if (z > 0.0)
        {
            return {(1.0 - std::cos(w)) / z, (w - std::sin(w)) / (z * w)};
        }
        return {(std::cosh(w) - 1.0) / -z, (std::sinh(w) - w) / (-z * w)};
    }

    namespace detail
    {
        /**
         * Universal Kepler equation for a fixed initial state,
         * sqrt(mu) dt = sigma0 chi^2 C + (1 - alpha r0) chi^3 S + r0 chi, with sigma0 = r0 . v0 / sqrt(mu)
         * and alpha = 1/a. Its derivative with respect to chi is the radius at chi.
         */
        struct UniversalKepler
        {
            double sqrt_mu;
            double r0;
            double sigma0;
            double alpha;

            double radius(const double chi, const Stumpff &sc) const
            {
                const double z = alpha * chi * chi;
                return sigma0 * chi * (1.0 - z * sc.s) + (1.0 - alpha * r0) * chi * chi * sc.c + r0;
            }

            Residual residual(const double chi, const double dt_s) const
            {
                const Stumpff sc = stumpff(alpha * chi * chi);
                const double time = sigma0 * chi * chi * sc.c + (1.0 - alpha * r0) * chi * chi * chi * sc.s + r0 * chi;
                return {time - sqrt_mu * dt_s, radius(chi, sc)};
            }

            /// Starting chi: the elliptic/hyperbolic estimate sqrt(mu) |alpha| dt, or the near-parabolic
            /// linear estimate when alpha vanishes.
            double initial_guess(const double dt_s) const
            {
                return (std::abs(alpha) > 1e-12) ? sqrt_mu * std::abs(alpha) * dt_s : sqrt_mu * dt_s / r0;
            }
        };

        /// Lagrange coefficients mapping (r0, v0) to the state at universal anomaly chi.
        struct LagrangeCoefficients
        {
            double f;
            double g;
            double fdot;
            double gdot;
        };

        inline LagrangeCoefficients lagrange_coefficients(const UniversalKepler &eq, const double chi,
                                                          const double dt_s, const double r)
        {
            const double z = eq.alpha * chi * chi;
            const Stumpff sc = stumpff(z);
            return {.f = 1.0 - chi * chi * sc.c / eq.r0,
                    .g = dt_s - chi * chi * chi * sc.s / eq.sqrt_mu,
                    .fdot = eq.sqrt_mu / (r * eq.r0) * (z * sc.s - 1.0) * chi,
                    .gdot = 1.0 - chi * chi * sc.c / r};
        }
    } // namespace detail

    /**
     * @brief Propagate a two-body orbit using the universal variable formulation.
     *
     * Works for every conic without special-casing. The computation runs in double precision and the
     * result is returned at the orbit's precision.
     *
     * @param orbit Initial orbit.
     * @param dt_s Time to propagate (can be negative for backward propagation).
     * @param opt Solver options.
     * @return The propagated orbit, or invalid_orbit(orbit.body()) if the input is invalid or Newton
     *         iteration does not converge.
     */
    template<class T>
    inline OrbitT<T> propagate_kepler(const OrbitT<T> &orbit, const double dt_s, const KeplerOptions &opt = {})
    {
        if (orbit.conic() == ConicSection::Invalid || !std::isfinite(dt_s))
        {
            return invalid_orbit(orbit.body());
        }

        const double mu_m3_s2 = static_cast<double>(orbit.body().mu_m3_s2());
        const Vec3 r0_m{orbit.position_inertial_m()};
        const Vec3 v0_mps{orbit.velocity_inertial_mps()};

        const double r0 = glm::length(r0_m);
        const double v0 = glm::length(v0_mps);
        if (!(mu_m3_s2 > 0.0) || !(r0 > 0.0) || !std::isfinite(r0) || !std::isfinite(v0))
        {
            return invalid_orbit(orbit.body());
        }

        const double sqrt_mu = std::sqrt(mu_m3_s2);
        const detail::UniversalKepler eq{.sqrt_mu = sqrt_mu,
                                         .r0 = r0,
                                         .sigma0 = glm::dot(r0_m, v0_mps) / sqrt_mu,
                                         .alpha = (2.0 / r0) - ((v0 * v0) / mu_m3_s2)};

        const KeplerSolveResult sol =
                detail::newton_solve(eq.initial_guess(dt_s), [&](const double chi) { return eq.residual(chi, dt_s); }, opt);
        if (!sol.converged)
        {
            spdlog::debug("propagate_kepler: universal anomaly did not converge after {} iterations (dt = {} s)",
                          sol.iterations, dt_s);
            return invalid_orbit(orbit.body());
        }

        const double chi = sol.anomaly_rad;
        const double r = eq.radius(chi, stumpff(eq.alpha * chi * chi));
        if (!(r > 0.0) || !std::isfinite(r))
        {
            spdlog::debug("propagate_kepler: degenerate radius after {} s", dt_s);
            return invalid_orbit(orbit.body());
        }

        const detail::LagrangeCoefficients lc = detail::lagrange_coefficients(eq, chi, dt_s, r);
        const Vec3 r_m = (lc.f * r0_m) + (lc.g * v0_mps);
        const Vec3 v_mps = (lc.fdot * r0_m) + (lc.gdot * v0_mps);

        return OrbitT<T>::from_cartesian(Vec3T<T>(r_m), Vec3T<T>(v_mps), orbit.body());
    }

} // namespace twobody
