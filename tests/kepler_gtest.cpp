#include <gtest/gtest.h>
#include "test_helpers.hpp"

#include <cmath>
#include <limits>
#include <numbers>
#include <optional>

using twobody::ConicSection;
using twobody::KeplerianElements;
using twobody::Orbit;
using twobody::Vec3;

namespace
{
    Orbit make_eccentric_orbit()
    {
        return Orbit::from_elements(KeplerianElements{.eccentricity = 0.3,
                                                      .semi_major_axis_m = twobody::kilometers(12000.0),
                                                      .inclination_rad = 0.7,
                                                      .raan_rad = 1.2,
                                                      .arg_periapsis_rad = 0.4,
                                                      .true_anomaly_rad = 0.5},
                                    twobody::kEarth);
    }
} // namespace

TEST(Kepler, SolvesEllipticEquation)
{
    const double e = 0.3;
    const double M = 1.0;
    const twobody::KeplerSolveResult res = twobody::solve_kepler(M, e);
    ASSERT_TRUE(res.converged);
    EXPECT_GT(res.iterations, 0);
    EXPECT_TRUE(near_abs(res.anomaly_rad - e * std::sin(res.anomaly_rad), M, 1e-12));
}

TEST(Kepler, SolvesHighEccentricityAndManyRevolutions)
{
    const double e = 0.95;
    const double M = 20.0;
    const twobody::KeplerSolveResult res = twobody::solve_kepler(M, e);
    ASSERT_TRUE(res.converged);
    EXPECT_TRUE(near_abs(res.anomaly_rad - e * std::sin(res.anomaly_rad), M, 1e-11));

    const twobody::KeplerSolveResult neg = twobody::solve_kepler(-0.2, e);
    ASSERT_TRUE(neg.converged);
    EXPECT_LT(neg.anomaly_rad, 0.0);
    EXPECT_TRUE(near_abs(neg.anomaly_rad - e * std::sin(neg.anomaly_rad), -0.2, 1e-12));
}

TEST(Kepler, SolvesHyperbolicEquation)
{
    const double e = 1.5;
    const double M = 2.0;
    const twobody::KeplerSolveResult res = twobody::solve_kepler(M, e);
    ASSERT_TRUE(res.converged);
    EXPECT_TRUE(near_abs(e * std::sinh(res.anomaly_rad) - res.anomaly_rad, M, 1e-11));
}

TEST(Kepler, RejectsUnsolvableInput)
{
    EXPECT_FALSE(twobody::solve_kepler(1.0, 1.0).converged);
    EXPECT_FALSE(twobody::solve_kepler(1.0, -0.1).converged);
    EXPECT_FALSE(twobody::solve_kepler(std::numeric_limits<double>::quiet_NaN(), 0.1).converged);
    EXPECT_FALSE(twobody::solve_kepler(1.0, std::numeric_limits<double>::infinity()).converged);
}

TEST(Kepler, StumpffFunctions)
{
    const double pi = std::numbers::pi;
    EXPECT_DOUBLE_EQ(twobody::stumpff(0.0).c, 0.5);
    EXPECT_DOUBLE_EQ(twobody::stumpff(0.0).s, 1.0 / 6.0);

    // z = pi^2: cos(sqrt(z)) = -1, sin(sqrt(z)) = 0.
    EXPECT_TRUE(near_abs(twobody::stumpff(pi * pi).c, 2.0 / (pi * pi), 1e-15));
    EXPECT_TRUE(near_abs(twobody::stumpff(pi * pi).s, 1.0 / (pi * pi), 1e-15));

    EXPECT_TRUE(near_abs(twobody::stumpff(-1.0).c, std::cosh(1.0) - 1.0, 1e-15));
    EXPECT_TRUE(near_abs(twobody::stumpff(-1.0).s, std::sinh(1.0) - 1.0, 1e-15));

    // Continuous across the series band.
    EXPECT_TRUE(near_abs(twobody::stumpff(1e-6).c, 0.5, 1e-7));
    EXPECT_TRUE(near_abs(twobody::stumpff(-1e-6).s, 1.0 / 6.0, 1e-7));
}

TEST(Kepler, OnePeriodReturnsToStart)
{
    const Orbit o0 = make_eccentric_orbit();
    ASSERT_EQ(o0.conic(), ConicSection::Elliptical);

    const Orbit o1 = twobody::propagate_kepler(o0, twobody::orbital_period(o0));
    ASSERT_TRUE(twobody::is_fully_defined(o1));
    EXPECT_TRUE(near_vec_rel(o1.position_inertial_m(), o0.position_inertial_m(), 1e-8));
    EXPECT_TRUE(near_vec_rel(o1.velocity_inertial_mps(), o0.velocity_inertial_mps(), 1e-8));
    EXPECT_TRUE(near_angle(o1.true_anomaly_rad(), o0.true_anomaly_rad(), 1e-8));
}

TEST(Kepler, PropagationAdvancesMeanAnomaly)
{
    const Orbit o0 = make_eccentric_orbit();
    const double dt_s = twobody::minutes(37.0);
    const Orbit o1 = twobody::propagate_kepler(o0, dt_s);
    ASSERT_EQ(o1.conic(), ConicSection::Elliptical);

    // Shape and orientation are constants of motion.
    EXPECT_TRUE(near_rel(o1.eccentricity(), o0.eccentricity(), 1e-9));
    EXPECT_TRUE(near_rel(o1.semi_major_axis_m(), o0.semi_major_axis_m(), 1e-9));
    EXPECT_TRUE(near_angle(o1.inclination_rad(), o0.inclination_rad(), 1e-9));
    EXPECT_TRUE(near_angle(o1.raan_rad(), o0.raan_rad(), 1e-9));
    EXPECT_TRUE(near_angle(o1.arg_periapsis_rad(), o0.arg_periapsis_rad(), 1e-9));

    // Same answer through Kepler's equation.
    const double M1 = twobody::anomalies(o0).mean_anomaly_rad + twobody::mean_motion(o0) * dt_s;
    const twobody::KeplerSolveResult E1 = twobody::solve_kepler(M1, o0.eccentricity());
    ASSERT_TRUE(E1.converged);
    const double nu1 = twobody::true_anomaly_from_anomaly(ConicSection::Elliptical, o0.eccentricity(), E1.anomaly_rad);
    EXPECT_TRUE(near_angle(o1.true_anomaly_rad(), nu1, 1e-9));
}

TEST(Kepler, HyperbolicForwardAndBack)
{
    const Orbit o0 = Orbit::from_cartesian(Vec3{7.0e6, 0.0, 0.0}, Vec3{0.0, 1.2e4, 1.0e3}, twobody::kEarth);
    ASSERT_EQ(o0.conic(), ConicSection::Hyperbolic);

    const double dt_s = twobody::hours(3.0);
    const Orbit out = twobody::propagate_kepler(o0, dt_s);
    ASSERT_EQ(out.conic(), ConicSection::Hyperbolic);
    EXPECT_GT(glm::length(out.position_inertial_m()), glm::length(o0.position_inertial_m()));

    const Orbit back = twobody::propagate_kepler(out, -dt_s);
    ASSERT_TRUE(twobody::is_fully_defined(back));
    EXPECT_TRUE(near_vec_rel(back.position_inertial_m(), o0.position_inertial_m(), 1e-8));
    EXPECT_TRUE(near_vec_rel(back.velocity_inertial_mps(), o0.velocity_inertial_mps(), 1e-8));
}

TEST(Kepler, ParabolicPropagationFollowsBarker)
{
    const Orbit o0 = Orbit::from_parabolic_elements(twobody::kilometers(7000.0), 0.3, 0.0, 0.0, 0.0, twobody::kEarth);
    ASSERT_EQ(o0.conic(), ConicSection::Parabolic);

    const double dt_s = twobody::minutes(45.0);
    const Orbit o1 = twobody::propagate_kepler(o0, dt_s);
    ASSERT_TRUE(twobody::is_fully_defined(o1));

    // Angle travelled from periapsis, measured in the initial orbital plane.
    const std::optional<twobody::RotatingFrame> pqw = twobody::make_perifocal_frame(o0);
    ASSERT_TRUE(pqw.has_value());
    const Vec3 r1 = twobody::inertial_position_to_frame(*pqw, o1.position_inertial_m());
    EXPECT_TRUE(near_abs(r1.z, 0.0, 1e-6 * glm::length(r1)));

    const double D1 = std::tan(0.5 * std::atan2(r1.y, r1.x));
    const double p = twobody::kilometers(14000.0);
    const double expected_M = twobody::mean_motion(o0) * dt_s;
    EXPECT_TRUE(near_rel(D1 + D1 * D1 * D1 / 3.0, expected_M, 1e-8));
    EXPECT_TRUE(near_rel(twobody::mean_motion(o0), 2.0 * std::sqrt(twobody::kEarth.mu_m3_s2() / (p * p * p)), 1e-12));
}

TEST(Kepler, NonConvergenceYieldsInvalidOrbit)
{
    const Orbit o0 = make_eccentric_orbit();
    const twobody::KeplerOptions opt{.max_iterations = 1};
    const Orbit o1 = twobody::propagate_kepler(o0, twobody::minutes(20.0), opt);

    EXPECT_TRUE(twobody::is_invalid(o1));
    EXPECT_EQ(o1.conic(), ConicSection::Invalid);
    EXPECT_EQ(o1.body(), o0.body());
}

TEST(Kepler, InvalidInputStaysInvalid)
{
    const Orbit sentinel = twobody::invalid_orbit(twobody::kMoon);
    const Orbit out = twobody::propagate_kepler(sentinel, 60.0);
    EXPECT_TRUE(twobody::is_invalid(out));
    EXPECT_EQ(out.body(), twobody::kLuna);

    const Orbit o0 = make_eccentric_orbit();
    EXPECT_TRUE(twobody::is_invalid(twobody::propagate_kepler(o0, std::numeric_limits<double>::quiet_NaN())));
}

TEST(Kepler, PropagatesSinglePrecision)
{
    const Orbit od = make_eccentric_orbit();
    const twobody::Orbitf of = od.cast<float>();

    const double dt_s = twobody::minutes(10.0);
    const twobody::Orbitf pf = twobody::propagate_kepler(of, dt_s);
    const Orbit pd = twobody::propagate_kepler(od, dt_s);
    ASSERT_TRUE(twobody::is_fully_defined(pf));

    EXPECT_TRUE(near_vec_rel(Vec3(pf.position_inertial_m()), pd.position_inertial_m(), 1e-5));
    EXPECT_TRUE(near_vec_rel(Vec3(pf.velocity_inertial_mps()), pd.velocity_inertial_mps(), 1e-5));
}
