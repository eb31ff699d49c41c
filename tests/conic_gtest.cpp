#include <gtest/gtest.h>
#include "test_helpers.hpp"

#include <limits>

using twobody::ConicSection;

TEST(Conic, ClassifiesEveryRegime)
{
    EXPECT_EQ(twobody::classify_conic(0.0), ConicSection::Circular);
    EXPECT_EQ(twobody::classify_conic(0.5), ConicSection::Elliptical);
    EXPECT_EQ(twobody::classify_conic(1.0), ConicSection::Parabolic);
    EXPECT_EQ(twobody::classify_conic(1.5), ConicSection::Hyperbolic);
}

TEST(Conic, ToleranceBands)
{
    EXPECT_EQ(twobody::classify_conic(1e-12), ConicSection::Circular);
    EXPECT_EQ(twobody::classify_conic(1e-6), ConicSection::Elliptical);
    EXPECT_EQ(twobody::classify_conic(1.0 - 1e-12), ConicSection::Parabolic);
    EXPECT_EQ(twobody::classify_conic(1.0 + 1e-12), ConicSection::Parabolic);
    EXPECT_EQ(twobody::classify_conic(1.0 - 1e-6), ConicSection::Elliptical);
    EXPECT_EQ(twobody::classify_conic(1.0 + 1e-6), ConicSection::Hyperbolic);

    const twobody::ConicTolerances loose{.circular_eccentricity = 1e-3, .parabolic_eccentricity = 1e-3};
    EXPECT_EQ(twobody::classify_conic(5e-4, true, loose), ConicSection::Circular);
    EXPECT_EQ(twobody::classify_conic(1.0005, true, loose), ConicSection::Parabolic);
    EXPECT_EQ(twobody::classify_conic(0.9, true, loose), ConicSection::Elliptical);
}

TEST(Conic, InvalidInputs)
{
    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EQ(twobody::classify_conic(nan), ConicSection::Invalid);
    EXPECT_EQ(twobody::classify_conic(-0.1), ConicSection::Invalid);

    // Validity wins over a nominal eccentricity.
    EXPECT_EQ(twobody::classify_conic(0.0, false), ConicSection::Invalid);
    EXPECT_EQ(twobody::classify_conic(0.5, false), ConicSection::Invalid);
    EXPECT_EQ(twobody::classify_conic(1.5, false), ConicSection::Invalid);
}

TEST(Conic, BandsWidenToScalarRoundoff)
{
    const twobody::ConicTolerances d = twobody::tolerances_for<double>({});
    EXPECT_EQ(d.circular_eccentricity, 1e-10);
    EXPECT_EQ(d.parabolic_eccentricity, 1e-10);

    const twobody::ConicTolerances f = twobody::tolerances_for<float>({});
    const double float_floor = 64.0 * static_cast<double>(std::numeric_limits<float>::epsilon());
    EXPECT_EQ(f.circular_eccentricity, float_floor);
    EXPECT_EQ(f.parabolic_eccentricity, float_floor);
    EXPECT_EQ(twobody::classify_conic(1.03e-7, true, f), ConicSection::Circular);
    EXPECT_EQ(twobody::classify_conic(1.0 + 1.19e-7, true, f), ConicSection::Parabolic);
    EXPECT_EQ(twobody::classify_conic(1e-3, true, f), ConicSection::Elliptical);

    // Caller bands wider than the floor are kept.
    const twobody::ConicTolerances loose = twobody::tolerances_for<float>({.circular_eccentricity = 1e-3});
    EXPECT_EQ(loose.circular_eccentricity, 1e-3);
    EXPECT_EQ(loose.parabolic_eccentricity, float_floor);
}

TEST(Conic, InvalidOrbitClassifiesInvalid)
{
    const twobody::Orbit sentinel = twobody::invalid_orbit(twobody::kEarth);
    EXPECT_EQ(sentinel.conic(), ConicSection::Invalid);
    EXPECT_EQ(twobody::classify_conic(0.5, twobody::is_fully_defined(sentinel)), ConicSection::Invalid);
    EXPECT_EQ(twobody::classify_conic(sentinel.eccentricity(), twobody::is_fully_defined(sentinel)),
              ConicSection::Invalid);
}

TEST(Conic, ClosedAndNames)
{
    EXPECT_TRUE(twobody::is_closed(ConicSection::Circular));
    EXPECT_TRUE(twobody::is_closed(ConicSection::Elliptical));
    EXPECT_FALSE(twobody::is_closed(ConicSection::Parabolic));
    EXPECT_FALSE(twobody::is_closed(ConicSection::Hyperbolic));
    EXPECT_FALSE(twobody::is_closed(ConicSection::Invalid));

    EXPECT_EQ(twobody::to_string(ConicSection::Hyperbolic), "Hyperbolic");
    EXPECT_EQ(twobody::to_string(ConicSection::Invalid), "Invalid");
}
