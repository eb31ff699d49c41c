#include <twobody/twobody.hpp>

#include <spdlog/spdlog.h>

#include <cstdio>
#include <optional>
#include <string>

using spdlog::info;
using spdlog::warn;

namespace
{
    void print_orbit(const char *name, const twobody::Orbit &o)
    {
        using namespace twobody;
        std::printf("%s,%s,%.9f,%.3f,%.6f,%.6f,%.6f,%.6f\n",
                    name,
                    std::string(to_string(o.conic())).c_str(),
                    o.eccentricity(),
                    to_kilometers(o.semi_major_axis_m()),
                    to_degrees(o.inclination_rad()),
                    to_degrees(o.raan_rad()),
                    to_degrees(o.arg_periapsis_rad()),
                    to_degrees(o.true_anomaly_rad()));
    }
} // namespace

int main()
{
    using namespace twobody;

    spdlog::set_level(spdlog::level::info);

    // Slightly sub-circular LEO around Earth.
    const Orbit leo = Orbit::from_cartesian(Vec3{kilometers(7000.0), 0.0, 0.0}, Vec3{0.0, km_per_s(7.5), 0.0}, kEarth);
    if (!is_fully_defined(leo))
    {
        warn("LEO state did not produce an orbit");
        return 1;
    }
    info("LEO: {} orbit, period {:.1f} min", to_string(leo.conic()), orbital_period(leo) / minutes(1.0));

    // Transfer ellipse and escape hyperbola from elements.
    const Orbit gto = Orbit::from_elements(KeplerianElements{.eccentricity = 0.73,
                                                             .semi_major_axis_m = kilometers(24'400.0),
                                                             .inclination_rad = degrees(28.5),
                                                             .raan_rad = degrees(40.0),
                                                             .arg_periapsis_rad = degrees(180.0),
                                                             .true_anomaly_rad = 0.0},
                                           kEarth);
    const Orbit escape = Orbit::from_elements(KeplerianElements{.eccentricity = 1.2,
                                                                .semi_major_axis_m = -kilometers(20'000.0),
                                                                .inclination_rad = degrees(10.0),
                                                                .true_anomaly_rad = degrees(30.0)},
                                              kEarth);
    const Orbit lunar = circular_orbit(kLuna, kilometers(1837.4), degrees(90.0));

    std::printf("\n--- orbits ---\n");
    std::printf("name,conic,e,a_km,i_deg,raan_deg,argp_deg,nu_deg\n");
    print_orbit("leo", leo);
    print_orbit("gto", gto);
    print_orbit("escape", escape);
    print_orbit("lunar", lunar);

    // Kepler propagation of the transfer orbit over one period.
    std::printf("\n--- gto propagation ---\n");
    std::printf("t_min,r_km,nu_deg\n");
    const double period_s = orbital_period(gto);
    for (int k = 0; k <= 8; ++k)
    {
        const double t_s = period_s * (static_cast<double>(k) / 8.0);
        const Orbit o = propagate_kepler(gto, t_s);
        if (is_invalid(o))
        {
            warn("propagation failed at t = {:.1f} s", t_s);
            continue;
        }
        std::printf("%.2f,%.3f,%.6f\n",
                    t_s / minutes(1.0),
                    to_kilometers(glm::length(o.position_inertial_m())),
                    to_degrees(o.true_anomaly_rad()));
    }

    // Re-express the LEO in an Earth-fixed frame.
    constexpr double earth_rate_radps = 7.2921159e-5;
    const std::optional<RotatingFrame> fixed = make_body_fixed_frame(Vec3{0.0, 0.0, 1.0}, degrees(100.0), earth_rate_radps);
    if (!fixed.has_value())
    {
        warn("could not build the Earth-fixed frame");
        return 1;
    }
    const auto to_fixed = make_frame_transform(*fixed, InertialFrame{}, BodyFixedFrame{});
    const State s_fixed = to_fixed(leo.inertial_state());
    std::printf("\n--- leo earth-fixed ---\n");
    std::printf("%.3f,%.3f,%.3f,%.6f,%.6f,%.6f\n",
                to_kilometers(s_fixed.position_m.x),
                to_kilometers(s_fixed.position_m.y),
                to_kilometers(s_fixed.position_m.z),
                to_km_per_s(s_fixed.velocity_mps.x),
                to_km_per_s(s_fixed.velocity_mps.y),
                to_km_per_s(s_fixed.velocity_mps.z));

    // Mixed precision: a float orbit promoted alongside the double one.
    const Orbitf leo_f = leo.cast<float>();
    const auto [a, b] = promote(leo_f, leo);
    info("float/double eccentricity difference: {:.3e}", a.eccentricity() - b.eccentricity());

    return 0;
}
