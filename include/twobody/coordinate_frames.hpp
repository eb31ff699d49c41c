#pragma once

#include "twobody/frame_utils.hpp"
#include "twobody/orbit.hpp"
#include "twobody/types.hpp"

#include <cmath>
#include <optional>

namespace twobody
{

    /**
     * @brief Rigid translating + rotating coordinate frame relative to an inertial frame.
     *
     * Convention:
     * - Basis vectors `ex_i/ey_i/ez_i` are expressed in inertial coordinates (orthonormal).
     * - `omega_inertial_radps` is the frame angular velocity expressed in inertial coordinates.
     * - Inertial -> frame for velocities applies the non-inertial term: `v_f = R^T v_i - ω_f × r_f`.
     *
     * Stored in double precision; vectors of any precision are transformed in double and cast back.
     */
    struct RotatingFrame
    {
        /// Frame origin position expressed in inertial coordinates.
        Vec3 origin_position_m{0.0, 0.0, 0.0};
        /// Frame origin velocity expressed in inertial coordinates.
        Vec3 origin_velocity_mps{0.0, 0.0, 0.0};

        /// Frame X-axis expressed in inertial coordinates.
        Vec3 ex_i{1.0, 0.0, 0.0};
        /// Frame Y-axis expressed in inertial coordinates.
        Vec3 ey_i{0.0, 1.0, 0.0};
        /// Frame Z-axis expressed in inertial coordinates.
        Vec3 ez_i{0.0, 0.0, 1.0};

        /// Frame angular velocity expressed in inertial coordinates.
        Vec3 omega_inertial_radps{0.0, 0.0, 0.0};

        /// @brief Returns true if all frame fields are finite.
        inline bool valid() const
        {
            return is_finite_vec(origin_position_m) && is_finite_vec(origin_velocity_mps) && is_finite_vec(ex_i) &&
                   is_finite_vec(ey_i) && is_finite_vec(ez_i) && is_finite_vec(omega_inertial_radps);
        }
    };

    inline Vec3 inertial_vector_to_frame(const RotatingFrame &frame, const Vec3 &v_in)
    {
        return Vec3{glm::dot(frame.ex_i, v_in), glm::dot(frame.ey_i, v_in), glm::dot(frame.ez_i, v_in)};
    }

    inline Vec3 frame_vector_to_inertial(const RotatingFrame &frame, const Vec3 &v_frame)
    {
        return frame.ex_i * v_frame.x + frame.ey_i * v_frame.y + frame.ez_i * v_frame.z;
    }

    inline Vec3 inertial_position_to_frame(const RotatingFrame &frame, const Vec3 &pos_in_m)
    {
        return inertial_vector_to_frame(frame, pos_in_m - frame.origin_position_m);
    }

    inline Vec3 frame_position_to_inertial(const RotatingFrame &frame, const Vec3 &pos_frame_m)
    {
        return frame.origin_position_m + frame_vector_to_inertial(frame, pos_frame_m);
    }

    /// @brief Inertial velocity at inertial position `pos_in_m`, expressed in the frame.
    inline Vec3 inertial_velocity_to_frame(const RotatingFrame &frame, const Vec3 &pos_in_m, const Vec3 &vel_in_mps)
    {
        const Vec3 r_frame_m = inertial_position_to_frame(frame, pos_in_m);
        const Vec3 omega_frame_radps = inertial_vector_to_frame(frame, frame.omega_inertial_radps);
        return inertial_vector_to_frame(frame, vel_in_mps - frame.origin_velocity_mps) -
               glm::cross(omega_frame_radps, r_frame_m);
    }

    /// @brief Frame velocity at frame position `pos_frame_m`, expressed in inertial coordinates.
    inline Vec3 frame_velocity_to_inertial(const RotatingFrame &frame, const Vec3 &pos_frame_m,
                                           const Vec3 &vel_frame_mps)
    {
        const Vec3 omega_frame_radps = inertial_vector_to_frame(frame, frame.omega_inertial_radps);
        return frame.origin_velocity_mps +
               frame_vector_to_inertial(frame, vel_frame_mps + glm::cross(omega_frame_radps, pos_frame_m));
    }

    // -------------------------------------------------------------------------
    // BCI: Body-centered inertial frame (translation only; no rotation).
    // -------------------------------------------------------------------------

    inline RotatingFrame make_body_centered_inertial_frame(const State &body_inertial_state)
    {
        RotatingFrame f;
        f.origin_position_m = body_inertial_state.position_m;
        f.origin_velocity_mps = body_inertial_state.velocity_mps;
        return f;
    }

    // -------------------------------------------------------------------------
    // Body-fixed rotating frame from a spin axis, rotation angle and rate.
    //
    // - ez_i: spin axis (in inertial coordinates)
    // - ex_i: a "prime meridian" reference perpendicular to ez_i, rotated by angle about ez_i
    // - ey_i: completes right-handed basis
    // -------------------------------------------------------------------------

    /**
     * @brief Construct a deterministic body-fixed frame centered on the body.
     *
     * Returns `std::nullopt` if the spin axis is not valid/finite or the basis construction becomes
     * degenerate.
     *
     * @param spin_axis Spin axis in inertial coordinates (normalized internally).
     * @param angle_rad Rotation angle of the prime meridian about the axis.
     * @param rate_radps Spin rate.
     */
    inline std::optional<RotatingFrame> make_body_fixed_frame(const Vec3 &spin_axis, const double angle_rad,
                                                              const double rate_radps)
    {
        const Vec3 axis = normalized_or(spin_axis, Vec3{0.0, 0.0, 0.0});
        const double axis2 = glm::dot(axis, axis);
        if (!(axis2 > 0.0) || !std::isfinite(axis2))
        {
            return std::nullopt;
        }

        const Vec3 ez = axis;

        // Choose a deterministic reference for the prime meridian at angle=0.
        const Vec3 a = (std::abs(ez.x) < 0.9) ? Vec3{1.0, 0.0, 0.0} : Vec3{0.0, 1.0, 0.0};
        Vec3 ex0 = a - glm::dot(a, ez) * ez;
        ex0 = normalized_or(ex0, Vec3{0.0, 0.0, 0.0});
        const double ex02 = glm::dot(ex0, ex0);
        if (!(ex02 > 0.0) || !std::isfinite(ex02))
        {
            return std::nullopt;
        }

        const double theta = wrap_angle_0_2pi(angle_rad);
        Vec3 ex = normalized_or(rotate_about_axis(ex0, ez, theta), ex0);
        Vec3 ey = normalized_or(glm::cross(ez, ex), Vec3{0.0, 0.0, 0.0});
        ex = normalized_or(glm::cross(ey, ez), ex);
        ey = normalized_or(glm::cross(ez, ex), ey);

        RotatingFrame f;
        f.ex_i = ex;
        f.ey_i = ey;
        f.ez_i = ez;
        f.omega_inertial_radps = std::isfinite(rate_radps) ? ez * rate_radps : Vec3{0.0, 0.0, 0.0};
        return f;
    }

    // -------------------------------------------------------------------------
    // Perifocal (PQW) frame of an orbit.
    //
    // - ex_i: P, toward periapsis (ascending node / +X for the canonical circular/equatorial cases)
    // - ey_i: Q, 90 degrees ahead of P in the direction of motion
    // - ez_i: W, orbit normal
    // -------------------------------------------------------------------------

    /**
     * @brief Construct the perifocal frame of `orbit` (non-rotating, centered on the body).
     *
     * Returns `std::nullopt` for an orbit whose orientation angles are not defined.
     */
    template<class T>
    inline std::optional<RotatingFrame> make_perifocal_frame(const OrbitT<T> &orbit)
    {
        const double raan = static_cast<double>(orbit.raan_rad());
        const double inc = static_cast<double>(orbit.inclination_rad());
        const double argp = static_cast<double>(orbit.arg_periapsis_rad());
        if (!std::isfinite(raan) || !std::isfinite(inc) || !std::isfinite(argp))
        {
            return std::nullopt;
        }

        const double cO = std::cos(raan);
        const double sO = std::sin(raan);
        const double ci = std::cos(inc);
        const double si = std::sin(inc);
        const double cw = std::cos(argp);
        const double sw = std::sin(argp);

        RotatingFrame f;
        f.ex_i = Vec3{cO * cw - sO * sw * ci, sO * cw + cO * sw * ci, sw * si};
        f.ey_i = Vec3{-cO * sw - sO * cw * ci, -sO * sw + cO * cw * ci, cw * si};
        f.ez_i = Vec3{sO * si, -cO * si, ci};
        return f;
    }

} // namespace twobody
