#pragma once

#include "twobody/conic.hpp"
#include "twobody/coordinate_frames.hpp"
#include "twobody/orbit.hpp"
#include "twobody/types.hpp"

#include <utility>

namespace twobody
{

    // Frame identity tags. Any empty, default-constructible type can name a frame.

    /** @brief Inertial frame the orbit's Cartesian state is natively expressed in. */
    struct InertialFrame
    {
    };

    /** @brief Frame rotating with the central body. */
    struct BodyFixedFrame
    {
    };

    /** @brief Orbital-plane frame with periapsis along +X. */
    struct PerifocalFrame
    {
    };

    /**
     * @brief Coordinate transformation from frame `From` to frame `To`.
     *
     * Holds two independent sub-transforms:
     * - position: `r_to = position_transform(r_from)`
     * - velocity: `v_to = velocity_transform(r_from, v_from)`; it receives the position as well because a
     *   rotating frame contributes an `ω × r` term.
     *
     * Both sub-transforms are callables over `Vec3T<T>` for the precisions they are applied to.
     */
    template<class From, class To, class PositionTransform, class VelocityTransform>
    class Transform
    {
    public:
        using from_frame = From;
        using to_frame = To;

        Transform(PositionTransform position_transform, VelocityTransform velocity_transform)
            : position_transform_(std::move(position_transform)), velocity_transform_(std::move(velocity_transform))
        {
        }

        const PositionTransform &position_transform() const { return position_transform_; }
        const VelocityTransform &velocity_transform() const { return velocity_transform_; }

        template<class T>
        Vec3T<T> position(const Vec3T<T> &r_from) const
        {
            return Vec3T<T>(position_transform_(r_from));
        }

        template<class T>
        Vec3T<T> velocity(const Vec3T<T> &r_from, const Vec3T<T> &v_from) const
        {
            return Vec3T<T>(velocity_transform_(r_from, v_from));
        }

        template<class T>
        StateT<T> operator()(const StateT<T> &s) const
        {
            return make_state(position(s.position_m), velocity(s.position_m, s.velocity_mps));
        }

        /**
         * @brief Re-express `orbit` in the destination frame.
         *
         * The Cartesian state is transformed and every element is recomputed from it, with inclination
         * and RAAN referenced to the destination frame's XY plane. The invalid sentinel maps to itself.
         */
        template<class T>
        OrbitT<T> operator()(const OrbitT<T> &orbit, const ConicTolerances &tol = {}) const
        {
            if (orbit.conic() == ConicSection::Invalid)
            {
                return invalid_orbit(orbit.body());
            }
            const StateT<T> s = (*this)(orbit.inertial_state());
            return OrbitT<T>::from_cartesian(s.position_m, s.velocity_mps, orbit.body(), tol);
        }

    private:
        PositionTransform position_transform_;
        VelocityTransform velocity_transform_;
    };

    /**
     * @brief Build a Transform from its sub-transforms and the frame identities.
     *
     * Alternate spelling of `Transform<From, To, P, V>(position_transform, velocity_transform)`.
     */
    template<class PositionTransform, class VelocityTransform, class From, class To>
    inline Transform<From, To, PositionTransform, VelocityTransform>
    make_transform(PositionTransform position_transform, VelocityTransform velocity_transform, From, To)
    {
        return Transform<From, To, PositionTransform, VelocityTransform>(std::move(position_transform),
                                                                         std::move(velocity_transform));
    }

    // -------------------------------------------------------------------------
    // Sub-transforms backed by a RotatingFrame.
    // -------------------------------------------------------------------------

    /** @brief Inertial -> frame position. */
    struct FramePositionTransform
    {
        RotatingFrame frame{};

        template<class T>
        Vec3T<T> operator()(const Vec3T<T> &r_in) const
        {
            return Vec3T<T>(inertial_position_to_frame(frame, Vec3(r_in)));
        }
    };

    /** @brief Inertial -> frame velocity, `v_f = R^T (v_i - v_origin) - ω_f × r_f`. */
    struct FrameVelocityTransform
    {
        RotatingFrame frame{};

        template<class T>
        Vec3T<T> operator()(const Vec3T<T> &r_in, const Vec3T<T> &v_in) const
        {
            return Vec3T<T>(inertial_velocity_to_frame(frame, Vec3(r_in), Vec3(v_in)));
        }
    };

    /** @brief Frame -> inertial position. */
    struct InverseFramePositionTransform
    {
        RotatingFrame frame{};

        template<class T>
        Vec3T<T> operator()(const Vec3T<T> &r_frame) const
        {
            return Vec3T<T>(frame_position_to_inertial(frame, Vec3(r_frame)));
        }
    };

    /** @brief Frame -> inertial velocity, `v_i = v_origin + R (v_f + ω_f × r_f)`. */
    struct InverseFrameVelocityTransform
    {
        RotatingFrame frame{};

        template<class T>
        Vec3T<T> operator()(const Vec3T<T> &r_frame, const Vec3T<T> &v_frame) const
        {
            return Vec3T<T>(frame_velocity_to_inertial(frame, Vec3(r_frame), Vec3(v_frame)));
        }
    };

    template<class From, class To>
    using RotatingFrameTransform = Transform<From, To, FramePositionTransform, FrameVelocityTransform>;

    template<class From, class To>
    using InverseRotatingFrameTransform =
            Transform<From, To, InverseFramePositionTransform, InverseFrameVelocityTransform>;

    /// @brief Transform from `From` (inertial coordinates) into the rotating frame `To`.
    template<class From, class To>
    inline RotatingFrameTransform<From, To> make_frame_transform(const RotatingFrame &frame, From from, To to)
    {
        return make_transform(FramePositionTransform{frame}, FrameVelocityTransform{frame}, from, to);
    }

    template<class From, class To>
    inline InverseRotatingFrameTransform<To, From> inverse(const RotatingFrameTransform<From, To> &t)
    {
        const RotatingFrame &frame = t.position_transform().frame;
        return make_transform(InverseFramePositionTransform{frame}, InverseFrameVelocityTransform{frame}, To{},
                              From{});
    }

    template<class From, class To>
    inline RotatingFrameTransform<To, From> inverse(const InverseRotatingFrameTransform<From, To> &t)
    {
        const RotatingFrame &frame = t.position_transform().frame;
        return make_transform(FramePositionTransform{frame}, FrameVelocityTransform{frame}, To{}, From{});
    }

    /**
     * @brief Chain `first` (A -> B) and `second` (B -> C) into A -> C.
     *
     * The shared frame B is part of both types, so a mismatched chain does not compile.
     */
    template<class A, class B, class C, class P1, class V1, class P2, class V2>
    inline auto compose(const Transform<A, B, P1, V1> &first, const Transform<B, C, P2, V2> &second)
    {
        auto position = [first, second](const auto &r_a) { return second.position(first.position(r_a)); };
        auto velocity = [first, second](const auto &r_a, const auto &v_a) {
            return second.velocity(first.position(r_a), first.velocity(r_a, v_a));
        };
        return make_transform(std::move(position), std::move(velocity), A{}, C{});
    }

} // namespace twobody
