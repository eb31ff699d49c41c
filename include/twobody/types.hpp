#pragma once

#include <glm/glm.hpp>

#include <type_traits>

namespace twobody
{

    /// Three-component vector at floating-point precision `T`.
    template<class T>
    using Vec3T = glm::vec<3, T, glm::defaultp>;

    using Vec3 = Vec3T<double>;
    using Vec3f = Vec3T<float>;

    /// @brief The wider of two floating-point precisions (float + double -> double).
    template<class A, class B>
    using promote_t = std::common_type_t<A, B>;

    template<class T>
    struct StateT
    {
        Vec3T<T> position_m{T(0), T(0), T(0)};
        Vec3T<T> velocity_mps{T(0), T(0), T(0)};
    };

    using State = StateT<double>;

    /// @brief Create a State with position and velocity.
    /// @param position_m Position vector [m].
    /// @param velocity_mps Velocity vector [m/s].
    template<class T>
    inline StateT<T> make_state(const Vec3T<T> &position_m, const Vec3T<T> &velocity_mps)
    {
        return StateT<T>{.position_m = position_m, .velocity_mps = velocity_mps};
    }

} // namespace twobody
