#pragma once

namespace twobody
{

    inline constexpr double kGravitationalConstant_SI = 6.67430e-11; // m^3 / (kg s^2)

} // namespace twobody
