#pragma once

#include "twobody/celestial_body.hpp"
#include "twobody/conic.hpp"
#include "twobody/constants.hpp"
#include "twobody/orbit.hpp"
#include "twobody/types.hpp"
#include "twobody/units.hpp"

#include "twobody/coordinate_frames.hpp"
#include "twobody/frame_utils.hpp"
#include "twobody/kepler.hpp"
#include "twobody/orbit_calcs.hpp"
#include "twobody/orbit_utils.hpp"
#include "twobody/transform.hpp"
