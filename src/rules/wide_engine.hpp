#pragma once
#include "rules/decisions.hpp"
#include "calibration.hpp"

namespace umpire {
class CoordinateMapper;
class Trajectory;
}

namespace umpire { namespace rules {

// Wide ruling from the ball position at the batting crease.
//
// The crease point is interpolated between the two samples bracketing the
// crease line, or taken from the nearest sample when the ball never crossed
// it. A ball beyond a wide line is WIDE on that side; a ball exactly on the
// line is not. Confidence is lowest on the line and rises with distance up
// to the configured margin. Uses params.handedness.
WideDecision evaluateWide(const Trajectory& trajectory,
                          const CoordinateMapper& mapper,
                          const RuleParameters& params);

}} // namespace
