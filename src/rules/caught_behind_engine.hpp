#pragma once
#include "rules/decisions.hpp"
#include "calibration.hpp"
#include "types.hpp"

#include <vector>

namespace umpire {
class CoordinateMapper;
class Trajectory;
}

namespace umpire { namespace rules {

// Deflection angle (degrees) that counts as an edge for the sensitivity.
double edgeDeflectionThresholdDeg(double edge_sensitivity);

/**
 * Caught-behind ruling against the wall catch zone.
 *
 * Needs an edge: a BAT impact whose velocity direction turns by at least
 * edgeDeflectionThresholdDeg(). Without one the appeal is NOT_APPLICABLE.
 * After the edge, contacts are taken in frame order with ground first on
 * equal frames:
 *   ground before wall  -> NOT_OUT
 *   no wall contact     -> NOT_OUT
 *   wall without ground -> OUT
 * A bounce in the post-edge trajectory counts as ground contact even when no
 * GROUND impact was reported.
 *
 * Throws CalibrationError when the session has no wall boundary.
 */
CaughtBehindDecision evaluateCaughtBehind(const Trajectory& trajectory,
                                          const std::vector<ImpactEvent>& impacts,
                                          const CoordinateMapper& mapper,
                                          const RuleParameters& params);

}} // namespace
