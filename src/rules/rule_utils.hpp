#pragma once
#include "calibration.hpp"

namespace umpire {
class Trajectory;
}

namespace umpire { namespace rules {

// Throws ConfigError when a parameter is outside its documented range.
void validateRuleParameters(const RuleParameters& params);

// Engines only accept finalized trajectories (std::invalid_argument).
void requireFinalized(const Trajectory& trajectory);

// 1.0 for a complete trajectory, lower when a detection gap was flagged.
float trajectoryQuality(const Trajectory& trajectory);

// Effective stump-zone width factor for the LBW strictness level.
double strictnessZoneFactor(LbwStrictness strictness);

float clampConfidence(double value);

// OUT / WIDE rulings below the threshold are reported as the negative verdict.
bool belowOutThreshold(float confidence, const RuleParameters& params);

}} // namespace
