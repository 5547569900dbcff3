#include "rules/rule_utils.hpp"
#include "rules/decisions.hpp"
#include "errors.hpp"
#include "trajectory.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace umpire { namespace rules {

namespace {
constexpr float kDetectionGapPenalty = 0.75f;
}

const char* toString(Verdict v) {
    switch (v) {
        case Verdict::OUT:            return "OUT";
        case Verdict::NOT_OUT:        return "NOT_OUT";
        case Verdict::NOT_APPLICABLE: return "NOT_APPLICABLE";
    }
    return "unknown";
}

const char* toString(WideVerdict v) {
    return v == WideVerdict::WIDE ? "WIDE" : "NOT_WIDE";
}

const char* toString(WideSide s) {
    return s == WideSide::OFF ? "off" : "leg";
}

const char* toString(LineZone z) {
    switch (z) {
        case LineZone::IN_LINE:     return "in_line";
        case LineZone::OUTSIDE_OFF: return "outside_off";
        case LineZone::OUTSIDE_LEG: return "outside_leg";
        case LineZone::NOT_PITCHED: return "not_pitched";
    }
    return "unknown";
}

void validateRuleParameters(const RuleParameters& params) {
    if (params.stump_tolerance < 0.5 || params.stump_tolerance > 3.0) {
        throw ConfigError("stump tolerance must be within 0.5 - 3.0, got " +
                          std::to_string(params.stump_tolerance));
    }
    if (params.edge_sensitivity < 0.0 || params.edge_sensitivity > 1.0) {
        throw ConfigError("edge sensitivity must be within 0 - 1");
    }
    if (params.min_out_confidence < 0.0 || params.min_out_confidence > 1.0) {
        throw ConfigError("minimum OUT confidence must be within 0 - 1");
    }
    if (params.wide_off_side_m <= 0.0 || params.wide_leg_side_m <= 0.0) {
        throw ConfigError("wide corridor distances must be positive");
    }
    if (params.wide_confidence_margin_m <= 0.0) {
        throw ConfigError("wide confidence margin must be positive");
    }
    if (params.min_projection_samples < 2) {
        throw ConfigError("projection needs at least 2 pre-impact samples");
    }
    if (params.max_projection_steps < 1) {
        throw ConfigError("projection step cap must be positive");
    }
}

void requireFinalized(const Trajectory& trajectory) {
    if (!trajectory.isFinalized()) {
        throw std::invalid_argument("rule engines evaluate finalized trajectories only");
    }
}

float trajectoryQuality(const Trajectory& trajectory) {
    return trajectory.detectionGap() ? kDetectionGapPenalty : 1.0f;
}

double strictnessZoneFactor(LbwStrictness strictness) {
    switch (strictness) {
        case LbwStrictness::STRICT:   return 0.85;
        case LbwStrictness::STANDARD: return 1.0;
        case LbwStrictness::LENIENT:  return 1.15;
    }
    return 1.0;
}

float clampConfidence(double value) {
    return static_cast<float>(std::clamp(value, 0.0, 1.0));
}

bool belowOutThreshold(float confidence, const RuleParameters& params) {
    return confidence < params.min_out_confidence;
}

}} // namespace
