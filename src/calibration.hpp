// calibration.hpp
#pragma once

#include "types.hpp"

#include <opencv2/core.hpp>

#include <vector>

namespace umpire {

// Stump tops in pixels, labelled as seen by a right-handed batter.
struct StumpSet {
    cv::Point2f off;
    cv::Point2f middle;
    cv::Point2f leg;
};

// Session geometry. Immutable while a delivery is in flight.
struct CalibrationData {
    double pitch_length_m = 20.12;
    cv::Point2f bowling_crease_px;   // crease centres; their distance is the
    cv::Point2f batting_crease_px;   // pixel equivalent of pitch_length_m
    StumpSet batting_stumps;
    StumpSet bowling_stumps;
    double stump_width_m = 0.2286;   // off stump outer edge to leg stump outer edge
    double stump_height_m = 0.711;
    std::vector<cv::Point2f> wall_boundary;  // catch zone behind the wicket
    double frame_rate = 30.0;
};

enum class LbwStrictness { STRICT, STANDARD, LENIENT };

const char* toString(LbwStrictness s);

// Tunables supplied with every rule evaluation; engines never modify them.
struct RuleParameters {
    double stump_tolerance = 1.0;          // stump-zone width multiplier, 0.5 - 3.0
    LbwStrictness lbw_strictness = LbwStrictness::STANDARD;
    double wide_off_side_m = 0.83;         // from off stump
    double wide_leg_side_m = 0.83;         // from leg stump
    double wide_confidence_margin_m = 0.15;
    double edge_sensitivity = 0.7;         // 0 - 1, higher accepts smaller deflections
    double min_out_confidence = 0.5;
    int min_projection_samples = 3;
    int max_projection_steps = 300;
    Handedness handedness = Handedness::RIGHT;
};

}  // namespace umpire
