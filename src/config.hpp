// config.hpp
#pragma once

#include "calibration.hpp"
#include "delivery_segmenter.hpp"
#include "event_detector.hpp"
#include "tracker.hpp"
#include "trajectory.hpp"
#include "utils.hpp"

#include <yaml-cpp/yaml.h>

#include <cstddef>
#include <string>

namespace umpire {

struct PipelineConfig {
    size_t queue_size = 8;                     // ended deliveries awaiting the finaliser
    cv::Point2f approach_direction{0.f, 0.f};  // zero: bowling -> batting crease
};

// Everything a session needs, loaded once and swapped only between
// deliveries.
struct SessionConfig {
    CalibrationData calibration;
    RuleParameters rules;
    TrackerConfig tracker;
    SegmenterConfig segmenter;
    EventConfig events;
    QualityConfig quality;
    PipelineConfig pipeline;
    Logger::Level log_level = Logger::INFO;
};

// Reads every section with per-field fallbacks. Calibration geometry has no
// fallback: missing creases, stumps or pitch length throw CalibrationError.
// Malformed values and out-of-range settings throw ConfigError.
SessionConfig loadConfig(const YAML::Node& config);
SessionConfig loadConfigFile(const std::string& path);

CalibrationData loadCalibration(const YAML::Node& node);
RuleParameters loadRuleParameters(const YAML::Node& node);

LbwStrictness parseStrictness(const std::string& name);
Handedness parseHandedness(const std::string& name);

void validateTrackerConfig(const TrackerConfig& config);
void validateSegmenterConfig(const SegmenterConfig& config);

}  // namespace umpire
