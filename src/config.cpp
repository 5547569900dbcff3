// config.cpp
#include "config.hpp"
#include "errors.hpp"
#include "rules/rule_utils.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace umpire {

namespace {

constexpr double kFeetToMeters = 0.3048;

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

cv::Point2f toPoint(const YAML::Node& node, const std::string& name) {
    auto v = node.as<std::vector<float>>();
    if (v.size() != 2) {
        throw ConfigError(name + " must be [x, y]");
    }
    return cv::Point2f(v[0], v[1]);
}

cv::Point2f requirePoint(const YAML::Node& node, const std::string& name) {
    if (!node[name]) {
        throw CalibrationError("missing " + name);
    }
    return toPoint(node[name], name);
}

StumpSet requireStumps(const YAML::Node& node, const std::string& name) {
    if (!node[name]) {
        throw CalibrationError("missing " + name);
    }
    const YAML::Node stumps = node[name];
    StumpSet s;
    s.off = requirePoint(stumps, "off");
    s.middle = requirePoint(stumps, "middle");
    s.leg = requirePoint(stumps, "leg");
    return s;
}

// Absent sections read as an empty node so per-field fallbacks apply.
YAML::Node section(const YAML::Node& config, const char* name) {
    if (config[name]) return config[name];
    return YAML::Node();
}

}  // namespace

const char* toString(LbwStrictness s) {
    switch (s) {
        case LbwStrictness::STRICT:   return "strict";
        case LbwStrictness::STANDARD: return "standard";
        case LbwStrictness::LENIENT:  return "lenient";
    }
    return "unknown";
}

LbwStrictness parseStrictness(const std::string& name) {
    const std::string lower = lowercase(name);
    if (lower == "strict") return LbwStrictness::STRICT;
    if (lower == "standard") return LbwStrictness::STANDARD;
    if (lower == "lenient") return LbwStrictness::LENIENT;
    throw ConfigError("unknown LBW strictness '" + name + "'");
}

Handedness parseHandedness(const std::string& name) {
    const std::string lower = lowercase(name);
    if (lower == "right" || lower == "rhb") return Handedness::RIGHT;
    if (lower == "left" || lower == "lhb") return Handedness::LEFT;
    throw ConfigError("unknown handedness '" + name + "'");
}

CalibrationData loadCalibration(const YAML::Node& node) {
    if (!node) {
        throw CalibrationError("missing calibration section");
    }

    CalibrationData cal;
    const std::string unit = lowercase(node["unit"].as<std::string>("meters"));
    double to_meters = 1.0;
    if (unit == "feet" || unit == "ft") {
        to_meters = kFeetToMeters;
    } else if (unit != "meters" && unit != "metres" && unit != "m") {
        throw ConfigError("unknown calibration unit '" + unit + "'");
    }

    if (!node["pitch_length"]) {
        throw CalibrationError("missing pitch_length");
    }
    cal.pitch_length_m = node["pitch_length"].as<double>() * to_meters;
    cal.stump_width_m = node["stump_width"].as<double>(cal.stump_width_m / to_meters) * to_meters;
    cal.stump_height_m = node["stump_height"].as<double>(cal.stump_height_m / to_meters) * to_meters;
    cal.frame_rate = node["frame_rate"].as<double>(30.0);

    cal.bowling_crease_px = requirePoint(node, "bowling_crease");
    cal.batting_crease_px = requirePoint(node, "batting_crease");
    cal.batting_stumps = requireStumps(node, "batting_stumps");
    if (node["bowling_stumps"]) {
        cal.bowling_stumps = requireStumps(node, "bowling_stumps");
    }

    if (node["wall_boundary"]) {
        for (const auto& p : node["wall_boundary"]) {
            cal.wall_boundary.push_back(toPoint(p, "wall_boundary vertex"));
        }
    }
    return cal;
}

RuleParameters loadRuleParameters(const YAML::Node& node) {
    RuleParameters p;
    if (!node) return p;

    p.stump_tolerance = node["stump_tolerance"].as<double>(p.stump_tolerance);
    if (node["lbw_strictness"]) {
        p.lbw_strictness = parseStrictness(node["lbw_strictness"].as<std::string>());
    }
    p.wide_off_side_m = node["wide_off_side"].as<double>(p.wide_off_side_m);
    p.wide_leg_side_m = node["wide_leg_side"].as<double>(p.wide_leg_side_m);
    p.wide_confidence_margin_m = node["wide_confidence_margin"].as<double>(p.wide_confidence_margin_m);
    p.edge_sensitivity = node["edge_sensitivity"].as<double>(p.edge_sensitivity);
    p.min_out_confidence = node["min_out_confidence"].as<double>(p.min_out_confidence);
    p.min_projection_samples = node["min_projection_samples"].as<int>(p.min_projection_samples);
    p.max_projection_steps = node["max_projection_steps"].as<int>(p.max_projection_steps);
    if (node["handedness"]) {
        p.handedness = parseHandedness(node["handedness"].as<std::string>());
    }

    rules::validateRuleParameters(p);
    return p;
}

void validateTrackerConfig(const TrackerConfig& config) {
    if (config.process_noise <= 0.f || config.measurement_noise <= 0.f) {
        throw ConfigError("tracker noise levels must be positive");
    }
    if (config.initial_position_var <= 0.f || config.initial_velocity_var <= 0.f ||
        config.initial_accel_var <= 0.f) {
        throw ConfigError("tracker initial variances must be positive");
    }
    if (config.min_confidence <= 0.f || config.min_confidence > 1.f) {
        throw ConfigError("tracker min_confidence must be within (0, 1]");
    }
}

void validateSegmenterConfig(const SegmenterConfig& config) {
    if (config.min_frames < 1 || config.idle_frames < 1) {
        throw ConfigError("segmenter frame counts must be at least 1");
    }
    if (config.min_motion_px < 0.f || config.stationary_px < 0.f) {
        throw ConfigError("segmenter motion thresholds cannot be negative");
    }
    if (config.min_confidence < 0.f || config.min_confidence > 1.f) {
        throw ConfigError("segmenter min_confidence must be within 0 - 1");
    }
}

SessionConfig loadConfig(const YAML::Node& config) {
    SessionConfig session;
    try {
        session.calibration = loadCalibration(config["calibration"]);
        session.rules = loadRuleParameters(config["rules"]);

        const YAML::Node tracker = section(config, "tracker");
        TrackerConfig& t = session.tracker;
        t.process_noise = tracker["process_noise"].as<float>(t.process_noise);
        t.measurement_noise = tracker["measurement_noise"].as<float>(t.measurement_noise);
        t.initial_position_var = tracker["initial_position_var"].as<float>(t.initial_position_var);
        t.initial_velocity_var = tracker["initial_velocity_var"].as<float>(t.initial_velocity_var);
        t.initial_accel_var = tracker["initial_accel_var"].as<float>(t.initial_accel_var);
        t.min_confidence = tracker["min_confidence"].as<float>(t.min_confidence);
        validateTrackerConfig(t);

        const YAML::Node segmenter = section(config, "segmenter");
        SegmenterConfig& s = session.segmenter;
        s.min_frames = segmenter["min_frames"].as<int>(s.min_frames);
        s.idle_frames = segmenter["idle_frames"].as<int>(s.idle_frames);
        s.min_motion_px = segmenter["min_motion_px"].as<float>(s.min_motion_px);
        s.stationary_px = segmenter["stationary_px"].as<float>(s.stationary_px);
        s.min_confidence = segmenter["min_confidence"].as<float>(s.min_confidence);
        validateSegmenterConfig(s);

        const YAML::Node events = section(config, "events");
        EventConfig& e = session.events;
        e.impact_threshold = events["impact_threshold"].as<float>(e.impact_threshold);
        e.zone_proximity_px = events["zone_proximity_px"].as<float>(e.zone_proximity_px);
        e.ground_band_px = events["ground_band_px"].as<float>(e.ground_band_px);
        e.player_proximity_px = events["player_proximity_px"].as<float>(e.player_proximity_px);
        if (e.impact_threshold <= 0.f) {
            throw ConfigError("impact_threshold must be positive");
        }

        const YAML::Node pipeline = section(config, "pipeline");
        PipelineConfig& pc = session.pipeline;
        const int queue_size = pipeline["queue_size"].as<int>(static_cast<int>(pc.queue_size));
        if (queue_size < 1) {
            throw ConfigError("pipeline queue_size must be at least 1");
        }
        pc.queue_size = static_cast<size_t>(queue_size);
        if (pipeline["approach_direction"]) {
            pc.approach_direction = toPoint(pipeline["approach_direction"], "approach_direction");
        }

        QualityConfig& q = session.quality;
        q.confidence_floor = pipeline["confidence_floor"].as<float>(q.confidence_floor);
        q.max_low_confidence_fraction =
            pipeline["max_low_confidence_fraction"].as<float>(q.max_low_confidence_fraction);
        if (q.max_low_confidence_fraction < 0.f || q.max_low_confidence_fraction > 1.f) {
            throw ConfigError("max_low_confidence_fraction must be within 0 - 1");
        }

        session.log_level = Logger::parseLevel(section(config, "logging")["level"].as<std::string>("info"));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("malformed value: ") + e.what());
    }
    return session;
}

SessionConfig loadConfigFile(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("could not load " + path + ": " + e.what());
    }
    return loadConfig(root);
}

}  // namespace umpire
