// types.hpp
#pragma once

#include <opencv2/core.hpp>

#include <cstdint>
#include <variant>
#include <vector>

namespace umpire {

enum class Visibility { VISIBLE, OCCLUDED, ABSENT };

// Batter region reported by the detector for one frame. The core has no pose
// model, so bat/pad disambiguation comes entirely from these boxes.
struct PlayerRegion {
    enum class Kind { BAT, PAD };
    Kind kind = Kind::PAD;
    cv::Rect2f box;
};

struct BallDetection {
    int frame_index = 0;
    double timestamp_ms = 0.0;
    cv::Point2f position;
    float confidence = 0.f;              // [0, 1]
    Visibility visibility = Visibility::VISIBLE;
    std::vector<PlayerRegion> players;
};

struct NoDetection {
    int frame_index = 0;
    double timestamp_ms = 0.0;
};

// One frame of detector output. Consumers must handle both alternatives.
using Observation = std::variant<BallDetection, NoDetection>;

int frameIndexOf(const Observation& obs);

// Returns the detection when it carries a usable position (ABSENT
// visibility counts as no observation), nullptr otherwise.
const BallDetection* usableDetection(const Observation& obs);

struct MotionState {
    cv::Point2f position;
    cv::Point2f velocity;      // px / frame
    cv::Point2f acceleration;  // px / frame^2
    float uncertainty = 0.f;   // trace of the position covariance (px^2)
};

enum class ImpactType { BAT, PAD, GROUND, STUMPS, WALL, NONE };

struct ImpactEvent {
    ImpactType type = ImpactType::NONE;
    cv::Point2f position_px;
    cv::Point2f position_m;
    int frame_index = 0;
    float confidence = 0.f;
    float magnitude = 0.f;       // |dv| in px / frame
    bool in_wall_boundary = false;
};

enum class Handedness { RIGHT, LEFT };

const char* toString(Visibility v);
const char* toString(ImpactType t);
const char* toString(Handedness h);

}  // namespace umpire
