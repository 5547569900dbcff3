#pragma once
#include "coordinate_mapper.hpp"
#include "types.hpp"

#include <opencv2/core.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace umpire { namespace rules {

enum class Verdict { OUT, NOT_OUT, NOT_APPLICABLE };
enum class WideVerdict { WIDE, NOT_WIDE };
enum class WideSide { OFF, LEG };
enum class LineZone { IN_LINE, OUTSIDE_OFF, OUTSIDE_LEG, NOT_PITCHED };

const char* toString(Verdict v);
const char* toString(WideVerdict v);
const char* toString(WideSide s);
const char* toString(LineZone z);

// Decisions are value snapshots: produced once per evaluation, never edited.

struct LbwDecision {
    uint64_t delivery_id = 0;
    Verdict result = Verdict::NOT_OUT;
    std::string reason;
    float confidence = 0.f;

    Handedness handedness = Handedness::RIGHT;
    LineZone pitching_zone = LineZone::NOT_PITCHED;
    LineZone impact_zone = LineZone::IN_LINE;
    bool projected_hitting_stumps = false;
    std::optional<StumpId> stump_hit;
    float projected_x = 0.f;                     // at the batting crease

    // Overlay geometry (pixels)
    std::optional<cv::Point2f> pitch_point;
    cv::Point2f impact_point;
    std::vector<cv::Point2f> projected_path;     // impact -> crease
    std::vector<cv::Point2f> stump_zone;
};

struct WideDecision {
    uint64_t delivery_id = 0;
    WideVerdict result = WideVerdict::NOT_WIDE;
    std::optional<WideSide> side;
    std::string reason;
    float confidence = 0.f;

    cv::Point2f ball_at_crease;
    bool interpolated = false;    // crease crossed between two samples
    float off_line_distance_px = 0.f;
    float leg_line_distance_px = 0.f;

    // Overlay geometry (pixels)
    LineSegment off_line;
    LineSegment leg_line;
};

struct CaughtBehindDecision {
    uint64_t delivery_id = 0;
    Verdict result = Verdict::NOT_APPLICABLE;
    std::string reason;
    float confidence = 0.f;

    bool edge_detected = false;
    bool ground_before_wall = false;
    bool wall_hit_in_boundary = false;

    // Overlay geometry (pixels)
    std::optional<cv::Point2f> edge_point;
    std::optional<cv::Point2f> ground_point;
    std::optional<cv::Point2f> wall_point;
    std::vector<cv::Point2f> wall_boundary;
};

}} // namespace
