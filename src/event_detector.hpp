// event_detector.hpp
#pragma once

#include "trajectory.hpp"
#include "types.hpp"

#include <opencv2/core.hpp>

#include <cstddef>
#include <optional>
#include <vector>

namespace umpire {

class CoordinateMapper;

struct EventConfig {
    // |v_i - v_{i-1}| in px / frame above which a sample is an impact.
    // Depends on resolution and frame rate; calibrate per camera.
    float impact_threshold = 6.0f;
    float zone_proximity_px = 12.0f;     // stumps / wall
    float ground_band_px = 15.0f;        // around the bounce height
    float player_proximity_px = 10.0f;   // bat / pad boxes
};

// Live bounce monitor for an in-progress trajectory. Feed samples in order;
// reports the first downward-to-upward reversal and nothing after it.
class BounceMonitor {
public:
    // Returns the index of the bounce sample when this sample completes one.
    std::optional<std::size_t> observe(const TrajectoryPoint& point);
    void reset();

    bool bounced() const { return bounced_; }

private:
    bool has_prev_ = false;
    float prev_vy_ = 0.f;
    std::size_t count_ = 0;
    bool bounced_ = false;
};

struct EventReport {
    std::optional<std::size_t> bounce_index;
    std::vector<ImpactEvent> impacts;
};

// Bounce and impact detection over a trajectory.
class EventDetector {
public:
    EventDetector(const EventConfig& config, const CoordinateMapper& mapper);

    // First sample whose vertical velocity turns negative after being
    // positive (image y grows downward). Same input, same answer.
    static std::optional<std::size_t> findBounce(const std::vector<TrajectoryPoint>& points);

    // Velocity discontinuities, one event per over-threshold run (at its
    // peak), classified against the calibrated zones. Uses the trajectory's
    // marked bounce for ground classification.
    std::vector<ImpactEvent> detectImpacts(const Trajectory& trajectory) const;

    // Exhaustive pass once the delivery has ended.
    EventReport analyze(const Trajectory& trajectory) const;

    ImpactType classify(const TrajectoryPoint& point, const TrajectoryPoint* bounce) const;

private:
    EventConfig config_;
    const CoordinateMapper& mapper_;
    std::vector<cv::Point2f> stump_zone_;

    bool inWallBoundary(const cv::Point2f& p) const;
};

}  // namespace umpire
