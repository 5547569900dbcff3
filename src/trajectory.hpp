// trajectory.hpp
#pragma once

#include "types.hpp"

#include <opencv2/core.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace umpire {

class CoordinateMapper;

struct TrajectoryPoint {
    int frame_index = 0;
    cv::Point2f pixel;          // filtered position
    cv::Point2f world;          // metres, filled in by finalize()
    cv::Point2f velocity;       // px / frame
    cv::Point2f acceleration;   // px / frame^2
    float confidence = 0.f;     // detector confidence, 0 when bridged
    bool observed = false;      // false when the frame was predict-only
    bool is_bounce = false;
    std::vector<PlayerRegion> players;
};

// Soft signal: the detector was unreliable for most of the delivery.
// Rulings are still produced, with lowered confidence.
struct DetectionGapWarning {
    int low_confidence_frames = 0;
    int total_frames = 0;
};

struct QualityConfig {
    float confidence_floor = 0.3f;          // below this a frame counts as a gap
    float max_low_confidence_fraction = 0.5f;
};

// Ordered path of one delivery.
//
// Append-only while tracking; finalize() computes metrics and freezes it.
// Frame indices must strictly increase and at most one bounce is marked;
// violating either throws std::logic_error.
class Trajectory {
public:
    explicit Trajectory(uint64_t delivery_id = 0);

    void append(const TrajectoryPoint& point);
    void markBounce(std::size_t index);

    // Drops predict-only samples after the last real observation (the frames
    // the segmenter spent waiting for the ball to reappear).
    void trimTrailingPredictions();

    void finalize(const CoordinateMapper& mapper, const QualityConfig& quality);

    uint64_t deliveryId() const { return delivery_id_; }
    const std::vector<TrajectoryPoint>& points() const { return points_; }
    std::size_t size() const { return points_.size(); }
    bool empty() const { return points_.empty(); }
    int startFrame() const;
    int endFrame() const;
    int observedCount() const;

    std::optional<std::size_t> bounceIndex() const { return bounce_index_; }
    const TrajectoryPoint* bouncePoint() const;
    std::optional<std::size_t> indexOfFrame(int frame_index) const;

    bool isFinalized() const { return finalized_; }
    // Finalized and free of a detection gap.
    bool isComplete() const { return finalized_ && !detection_gap_; }
    const std::optional<DetectionGapWarning>& detectionGap() const { return detection_gap_; }

    // Metrics; throw std::logic_error before finalize().
    double speedKmh() const;
    double deviationPx() const;
    double deviationMeters() const;

private:
    uint64_t delivery_id_;
    std::vector<TrajectoryPoint> points_;
    std::optional<std::size_t> bounce_index_;
    std::optional<DetectionGapWarning> detection_gap_;
    bool finalized_ = false;

    double speed_kmh_ = 0.0;
    double deviation_px_ = 0.0;
    double deviation_m_ = 0.0;

    void requireOpen(const char* operation) const;
    void requireFinalized(const char* metric) const;
};

}  // namespace umpire
