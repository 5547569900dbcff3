// delivery_segmenter.hpp
#pragma once

#include "types.hpp"

#include <opencv2/core.hpp>

namespace umpire {

enum class DeliveryState { IDLE, TRACKING, COMPLETE };

enum class SegmentEvent { NONE, DELIVERY_STARTED, DELIVERY_ENDED };

const char* toString(DeliveryState state);

struct SegmenterConfig {
    int min_frames = 5;             // consecutive approaching detections to start
    int idle_frames = 15;           // consecutive absent/stationary frames to end
    float min_motion_px = 1.0f;     // per-frame progress toward the batter
    float stationary_px = 0.5f;     // movement below this counts as at rest
    float min_confidence = 0.2f;    // weaker detections never start a delivery
};

// Decides when a delivery begins and ends.
//
//   IDLE --(min_frames approaching detections)--> TRACKING
//   TRACKING --(idle_frames absent/stationary)--> COMPLETE
//   COMPLETE --acknowledge()--> IDLE
//
// Sole authority for resetting the tracker and finalising a trajectory.
// Frames must arrive in increasing frame order.
class DeliverySegmenter {
public:
    // approach_direction points from the bowler toward the batter in image
    // space; it need not be normalised.
    DeliverySegmenter(const SegmenterConfig& config, const cv::Point2f& approach_direction);

    SegmentEvent update(const Observation& observation);

    // Hand-off done: COMPLETE -> IDLE.
    void acknowledge();
    // Cancel the delivery in flight (camera dropout etc.).
    void abandon();

    DeliveryState state() const { return state_; }
    bool isDeliveryActive() const { return state_ == DeliveryState::TRACKING; }

    // Frame of the first approaching detection / last moving detection.
    int deliveryStartFrame() const { return start_frame_; }
    int deliveryEndFrame() const { return end_frame_; }
    int consecutiveIdleFrames() const { return idle_count_; }

private:
    SegmenterConfig config_;
    cv::Point2f direction_;

    DeliveryState state_ = DeliveryState::IDLE;
    int approach_count_ = 0;
    int idle_count_ = 0;
    int start_frame_ = -1;
    int end_frame_ = -1;
    int run_start_frame_ = -1;

    bool has_last_ = false;
    cv::Point2f last_position_;

    void clearRun();
};

}  // namespace umpire
