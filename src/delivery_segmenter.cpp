// delivery_segmenter.cpp
#include "delivery_segmenter.hpp"

#include <cmath>

namespace umpire {

const char* toString(DeliveryState state) {
    switch (state) {
        case DeliveryState::IDLE:     return "idle";
        case DeliveryState::TRACKING: return "tracking";
        case DeliveryState::COMPLETE: return "complete";
    }
    return "unknown";
}

DeliverySegmenter::DeliverySegmenter(const SegmenterConfig& config,
                                     const cv::Point2f& approach_direction)
    : config_(config), direction_(0.f, 1.f) {
    const float norm = std::hypot(approach_direction.x, approach_direction.y);
    if (norm > 0.f) {
        direction_ = approach_direction * (1.f / norm);
    }
}

void DeliverySegmenter::clearRun() {
    approach_count_ = 0;
    run_start_frame_ = -1;
}

SegmentEvent DeliverySegmenter::update(const Observation& observation) {
    const BallDetection* det = usableDetection(observation);
    const int frame = frameIndexOf(observation);

    switch (state_) {
    case DeliveryState::IDLE: {
        if (!det || det->confidence < config_.min_confidence) {
            clearRun();
            has_last_ = false;
            return SegmentEvent::NONE;
        }

        const bool approaching = has_last_ &&
            (det->position - last_position_).dot(direction_) >= config_.min_motion_px;
        if (approaching) {
            approach_count_++;
        } else {
            // This detection may open a new run.
            approach_count_ = 1;
            run_start_frame_ = frame;
        }

        last_position_ = det->position;
        has_last_ = true;

        if (approach_count_ >= config_.min_frames) {
            state_ = DeliveryState::TRACKING;
            start_frame_ = run_start_frame_;
            end_frame_ = frame;
            idle_count_ = 0;
            clearRun();
            return SegmentEvent::DELIVERY_STARTED;
        }
        return SegmentEvent::NONE;
    }

    case DeliveryState::TRACKING: {
        bool moving = false;
        if (det) {
            const cv::Point2f d = det->position - last_position_;
            moving = std::hypot(d.x, d.y) >= config_.stationary_px;
            last_position_ = det->position;
        }

        if (moving) {
            idle_count_ = 0;
            end_frame_ = frame;
            return SegmentEvent::NONE;
        }

        idle_count_++;
        if (idle_count_ >= config_.idle_frames) {
            state_ = DeliveryState::COMPLETE;
            return SegmentEvent::DELIVERY_ENDED;
        }
        return SegmentEvent::NONE;
    }

    case DeliveryState::COMPLETE:
        // Waiting for hand-off; frames are ignored until acknowledge().
        return SegmentEvent::NONE;
    }
    return SegmentEvent::NONE;
}

void DeliverySegmenter::acknowledge() {
    if (state_ != DeliveryState::COMPLETE) return;
    state_ = DeliveryState::IDLE;
    idle_count_ = 0;
    has_last_ = false;
    clearRun();
}

void DeliverySegmenter::abandon() {
    state_ = DeliveryState::IDLE;
    idle_count_ = 0;
    start_frame_ = -1;
    end_frame_ = -1;
    has_last_ = false;
    clearRun();
}

}  // namespace umpire
