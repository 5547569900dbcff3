// tracker.hpp
#pragma once

#include "types.hpp"

#include <opencv2/core.hpp>
#include <opencv2/video/tracking.hpp>

namespace umpire {

struct TrackerConfig {
    float process_noise = 1.0f;        // white-noise acceleration variance
    float measurement_noise = 5.0f;    // px^2 at confidence 1.0
    float initial_position_var = 10.0f;
    float initial_velocity_var = 100.0f;
    float initial_accel_var = 10.0f;
    float min_confidence = 0.05f;      // confidence is clamped to this before weighting
};

// Constant-acceleration Kalman filter over [x, y, vx, vy, ax, ay], one step
// per frame. predict() runs every frame; update() only when the detector saw
// the ball, so occluded stretches are bridged by the motion model.
class BallTracker {
public:
    explicit BallTracker(const TrackerConfig& config = TrackerConfig());

    void predict();
    // No-op for NoDetection and ABSENT detections.
    void update(const Observation& observation);

    // Best estimate of the ball position one frame ahead. Never throws.
    cv::Point2f getPredictedPosition() const;

    MotionState state() const;
    bool isInitialized() const { return initialized_; }
    int framesSinceMeasurement() const { return frames_since_measurement_; }

    void reset();

private:
    TrackerConfig config_;
    cv::KalmanFilter kf_;
    cv::Mat measurement_;

    bool initialized_;
    int frames_since_measurement_;

    void initKalman();
};

}  // namespace umpire
