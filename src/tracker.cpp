// tracker.cpp
#include "tracker.hpp"

#include <algorithm>

namespace umpire {

BallTracker::BallTracker(const TrackerConfig& config)
    : config_(config), kf_(6, 2, 0, CV_32F), initialized_(false),
      frames_since_measurement_(0) {
    initKalman();
}

void BallTracker::initKalman() {
    // State: [x, y, vx, vy, ax, ay]
    // Measurement: [x, y]

    // State transition matrix (constant acceleration, dt = 1 frame)
    kf_.transitionMatrix = (cv::Mat_<float>(6, 6) <<
        1, 0, 1, 0, 0.5f, 0,
        0, 1, 0, 1, 0, 0.5f,
        0, 0, 1, 0, 1, 0,
        0, 0, 0, 1, 0, 1,
        0, 0, 0, 0, 1, 0,
        0, 0, 0, 0, 0, 1);

    // Measurement matrix
    kf_.measurementMatrix = (cv::Mat_<float>(2, 6) <<
        1, 0, 0, 0, 0, 0,
        0, 1, 0, 0, 0, 0);

    // Discrete white-noise acceleration, per axis:
    //   [dt^4/4  dt^3/2  dt^2/2]
    //   [dt^3/2  dt^2    dt    ] * q
    //   [dt^2/2  dt      1     ]
    const float q = config_.process_noise;
    const float block[3][3] = {{0.25f, 0.5f, 0.5f},
                               {0.5f,  1.0f, 1.0f},
                               {0.5f,  1.0f, 1.0f}};
    kf_.processNoiseCov = cv::Mat::zeros(6, 6, CV_32F);
    for (int axis = 0; axis < 2; ++axis) {
        for (int r = 0; r < 3; ++r) {
            for (int c = 0; c < 3; ++c) {
                kf_.processNoiseCov.at<float>(axis + 2 * r, axis + 2 * c) = block[r][c] * q;
            }
        }
    }

    // Measurement noise covariance
    cv::setIdentity(kf_.measurementNoiseCov, cv::Scalar(config_.measurement_noise));

    // Error covariance
    kf_.errorCovPost = cv::Mat::zeros(6, 6, CV_32F);
    kf_.errorCovPost.at<float>(0, 0) = config_.initial_position_var;
    kf_.errorCovPost.at<float>(1, 1) = config_.initial_position_var;
    kf_.errorCovPost.at<float>(2, 2) = config_.initial_velocity_var;
    kf_.errorCovPost.at<float>(3, 3) = config_.initial_velocity_var;
    kf_.errorCovPost.at<float>(4, 4) = config_.initial_accel_var;
    kf_.errorCovPost.at<float>(5, 5) = config_.initial_accel_var;

    // Initial state
    kf_.statePost = cv::Mat::zeros(6, 1, CV_32F);
    measurement_ = cv::Mat::zeros(2, 1, CV_32F);
}

void BallTracker::predict() {
    // predict() also copies the prior into statePost/errorCovPost, so the
    // estimate stands on its own when no update follows.
    kf_.predict();
    frames_since_measurement_++;
}

void BallTracker::update(const Observation& observation) {
    const BallDetection* det = usableDetection(observation);
    if (!det) return;

    if (!initialized_) {
        // First measurement - snap to position, motion unknown
        kf_.statePost = cv::Mat::zeros(6, 1, CV_32F);
        kf_.statePost.at<float>(0) = det->position.x;
        kf_.statePost.at<float>(1) = det->position.y;
        initialized_ = true;
        frames_since_measurement_ = 0;
        return;
    }

    // Weaker correction for less confident detections
    const float confidence = std::clamp(det->confidence, config_.min_confidence, 1.0f);
    cv::setIdentity(kf_.measurementNoiseCov, cv::Scalar(config_.measurement_noise / confidence));

    measurement_.at<float>(0) = det->position.x;
    measurement_.at<float>(1) = det->position.y;
    kf_.correct(measurement_);

    frames_since_measurement_ = 0;
}

cv::Point2f BallTracker::getPredictedPosition() const {
    const cv::Mat& s = kf_.statePost;
    return cv::Point2f(s.at<float>(0) + s.at<float>(2) + 0.5f * s.at<float>(4),
                       s.at<float>(1) + s.at<float>(3) + 0.5f * s.at<float>(5));
}

MotionState BallTracker::state() const {
    const cv::Mat& s = kf_.statePost;
    MotionState out;
    out.position = cv::Point2f(s.at<float>(0), s.at<float>(1));
    out.velocity = cv::Point2f(s.at<float>(2), s.at<float>(3));
    out.acceleration = cv::Point2f(s.at<float>(4), s.at<float>(5));
    out.uncertainty = kf_.errorCovPost.at<float>(0, 0) + kf_.errorCovPost.at<float>(1, 1);
    return out;
}

void BallTracker::reset() {
    initialized_ = false;
    frames_since_measurement_ = 0;
    initKalman();
}

}  // namespace umpire
