// trajectory.cpp
#include "trajectory.hpp"
#include "coordinate_mapper.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace umpire {

Trajectory::Trajectory(uint64_t delivery_id) : delivery_id_(delivery_id) {}

void Trajectory::requireOpen(const char* operation) const {
    if (finalized_) {
        throw std::logic_error(std::string("trajectory is finalized: cannot ") + operation);
    }
}

void Trajectory::requireFinalized(const char* metric) const {
    if (!finalized_) {
        throw std::logic_error(std::string(metric) + " is only valid after finalize()");
    }
}

void Trajectory::append(const TrajectoryPoint& point) {
    requireOpen("append");
    if (!points_.empty() && point.frame_index <= points_.back().frame_index) {
        throw std::logic_error("trajectory frame " + std::to_string(point.frame_index) +
                               " does not follow frame " +
                               std::to_string(points_.back().frame_index));
    }
    points_.push_back(point);
    points_.back().is_bounce = false;
}

void Trajectory::markBounce(std::size_t index) {
    requireOpen("mark bounce");
    if (index >= points_.size()) {
        throw std::logic_error("bounce index out of range");
    }
    if (bounce_index_) {
        throw std::logic_error("trajectory already has a bounce at frame " +
                               std::to_string(points_[*bounce_index_].frame_index));
    }
    points_[index].is_bounce = true;
    bounce_index_ = index;
}

void Trajectory::trimTrailingPredictions() {
    requireOpen("trim");
    while (!points_.empty() && !points_.back().observed) {
        points_.pop_back();
    }
    if (bounce_index_ && *bounce_index_ >= points_.size()) {
        bounce_index_.reset();
    }
}

int Trajectory::startFrame() const {
    return points_.empty() ? -1 : points_.front().frame_index;
}

int Trajectory::endFrame() const {
    return points_.empty() ? -1 : points_.back().frame_index;
}

int Trajectory::observedCount() const {
    return static_cast<int>(std::count_if(points_.begin(), points_.end(),
        [](const TrajectoryPoint& p) { return p.observed; }));
}

const TrajectoryPoint* Trajectory::bouncePoint() const {
    return bounce_index_ ? &points_[*bounce_index_] : nullptr;
}

std::optional<std::size_t> Trajectory::indexOfFrame(int frame_index) const {
    auto it = std::lower_bound(points_.begin(), points_.end(), frame_index,
        [](const TrajectoryPoint& p, int f) { return p.frame_index < f; });
    if (it == points_.end() || it->frame_index != frame_index) return std::nullopt;
    return static_cast<std::size_t>(it - points_.begin());
}

void Trajectory::finalize(const CoordinateMapper& mapper, const QualityConfig& quality) {
    requireOpen("finalize");

    for (auto& p : points_) {
        p.world = mapper.toWorld(p.pixel);
    }

    std::vector<cv::Point2f> observed;
    int low_confidence = 0;
    for (const auto& p : points_) {
        if (p.observed) observed.push_back(p.pixel);
        if (!p.observed || p.confidence < quality.confidence_floor) ++low_confidence;
    }

    const int total = static_cast<int>(points_.size());
    if (total == 0 ||
        static_cast<float>(low_confidence) / total > quality.max_low_confidence_fraction) {
        detection_gap_ = DetectionGapWarning{low_confidence, total};
    }

    // Average speed between the first and last real observation.
    if (observed.size() >= 2) {
        const TrajectoryPoint* first = nullptr;
        const TrajectoryPoint* last = nullptr;
        for (const auto& p : points_) {
            if (!p.observed) continue;
            if (!first) first = &p;
            last = &p;
        }
        const cv::Point2f d = last->pixel - first->pixel;
        const int frames = last->frame_index - first->frame_index;
        speed_kmh_ = mapper.speedKmh(std::hypot(d.x, d.y) / frames);
    }

    // Largest perpendicular distance from the least-squares line.
    if (observed.size() >= 3) {
        cv::Vec4f line;
        cv::fitLine(observed, line, cv::DIST_L2, 0, 0.01, 0.01);
        const cv::Point2f dir(line[0], line[1]);
        const cv::Point2f origin(line[2], line[3]);
        double worst = 0.0;
        for (const auto& q : observed) {
            const cv::Point2f r = q - origin;
            worst = std::max(worst, static_cast<double>(std::abs(r.x * dir.y - r.y * dir.x)));
        }
        deviation_px_ = worst;
        deviation_m_ = mapper.pixelsToMeters(worst);
    }

    finalized_ = true;
}

double Trajectory::speedKmh() const {
    requireFinalized("speed");
    return speed_kmh_;
}

double Trajectory::deviationPx() const {
    requireFinalized("deviation");
    return deviation_px_;
}

double Trajectory::deviationMeters() const {
    requireFinalized("deviation");
    return deviation_m_;
}

}  // namespace umpire
