// event_detector.cpp
#include "event_detector.hpp"
#include "coordinate_mapper.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace umpire {

namespace {

float distanceToRect(const cv::Point2f& p, const cv::Rect2f& r) {
    const float dx = std::max({r.x - p.x, 0.f, p.x - (r.x + r.width)});
    const float dy = std::max({r.y - p.y, 0.f, p.y - (r.y + r.height)});
    return std::hypot(dx, dy);
}

float velocityChange(const TrajectoryPoint& a, const TrajectoryPoint& b) {
    const cv::Point2f dv = b.velocity - a.velocity;
    return std::hypot(dv.x, dv.y);
}

}  // namespace

std::optional<std::size_t> BounceMonitor::observe(const TrajectoryPoint& point) {
    const std::size_t index = count_++;
    if (bounced_) return std::nullopt;

    const float vy = point.velocity.y;
    const bool reversal = has_prev_ && prev_vy_ > 0.f && vy < 0.f;
    prev_vy_ = vy;
    has_prev_ = true;

    if (!reversal) return std::nullopt;
    bounced_ = true;
    return index;
}

void BounceMonitor::reset() {
    has_prev_ = false;
    prev_vy_ = 0.f;
    count_ = 0;
    bounced_ = false;
}

EventDetector::EventDetector(const EventConfig& config, const CoordinateMapper& mapper)
    : config_(config), mapper_(mapper), stump_zone_(mapper.stumpZonePolygon(1.0)) {}

std::optional<std::size_t> EventDetector::findBounce(const std::vector<TrajectoryPoint>& points) {
    BounceMonitor monitor;
    for (const auto& p : points) {
        if (auto index = monitor.observe(p)) return index;
    }
    return std::nullopt;
}

bool EventDetector::inWallBoundary(const cv::Point2f& p) const {
    if (!mapper_.hasWallBoundary()) return false;
    return cv::pointPolygonTest(mapper_.calibration().wall_boundary, p, false) >= 0;
}

ImpactType EventDetector::classify(const TrajectoryPoint& point,
                                   const TrajectoryPoint* bounce) const {
    const cv::Point2f& p = point.pixel;

    // Signed distance, positive inside.
    if (cv::pointPolygonTest(stump_zone_, p, true) >= -config_.zone_proximity_px) {
        return ImpactType::STUMPS;
    }

    if (mapper_.hasWallBoundary() &&
        cv::pointPolygonTest(mapper_.calibration().wall_boundary, p, true) >= -config_.zone_proximity_px) {
        return ImpactType::WALL;
    }

    if (bounce && point.frame_index >= bounce->frame_index &&
        std::abs(p.y - bounce->pixel.y) <= config_.ground_band_px) {
        return ImpactType::GROUND;
    }

    float best = std::numeric_limits<float>::max();
    ImpactType type = ImpactType::NONE;
    for (const auto& region : point.players) {
        const float d = distanceToRect(p, region.box);
        if (d <= config_.player_proximity_px && d < best) {
            best = d;
            type = region.kind == PlayerRegion::Kind::BAT ? ImpactType::BAT : ImpactType::PAD;
        }
    }
    return type;
}

std::vector<ImpactEvent> EventDetector::detectImpacts(const Trajectory& trajectory) const {
    const auto& pts = trajectory.points();
    std::vector<ImpactEvent> impacts;
    if (pts.size() < 2) return impacts;

    std::optional<std::size_t> bounce_index = trajectory.bounceIndex();
    if (!bounce_index) bounce_index = findBounce(pts);
    const TrajectoryPoint* bounce = bounce_index ? &pts[*bounce_index] : nullptr;

    std::size_t i = 1;
    while (i < pts.size()) {
        if (velocityChange(pts[i - 1], pts[i]) <= config_.impact_threshold) {
            ++i;
            continue;
        }

        // One contact spreads over several filtered samples; keep the peak.
        std::size_t peak = i;
        float peak_dv = velocityChange(pts[i - 1], pts[i]);
        std::size_t j = i + 1;
        for (; j < pts.size(); ++j) {
            const float dv = velocityChange(pts[j - 1], pts[j]);
            if (dv <= config_.impact_threshold) break;
            if (dv > peak_dv) {
                peak_dv = dv;
                peak = j;
            }
        }

        const TrajectoryPoint& p = pts[peak];
        ImpactEvent ev;
        ev.type = classify(p, bounce);
        ev.position_px = p.pixel;
        ev.position_m = mapper_.toWorld(p.pixel);
        ev.frame_index = p.frame_index;
        ev.magnitude = peak_dv;
        ev.in_wall_boundary = inWallBoundary(p.pixel);

        // Predicted samples carry no detector confidence of their own.
        const float strength = std::min(1.0f, peak_dv / (2.0f * config_.impact_threshold));
        const float support = p.observed ? p.confidence : 0.5f;
        ev.confidence = std::clamp(strength * support, 0.0f, 1.0f);

        impacts.push_back(ev);
        i = j + 1;
    }
    return impacts;
}

EventReport EventDetector::analyze(const Trajectory& trajectory) const {
    EventReport report;
    report.bounce_index = trajectory.bounceIndex();
    if (!report.bounce_index) report.bounce_index = findBounce(trajectory.points());
    report.impacts = detectImpacts(trajectory);
    return report;
}

}  // namespace umpire
