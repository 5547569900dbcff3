#include "rules/caught_behind_engine.hpp"
#include "rules/rule_utils.hpp"
#include "coordinate_mapper.hpp"
#include "errors.hpp"
#include "event_detector.hpp"
#include "trajectory.hpp"
#include "utils.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <optional>
#include <sstream>
#include <string>

namespace umpire { namespace rules {

namespace {

constexpr double kMaxEdgeThresholdDeg = 60.0;
constexpr double kRadToDeg = 180.0 / CV_PI;

double deflectionDeg(const cv::Point2f& before, const cv::Point2f& after) {
    const double nb = std::hypot(before.x, before.y);
    const double na = std::hypot(after.x, after.y);
    if (nb <= 0.0 || na <= 0.0) return 0.0;
    const double c = std::clamp((before.x * after.x + before.y * after.y) / (nb * na), -1.0, 1.0);
    return std::acos(c) * kRadToDeg;
}

struct Edge {
    ImpactEvent impact;
    std::size_t index = 0;
    double deflection_deg = 0.0;
};

std::optional<Edge> findEdge(const Trajectory& trajectory,
                             const std::vector<ImpactEvent>& by_frame,
                             double threshold_deg) {
    const auto& pts = trajectory.points();
    for (const auto& ev : by_frame) {
        if (ev.type != ImpactType::BAT) continue;
        const auto index = trajectory.indexOfFrame(ev.frame_index);
        if (!index) continue;

        // The filter needs a couple of frames to swing onto the new heading.
        const std::size_t before = *index > 0 ? *index - 1 : *index;
        const std::size_t after = std::min(*index + 2, pts.size() - 1);
        const double angle = deflectionDeg(pts[before].velocity, pts[after].velocity);
        if (angle >= threshold_deg) {
            return Edge{ev, *index, angle};
        }
    }
    return std::nullopt;
}

// Bounce in the samples after the edge and before the wall frame, reported as
// a ground contact. A reversal on a wall or stumps contact is the ball coming
// off that contact, not off the pitch.
std::optional<ImpactEvent> postEdgeBounce(const Trajectory& trajectory, std::size_t edge_index,
                                          const std::vector<ImpactEvent>& by_frame,
                                          const std::optional<ImpactEvent>& wall,
                                          const CoordinateMapper& mapper) {
    const auto isRebound = [&by_frame](int frame) {
        return std::any_of(by_frame.begin(), by_frame.end(), [frame](const ImpactEvent& ev) {
            return ev.frame_index == frame &&
                   (ev.type == ImpactType::WALL || ev.type == ImpactType::STUMPS);
        });
    };

    const auto& pts = trajectory.points();
    BounceMonitor monitor;
    for (std::size_t i = edge_index + 1; i < pts.size(); ++i) {
        const TrajectoryPoint& p = pts[i];
        if (wall && p.frame_index >= wall->frame_index) break;
        if (!monitor.observe(p)) continue;
        if (isRebound(p.frame_index)) {
            monitor.reset();
            continue;
        }
        ImpactEvent ev;
        ev.type = ImpactType::GROUND;
        ev.position_px = p.pixel;
        ev.position_m = mapper.toWorld(p.pixel);
        ev.frame_index = p.frame_index;
        ev.confidence = p.observed ? p.confidence : 0.5f;
        ev.in_wall_boundary = mapper.hasWallBoundary() &&
            cv::pointPolygonTest(mapper.calibration().wall_boundary, p.pixel, false) >= 0;
        return ev;
    }
    return std::nullopt;
}

void logDecision(const CaughtBehindDecision& decision) {
    if (Logger::enabled(Logger::DEBUG)) {
        Logger::log(Logger::DEBUG, "Caught-behind delivery " + std::to_string(decision.delivery_id) +
                    ": " + toString(decision.result) + " (" + decision.reason + ")");
    }
}

}  // namespace

double edgeDeflectionThresholdDeg(double edge_sensitivity) {
    return (1.0 - edge_sensitivity) * kMaxEdgeThresholdDeg;
}

CaughtBehindDecision evaluateCaughtBehind(const Trajectory& trajectory,
                                          const std::vector<ImpactEvent>& impacts,
                                          const CoordinateMapper& mapper,
                                          const RuleParameters& params) {
    validateRuleParameters(params);
    requireFinalized(trajectory);
    if (!mapper.hasWallBoundary()) {
        throw CalibrationError("caught-behind needs a wall boundary polygon");
    }

    const float quality = trajectoryQuality(trajectory);

    CaughtBehindDecision decision;
    decision.delivery_id = trajectory.deliveryId();
    decision.wall_boundary = mapper.calibration().wall_boundary;

    // Frame order, ground before anything else on the same frame.
    std::vector<ImpactEvent> by_frame(impacts);
    std::stable_sort(by_frame.begin(), by_frame.end(),
        [](const ImpactEvent& a, const ImpactEvent& b) {
            if (a.frame_index != b.frame_index) return a.frame_index < b.frame_index;
            return a.type == ImpactType::GROUND && b.type != ImpactType::GROUND;
        });

    const double threshold = edgeDeflectionThresholdDeg(params.edge_sensitivity);
    const std::optional<Edge> edge = trajectory.empty()
        ? std::nullopt : findEdge(trajectory, by_frame, threshold);

    if (!edge) {
        decision.result = Verdict::NOT_APPLICABLE;
        decision.reason = "No edge detected";
        decision.confidence = clampConfidence(quality);
        logDecision(decision);
        return decision;
    }

    decision.edge_detected = true;
    decision.edge_point = edge->impact.position_px;
    const double edge_conf = edge->impact.confidence;

    std::optional<ImpactEvent> ground;
    std::optional<ImpactEvent> wall;
    for (const auto& ev : by_frame) {
        if (ev.frame_index <= edge->impact.frame_index) continue;
        if (ev.type == ImpactType::GROUND && !ground && !wall) ground = ev;
        if (ev.type == ImpactType::WALL && !wall) wall = ev;
    }
    if (!ground) ground = postEdgeBounce(trajectory, edge->index, by_frame, wall, mapper);

    if (ground) decision.ground_point = ground->position_px;
    if (wall) {
        decision.wall_point = wall->position_px;
        decision.wall_hit_in_boundary = wall->in_wall_boundary;
    }

    std::ostringstream reason;
    if (ground && (!wall || ground->frame_index <= wall->frame_index)) {
        decision.ground_before_wall = true;
        decision.result = Verdict::NOT_OUT;
        decision.confidence = clampConfidence((0.4 * edge_conf + 0.4 * ground->confidence + 0.2) * quality);
        reason << "Ball touched the ground at frame " << ground->frame_index
               << " before reaching the wall";
    } else if (!wall) {
        decision.result = Verdict::NOT_OUT;
        decision.confidence = clampConfidence((0.5 * edge_conf + 0.5) * quality);
        reason << "Edge at frame " << edge->impact.frame_index << " but no wall contact";
    } else {
        decision.confidence = clampConfidence((0.4 * edge_conf + 0.4 * wall->confidence + 0.2) * quality);
        if (belowOutThreshold(decision.confidence, params)) {
            decision.result = Verdict::NOT_OUT;
            reason << "Edge carried to the wall, but confidence " << decision.confidence
                   << " is below " << params.min_out_confidence;
        } else {
            decision.result = Verdict::OUT;
            reason << "Edge (" << edge->deflection_deg << " deg) carried to the wall at frame "
                   << wall->frame_index << (wall->in_wall_boundary ? " inside" : " outside")
                   << " the catch zone";
        }
    }
    decision.reason = reason.str();
    logDecision(decision);
    return decision;
}

}} // namespace
