#include "rules/wide_engine.hpp"
#include "rules/rule_utils.hpp"
#include "coordinate_mapper.hpp"
#include "trajectory.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>

namespace umpire { namespace rules {

namespace {

constexpr float kNearestSamplePenalty = 0.8f;

struct CreaseCrossing {
    cv::Point2f point;
    bool interpolated = false;
};

CreaseCrossing ballAtCrease(const std::vector<TrajectoryPoint>& points, float crease_y) {
    for (size_t i = 1; i < points.size(); ++i) {
        const cv::Point2f& a = points[i - 1].pixel;
        const cv::Point2f& b = points[i].pixel;
        const float da = a.y - crease_y;
        const float db = b.y - crease_y;
        if (da * db > 0.f || a.y == b.y) continue;

        const float t = da / (da - db);
        CreaseCrossing c;
        c.point = cv::Point2f(a.x + (b.x - a.x) * t, crease_y);
        c.interpolated = true;
        return c;
    }

    auto nearest = std::min_element(points.begin(), points.end(),
        [crease_y](const TrajectoryPoint& l, const TrajectoryPoint& r) {
            return std::abs(l.pixel.y - crease_y) < std::abs(r.pixel.y - crease_y);
        });
    CreaseCrossing c;
    c.point = nearest->pixel;
    return c;
}

}  // namespace

WideDecision evaluateWide(const Trajectory& trajectory,
                          const CoordinateMapper& mapper,
                          const RuleParameters& params) {
    validateRuleParameters(params);
    requireFinalized(trajectory);

    const WideCorridor corridor = mapper.wideCorridor(params, params.handedness);

    WideDecision decision;
    decision.delivery_id = trajectory.deliveryId();
    decision.off_line = corridor.off_line;
    decision.leg_line = corridor.leg_line;

    if (trajectory.empty()) {
        decision.result = WideVerdict::NOT_WIDE;
        decision.confidence = 0.f;
        decision.reason = "No trajectory samples";
        return decision;
    }

    const CreaseCrossing crossing = ballAtCrease(trajectory.points(), mapper.battingCreaseY());
    decision.ball_at_crease = crossing.point;
    decision.interpolated = crossing.interpolated;

    const float x = crossing.point.x;
    decision.off_line_distance_px = std::abs(x - corridor.off_line_x);
    decision.leg_line_distance_px = std::abs(x - corridor.leg_line_x);

    // Positive beyond the line, negative inside the corridor.
    const float beyond_off = (x - corridor.off_line_x) * corridor.off_sign;
    const float beyond_leg = (corridor.leg_line_x - x) * corridor.off_sign;

    float distance_px;
    std::ostringstream reason;
    if (beyond_off > 0.f) {
        decision.result = WideVerdict::WIDE;
        decision.side = WideSide::OFF;
        distance_px = beyond_off;
    } else if (beyond_leg > 0.f) {
        decision.result = WideVerdict::WIDE;
        decision.side = WideSide::LEG;
        distance_px = beyond_leg;
    } else {
        decision.result = WideVerdict::NOT_WIDE;
        distance_px = std::min(-beyond_off, -beyond_leg);
    }

    const double margin_px = mapper.metersToPixels(params.wide_confidence_margin_m);
    double confidence = 0.5 + 0.5 * std::min(1.0, distance_px / margin_px);
    confidence *= trajectoryQuality(trajectory);
    if (!crossing.interpolated) confidence *= kNearestSamplePenalty;
    decision.confidence = clampConfidence(confidence);

    const double distance_m = mapper.pixelsToMeters(distance_px);
    if (decision.result == WideVerdict::WIDE) {
        if (belowOutThreshold(decision.confidence, params)) {
            decision.result = WideVerdict::NOT_WIDE;
            reason << "Ball " << distance_m << " m outside the " << toString(*decision.side)
                   << " wide line, but confidence " << decision.confidence
                   << " is below " << params.min_out_confidence;
            decision.side.reset();
        } else {
            reason << "Ball passed " << distance_m << " m outside the "
                   << toString(*decision.side) << " wide line";
        }
    } else {
        reason << "Ball inside the wide lines (" << distance_m << " m from the nearer line)";
    }
    decision.reason = reason.str();

    if (Logger::enabled(Logger::DEBUG)) {
        Logger::log(Logger::DEBUG, "Wide delivery " + std::to_string(decision.delivery_id) +
                    ": " + toString(decision.result) + " (" + decision.reason + ")");
    }
    return decision;
}

}} // namespace
