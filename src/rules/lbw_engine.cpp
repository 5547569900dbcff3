#include "rules/lbw_engine.hpp"
#include "rules/rule_utils.hpp"
#include "coordinate_mapper.hpp"
#include "errors.hpp"
#include "trajectory.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>
#include <vector>

namespace umpire { namespace rules {

namespace {

constexpr float kRejectConfidence = 0.3f;
constexpr double kFullConfidenceSamples = 10.0;
constexpr double kAccelVarianceScale = 1.0;   // px^2 / frame^4

float sign(float v) {
    return (v > 0.f) ? 1.f : (v < 0.f) ? -1.f : 0.f;
}

LineZone classifyLine(float x, const CoordinateMapper& mapper, double tolerance,
                      Handedness handedness) {
    if (mapper.isInStumpZone(x, tolerance)) return LineZone::IN_LINE;
    const float offset = x - mapper.calibration().batting_stumps.middle.x;
    return offset * mapper.offSideSign(handedness) > 0.f ? LineZone::OUTSIDE_OFF
                                                         : LineZone::OUTSIDE_LEG;
}

double variance(const std::vector<double>& values) {
    if (values.size() < 2) return 0.0;
    double mean = 0.0;
    for (double v : values) mean += v;
    mean /= values.size();
    double acc = 0.0;
    for (double v : values) acc += (v - mean) * (v - mean);
    return acc / values.size();
}

// Samples count, share of real detections, steadiness of the acceleration
// estimate since the bounce.
double projectionConfidence(const std::vector<const TrajectoryPoint*>& pre_impact) {
    const double n = static_cast<double>(pre_impact.size());
    const double length = std::min(1.0, n / kFullConfidenceSamples);

    const double observed = static_cast<double>(std::count_if(pre_impact.begin(), pre_impact.end(),
        [](const TrajectoryPoint* p) { return p->observed; }));
    const double detections = observed / n;

    std::vector<double> ax, ay;
    for (const TrajectoryPoint* p : pre_impact) {
        if (p->is_bounce) {
            ax.clear();
            ay.clear();
        }
        ax.push_back(p->acceleration.x);
        ay.push_back(p->acceleration.y);
    }
    if (ax.size() < 2) {
        ax.clear();
        ay.clear();
        for (const TrajectoryPoint* p : pre_impact) {
            ax.push_back(p->acceleration.x);
            ay.push_back(p->acceleration.y);
        }
    }
    const double stability = 1.0 / (1.0 + (variance(ax) + variance(ay)) / kAccelVarianceScale);

    return 0.4 * length + 0.3 * detections + 0.3 * stability;
}

}  // namespace

ProjectedPath::iterator::iterator(const ProjectionSeed& seed)
    : pos_(seed.position), vel_(seed.velocity), acc_(seed.acceleration),
      gravity_(seed.gravity), target_y_(seed.target_y),
      side_(sign(seed.position.y - seed.target_y)),
      steps_(0), max_steps_(seed.max_steps), reached_(side_ == 0.f), done_(false) {}

ProjectedPath::iterator& ProjectedPath::iterator::operator++() {
    if (done_) return *this;
    if (reached_ || steps_ >= max_steps_) {
        done_ = true;
        return *this;
    }
    ++steps_;

    const cv::Point2f next(pos_.x + vel_.x + 0.5f * acc_.x,
                           pos_.y + vel_.y + 0.5f * acc_.y + 0.5f * gravity_);
    vel_.x += acc_.x;
    vel_.y += acc_.y + gravity_;

    if ((next.y - target_y_) * side_ <= 0.f) {
        // Crossed the crease inside this step: stop exactly on the line.
        const float t = (target_y_ - pos_.y) / (next.y - pos_.y);
        pos_ = pos_ + (next - pos_) * t;
        pos_.y = target_y_;
        reached_ = true;
    } else {
        pos_ = next;
    }
    return *this;
}

LbwDecision evaluateLbw(const Trajectory& trajectory,
                        const LbwAppeal& appeal,
                        const CoordinateMapper& mapper,
                        const RuleParameters& params) {
    validateRuleParameters(params);
    requireFinalized(trajectory);

    const ImpactEvent& impact = appeal.pad_impact;

    std::vector<const TrajectoryPoint*> pre_impact;
    for (const auto& p : trajectory.points()) {
        if (p.frame_index < impact.frame_index) pre_impact.push_back(&p);
    }
    if (static_cast<int>(pre_impact.size()) < params.min_projection_samples) {
        throw InsufficientDataError("LBW projection needs " +
                                    std::to_string(params.min_projection_samples) +
                                    " samples before the impact, trajectory has " +
                                    std::to_string(pre_impact.size()));
    }

    const double tolerance = params.stump_tolerance * strictnessZoneFactor(params.lbw_strictness);

    LbwDecision decision;
    decision.delivery_id = trajectory.deliveryId();
    decision.handedness = appeal.handedness;
    decision.impact_point = impact.position_px;
    decision.stump_zone = mapper.stumpZonePolygon(tolerance);

    // A delivery that reaches the pad on the full has no pitching point.
    const TrajectoryPoint* bounce = trajectory.bouncePoint();
    if (bounce && bounce->frame_index < impact.frame_index) {
        decision.pitch_point = bounce->pixel;
        decision.pitching_zone = classifyLine(bounce->pixel.x, mapper, tolerance, appeal.handedness);
    } else {
        decision.pitching_zone = LineZone::NOT_PITCHED;
    }
    decision.impact_zone = classifyLine(impact.position_px.x, mapper, tolerance, appeal.handedness);

    if (decision.pitching_zone == LineZone::OUTSIDE_LEG) {
        decision.result = Verdict::NOT_OUT;
        decision.reason = "Ball pitched outside leg stump";
        decision.confidence = kRejectConfidence;
        return decision;
    }
    if (decision.impact_zone == LineZone::OUTSIDE_LEG) {
        decision.result = Verdict::NOT_OUT;
        decision.reason = "Ball hit the pad outside leg stump";
        decision.confidence = kRejectConfidence;
        return decision;
    }
    if (decision.impact_zone == LineZone::OUTSIDE_OFF && appeal.shot_offered) {
        decision.result = Verdict::NOT_OUT;
        decision.reason = "Ball hit the pad outside off stump with a shot offered";
        decision.confidence = kRejectConfidence;
        return decision;
    }

    const TrajectoryPoint& last = *pre_impact.back();
    ProjectionSeed seed;
    seed.position = impact.position_px;
    seed.velocity = last.velocity;
    seed.acceleration = last.acceleration;
    seed.gravity = static_cast<float>(mapper.gravityPxPerFrame2());
    seed.target_y = mapper.battingCreaseY();
    seed.max_steps = params.max_projection_steps;

    const ProjectedPath path(seed);
    bool reached = false;
    for (auto it = path.begin(); it != path.end(); ++it) {
        decision.projected_path.push_back(*it);
        reached = it.reachedTarget();
    }

    decision.projected_x = decision.projected_path.back().x;
    decision.projected_hitting_stumps = reached && mapper.isInStumpZone(decision.projected_x, tolerance);
    if (decision.projected_hitting_stumps) {
        decision.stump_hit = mapper.nearestStump(decision.projected_x, appeal.handedness);
    }

    decision.confidence = clampConfidence(projectionConfidence(pre_impact) *
                                          trajectoryQuality(trajectory));

    std::ostringstream reason;
    if (!reached) {
        decision.result = Verdict::NOT_OUT;
        reason << "Projection did not reach the batting crease within "
               << params.max_projection_steps << " frames";
    } else if (!decision.projected_hitting_stumps) {
        decision.result = Verdict::NOT_OUT;
        reason << "Ball would have missed the stumps";
    } else if (belowOutThreshold(decision.confidence, params)) {
        decision.result = Verdict::NOT_OUT;
        reason << "Projected to hit " << toString(*decision.stump_hit)
               << " stump, but confidence " << decision.confidence
               << " is below " << params.min_out_confidence;
    } else {
        decision.result = Verdict::OUT;
        reason << (decision.pitching_zone == LineZone::NOT_PITCHED ? "Full toss" : "Pitched ")
               << (decision.pitching_zone == LineZone::NOT_PITCHED ? "" : toString(decision.pitching_zone))
               << ", impact " << toString(decision.impact_zone)
               << ", projected to hit " << toString(*decision.stump_hit) << " stump";
    }
    decision.reason = reason.str();

    if (Logger::enabled(Logger::DEBUG)) {
        Logger::log(Logger::DEBUG, "LBW delivery " + std::to_string(decision.delivery_id) +
                    ": " + toString(decision.result) + " (" + decision.reason + ")");
    }
    return decision;
}

}} // namespace
