#pragma once
#include "rules/decisions.hpp"
#include "calibration.hpp"
#include "types.hpp"

#include <opencv2/core.hpp>

#include <cstddef>
#include <iterator>

namespace umpire {
class CoordinateMapper;
class Trajectory;
}

namespace umpire { namespace rules {

/**
 * Starting state for a post-impact projection.
 *  - position:     pad impact point (px)
 *  - velocity:     pre-impact velocity (px/frame)
 *  - acceleration: pre-impact acceleration (px/frame^2)
 *  - gravity:      added to the vertical component every step (px/frame^2)
 *  - target_y:     batting-crease line; the sequence ends on reaching it
 */
struct ProjectionSeed {
    cv::Point2f position;
    cv::Point2f velocity;
    cv::Point2f acceleration;
    float gravity = 0.f;
    float target_y = 0.f;
    int max_steps = 300;
};

/**
 * Lazy, finite sequence of projected positions, one per frame:
 *     x' = x + vx + 0.5*ax
 *     y' = y + vy + 0.5*ay + 0.5*g
 * The first element is the seed position. The last element lies exactly on
 * the target line (interpolated inside the crossing step) unless the step
 * cap runs out first. Every begin() restarts from the seed.
 */
class ProjectedPath {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = cv::Point2f;
        using difference_type = std::ptrdiff_t;
        using pointer = const cv::Point2f*;
        using reference = const cv::Point2f&;

        iterator() = default;  // end
        explicit iterator(const ProjectionSeed& seed);

        reference operator*() const { return pos_; }
        pointer operator->() const { return &pos_; }
        iterator& operator++();

        // True once the current element sits on the target line.
        bool reachedTarget() const { return reached_; }

        bool operator==(const iterator& other) const { return done_ == other.done_; }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        cv::Point2f pos_;
        cv::Point2f vel_;
        cv::Point2f acc_;
        float gravity_ = 0.f;
        float target_y_ = 0.f;
        float side_ = 0.f;    // sign of (start.y - target_y)
        int steps_ = 0;
        int max_steps_ = 0;
        bool reached_ = false;
        bool done_ = true;
    };

    explicit ProjectedPath(const ProjectionSeed& seed) : seed_(seed) {}

    iterator begin() const { return iterator(seed_); }
    iterator end() const { return iterator(); }

    const ProjectionSeed& seed() const { return seed_; }

private:
    ProjectionSeed seed_;
};

struct LbwAppeal {
    ImpactEvent pad_impact;
    Handedness handedness = Handedness::RIGHT;
    bool shot_offered = true;   // batter attempted a genuine stroke
};

/**
 * Leg-before-wicket review (on demand).
 *
 * Pitching and impact points are classified against the tolerance-expanded
 * stump zone. Pitching outside leg, impact outside leg, or impact outside
 * off with a shot offered are rejected with a fixed low confidence.
 * Otherwise the ball is projected from the impact to the batting crease and
 * ruled OUT when it lands inside the stump zone with enough confidence.
 *
 * Throws InsufficientDataError with fewer than min_projection_samples
 * samples before the impact, ConfigError for invalid parameters.
 */
LbwDecision evaluateLbw(const Trajectory& trajectory,
                        const LbwAppeal& appeal,
                        const CoordinateMapper& mapper,
                        const RuleParameters& params);

}} // namespace
