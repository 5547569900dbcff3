#include "rules/lbw_engine.hpp"
#include "coordinate_mapper.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>
#include <vector>

using namespace umpire;
using namespace umpire::rules;

namespace {

struct LbwScenario {
    float impact_x = 320.f;
    std::optional<float> bounce_x = 320.f;   // nullopt: full toss
    int pre_impact_samples = 12;
};

// Ball travelling straight down the pitch at 20 px/frame, pitching at
// sample 3 and hitting the pad at y = 500 + 20 * pre_impact_samples.
class LbwEngineTest : public ::testing::Test {
protected:
    LbwEngineTest() : mapper_(test::makeCalibration()) {}

    Trajectory build(const LbwScenario& s) {
        Trajectory t(7);
        for (int i = 0; i <= s.pre_impact_samples; ++i) {
            float x = s.impact_x;
            if (s.bounce_x && i == 3) x = *s.bounce_x;
            t.append(test::makePoint(i, {x, 500.f + 20.f * i}, {0.f, 20.f}));
        }
        if (s.bounce_x && s.pre_impact_samples > 3) t.markBounce(3);
        t.finalize(mapper_, QualityConfig());
        return t;
    }

    LbwAppeal appeal(const LbwScenario& s, bool shot_offered = true,
                     Handedness h = Handedness::RIGHT) {
        LbwAppeal a;
        a.pad_impact.type = ImpactType::PAD;
        a.pad_impact.frame_index = s.pre_impact_samples;
        a.pad_impact.position_px = cv::Point2f(s.impact_x, 500.f + 20.f * s.pre_impact_samples);
        a.pad_impact.confidence = 0.8f;
        a.handedness = h;
        a.shot_offered = shot_offered;
        return a;
    }

    float offsetPx(double meters) const {
        return static_cast<float>(mapper_.metersToPixels(meters));
    }

    CoordinateMapper mapper_;
};

}  // namespace

TEST_F(LbwEngineTest, InLineIsOutForEveryTolerance) {
    LbwScenario s;
    Trajectory t = build(s);

    for (double tolerance : {1.0, 1.5, 2.0, 3.0}) {
        RuleParameters params;
        params.stump_tolerance = tolerance;
        LbwDecision d = evaluateLbw(t, appeal(s), mapper_, params);

        EXPECT_EQ(d.result, Verdict::OUT) << "tolerance " << tolerance << ": " << d.reason;
        EXPECT_EQ(d.pitching_zone, LineZone::IN_LINE);
        EXPECT_EQ(d.impact_zone, LineZone::IN_LINE);
        EXPECT_TRUE(d.projected_hitting_stumps);
        ASSERT_TRUE(d.stump_hit.has_value());
        EXPECT_EQ(*d.stump_hit, StumpId::MIDDLE);
        EXPECT_GE(d.confidence, 0.5f);
        EXPECT_EQ(d.delivery_id, 7u);
    }
}

TEST_F(LbwEngineTest, ProjectionEndsOnTheCrease) {
    LbwScenario s;
    Trajectory t = build(s);
    LbwDecision d = evaluateLbw(t, appeal(s), mapper_, RuleParameters());

    ASSERT_GE(d.projected_path.size(), 2u);
    EXPECT_EQ(d.projected_path.front(), d.impact_point);
    EXPECT_FLOAT_EQ(d.projected_path.back().y, 900.f);
    EXPECT_FLOAT_EQ(d.projected_x, 320.f);
    EXPECT_EQ(d.stump_zone.size(), 4u);
    ASSERT_TRUE(d.pitch_point.has_value());
    EXPECT_FLOAT_EQ(d.pitch_point->y, 560.f);
}

TEST_F(LbwEngineTest, StumpZoneFifteenAndEighteenCentimetres) {
    RuleParameters params;
    params.stump_tolerance = 1.5;

    LbwScenario inside;
    inside.impact_x = 320.f - offsetPx(0.15);
    inside.bounce_x = 320.f;
    Trajectory t_in = build(inside);
    LbwDecision d_in = evaluateLbw(t_in, appeal(inside, false), mapper_, params);
    EXPECT_EQ(d_in.impact_zone, LineZone::IN_LINE);
    EXPECT_TRUE(d_in.projected_hitting_stumps);
    EXPECT_EQ(d_in.result, Verdict::OUT);

    LbwScenario outside;
    outside.impact_x = 320.f - offsetPx(0.18);
    outside.bounce_x = 320.f;
    Trajectory t_out = build(outside);
    LbwDecision d_out = evaluateLbw(t_out, appeal(outside, false), mapper_, params);
    EXPECT_EQ(d_out.impact_zone, LineZone::OUTSIDE_OFF);
    EXPECT_FALSE(d_out.projected_hitting_stumps);
    EXPECT_EQ(d_out.result, Verdict::NOT_OUT);
}

TEST_F(LbwEngineTest, PitchedOutsideLegIsNotOut) {
    LbwScenario s;
    s.bounce_x = 340.f;
    Trajectory t = build(s);
    LbwDecision d = evaluateLbw(t, appeal(s), mapper_, RuleParameters());

    EXPECT_EQ(d.result, Verdict::NOT_OUT);
    EXPECT_EQ(d.pitching_zone, LineZone::OUTSIDE_LEG);
    EXPECT_FLOAT_EQ(d.confidence, 0.3f);
    EXPECT_TRUE(d.projected_path.empty());
}

TEST_F(LbwEngineTest, ImpactOutsideLegIsNotOut) {
    LbwScenario s;
    s.impact_x = 330.f;
    Trajectory t = build(s);
    LbwDecision d = evaluateLbw(t, appeal(s, false), mapper_, RuleParameters());

    EXPECT_EQ(d.result, Verdict::NOT_OUT);
    EXPECT_EQ(d.impact_zone, LineZone::OUTSIDE_LEG);
}

TEST_F(LbwEngineTest, ImpactOutsideOffDependsOnShot) {
    LbwScenario s;
    s.impact_x = 310.f;
    Trajectory t = build(s);

    LbwDecision played = evaluateLbw(t, appeal(s, true), mapper_, RuleParameters());
    EXPECT_EQ(played.result, Verdict::NOT_OUT);
    EXPECT_EQ(played.impact_zone, LineZone::OUTSIDE_OFF);
    EXPECT_FLOAT_EQ(played.confidence, 0.3f);

    // No shot: the projection decides, and a straight ball from 310 misses.
    LbwDecision padded = evaluateLbw(t, appeal(s, false), mapper_, RuleParameters());
    EXPECT_EQ(padded.result, Verdict::NOT_OUT);
    EXPECT_FALSE(padded.projected_path.empty());
}

TEST_F(LbwEngineTest, LeftHanderFlipsPitchingSide) {
    LbwScenario s;
    s.bounce_x = 310.f;
    Trajectory t = build(s);

    LbwDecision right = evaluateLbw(t, appeal(s, true, Handedness::RIGHT), mapper_, RuleParameters());
    EXPECT_EQ(right.pitching_zone, LineZone::OUTSIDE_OFF);
    EXPECT_EQ(right.result, Verdict::OUT);

    LbwDecision left = evaluateLbw(t, appeal(s, true, Handedness::LEFT), mapper_, RuleParameters());
    EXPECT_EQ(left.pitching_zone, LineZone::OUTSIDE_LEG);
    EXPECT_EQ(left.result, Verdict::NOT_OUT);
    EXPECT_EQ(left.handedness, Handedness::LEFT);
}

TEST_F(LbwEngineTest, FullTossHasNoPitchingPoint) {
    LbwScenario s;
    s.bounce_x.reset();
    Trajectory t = build(s);
    LbwDecision d = evaluateLbw(t, appeal(s), mapper_, RuleParameters());

    EXPECT_EQ(d.pitching_zone, LineZone::NOT_PITCHED);
    EXPECT_FALSE(d.pitch_point.has_value());
    EXPECT_EQ(d.result, Verdict::OUT);
}

TEST_F(LbwEngineTest, StrictnessNarrowsTheZone) {
    LbwScenario s;
    s.impact_x = 315.8f;
    Trajectory t = build(s);

    RuleParameters standard;
    LbwDecision d_standard = evaluateLbw(t, appeal(s, false), mapper_, standard);
    EXPECT_EQ(d_standard.result, Verdict::OUT);

    RuleParameters strict;
    strict.lbw_strictness = LbwStrictness::STRICT;
    LbwDecision d_strict = evaluateLbw(t, appeal(s, false), mapper_, strict);
    EXPECT_EQ(d_strict.result, Verdict::NOT_OUT);
    EXPECT_FALSE(d_strict.projected_hitting_stumps);
}

TEST_F(LbwEngineTest, LowConfidenceOutBecomesNotOut) {
    LbwScenario s;
    s.bounce_x.reset();
    s.pre_impact_samples = 4;
    Trajectory t = build(s);

    RuleParameters params;
    params.min_out_confidence = 0.9;
    LbwDecision d = evaluateLbw(t, appeal(s), mapper_, params);

    EXPECT_EQ(d.result, Verdict::NOT_OUT);
    EXPECT_TRUE(d.projected_hitting_stumps);
    EXPECT_NEAR(d.confidence, 0.76f, 1e-4);
}

TEST_F(LbwEngineTest, TooFewSamplesThrows) {
    LbwScenario s;
    s.bounce_x.reset();
    s.pre_impact_samples = 2;
    Trajectory t = build(s);
    EXPECT_THROW(evaluateLbw(t, appeal(s), mapper_, RuleParameters()), InsufficientDataError);
}

TEST_F(LbwEngineTest, RequiresFinalizedTrajectory) {
    Trajectory t = test::straightTrajectory({320.f, 500.f}, {0.f, 20.f}, 12);
    LbwScenario s;
    s.pre_impact_samples = 11;
    EXPECT_THROW(evaluateLbw(t, appeal(s), mapper_, RuleParameters()), std::invalid_argument);
}

TEST_F(LbwEngineTest, RejectsOutOfRangeTolerance) {
    LbwScenario s;
    Trajectory t = build(s);
    RuleParameters params;
    params.stump_tolerance = 3.5;
    EXPECT_THROW(evaluateLbw(t, appeal(s), mapper_, params), ConfigError);
}

TEST(ProjectedPath, RestartsFromTheSeed) {
    ProjectionSeed seed;
    seed.position = {320.f, 700.f};
    seed.velocity = {1.f, 20.f};
    seed.gravity = 0.4f;
    seed.target_y = 900.f;

    ProjectedPath path(seed);
    std::vector<cv::Point2f> first(path.begin(), path.end());
    std::vector<cv::Point2f> second(path.begin(), path.end());

    ASSERT_FALSE(first.empty());
    EXPECT_EQ(first, second);
    EXPECT_EQ(first.front(), seed.position);
    EXPECT_FLOAT_EQ(first.back().y, 900.f);
    for (size_t i = 1; i < first.size(); ++i) {
        EXPECT_GT(first[i].y, first[i - 1].y);
    }
}

TEST(ProjectedPath, StopsAtStepCap) {
    ProjectionSeed seed;
    seed.position = {320.f, 500.f};
    seed.velocity = {0.f, -20.f};
    seed.target_y = 900.f;
    seed.max_steps = 10;

    ProjectedPath path(seed);
    size_t count = 0;
    bool reached = true;
    for (auto it = path.begin(); it != path.end(); ++it) {
        ++count;
        reached = it.reachedTarget();
    }
    EXPECT_EQ(count, 11u);
    EXPECT_FALSE(reached);
}

TEST(ProjectedPath, SeedOnTheLineIsASinglePoint) {
    ProjectionSeed seed;
    seed.position = {320.f, 900.f};
    seed.velocity = {0.f, 20.f};
    seed.target_y = 900.f;

    ProjectedPath path(seed);
    std::vector<cv::Point2f> pts(path.begin(), path.end());
    ASSERT_EQ(pts.size(), 1u);
    EXPECT_TRUE(path.begin().reachedTarget());
}
