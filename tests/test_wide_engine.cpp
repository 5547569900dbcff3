#include "rules/wide_engine.hpp"
#include "coordinate_mapper.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace umpire;
using namespace umpire::rules;

namespace {

class WideEngineTest : public ::testing::Test {
protected:
    WideEngineTest() : mapper_(test::makeCalibration()) {}

    // Straight down the pitch at a fixed x, crossing the crease (y = 900).
    Trajectory throughCrease(float x, int unobserved = 0) {
        Trajectory t(3);
        for (int i = 0; i < 7; ++i) {
            const bool observed = i >= unobserved;
            t.append(test::makePoint(i, {x, 780.f + 30.f * i}, {0.f, 30.f}, {0.f, 0.f},
                                     observed ? 0.9f : 0.f, observed));
        }
        t.finalize(mapper_, QualityConfig());
        return t;
    }

    RuleParameters halfMetreLines() const {
        RuleParameters p;
        p.wide_off_side_m = 0.5;
        p.wide_leg_side_m = 0.5;
        return p;
    }

    float offStumpMinus(double meters) const {
        return 316.f - static_cast<float>(mapper_.metersToPixels(meters));
    }

    CoordinateMapper mapper_;
};

}  // namespace

TEST_F(WideEngineTest, BallOutsideOffLineIsWide) {
    Trajectory t = throughCrease(offStumpMinus(0.6));
    WideDecision d = evaluateWide(t, mapper_, halfMetreLines());

    EXPECT_EQ(d.result, WideVerdict::WIDE);
    ASSERT_TRUE(d.side.has_value());
    EXPECT_EQ(*d.side, WideSide::OFF);
    EXPECT_TRUE(d.interpolated);
    EXPECT_NEAR(d.off_line_distance_px, mapper_.metersToPixels(0.1), 1e-3);
    EXPECT_NEAR(d.confidence, 0.5 + 0.5 * (0.1 / 0.15), 1e-3);
    EXPECT_FLOAT_EQ(d.ball_at_crease.y, 900.f);
    EXPECT_EQ(d.delivery_id, 3u);
}

TEST_F(WideEngineTest, SameBallIsLegSideWideForLeftHander) {
    Trajectory t = throughCrease(offStumpMinus(0.6));
    RuleParameters params = halfMetreLines();
    params.handedness = Handedness::LEFT;
    WideDecision d = evaluateWide(t, mapper_, params);

    EXPECT_EQ(d.result, WideVerdict::WIDE);
    ASSERT_TRUE(d.side.has_value());
    EXPECT_EQ(*d.side, WideSide::LEG);
}

TEST_F(WideEngineTest, BallInsideCorridorIsNotWide) {
    Trajectory t = throughCrease(320.f);
    WideDecision d = evaluateWide(t, mapper_, RuleParameters());

    EXPECT_EQ(d.result, WideVerdict::NOT_WIDE);
    EXPECT_FALSE(d.side.has_value());
    EXPECT_FLOAT_EQ(d.confidence, 1.f);
}

TEST_F(WideEngineTest, ConfidenceLowestOnTheLine) {
    RuleParameters params;
    const float line_x = mapper_.wideCorridor(params, Handedness::RIGHT).off_line_x;

    WideDecision on_line = evaluateWide(throughCrease(line_x), mapper_, params);
    WideDecision inside = evaluateWide(throughCrease(320.f), mapper_, params);
    WideDecision outside = evaluateWide(throughCrease(line_x - 30.f), mapper_, params);

    EXPECT_EQ(on_line.result, WideVerdict::NOT_WIDE);
    EXPECT_NEAR(on_line.confidence, 0.5f, 1e-5);
    EXPECT_GT(inside.confidence, on_line.confidence);
    EXPECT_GT(outside.confidence, on_line.confidence);
    EXPECT_EQ(outside.result, WideVerdict::WIDE);
}

TEST_F(WideEngineTest, InterpolatesBetweenBracketingSamples) {
    Trajectory t(1);
    t.append(test::makePoint(0, {310.f, 880.f}, {10.f, 40.f}));
    t.append(test::makePoint(1, {330.f, 920.f}, {10.f, 40.f}));
    t.finalize(mapper_, QualityConfig());

    WideDecision d = evaluateWide(t, mapper_, RuleParameters());
    EXPECT_TRUE(d.interpolated);
    EXPECT_FLOAT_EQ(d.ball_at_crease.x, 320.f);
    EXPECT_FLOAT_EQ(d.ball_at_crease.y, 900.f);
}

TEST_F(WideEngineTest, FallsBackToNearestSample) {
    Trajectory t(1);
    for (int i = 0; i < 6; ++i) {
        t.append(test::makePoint(i, {250.f, 700.f + 30.f * i}, {0.f, 30.f}));
    }
    t.finalize(mapper_, QualityConfig());

    WideDecision d = evaluateWide(t, mapper_, RuleParameters());
    EXPECT_FALSE(d.interpolated);
    EXPECT_FLOAT_EQ(d.ball_at_crease.y, 850.f);
    EXPECT_EQ(d.result, WideVerdict::WIDE);
    EXPECT_NEAR(d.confidence, 0.8f, 1e-5);
}

TEST_F(WideEngineTest, EmptyTrajectoryIsNotWide) {
    Trajectory t(9);
    t.finalize(mapper_, QualityConfig());
    WideDecision d = evaluateWide(t, mapper_, RuleParameters());

    EXPECT_EQ(d.result, WideVerdict::NOT_WIDE);
    EXPECT_FLOAT_EQ(d.confidence, 0.f);
}

TEST_F(WideEngineTest, BelowThresholdWideIsReportedNotWide) {
    Trajectory t = throughCrease(offStumpMinus(0.6));
    RuleParameters params = halfMetreLines();
    params.min_out_confidence = 0.9;
    WideDecision d = evaluateWide(t, mapper_, params);

    EXPECT_EQ(d.result, WideVerdict::NOT_WIDE);
    EXPECT_FALSE(d.side.has_value());
    EXPECT_FALSE(d.reason.empty());
}

TEST_F(WideEngineTest, DetectionGapLowersConfidence) {
    WideDecision clean = evaluateWide(throughCrease(offStumpMinus(0.6)), mapper_, halfMetreLines());
    WideDecision gappy = evaluateWide(throughCrease(offStumpMinus(0.6), 4), mapper_, halfMetreLines());

    EXPECT_LT(gappy.confidence, clean.confidence);
    EXPECT_NEAR(gappy.confidence, clean.confidence * 0.75f, 1e-4);
}

TEST_F(WideEngineTest, ReportsCorridorGeometry) {
    RuleParameters params;
    WideDecision d = evaluateWide(throughCrease(320.f), mapper_, params);
    const WideCorridor c = mapper_.wideCorridor(params, Handedness::RIGHT);

    EXPECT_FLOAT_EQ(d.off_line.from.x, c.off_line_x);
    EXPECT_FLOAT_EQ(d.leg_line.to.x, c.leg_line_x);
    EXPECT_NEAR(d.off_line_distance_px, 320.f - c.off_line_x, 1e-3);
    EXPECT_NEAR(d.leg_line_distance_px, c.leg_line_x - 320.f, 1e-3);
}
