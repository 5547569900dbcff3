#include "delivery_segmenter.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace umpire;

namespace {

DeliverySegmenter makeSegmenter() {
    SegmenterConfig cfg;
    cfg.min_frames = 5;
    cfg.idle_frames = 15;
    return DeliverySegmenter(cfg, cv::Point2f(0.f, 1.f));
}

// Feeds approaching detections for frames [first, first + count).
SegmentEvent approach(DeliverySegmenter& seg, int first, int count, float y0 = 200.f) {
    SegmentEvent last = SegmentEvent::NONE;
    for (int i = 0; i < count; ++i) {
        last = seg.update(test::makeDetection(first + i, cv::Point2f(320.f, y0 + 20.f * i)));
    }
    return last;
}

}  // namespace

TEST(DeliverySegmenter, StartsAfterMinFramesApproaching) {
    DeliverySegmenter seg = makeSegmenter();
    EXPECT_EQ(approach(seg, 10, 4), SegmentEvent::NONE);
    EXPECT_EQ(seg.state(), DeliveryState::IDLE);

    EXPECT_EQ(seg.update(test::makeDetection(14, cv::Point2f(320.f, 280.f))),
              SegmentEvent::DELIVERY_STARTED);
    EXPECT_TRUE(seg.isDeliveryActive());
    EXPECT_EQ(seg.deliveryStartFrame(), 10);
}

TEST(DeliverySegmenter, IgnoresBallMovingAway) {
    DeliverySegmenter seg = makeSegmenter();
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(seg.update(test::makeDetection(i, cv::Point2f(320.f, 800.f - 20.f * i))),
                  SegmentEvent::NONE);
    }
    EXPECT_EQ(seg.state(), DeliveryState::IDLE);
}

TEST(DeliverySegmenter, WeakOrMissingDetectionBreaksTheRun) {
    DeliverySegmenter seg = makeSegmenter();
    approach(seg, 0, 4);
    seg.update(test::makeMiss(4));
    EXPECT_EQ(approach(seg, 5, 4, 300.f), SegmentEvent::NONE);

    seg.update(test::makeDetection(9, cv::Point2f(320.f, 400.f), 0.05f));
    EXPECT_EQ(seg.state(), DeliveryState::IDLE);

    EXPECT_EQ(approach(seg, 10, 5, 500.f), SegmentEvent::DELIVERY_STARTED);
    EXPECT_EQ(seg.deliveryStartFrame(), 10);
}

TEST(DeliverySegmenter, ShortGapDoesNotEndDelivery) {
    DeliverySegmenter seg = makeSegmenter();
    approach(seg, 0, 5);
    ASSERT_TRUE(seg.isDeliveryActive());

    for (int f = 5; f < 15; ++f) {
        EXPECT_EQ(seg.update(test::makeMiss(f)), SegmentEvent::NONE);
    }
    EXPECT_EQ(seg.consecutiveIdleFrames(), 10);

    seg.update(test::makeDetection(15, cv::Point2f(320.f, 500.f)));
    EXPECT_TRUE(seg.isDeliveryActive());
    EXPECT_EQ(seg.consecutiveIdleFrames(), 0);
    EXPECT_EQ(seg.deliveryEndFrame(), 15);

    for (int f = 16; f < 30; ++f) {
        EXPECT_EQ(seg.update(test::makeMiss(f)), SegmentEvent::NONE);
    }
    EXPECT_EQ(seg.update(test::makeMiss(30)), SegmentEvent::DELIVERY_ENDED);
    EXPECT_EQ(seg.state(), DeliveryState::COMPLETE);
}

TEST(DeliverySegmenter, StationaryBallEndsDelivery) {
    DeliverySegmenter seg = makeSegmenter();
    approach(seg, 0, 5);

    SegmentEvent ev = SegmentEvent::NONE;
    int f = 5;
    for (; f < 40 && ev == SegmentEvent::NONE; ++f) {
        ev = seg.update(test::makeDetection(f, cv::Point2f(320.f, 280.f)));
    }
    EXPECT_EQ(ev, SegmentEvent::DELIVERY_ENDED);
    EXPECT_EQ(f, 20);
}

TEST(DeliverySegmenter, CompleteWaitsForAcknowledge) {
    DeliverySegmenter seg = makeSegmenter();
    approach(seg, 0, 5);
    for (int f = 5; f < 20; ++f) seg.update(test::makeMiss(f));
    ASSERT_EQ(seg.state(), DeliveryState::COMPLETE);

    EXPECT_EQ(approach(seg, 20, 10), SegmentEvent::NONE);
    EXPECT_EQ(seg.state(), DeliveryState::COMPLETE);

    seg.acknowledge();
    EXPECT_EQ(seg.state(), DeliveryState::IDLE);
    EXPECT_EQ(approach(seg, 30, 5), SegmentEvent::DELIVERY_STARTED);
}

TEST(DeliverySegmenter, AbandonReturnsToIdle) {
    DeliverySegmenter seg = makeSegmenter();
    approach(seg, 0, 5);
    ASSERT_TRUE(seg.isDeliveryActive());

    seg.abandon();
    EXPECT_EQ(seg.state(), DeliveryState::IDLE);
    EXPECT_EQ(seg.deliveryStartFrame(), -1);
    EXPECT_STREQ(toString(seg.state()), "idle");
}
