// pipeline.hpp
#pragma once

#include "config.hpp"
#include "coordinate_mapper.hpp"
#include "delivery_segmenter.hpp"
#include "event_detector.hpp"
#include "lock_free_queue.hpp"
#include "rules/caught_behind_engine.hpp"
#include "rules/lbw_engine.hpp"
#include "rules/wide_engine.hpp"
#include "tracker.hpp"
#include "trajectory.hpp"
#include "utils.hpp"

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace umpire {

// Configuration and geometry a delivery was recorded under. Shared by every
// record produced between two configuration swaps.
struct SessionContext {
    explicit SessionContext(const SessionConfig& cfg) : config(cfg), mapper(cfg.calibration) {}

    SessionConfig config;
    CoordinateMapper mapper;
};

// Everything produced for one finished delivery.
struct DeliveryRecord {
    std::shared_ptr<const Trajectory> trajectory;
    std::vector<ImpactEvent> impacts;
    rules::WideDecision wide;
    rules::CaughtBehindDecision caught_behind;
    std::shared_ptr<const SessionContext> session;
};

// First PAD impact of a delivery, the usual subject of an LBW appeal.
std::optional<ImpactEvent> firstPadImpact(const DeliveryRecord& record);

// Per-session delivery pipeline.
//
// processFrame() runs on the frame thread: segmenter and tracker advance in
// step and never block. Ended deliveries go through a lock-free queue to the
// finaliser thread, which runs the exhaustive event pass and the wide and
// caught-behind rules, then publishes an immutable DeliveryRecord.
// processFrame(), abandonDelivery() and swapConfiguration() must all be
// called from the frame thread.
class DeliveryPipeline {
public:
    using CompletionCallback = std::function<void(std::shared_ptr<const DeliveryRecord>)>;

    // Throws CalibrationError for unusable geometry (a wall boundary is
    // required for caught-behind rulings), ConfigError for bad settings.
    explicit DeliveryPipeline(const SessionConfig& config);
    ~DeliveryPipeline();

    DeliveryPipeline(const DeliveryPipeline&) = delete;
    DeliveryPipeline& operator=(const DeliveryPipeline&) = delete;

    // Set before start(); invoked on the finaliser thread.
    void setCompletionCallback(CompletionCallback callback);

    // Spawns the finaliser thread. Without it, flush() finalises inline.
    void start();
    // Finalises whatever is queued, then joins the finaliser.
    void stop();
    bool isRunning() const { return running_; }

    // When the finaliser queue is full the delivery is never dropped: with
    // no finaliser thread the oldest queued delivery is finalised inline,
    // otherwise the call waits for a free slot.
    SegmentEvent processFrame(const Observation& observation);

    // Discards the delivery in flight without producing any decision.
    void abandonDelivery();

    // Replaces calibration and rules. Refused (returns false) while a
    // delivery is being tracked.
    bool swapConfiguration(const SessionConfig& config);

    // Blocks until every queued delivery has been finalised.
    void flush();

    // Records are kept until taken; long sessions should drain them with
    // takeCompletedDeliveries().
    std::vector<std::shared_ptr<const DeliveryRecord>> completedDeliveries() const;
    std::vector<std::shared_ptr<const DeliveryRecord>> takeCompletedDeliveries();

    // On-demand LBW review against the rules the delivery was recorded under.
    rules::LbwDecision reviewLbw(const DeliveryRecord& record, const rules::LbwAppeal& appeal) const;

    DeliveryState deliveryState() const { return segmenter_->state(); }
    const BallTracker& tracker() const { return *tracker_; }
    std::shared_ptr<const SessionContext> session() const { return session_; }
    const PipelineStats& stats() const { return stats_; }

private:
    struct PendingDelivery {
        std::shared_ptr<Trajectory> trajectory;
        std::shared_ptr<const SessionContext> session;
    };

    std::shared_ptr<const SessionContext> session_;
    std::unique_ptr<BallTracker> tracker_;
    std::unique_ptr<DeliverySegmenter> segmenter_;
    BounceMonitor bounce_monitor_;

    // Observations seen while idle, replayed once a delivery is confirmed.
    std::deque<Observation> recent_;
    std::shared_ptr<Trajectory> active_;
    uint64_t next_delivery_id_ = 1;
    int last_frame_ = -1;
    bool has_frame_ = false;

    LockFreeQueue<PendingDelivery> queue_;
    std::atomic<int> in_flight_{0};
    std::atomic<bool> running_{false};
    std::thread finaliser_;

    CompletionCallback callback_;
    mutable std::mutex completed_mutex_;
    std::vector<std::shared_ptr<const DeliveryRecord>> completed_;

    PipelineStats stats_;

    static std::shared_ptr<const SessionContext> makeSession(const SessionConfig& config);
    void rebuildComponents();

    void beginDelivery();
    void track(const Observation& observation);
    void endDelivery();

    void finaliserLoop();
    bool drainOne();
    void finalizeDelivery(PendingDelivery& pending);
};

}  // namespace umpire
