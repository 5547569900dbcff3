// pipeline.cpp
#include "pipeline.hpp"
#include "errors.hpp"
#include "rules/rule_utils.hpp"

#include <chrono>
#include <exception>
#include <sstream>

namespace umpire {

std::optional<ImpactEvent> firstPadImpact(const DeliveryRecord& record) {
    for (const auto& ev : record.impacts) {
        if (ev.type == ImpactType::PAD) return ev;
    }
    return std::nullopt;
}

std::shared_ptr<const SessionContext> DeliveryPipeline::makeSession(const SessionConfig& config) {
    auto session = std::make_shared<const SessionContext>(config);
    if (!session->mapper.hasWallBoundary()) {
        throw CalibrationError("wall boundary polygon is required");
    }
    rules::validateRuleParameters(config.rules);
    validateTrackerConfig(config.tracker);
    validateSegmenterConfig(config.segmenter);
    return session;
}

DeliveryPipeline::DeliveryPipeline(const SessionConfig& config)
    : session_(makeSession(config)),
      queue_(config.pipeline.queue_size) {
    rebuildComponents();
}

DeliveryPipeline::~DeliveryPipeline() {
    stop();
}

void DeliveryPipeline::rebuildComponents() {
    const SessionConfig& cfg = session_->config;

    cv::Point2f direction = cfg.pipeline.approach_direction;
    if (direction.x == 0.f && direction.y == 0.f) {
        direction = cfg.calibration.batting_crease_px - cfg.calibration.bowling_crease_px;
    }

    tracker_ = std::make_unique<BallTracker>(cfg.tracker);
    segmenter_ = std::make_unique<DeliverySegmenter>(cfg.segmenter, direction);
    bounce_monitor_.reset();
    recent_.clear();
    active_.reset();
}

void DeliveryPipeline::setCompletionCallback(CompletionCallback callback) {
    callback_ = std::move(callback);
}

void DeliveryPipeline::start() {
    if (running_) return;
    running_ = true;
    finaliser_ = std::thread(&DeliveryPipeline::finaliserLoop, this);
    Logger::log(Logger::INFO, "Finaliser started");
}

void DeliveryPipeline::stop() {
    if (!running_) return;
    running_ = false;
    if (finaliser_.joinable()) {
        finaliser_.join();
    }
    Logger::log(Logger::INFO, "Finaliser stopped");
}

SegmentEvent DeliveryPipeline::processFrame(const Observation& observation) {
    Timer timer;
    const int frame = frameIndexOf(observation);
    if (has_frame_ && frame <= last_frame_) {
        Logger::log(Logger::WARNING, "Ignoring out-of-order frame " + std::to_string(frame) +
                    " (last " + std::to_string(last_frame_) + ")");
        return SegmentEvent::NONE;
    }
    last_frame_ = frame;
    has_frame_ = true;
    stats_.frames_processed++;

    const bool was_tracking = segmenter_->isDeliveryActive();
    const SegmentEvent event = segmenter_->update(observation);

    if (was_tracking) {
        track(observation);
    } else {
        recent_.push_back(observation);
        while (static_cast<int>(recent_.size()) > session_->config.segmenter.min_frames) {
            recent_.pop_front();
        }
    }

    if (event == SegmentEvent::DELIVERY_STARTED) {
        beginDelivery();
    } else if (event == SegmentEvent::DELIVERY_ENDED) {
        endDelivery();
    }

    stats_.ingest_time = timer.elapsed_us();
    return event;
}

void DeliveryPipeline::beginDelivery() {
    active_ = std::make_shared<Trajectory>(next_delivery_id_++);
    tracker_->reset();
    bounce_monitor_.reset();

    // The segmenter confirms a delivery only after several frames; those
    // frames belong to it too.
    const int start_frame = segmenter_->deliveryStartFrame();
    for (const auto& obs : recent_) {
        if (frameIndexOf(obs) >= start_frame) track(obs);
    }
    recent_.clear();

    Logger::log(Logger::INFO, "Delivery " + std::to_string(active_->deliveryId()) +
                " started at frame " + std::to_string(start_frame));
}

void DeliveryPipeline::track(const Observation& observation) {
    if (!active_) return;

    tracker_->predict();
    tracker_->update(observation);
    if (!tracker_->isInitialized()) return;

    const MotionState state = tracker_->state();
    const BallDetection* det = usableDetection(observation);

    TrajectoryPoint point;
    point.frame_index = frameIndexOf(observation);
    point.pixel = state.position;
    point.velocity = state.velocity;
    point.acceleration = state.acceleration;
    point.observed = det != nullptr;
    point.confidence = det ? det->confidence : 0.f;
    if (det) point.players = det->players;
    active_->append(point);

    if (bounce_monitor_.observe(point)) {
        Logger::log(Logger::INFO, "Bounce at frame " + std::to_string(point.frame_index));
    }
}

void DeliveryPipeline::endDelivery() {
    std::shared_ptr<Trajectory> trajectory = std::move(active_);
    active_.reset();
    segmenter_->acknowledge();
    if (!trajectory) return;

    trajectory->trimTrailingPredictions();
    if (auto bounce = EventDetector::findBounce(trajectory->points())) {
        trajectory->markBounce(*bounce);
    }

    Logger::log(Logger::INFO, "Delivery " + std::to_string(trajectory->deliveryId()) +
                " ended at frame " + std::to_string(segmenter_->deliveryEndFrame()) +
                " (" + std::to_string(trajectory->size()) + " samples)");

    in_flight_++;
    PendingDelivery pending{trajectory, session_};
    if (queue_.push(pending)) return;

    stats_.queue_full++;
    Logger::log(Logger::WARNING, "Finaliser queue full at delivery " +
                std::to_string(trajectory->deliveryId()));
    while (!queue_.push(pending)) {
        if (running_) {
            std::this_thread::sleep_for(std::chrono::microseconds(100));
        } else {
            // Nobody else consumes the queue: make room inline.
            drainOne();
        }
    }
}

void DeliveryPipeline::abandonDelivery() {
    const bool active = segmenter_->isDeliveryActive();
    segmenter_->abandon();
    tracker_->reset();
    bounce_monitor_.reset();
    recent_.clear();

    if (active && active_) {
        stats_.deliveries_abandoned++;
        Logger::log(Logger::WARNING, "Delivery " + std::to_string(active_->deliveryId()) +
                    " abandoned");
    }
    active_.reset();
}

bool DeliveryPipeline::swapConfiguration(const SessionConfig& config) {
    if (segmenter_->state() != DeliveryState::IDLE) {
        Logger::log(Logger::WARNING, "Configuration swap refused: delivery in progress");
        return false;
    }
    if (config.pipeline.queue_size != session_->config.pipeline.queue_size) {
        Logger::log(Logger::WARNING, "queue_size change takes effect on the next session");
    }
    session_ = makeSession(config);
    rebuildComponents();
    Logger::log(Logger::INFO, "Configuration swapped");
    return true;
}

void DeliveryPipeline::flush() {
    if (!running_) {
        while (drainOne()) {}
        return;
    }
    while (in_flight_ > 0) {
        std::this_thread::sleep_for(std::chrono::microseconds(100));
    }
}

void DeliveryPipeline::finaliserLoop() {
    while (running_) {
        if (!drainOne()) {
            std::this_thread::sleep_for(std::chrono::microseconds(100));
        }
    }
    // Drain after stop so no ended delivery is lost.
    while (drainOne()) {}
}

bool DeliveryPipeline::drainOne() {
    PendingDelivery pending;
    if (!queue_.pop(pending)) return false;
    finalizeDelivery(pending);
    in_flight_--;
    return true;
}

void DeliveryPipeline::finalizeDelivery(PendingDelivery& pending) {
    Timer timer;
    const SessionContext& ctx = *pending.session;
    const SessionConfig& cfg = ctx.config;

    try {
        pending.trajectory->finalize(ctx.mapper, cfg.quality);

        auto record = std::make_shared<DeliveryRecord>();
        record->trajectory = pending.trajectory;
        record->session = pending.session;

        EventDetector detector(cfg.events, ctx.mapper);
        record->impacts = detector.analyze(*pending.trajectory).impacts;

        record->wide = rules::evaluateWide(*pending.trajectory, ctx.mapper, cfg.rules);
        record->caught_behind = rules::evaluateCaughtBehind(*pending.trajectory, record->impacts,
                                                            ctx.mapper, cfg.rules);

        std::shared_ptr<const DeliveryRecord> snapshot = record;
        {
            std::lock_guard<std::mutex> lock(completed_mutex_);
            completed_.push_back(snapshot);
        }

        stats_.deliveries_completed++;
        stats_.finalize_time = timer.elapsed_us();

        std::ostringstream msg;
        msg << "Delivery " << pending.trajectory->deliveryId()
            << ": " << pending.trajectory->speedKmh() << " km/h"
            << ", " << record->impacts.size() << " impacts"
            << ", wide " << rules::toString(record->wide.result)
            << ", caught-behind " << rules::toString(record->caught_behind.result);
        if (pending.trajectory->detectionGap()) msg << " [detection gap]";
        Logger::log(Logger::INFO, msg.str());

        if (callback_) callback_(snapshot);
    } catch (const std::exception& e) {
        stats_.deliveries_dropped++;
        Logger::log(Logger::ERROR, "Finalising delivery " +
                    std::to_string(pending.trajectory->deliveryId()) + " failed: " + e.what());
    }
}

std::vector<std::shared_ptr<const DeliveryRecord>> DeliveryPipeline::completedDeliveries() const {
    std::lock_guard<std::mutex> lock(completed_mutex_);
    return completed_;
}

std::vector<std::shared_ptr<const DeliveryRecord>> DeliveryPipeline::takeCompletedDeliveries() {
    std::vector<std::shared_ptr<const DeliveryRecord>> taken;
    std::lock_guard<std::mutex> lock(completed_mutex_);
    taken.swap(completed_);
    return taken;
}

rules::LbwDecision DeliveryPipeline::reviewLbw(const DeliveryRecord& record,
                                               const rules::LbwAppeal& appeal) const {
    return rules::evaluateLbw(*record.trajectory, appeal, record.session->mapper,
                              record.session->config.rules);
}

}  // namespace umpire
