#include <iostream>
#include <iomanip>
#include <memory>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <string>
#include <variant>
#include <getopt.h>

#include "config.hpp"
#include "errors.hpp"
#include "observation_csv.hpp"
#include "pipeline.hpp"
#include "utils.hpp"

using namespace umpire;

std::atomic<bool> g_running{true};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = false;
    }
}

struct Options {
    std::string config_file = "config/config.yaml";
    std::string observations_file;
    bool review_lbw = false;
    bool shot_offered = true;
    std::string handedness;
    bool verbose = false;
};

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " --observations FILE [options]\n"
              << "Options:\n"
              << "  -c, --config FILE        Config file path (default: config/config.yaml)\n"
              << "  -o, --observations FILE  Recorded detector output (CSV)\n"
              << "  -l, --lbw                Review LBW for every delivery with a pad impact\n"
              << "  -n, --no-shot            LBW reviews assume no shot was offered\n"
              << "  -H, --handedness SIDE    Batter handedness: right|left (default: from config)\n"
              << "  -v, --verbose            Debug logging\n"
              << "  --help                   Show this help\n";
}

Options parse_args(int argc, char* argv[]) {
    Options opts;

    static struct option long_options[] = {
        {"config", required_argument, 0, 'c'},
        {"observations", required_argument, 0, 'o'},
        {"lbw", no_argument, 0, 'l'},
        {"no-shot", no_argument, 0, 'n'},
        {"handedness", required_argument, 0, 'H'},
        {"verbose", no_argument, 0, 'v'},
        {"help", no_argument, 0, '?'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "c:o:lnH:v?",
                              long_options, &option_index)) != -1) {
        switch (opt) {
            case 'c': opts.config_file = optarg; break;
            case 'o': opts.observations_file = optarg; break;
            case 'l': opts.review_lbw = true; break;
            case 'n': opts.shot_offered = false; break;
            case 'H': opts.handedness = optarg; break;
            case 'v': opts.verbose = true; break;
            case '?':
            default:
                print_usage(argv[0]);
                exit(0);
        }
    }

    return opts;
}

void print_delivery(const DeliveryRecord& record) {
    const Trajectory& t = *record.trajectory;

    std::cout << "\n=== Delivery " << t.deliveryId() << " ===\n"
              << std::fixed << std::setprecision(2)
              << "Frames:    " << t.startFrame() << " - " << t.endFrame()
              << " (" << t.size() << " samples, " << t.observedCount() << " observed)\n"
              << "Speed:     " << t.speedKmh() << " km/h\n"
              << "Deviation: " << t.deviationPx() << " px (" << t.deviationMeters() << " m)\n";
    if (const TrajectoryPoint* b = t.bouncePoint()) {
        std::cout << "Bounce:    frame " << b->frame_index
                  << " at (" << b->pixel.x << ", " << b->pixel.y << ")\n";
    }
    if (t.detectionGap()) {
        std::cout << "Warning:   detection gap (" << t.detectionGap()->low_confidence_frames
                  << "/" << t.detectionGap()->total_frames << " low-confidence frames)\n";
    }

    for (const auto& ev : record.impacts) {
        std::cout << "Impact:    " << toString(ev.type) << " at frame " << ev.frame_index
                  << " (" << ev.position_px.x << ", " << ev.position_px.y << ")"
                  << " conf " << ev.confidence
                  << (ev.in_wall_boundary ? " [in wall boundary]" : "") << "\n";
    }

    std::cout << "Wide:      " << rules::toString(record.wide.result);
    if (record.wide.side) std::cout << " (" << rules::toString(*record.wide.side) << ")";
    std::cout << " conf " << record.wide.confidence << " - " << record.wide.reason << "\n";

    std::cout << "Caught:    " << rules::toString(record.caught_behind.result)
              << " conf " << record.caught_behind.confidence
              << " - " << record.caught_behind.reason << "\n";
}

void print_lbw(const DeliveryPipeline& pipeline, const DeliveryRecord& record,
               Handedness handedness, bool shot_offered) {
    const auto pad = firstPadImpact(record);
    if (!pad) {
        std::cout << "LBW:       no pad impact\n";
        return;
    }

    rules::LbwAppeal appeal;
    appeal.pad_impact = *pad;
    appeal.handedness = handedness;
    appeal.shot_offered = shot_offered;

    try {
        const rules::LbwDecision d = pipeline.reviewLbw(record, appeal);
        std::cout << "LBW:       " << rules::toString(d.result)
                  << " conf " << d.confidence
                  << " (pitched " << rules::toString(d.pitching_zone)
                  << ", impact " << rules::toString(d.impact_zone) << ") - "
                  << d.reason << "\n";
    } catch (const InsufficientDataError& e) {
        std::cout << "LBW:       inconclusive - " << e.what() << "\n";
    }
}

int main(int argc, char* argv[]) {
    Options opts = parse_args(argc, argv);
    if (opts.observations_file.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    SessionConfig config;
    std::vector<Observation> observations;
    try {
        config = loadConfigFile(opts.config_file);
        if (!opts.handedness.empty()) {
            config.rules.handedness = parseHandedness(opts.handedness);
        }
        observations = readObservationsFile(opts.observations_file);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    Logger::setLevel(opts.verbose ? Logger::DEBUG : config.log_level);

    std::unique_ptr<DeliveryPipeline> pipeline;
    try {
        pipeline = std::make_unique<DeliveryPipeline>(config);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    Logger::log(Logger::INFO, "Replaying " + std::to_string(observations.size()) +
                " frames from " + opts.observations_file);
    pipeline->start();

    int last_frame = -1;
    double last_ts = 0.0;
    for (const auto& obs : observations) {
        if (!g_running) break;
        pipeline->processFrame(obs);
        last_frame = frameIndexOf(obs);
        last_ts = std::visit([](const auto& o) { return o.timestamp_ms; }, obs);
    }

    // Recording ended mid-delivery: let the segmenter see the ball go away.
    const double frame_ms = 1000.0 / config.calibration.frame_rate;
    while (g_running && pipeline->deliveryState() == DeliveryState::TRACKING) {
        ++last_frame;
        last_ts += frame_ms;
        pipeline->processFrame(NoDetection{last_frame, last_ts});
    }
    if (pipeline->deliveryState() == DeliveryState::TRACKING) {
        pipeline->abandonDelivery();
    }

    pipeline->flush();
    pipeline->stop();

    for (const auto& record : pipeline->takeCompletedDeliveries()) {
        print_delivery(*record);
        if (opts.review_lbw) {
            print_lbw(*pipeline, *record, config.rules.handedness, opts.shot_offered);
        }
    }

    const PipelineStats& stats = pipeline->stats();
    std::cout << "\nFrames: " << stats.frames_processed
              << " | Deliveries: " << stats.deliveries_completed
              << " | Abandoned: " << stats.deliveries_abandoned
              << " | Dropped: " << stats.deliveries_dropped
              << " | Queue full: " << stats.queue_full
              << " | Last finalise: " << stats.getFinalizeLatency() << "ms" << std::endl;
    return 0;
}
