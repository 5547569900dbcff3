// utils.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace umpire {

class PipelineStats {
public:
    std::atomic<uint64_t> frames_processed{0};
    std::atomic<int> deliveries_completed{0};
    std::atomic<int> deliveries_abandoned{0};
    std::atomic<int> deliveries_dropped{0};   // finalisation failed
    std::atomic<int> queue_full{0};           // ended delivery waited for a slot
    std::atomic<int64_t> ingest_time{0};      // microseconds, last frame
    std::atomic<int64_t> finalize_time{0};    // microseconds, last delivery

    float getFinalizeLatency() const {
        return finalize_time / 1000.0f;  // Convert to ms
    }
};

class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    void reset() {
        start_ = std::chrono::steady_clock::now();
    }

    double elapsed_ms() const {
        auto end = std::chrono::steady_clock::now();
        return std::chrono::duration<double, std::milli>(end - start_).count();
    }

    int64_t elapsed_us() const {
        auto end = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::microseconds>(end - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// Simple logger
class Logger {
public:
    enum Level {
        DEBUG = 0,
        INFO = 1,
        WARNING = 2,
        ERROR = 3
    };

    static void log(Level level, const std::string& message);
    static void setLevel(Level level) { min_level_ = level; }
    static Level getLevel() { return min_level_; }
    static bool enabled(Level level) { return level >= min_level_; }

    // Accepts "debug", "info", "warning"/"warn", "error"; anything else keeps INFO.
    static Level parseLevel(const std::string& name);

private:
    static std::atomic<Level> min_level_;
};

}  // namespace umpire
