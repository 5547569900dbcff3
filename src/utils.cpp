// utils.cpp
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace umpire {

std::atomic<Logger::Level> Logger::min_level_{Logger::INFO};

namespace {
std::mutex g_log_mutex;  // producer and finaliser threads both log
}

void Logger::log(Level level, const std::string& message) {
    if (level < min_level_) return;

    const char* level_str[] = {"DEBUG", "INFO", "WARN", "ERROR"};

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cout << "[" << std::put_time(&local_tm, "%H:%M:%S");
    std::cout << "." << std::setfill('0') << std::setw(3) << ms.count() << std::setfill(' ');
    std::cout << "] [" << level_str[level] << "] " << message << std::endl;
}

Logger::Level Logger::parseLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return DEBUG;
    if (lower == "warning" || lower == "warn") return WARNING;
    if (lower == "error") return ERROR;
    return INFO;
}

}  // namespace umpire
