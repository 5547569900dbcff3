// errors.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace umpire {

// Invalid or missing reference geometry. Blocks every conversion and ruling
// until the session is recalibrated.
class CalibrationError : public std::runtime_error {
public:
    explicit CalibrationError(const std::string& what)
        : std::runtime_error("calibration: " + what) {}
};

// Too few samples to support the requested projection. The caller should
// report the appeal as inconclusive.
class InsufficientDataError : public std::runtime_error {
public:
    explicit InsufficientDataError(const std::string& what)
        : std::runtime_error("insufficient data: " + what) {}
};

// Out-of-range rule or tracker setting.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what)
        : std::runtime_error("config: " + what) {}
};

}  // namespace umpire
