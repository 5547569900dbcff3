// coordinate_mapper.cpp
#include "coordinate_mapper.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace umpire {

namespace {
constexpr double kGravity = 9.81;          // m/s^2
constexpr double kMpsToKmh = 3.6;
}

const char* toString(StumpId s) {
    switch (s) {
        case StumpId::OFF:    return "off";
        case StumpId::MIDDLE: return "middle";
        case StumpId::LEG:    return "leg";
    }
    return "unknown";
}

CoordinateMapper::CoordinateMapper(const CalibrationData& calibration)
    : calibration_(calibration) {
    if (calibration_.pitch_length_m <= 0.0) {
        throw CalibrationError("pitch length must be positive, got " +
                               std::to_string(calibration_.pitch_length_m));
    }

    const cv::Point2f d = calibration_.batting_crease_px - calibration_.bowling_crease_px;
    const double pixel_distance = std::hypot(d.x, d.y);
    if (pixel_distance <= 0.0) {
        throw CalibrationError("bowling and batting crease share the same pixel position");
    }

    scale_ = pixel_distance / calibration_.pitch_length_m;
    validate();
}

void CoordinateMapper::validate() const {
    if (calibration_.frame_rate <= 0.0) {
        throw CalibrationError("frame rate must be positive");
    }
    if (calibration_.stump_width_m <= 0.0 || calibration_.stump_height_m <= 0.0) {
        throw CalibrationError("stump dimensions must be positive");
    }
    const StumpSet& s = calibration_.batting_stumps;
    if (s.off.x == s.leg.x) {
        throw CalibrationError("off and leg stump cannot share an x coordinate");
    }
    const size_t wall_points = calibration_.wall_boundary.size();
    if (wall_points > 0 && wall_points < 3) {
        throw CalibrationError("wall boundary needs at least 3 vertices, got " +
                               std::to_string(wall_points));
    }
}

double CoordinateMapper::pixelsToMeters(double pixels) const {
    return pixels / scale_;
}

double CoordinateMapper::metersToPixels(double meters) const {
    return meters * scale_;
}

cv::Point2f CoordinateMapper::toWorld(const cv::Point2f& pixel) const {
    const cv::Point2f rel = pixel - calibration_.batting_stumps.middle;
    return cv::Point2f(static_cast<float>(pixelsToMeters(rel.x)),
                       static_cast<float>(pixelsToMeters(rel.y)));
}

double CoordinateMapper::speedKmh(double pixels_per_frame) const {
    return pixelsToMeters(pixels_per_frame) * calibration_.frame_rate * kMpsToKmh;
}

double CoordinateMapper::gravityPxPerFrame2() const {
    const double fps = calibration_.frame_rate;
    return metersToPixels(kGravity) / (fps * fps);
}

float CoordinateMapper::offSideSign(Handedness handedness) const {
    const StumpSet& s = calibration_.batting_stumps;
    const float right_handed = (s.off.x < s.leg.x) ? -1.f : 1.f;
    return handedness == Handedness::RIGHT ? right_handed : -right_handed;
}

double CoordinateMapper::stumpZoneHalfWidthPx(double tolerance) const {
    return metersToPixels(calibration_.stump_width_m * tolerance) / 2.0;
}

bool CoordinateMapper::isInStumpZone(float x, double tolerance) const {
    const double offset = std::abs(x - calibration_.batting_stumps.middle.x);
    return offset <= stumpZoneHalfWidthPx(tolerance);
}

std::vector<cv::Point2f> CoordinateMapper::stumpZonePolygon(double tolerance) const {
    const StumpSet& s = calibration_.batting_stumps;
    const float half = static_cast<float>(stumpZoneHalfWidthPx(tolerance));
    const float top = std::min({s.off.y, s.middle.y, s.leg.y});
    const float bottom = std::max({s.off.y, s.middle.y, s.leg.y}) +
                         static_cast<float>(metersToPixels(calibration_.stump_height_m));

    return {
        {s.middle.x - half, top},
        {s.middle.x + half, top},
        {s.middle.x + half, bottom},
        {s.middle.x - half, bottom}
    };
}

WideCorridor CoordinateMapper::wideCorridor(const RuleParameters& params,
                                            Handedness handedness) const {
    const StumpSet& s = calibration_.batting_stumps;
    WideCorridor corridor;
    corridor.off_sign = offSideSign(handedness);

    // For a left-hander the physical off stump is the calibrated leg stump.
    const bool right = handedness == Handedness::RIGHT;
    const float off_stump_x = right ? s.off.x : s.leg.x;
    const float leg_stump_x = right ? s.leg.x : s.off.x;

    corridor.off_line_x = off_stump_x +
        corridor.off_sign * static_cast<float>(metersToPixels(params.wide_off_side_m));
    corridor.leg_line_x = leg_stump_x -
        corridor.off_sign * static_cast<float>(metersToPixels(params.wide_leg_side_m));

    // Segments span one stump height either side of the crease for display.
    const float crease_y = battingCreaseY();
    const float span = static_cast<float>(metersToPixels(calibration_.stump_height_m));
    corridor.off_line = {{corridor.off_line_x, crease_y - span}, {corridor.off_line_x, crease_y + span}};
    corridor.leg_line = {{corridor.leg_line_x, crease_y - span}, {corridor.leg_line_x, crease_y + span}};
    return corridor;
}

StumpId CoordinateMapper::nearestStump(float x, Handedness handedness) const {
    const StumpSet& s = calibration_.batting_stumps;
    const bool right = handedness == Handedness::RIGHT;
    const float off_x = right ? s.off.x : s.leg.x;
    const float leg_x = right ? s.leg.x : s.off.x;

    const float d_off = std::abs(x - off_x);
    const float d_mid = std::abs(x - s.middle.x);
    const float d_leg = std::abs(x - leg_x);

    if (d_mid <= d_off && d_mid <= d_leg) return StumpId::MIDDLE;
    return d_off < d_leg ? StumpId::OFF : StumpId::LEG;
}

}  // namespace umpire
