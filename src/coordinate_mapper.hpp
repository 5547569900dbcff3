// coordinate_mapper.hpp
#pragma once

#include "calibration.hpp"

#include <opencv2/core.hpp>

#include <vector>

namespace umpire {

struct LineSegment {
    cv::Point2f from;
    cv::Point2f to;
};

struct WideCorridor {
    LineSegment off_line;
    LineSegment leg_line;
    float off_line_x = 0.f;
    float leg_line_x = 0.f;
    float off_sign = -1.f;   // +1 when the off side lies toward larger x
};

enum class StumpId { OFF, MIDDLE, LEG };

const char* toString(StumpId s);

// Pixel <-> real-world conversion for one calibrated camera.
//
// The scale factor is derived once from the crease centres:
//     scale = |batting_crease - bowling_crease| / pitch_length_m   (px / m)
// Construction validates the calibration and throws CalibrationError; a
// mapper that exists is always usable. All queries are const.
class CoordinateMapper {
public:
    explicit CoordinateMapper(const CalibrationData& calibration);

    const CalibrationData& calibration() const { return calibration_; }
    double scale() const { return scale_; }

    double pixelsToMeters(double pixels) const;
    double metersToPixels(double meters) const;

    // World frame: metres, origin at the batting middle stump, axes aligned
    // with the image axes.
    cv::Point2f toWorld(const cv::Point2f& pixel) const;

    // px / frame -> km/h using the calibrated frame rate.
    double speedKmh(double pixels_per_frame) const;

    // Gravitational acceleration expressed in px / frame^2 along +y.
    double gravityPxPerFrame2() const;

    float battingCreaseY() const { return calibration_.batting_crease_px.y; }

    // -1 or +1: the x direction of the off side for this batter.
    float offSideSign(Handedness handedness) const;

    // Half of the stump-zone width in pixels, expanded by the tolerance.
    double stumpZoneHalfWidthPx(double tolerance) const;
    // Lateral test against the tolerance-expanded zone around middle stump.
    bool isInStumpZone(float x, double tolerance) const;
    // Rectangle from stump tops to stump bases, width scaled by tolerance.
    std::vector<cv::Point2f> stumpZonePolygon(double tolerance) const;

    WideCorridor wideCorridor(const RuleParameters& params,
                              Handedness handedness) const;

    StumpId nearestStump(float x, Handedness handedness) const;

    bool hasWallBoundary() const { return calibration_.wall_boundary.size() >= 3; }

private:
    CalibrationData calibration_;
    double scale_ = 0.0;

    void validate() const;
};

}  // namespace umpire
