#include "Calibrator.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include <cmath>
#include <sstream>

namespace {

bool positive(double v) { return std::isfinite(v) && v > 0.0; }

} // namespace

Calibrator::Calibrator(double meters_per_pixel) : mpp_(meters_per_pixel)
{
    if (!positive(meters_per_pixel)) {
        std::ostringstream msg;
        msg << "meters_per_pixel must be positive, got " << meters_per_pixel;
        throw InvalidCalibrationError(msg.str());
    }
}

double Calibrator::compute_scale(double reference_pixel_span, double reference_real_span_m)
{
    if (!positive(reference_pixel_span) || !positive(reference_real_span_m)) {
        std::ostringstream msg;
        msg << "reference span must be positive, got " << reference_pixel_span
            << " px for " << reference_real_span_m << " m";
        throw InvalidCalibrationError(msg.str());
    }
    return reference_real_span_m / reference_pixel_span;
}

Calibrator Calibrator::from_scale(double meters_per_pixel)
{
    return Calibrator(meters_per_pixel);
}

Calibrator Calibrator::from_reference(double pixel_span, double real_span_m)
{
    return Calibrator(compute_scale(pixel_span, real_span_m));
}

Calibrator Calibrator::from_lane_width(int frame_width, double lane_width_m)
{
    return from_reference(frame_width / 3.0, lane_width_m);
}

Calibrator Calibrator::from_config(const CalibrationConfig& cfg, int frame_width)
{
    if (cfg.meters_per_pixel)
        return from_scale(*cfg.meters_per_pixel);
    if (cfg.reference_span_pixels)
        return from_reference(*cfg.reference_span_pixels, cfg.reference_span_meters);

    Logger::warn("no reference span configured, assuming a "
                 + std::to_string(cfg.reference_span_meters)
                 + " m lane spans a third of the " + std::to_string(frame_width)
                 + " px frame width");
    return from_lane_width(frame_width, cfg.reference_span_meters);
}

double Calibrator::distance_meters(const cv::Point2d& a, const cv::Point2d& b, double meters_per_pixel)
{
    return pixels_to_meters(std::hypot(b.x - a.x, b.y - a.y), meters_per_pixel);
}

double Calibrator::distance_meters(const cv::Point2d& a, const cv::Point2d& b) const
{
    return distance_meters(a, b, mpp_);
}
