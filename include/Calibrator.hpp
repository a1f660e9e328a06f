#pragma once
#include "Config.hpp"
#include <opencv2/core.hpp>

/*
 * Pixel to ground-distance conversion with a single scale for the whole
 * frame. The model assumes no lens distortion and a ground plane at uniform
 * distance from the camera; distances measured far from the reference span
 * inherit the perspective error. The scale is fixed once derived.
 */
class Calibrator
{
public:
    /** Throws InvalidCalibrationError unless meters_per_pixel is positive and finite. */
    explicit Calibrator(double meters_per_pixel);

    /** Precomputed scale; same checks as the constructor. */
    static Calibrator from_scale(double meters_per_pixel);

    /** Reference of known real width spanning a measured pixel width. */
    static Calibrator from_reference(double pixel_span, double real_span_m);

    /** Estimate used when no pixel span is known: one lane spans a third of the frame. */
    static Calibrator from_lane_width(int frame_width, double lane_width_m);

    /** Precomputed scale, else reference span, else lane-width estimate. */
    static Calibrator from_config(const CalibrationConfig& cfg, int frame_width);

    static double compute_scale(double reference_pixel_span, double reference_real_span_m);
    static double pixels_to_meters(double pixel_distance, double meters_per_pixel)
    {
        return pixel_distance * meters_per_pixel;
    }
    static double meters_to_pixels(double meters, double meters_per_pixel)
    {
        return meters / meters_per_pixel;
    }
    static double distance_meters(const cv::Point2d& a, const cv::Point2d& b, double meters_per_pixel);

    double meters_per_pixel() const { return mpp_; }
    double to_meters(double pixels) const { return pixels_to_meters(pixels, mpp_); }
    double to_pixels(double meters) const { return meters_to_pixels(meters, mpp_); }
    double distance_meters(const cv::Point2d& a, const cv::Point2d& b) const;

private:
    double mpp_;
};
