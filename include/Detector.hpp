#pragma once
#include "Config.hpp"
#include "Detection.hpp"
#include <opencv2/opencv.hpp>
#include <vector>

/*
 * Moving-vehicle candidates from MOG2 background subtraction. Shadows are
 * thresholded away and contours smaller than min_vehicle_area are ignored,
 * so only boxes of plausible vehicles reach the tracker.
 */
class BackgroundDetector
{
public:
    explicit BackgroundDetector(const DetectorConfig& cfg);

    std::vector<Detection> detect(const cv::Mat& frame, int frame_index, double timestamp);

private:
    double min_area_;
    cv::Ptr<cv::BackgroundSubtractor> bg_subtractor_;
    cv::Mat morph_kernel_;
    cv::Mat fg_mask_;
};
