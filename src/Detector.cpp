#include "Detector.hpp"

BackgroundDetector::BackgroundDetector(const DetectorConfig& cfg)
    : min_area_(cfg.min_vehicle_area)
{
    bg_subtractor_ = cv::createBackgroundSubtractorMOG2(200, 25, true);
    morph_kernel_ = cv::Mat::ones(5, 5, CV_8U);
}

std::vector<Detection> BackgroundDetector::detect(const cv::Mat& frame, int frame_index, double timestamp)
{
    bg_subtractor_->apply(frame, fg_mask_);

    // Noise removal, then drop shadow pixels (MOG2 marks them 127)
    cv::morphologyEx(fg_mask_, fg_mask_, cv::MORPH_OPEN, morph_kernel_);
    cv::morphologyEx(fg_mask_, fg_mask_, cv::MORPH_CLOSE, morph_kernel_);
    cv::threshold(fg_mask_, fg_mask_, 127, 255, cv::THRESH_BINARY);

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(fg_mask_, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

    std::vector<Detection> dets;
    for (const auto& contour : contours) {
        if (cv::contourArea(contour) <= min_area_) continue;
        cv::Rect r = cv::boundingRect(contour);
        dets.push_back({cv::Rect2d(r), frame_index, timestamp});
    }
    return dets;
}
