#pragma once
#include <opencv2/core.hpp>

struct Detection
{
    cv::Rect2d bbox;             // pixels, top-left origin
    int        frame_index = 0;
    double     timestamp   = 0.0; // seconds
};

/** Throws DegenerateDetectionError unless width and height are positive and finite. */
void validate_detection(const Detection& d);

inline cv::Point2d centre(const cv::Rect2d& r)
{
    return {r.x + r.width * 0.5, r.y + r.height * 0.5};
}
