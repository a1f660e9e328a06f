#pragma once
#include "Pipeline.hpp"
#include <opencv2/opencv.hpp>
#include <optional>

/** Boxes, ids, speeds, the detection line, the running count and, if given, processing FPS. */
void draw_overlay(cv::Mat& img, const FrameResult& result, const Pipeline& pipeline,
                  std::optional<double> fps = std::nullopt);

/** Same overlay on a blank canvas, for replays without video. */
cv::Mat render_frame(const cv::Size& size, const FrameResult& result, const Pipeline& pipeline,
                     std::optional<double> fps = std::nullopt);
