#include "Overlay.hpp"
#include <iomanip>
#include <sstream>

namespace {

const cv::Scalar GREEN(0, 255, 0);
const cv::Scalar RED(0, 0, 255);
const cv::Scalar YELLOW(0, 255, 255);
const cv::Scalar GREY(160, 160, 160);

} // namespace

void draw_overlay(cv::Mat& img, const FrameResult& result, const Pipeline& pipeline,
                  std::optional<double> fps)
{
    for (const auto& t : result.frame.tracks) {
        if (t.last_seen_frame != result.frame.frame_index) continue;  // coasting

        cv::Rect box(t.bbox);
        cv::rectangle(img, box, t.crossed ? RED : GREEN, 2);

        std::ostringstream label;
        label << "ID: " << t.id;
        if (auto sp = pipeline.speeds().speed(t.id))
            label << ", " << std::fixed << std::setprecision(1) << sp->kmh << " km/h";
        cv::putText(img, label.str(), {box.x, box.y - 5},
                    cv::FONT_HERSHEY_SIMPLEX, 0.5, YELLOW, 1);

        for (size_t i = 1; i < t.history.size(); ++i)
            cv::line(img, t.history[i - 1].centre, t.history[i].centre, GREY, 1);
    }

    const Tracker& tr = pipeline.tracker();
    int pos = static_cast<int>(tr.line_position());
    if (tr.line_axis() == LineAxis::Horizontal)
        cv::line(img, {0, pos}, {img.cols, pos}, RED, 2);
    else
        cv::line(img, {pos, 0}, {pos, img.rows}, RED, 2);

    cv::putText(img, "Count: " + std::to_string(result.unique_count), {10, 30},
                cv::FONT_HERSHEY_SIMPLEX, 0.7, GREEN, 2);

    if (fps) {
        std::ostringstream text;
        text << "FPS: " << std::fixed << std::setprecision(1) << *fps;
        cv::putText(img, text.str(), {10, 60}, cv::FONT_HERSHEY_SIMPLEX, 0.7, GREEN, 2);
    }
}

cv::Mat render_frame(const cv::Size& size, const FrameResult& result, const Pipeline& pipeline,
                     std::optional<double> fps)
{
    cv::Mat img(size, CV_8UC3, cv::Scalar(30, 30, 30));
    draw_overlay(img, result, pipeline, fps);
    return img;
}
