#include "Detection.hpp"
#include "Errors.hpp"
#include <cmath>
#include <sstream>

void validate_detection(const Detection& d)
{
    const cv::Rect2d& b = d.bbox;
    if (!std::isfinite(b.x) || !std::isfinite(b.y) ||
        !std::isfinite(b.width) || !std::isfinite(b.height) ||
        b.width <= 0.0 || b.height <= 0.0) {
        std::ostringstream msg;
        msg << "frame " << d.frame_index << " box (" << b.x << ", " << b.y
            << ", " << b.width << ", " << b.height << ")";
        throw DegenerateDetectionError(msg.str());
    }
}
