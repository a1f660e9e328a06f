#include "Counter.hpp"
#include "Logger.hpp"

bool Counter::on_crossing(const CrossingEvent& event)
{
    if (!counted_.insert(event.track_id).second) {
        Logger::debug("crossing for track " + std::to_string(event.track_id) + " already counted");
        return false;
    }
    ++count_;
    history_.emplace_back(event.timestamp, count_);
    Logger::info("vehicle " + std::to_string(event.track_id) + " counted at frame "
                 + std::to_string(event.frame_index) + ", total " + std::to_string(count_));
    return true;
}

double Counter::rate(double elapsed_seconds) const
{
    if (elapsed_seconds <= 0.0) return 0.0;
    return count_ / elapsed_seconds;
}

double Counter::rate_per_minute(double now, double window_seconds) const
{
    if (window_seconds <= 0.0) return 0.0;

    int first = -1, last = -1;
    double t_first = 0.0, t_last = 0.0;
    for (const auto& [t, c] : history_) {
        if (now - t > window_seconds || t > now) continue;
        if (first < 0) { first = c; t_first = t; }
        last = c;
        t_last = t;
    }
    if (first < 0) return 0.0;

    if (t_last > t_first) return (last - first) / (t_last - t_first) * 60.0;
    // too little spread in the window: spread the session total over it
    return count_ / window_seconds * 60.0;
}
