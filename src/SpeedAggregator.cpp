#include "SpeedAggregator.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include <sstream>

SpeedAggregator::SpeedAggregator(const Config& cfg, const Calibrator& calibrator)
    : calibrator_(calibrator),
      window_(static_cast<std::size_t>(cfg.speed.smoothing_window))
{
}

double SpeedAggregator::instantaneous_speed(const TrackPoint& prev, const TrackPoint& last,
                                            const Calibrator& calibrator)
{
    double elapsed = last.timestamp - prev.timestamp;
    if (!(elapsed > 0.0)) {
        std::ostringstream msg;
        msg << "frame " << prev.frame_index << " at " << prev.timestamp
            << " s followed by frame " << last.frame_index << " at " << last.timestamp << " s";
        throw NonMonotonicTimestampError(msg.str());
    }
    return calibrator.distance_meters(prev.centre, last.centre) / elapsed;
}

SpeedEstimate SpeedAggregator::estimate(const RollingWindow<double>& w)
{
    SpeedEstimate e;
    e.mps = w.mean();
    e.kmh = e.mps * kMpsToKmh;
    e.samples = w.size();
    return e;
}

int SpeedAggregator::update(const FrameUpdate& frame)
{
    int added = 0;
    for (const auto& tr : frame.tracks) {
        if (tr.history.empty()) continue;
        int newest = tr.history.back().frame_index;

        if (finished(tr.id)) continue;

        auto it = live_.find(tr.id);
        if (it == live_.end()) {
            // first sight: nothing to difference against yet
            live_.emplace(tr.id, State{RollingWindow<double>(window_), newest});
            continue;
        }

        State& st = it->second;
        if (newest <= st.last_frame || tr.history.size() < 2) continue;
        st.last_frame = newest;

        const TrackPoint& last = tr.history.back();
        const TrackPoint& prev = tr.history[tr.history.size() - 2];
        try {
            st.samples.push(instantaneous_speed(prev, last, calibrator_));
            ++added;
        } catch (const NonMonotonicTimestampError& e) {
            ++discarded_;
            Logger::warn("track " + std::to_string(tr.id) + " speed sample discarded: " + e.what());
        }
    }

    for (const auto& tr : frame.removed) finalize(tr.id);
    return added;
}

void SpeedAggregator::finalize(int track_id)
{
    if (!finished_.insert(track_id).second) return;
    auto it = live_.find(track_id);
    if (it == live_.end()) return;
    if (!it->second.samples.empty()) retired_[track_id] = estimate(it->second.samples);
    live_.erase(it);
}

std::optional<SpeedEstimate> SpeedAggregator::speed(int track_id) const
{
    auto it = live_.find(track_id);
    if (it != live_.end()) {
        if (it->second.samples.empty()) return std::nullopt;
        return estimate(it->second.samples);
    }
    auto rt = retired_.find(track_id);
    if (rt != retired_.end()) return rt->second;
    return std::nullopt;
}

std::optional<double> SpeedAggregator::average_kmh() const
{
    double sum = 0.0;
    int n = 0;
    for (const auto& [id, st] : live_) {
        if (st.samples.empty()) continue;
        sum += estimate(st.samples).kmh;
        ++n;
    }
    for (const auto& [id, e] : retired_) {
        sum += e.kmh;
        ++n;
    }
    if (n == 0) return std::nullopt;
    return sum / n;
}
