#include "Pipeline.hpp"

namespace {

const Config& validated(const Config& cfg)
{
    cfg.validate();
    return cfg;
}

} // namespace

Pipeline::Pipeline(const Config& cfg, const cv::Size& frame_size)
    : calibrator_(Calibrator::from_config(validated(cfg).calibration, frame_size.width)),
      tracker_(cfg, frame_size),
      speeds_(cfg, calibrator_),
      storage_(cfg.storage)
{
}

TrackSummary Pipeline::summarise(const Track& t) const
{
    TrackSummary s;
    s.track_id = t.id;
    s.first_seen_frame = t.first_seen_frame;
    s.last_seen_frame = t.last_seen_frame;
    s.first_seen = t.first_seen_ts;
    s.last_seen = t.last_seen_ts;
    s.crossed = t.crossed;
    if (auto sp = speeds_.speed(t.id)) {
        s.avg_speed_kmh = sp->kmh;
        s.samples = sp->samples;
    }
    return s;
}

FrameResult Pipeline::process(const std::vector<Detection>& dets, int frame_index, double timestamp)
{
    FrameResult r;
    r.frame = tracker_.update(dets, frame_index, timestamp);
    if (!first_ts_) first_ts_ = timestamp;
    last_ts_ = timestamp;

    r.samples_added = speeds_.update(r.frame);

    for (const auto& ev : r.frame.crossings)
        if (counter_.on_crossing(ev)) r.counted.push_back(ev);
    r.unique_count = counter_.unique_count();

    for (const auto& tr : r.frame.tracks) {
        if (tr.last_seen_frame == frame_index) storage_.update_track(summarise(tr));
    }
    for (const auto& tr : r.frame.removed) storage_.update_track(summarise(tr));

    for (const auto& l : r.frame.labels) {
        DetectionRecord rec;
        rec.track_id = l.track_id;
        rec.frame_index = frame_index;
        rec.bbox = l.det.bbox;
        rec.timestamp = timestamp;
        if (auto sp = speeds_.speed(l.track_id)) rec.speed_kmh = sp->kmh;
        rec.crossed = counter_.counted(l.track_id);
        storage_.add_detection(rec);
    }
    return r;
}

SessionSummary Pipeline::summary() const
{
    SessionSummary s;
    s.unique_count = counter_.unique_count();
    s.duration = first_ts_ ? last_ts_ - *first_ts_ : 0.0;
    s.active_tracks = static_cast<int>(tracker_.tracks().size());
    s.rate_per_minute = counter_.rate(s.duration) * 60.0;
    return s;
}
