#include "Tracker.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <numeric>
#include <sstream>
#include <stdexcept>

using namespace std;

// -------- utility functions --------------

double Tracker::overlap(const cv::Rect2d& a, const cv::Rect2d& b, OverlapPolicy policy)
{
    double x1 = max(a.x, b.x), y1 = max(a.y, b.y);
    double x2 = min(a.x + a.width, b.x + b.width), y2 = min(a.y + a.height, b.y + b.height);
    double inter = max(0.0, x2 - x1) * max(0.0, y2 - y1);
    if (inter <= 0.0) return 0.0;

    double area_a = a.width * a.height, area_b = b.width * b.height;
    double denom = policy == OverlapPolicy::IoU ? area_a + area_b - inter
                                                : min(area_a, area_b);
    return denom > 0 ? inter / denom : 0.0;
}

double Tracker::axis_coord(const cv::Point2d& p) const
{
    return cfg_.line_axis == LineAxis::Horizontal ? p.y : p.x;
}

// The line counts as crossed when it lies between the last two centres.
// Starting exactly on the line and moving away is not a crossing.
bool Tracker::crosses_line(const Track& t) const
{
    if (t.crossed || t.history.size() < 2) return false;
    double a = axis_coord(t.history[t.history.size() - 2].centre) - line_px_;
    double b = axis_coord(t.history.back().centre) - line_px_;
    return (a < 0 && b >= 0) || (a > 0 && b <= 0);
}

void Tracker::append_point(Track& t, const Detection& d, int frame_index, double ts)
{
    t.bbox = d.bbox;
    t.history.push_back({centre(d.bbox), frame_index, ts});
    while (t.history.size() > history_capacity_) t.history.pop_front();
    t.last_seen_frame = frame_index;
    t.last_seen_ts = ts;
    t.disappeared = 0;
}

// -------- Tracker implementation ------------

Tracker::Tracker(const Config& cfg, const cv::Size& frame_size)
    : cfg_(cfg.tracker),
      // smoothing window plus the two points used for crossing detection
      history_capacity_(static_cast<size_t>(max(cfg.speed.smoothing_window, 0)) + 2),
      line_px_(cfg.tracker.line_position *
               (cfg.tracker.line_axis == LineAxis::Horizontal ? frame_size.height
                                                              : frame_size.width))
{
    if (frame_size.width <= 0 || frame_size.height <= 0)
        throw invalid_argument("frame size must be positive");
}

FrameUpdate Tracker::update(const vector<Detection>& input, int frame_index, double timestamp)
{
    if (started_ && frame_index <= last_frame_) {
        ostringstream msg;
        msg << "frame " << frame_index << " arrived after frame " << last_frame_;
        throw invalid_argument(msg.str());
    }
    started_ = true;
    last_frame_ = frame_index;

    FrameUpdate out;
    out.frame_index = frame_index;
    out.timestamp = timestamp;

    // Drop degenerate boxes before they can match or spawn anything
    vector<Detection> dets;
    dets.reserve(input.size());
    for (const auto& d : input) {
        try {
            validate_detection(d);
            dets.push_back(d);
        } catch (const DegenerateDetectionError& e) {
            Logger::warn(string("dropping detection: ") + e.what());
            ++out.rejected_detections;
        }
    }

    // Leftmost first so that index order doubles as the detection tie-break
    stable_sort(dets.begin(), dets.end(), [](const Detection& a, const Detection& b) {
        if (a.bbox.x != b.bbox.x) return a.bbox.x < b.bbox.x;
        return a.bbox.y < b.bbox.y;
    });

    // Greedy matching over every pair above the threshold
    struct Candidate { double score; size_t ti, di; };
    int nT = tracks_.size(), nD = dets.size();
    vector<Candidate> cands;
    for (int ti = 0; ti < nT; ++ti) {
        for (int di = 0; di < nD; ++di) {
            double s = overlap(tracks_[ti].bbox, dets[di].bbox, cfg_.overlap_policy);
            if (s > cfg_.match_threshold) cands.push_back({s, size_t(ti), size_t(di)});
        }
    }
    // tracks_ is kept in ascending id, so ti order is id order
    sort(cands.begin(), cands.end(), [](const Candidate& a, const Candidate& b) {
        if (a.score != b.score) return a.score > b.score;
        if (a.ti != b.ti) return a.ti < b.ti;
        return a.di < b.di;
    });

    vector<int> tr2det(nT, -1), det2tr(nD, -1);
    for (const auto& c : cands) {
        if (tr2det[c.ti] != -1 || det2tr[c.di] != -1) continue;
        tr2det[c.ti] = c.di;
        det2tr[c.di] = c.ti;
    }

    // Update matched tracks, age the rest
    vector<Track> live;
    live.reserve(tracks_.size() + dets.size());
    for (int ti = 0; ti < nT; ++ti) {
        Track& tr = tracks_[ti];
        int di = tr2det[ti];
        if (di != -1) {
            append_point(tr, dets[di], frame_index, timestamp);
            out.labels.push_back({tr.id, dets[di]});
            out.matched_ids.push_back(tr.id);
            if (crosses_line(tr)) {
                tr.crossed = true;
                out.crossings.push_back({tr.id, frame_index, timestamp});
                Logger::debug("track " + to_string(tr.id) + " crossed the line at frame "
                              + to_string(frame_index));
            }
        } else if (++tr.disappeared > cfg_.max_disappeared_frames) {
            Logger::info("track " + to_string(tr.id) + " retired after "
                         + to_string(tr.disappeared) + " missed frames");
            out.removed.push_back(std::move(tr));
            continue;
        }
        live.push_back(std::move(tr));
    }

    // Add unmatched detections as new tracks
    for (int di = 0; di < nD; ++di) {
        if (det2tr[di] != -1) continue;
        Track tr;
        tr.id = next_id_++;
        tr.first_seen_frame = frame_index;
        tr.first_seen_ts = timestamp;
        append_point(tr, dets[di], frame_index, timestamp);
        out.labels.push_back({tr.id, dets[di]});
        Logger::debug("track " + to_string(tr.id) + " opened at frame " + to_string(frame_index));
        live.push_back(std::move(tr));
    }

    tracks_ = std::move(live);
    out.tracks = tracks_;
    return out;
}
