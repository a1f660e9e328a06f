#pragma once
#include "Config.hpp"
#include "Detection.hpp"
#include <opencv2/core.hpp>
#include <deque>
#include <vector>

struct TrackPoint
{
    cv::Point2d centre;
    int         frame_index = 0;
    double      timestamp   = 0.0;
};

struct Track
{
    int                    id                = -1;  // never reused
    cv::Rect2d             bbox;                    // last matched box
    std::deque<TrackPoint> history;                 // most recent last, bounded
    int                    first_seen_frame  = 0;
    double                 first_seen_ts     = 0.0;
    int                    last_seen_frame   = 0;
    double                 last_seen_ts      = 0.0;
    int                    disappeared       = 0;   // consecutive unmatched frames
    bool                   crossed           = false;
};

struct CrossingEvent
{
    int    track_id    = -1;
    int    frame_index = 0;
    double timestamp   = 0.0;
};

struct Label            // what we emit each frame
{
    int       track_id; // stable ID
    Detection det;      // the raw detection that was matched or spawned the track
};

struct FrameUpdate
{
    int                        frame_index = 0;
    double                     timestamp   = 0.0;
    std::vector<Track>         tracks;      // live set after this frame
    std::vector<Label>         labels;      // one per accepted detection: track id and box
    std::vector<int>           matched_ids; // existing tracks that received a detection
    std::vector<CrossingEvent> crossings;
    std::vector<Track>         removed;     // aged out this frame
    int                        rejected_detections = 0;
};

class Tracker
{
public:
    Tracker(const Config& cfg, const cv::Size& frame_size);

    /**
     * Process one frame. Frames must arrive with strictly increasing
     * frame_index; an out-of-order index throws std::invalid_argument
     * before any track is touched.
     */
    FrameUpdate update(const std::vector<Detection>& dets,
                       int frame_index, double timestamp);

    const std::vector<Track>& tracks() const { return tracks_; }
    int    next_id() const { return next_id_; }
    std::size_t active_count() const { return tracks_.size(); }
    double line_position() const { return line_px_; }
    LineAxis line_axis() const { return cfg_.line_axis; }

    static double overlap(const cv::Rect2d& a, const cv::Rect2d& b, OverlapPolicy policy);

private:
    // ─── helpers ────────────────────────────────────────────────────
    double axis_coord(const cv::Point2d& p) const;
    bool   crosses_line(const Track& t) const;
    void   append_point(Track& t, const Detection& d, int frame_index, double ts);

    // ─── data ───────────────────────────────────────────────────────
    TrackerConfig      cfg_;
    std::size_t        history_capacity_;
    double             line_px_;
    int                next_id_    = 0;
    int                last_frame_ = 0;
    bool               started_    = false;
    std::vector<Track> tracks_;     // ascending id
};
