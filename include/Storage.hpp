#pragma once
#include "Config.hpp"
#include <opencv2/core.hpp>
#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

struct DetectionRecord
{
    int                   track_id    = -1;
    int                   frame_index = 0;
    cv::Rect2d            bbox;
    double                timestamp   = 0.0;
    std::optional<double> speed_kmh;     // unknown until two points exist
    bool                  crossed     = false;
};

struct TrackSummary
{
    int                   track_id         = -1;
    std::optional<double> avg_speed_kmh;
    std::size_t           samples          = 0;
    int                   first_seen_frame = 0;
    int                   last_seen_frame  = 0;
    double                first_seen       = 0.0;
    double                last_seen        = 0.0;
    bool                  crossed          = false;
};

struct SpeedBucket
{
    double      bin_start  = 0.0;
    double      bin_end    = 0.0;
    int         count      = 0;
    double      percentage = 0.0;
    std::string label() const;
};

struct SessionSummary
{
    int    unique_count    = 0;
    double duration        = 0.0;   // seconds of stream time
    int    active_tracks   = 0;
    double rate_per_minute = 0.0;
};

// Upper bound on histogram bins; the last bin also holds anything faster.
constexpr int kMaxSpeedBuckets = 100;

/** Histogram of speeds in fixed-width km/h bins starting at 0. */
std::vector<SpeedBucket> speed_buckets(const std::vector<double>& speeds_kmh, double bin_width);

class Storage
{
public:
    using Clock = std::chrono::system_clock;

    /** The session id ("YYYYmmdd_HHMMSS", local time) is taken from session_start. */
    explicit Storage(const StorageConfig& cfg, Clock::time_point session_start = Clock::now());

    void add_detection(const DetectionRecord& r) { records_.push_back(r); }
    void update_track(const TrackSummary& s)     { tracks_[s.track_id] = s; }

    const std::vector<DetectionRecord>&  detections() const { return records_; }
    const std::map<int, TrackSummary>&   tracks() const { return tracks_; }

    /** Per-track average speeds that are known, in track id order. */
    std::vector<double> known_speeds() const;

    /**
     * Rewrites detections.csv, tracks.json and summary.json in the output
     * directory. Throws std::runtime_error if a file cannot be written.
     */
    void save(const SessionSummary& session) const;

    std::filesystem::path output_dir() const { return cfg_.output_dir; }
    const std::string&    session_id() const { return session_id_; }
    Clock::time_point     session_start() const { return session_start_; }

    /** e.g. "summary.json", or "summary_<session>.json" with session_files set. */
    std::filesystem::path file_path(const std::string& stem, const std::string& ext) const;

    /** Distinct tracks flagged as having crossed the line. */
    int crossed_count() const;

private:
    void write_detections(const std::filesystem::path& path) const;
    void write_tracks(const std::filesystem::path& path) const;
    void write_summary(const std::filesystem::path& path, const SessionSummary& session) const;

    StorageConfig                cfg_;
    Clock::time_point            session_start_;
    std::string                  session_id_;
    std::vector<DetectionRecord> records_;
    std::map<int, TrackSummary>  tracks_;
};
