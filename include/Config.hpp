#pragma once
#include <map>
#include <optional>
#include <string>

enum class OverlapPolicy { IoU, OverSmaller };
enum class LineAxis      { Horizontal, Vertical };

struct TrackerConfig
{
    double        match_threshold        = 0.3;   // overlap ratio, strictly exceeded
    int           max_disappeared_frames = 10;
    OverlapPolicy overlap_policy         = OverlapPolicy::IoU;
    double        line_position          = 0.6;   // relative to frame extent, (0,1)
    LineAxis      line_axis              = LineAxis::Horizontal;
};

struct SpeedConfig
{
    int smoothing_window = 5;                     // samples averaged per track
};

/*
 * Either meters_per_pixel, or the reference span pair. With neither
 * pixel figure set the lane is assumed to cover a third of the frame.
 */
struct CalibrationConfig
{
    std::optional<double> reference_span_pixels;
    double                reference_span_meters = 3.5;
    std::optional<double> meters_per_pixel;
};

struct DetectorConfig
{
    double min_vehicle_area = 500.0;              // contour area in px^2
};

struct StorageConfig
{
    std::string output_dir            = "data";
    double      save_interval_seconds = 10.0;     // wall clock
    double      bucket_width_kmh      = 5.0;
    bool        session_files         = false;    // suffix file names with the session id
};

struct Config
{
    TrackerConfig     tracker;
    SpeedConfig       speed;
    CalibrationConfig calibration;
    DetectorConfig    detector;
    StorageConfig     storage;

    /** Throws std::invalid_argument on the first out-of-range option. */
    void validate() const;

    /** Defaults overlaid with the [speedtrack] section of an INI file, if present. */
    static Config from_ini(const std::string& path);

    /** Applies a single "key = value" setting; unknown keys throw. */
    void set(const std::string& key, const std::string& value);
};

OverlapPolicy parse_overlap_policy(const std::string& s);
LineAxis      parse_line_axis(const std::string& s);
std::string   to_string(OverlapPolicy p);
std::string   to_string(LineAxis a);

/** key -> value for one section of an INI file; empty if the file is missing. */
std::map<std::string, std::string> read_ini_section(const std::string& path,
                                                    const std::string& section);
