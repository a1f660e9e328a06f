#include "Config.hpp"
#include "Detector.hpp"
#include "FpsMeter.hpp"
#include "Logger.hpp"
#include "Overlay.hpp"
#include "Pipeline.hpp"
#include <nlohmann/json.hpp>
#include <CLI/CLI.hpp>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

// -----------------------------------------------------------------------------
// Parse ISO timestamp string to seconds-since-epoch (double)
static double parse_iso(const std::string& s)
{
    std::tm tm{}; double frac = 0.0; char dot;
    std::istringstream ss(s);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) throw std::runtime_error("Invalid timestamp '" + s + "'");
    if (ss.peek() == '.') {
        ss >> dot;
        std::string micros;
        ss >> micros;
        frac = std::stod("0." + micros);
    }
    std::time_t t = timegm(&tm);
    return double(t) + frac;
}

static double read_timestamp(const nlohmann::json& v)
{
    if (v.is_string()) return parse_iso(v.get<std::string>());
    return v.get<double>();
}

// -----------------------------------------------------------------------------

struct Frame { int index; double ts; std::vector<Detection> dets; };

struct Replay
{
    cv::Size           size;
    std::vector<Frame> frames;
};

// Either a bare array of frames or {"frame_width", "frame_height", "frames"}.
static Replay load_replay(const std::string& path, cv::Size fallback_size)
{
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Failed to open replay file: " + path);
    nlohmann::json j; in >> j;

    Replay replay;
    replay.size = fallback_size;
    const nlohmann::json* frames = &j;
    if (j.is_object()) {
        replay.size.width = j.value("frame_width", fallback_size.width);
        replay.size.height = j.value("frame_height", fallback_size.height);
        frames = &j.at("frames");
    }

    int next_index = 0;
    for (auto& f : *frames) {
        Frame fr;
        fr.index = f.value("frame_index", next_index);
        fr.ts = read_timestamp(f.at("timestamp"));
        next_index = fr.index + 1;
        for (auto& d : f.at("detections")) {
            // degenerate boxes are passed through; the tracker rejects them
            fr.dets.push_back({cv::Rect2d(d.at("x").get<double>(), d.at("y").get<double>(),
                                          d.at("w").get<double>(), d.at("h").get<double>()),
                               fr.index, fr.ts});
        }
        replay.frames.push_back(std::move(fr));
    }
    return replay;
}

static double seconds_since(std::chrono::steady_clock::time_point t)
{
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - t).count();
}

static void save_vis(const std::string& dir, int idx, const cv::Mat& img)
{
    std::ostringstream fn; fn << dir << "/frame_" << std::setw(5)
                              << std::setfill('0') << idx << ".png";
    cv::imwrite(fn.str(), img);
}

// Saves on a wall-clock interval, independent of frame rate.
class PeriodicSaver
{
public:
    explicit PeriodicSaver(double interval_s)
        : interval_(interval_s), last_(std::chrono::steady_clock::now()) {}

    void tick(const Pipeline& p)
    {
        auto now = std::chrono::steady_clock::now();
        if (std::chrono::duration<double>(now - last_).count() < interval_) return;
        p.save();
        last_ = now;
    }

private:
    double interval_;
    std::chrono::steady_clock::time_point last_;
};

// -----------------------------------------------------------------------------

struct RunOptions
{
    std::string mode = "video";
    std::string input;
    int         camera = 0;
    std::string output;     // annotated video
    std::string vis_dir;
    bool        display = false;
    cv::Size    frame_size{1280, 720};
};

static void report(const Pipeline& p)
{
    SessionSummary s = p.summary();
    std::ostringstream msg;
    msg << "vehicles counted: " << s.unique_count << ", duration " << std::fixed
        << std::setprecision(1) << s.duration << " s";
    if (auto avg = p.speeds().average_kmh()) msg << ", average speed " << *avg << " km/h";
    Logger::info(msg.str());
    Logger::info("session " + p.storage().session_id() + ", data saved in "
                 + p.storage().output_dir().string());
}

static int run_replay(const Config& cfg, const RunOptions& opt)
{
    Replay replay = load_replay(opt.input, opt.frame_size);
    Pipeline pipeline(cfg, replay.size);
    PeriodicSaver saver(cfg.storage.save_interval_seconds);
    if (!opt.vis_dir.empty()) std::filesystem::create_directories(opt.vis_dir);

    FpsMeter meter;
    for (const auto& fr : replay.frames) {
        auto t0 = std::chrono::steady_clock::now();
        FrameResult r = pipeline.process(fr.dets, fr.index, fr.ts);
        meter.add(seconds_since(t0));
        if (!opt.vis_dir.empty())
            save_vis(opt.vis_dir, fr.index, render_frame(replay.size, r, pipeline, meter.fps()));
        saver.tick(pipeline);
    }

    pipeline.save();
    Logger::info("Replay complete. Frames: " + std::to_string(replay.frames.size()));
    report(pipeline);
    return 0;
}

static int run_capture(const Config& cfg, const RunOptions& opt)
{
    cv::VideoCapture capture;
    if (opt.mode == "camera") capture.open(opt.camera);
    else capture.open(opt.input);
    if (!capture.isOpened()) {
        Logger::error("Could not open " + (opt.mode == "camera" ? "camera " + std::to_string(opt.camera)
                                                                 : opt.input));
        return 1;
    }

    cv::Mat frame;
    if (!capture.read(frame) || frame.empty()) {
        Logger::error("No frames to read");
        return 1;
    }

    double fps = capture.get(cv::CAP_PROP_FPS);
    Pipeline pipeline(cfg, frame.size());
    BackgroundDetector detector(cfg.detector);
    PeriodicSaver saver(cfg.storage.save_interval_seconds);

    cv::VideoWriter writer;
    if (!opt.output.empty()) {
        writer.open(opt.output, cv::VideoWriter::fourcc('X', 'V', 'I', 'D'),
                    fps > 0 ? fps : 30.0, frame.size());
        if (!writer.isOpened()) Logger::warn("Could not open video output " + opt.output);
    }
    if (!opt.vis_dir.empty()) std::filesystem::create_directories(opt.vis_dir);

    FpsMeter meter;
    auto start = std::chrono::steady_clock::now();
    int index = 0;
    do {
        // live sources without a frame rate fall back to wall-clock time
        double ts = fps > 0 ? index / fps : seconds_since(start);

        auto t0 = std::chrono::steady_clock::now();
        auto dets = detector.detect(frame, index, ts);
        FrameResult r = pipeline.process(dets, index, ts);
        meter.add(seconds_since(t0));

        if (opt.display || writer.isOpened() || !opt.vis_dir.empty()) {
            draw_overlay(frame, r, pipeline, meter.fps());
            if (writer.isOpened()) writer.write(frame);
            if (!opt.vis_dir.empty()) save_vis(opt.vis_dir, index, frame);
            if (opt.display) {
                cv::imshow("speedtrack", frame);
                int key = cv::waitKey(1);
                if (key == 27 || key == 'q') break;
            }
        }
        saver.tick(pipeline);
        ++index;
    } while (capture.read(frame) && !frame.empty());

    if (opt.display) cv::destroyAllWindows();
    pipeline.save();
    Logger::info("Processing complete. Frames: " + std::to_string(index));
    report(pipeline);
    return 0;
}

// -----------------------------------------------------------------------------

int main(int argc, char** argv)
{
    Config cfg;
    RunOptions opt;
    try {
        // Read defaults from .ini
        cfg = Config::from_ini("defaults.ini");
    } catch (const std::exception& e) {
        Logger::error(std::string("defaults.ini: ") + e.what());
        return 1;
    }

    std::string overlap = to_string(cfg.tracker.overlap_policy);
    std::string axis    = to_string(cfg.tracker.line_axis);
    double ref_px = 0.0, mpp = 0.0;
    bool verbose = false;

    CLI::App app{"Vehicle tracking, speed estimation and counting"};
    app.add_option("--mode", opt.mode, "video, camera or replay")
        ->check(CLI::IsMember({"video", "camera", "replay"}));
    app.add_option("--input", opt.input, "Video file, or JSON detections for replay");
    app.add_option("--camera", opt.camera, "Camera device id");
    app.add_option("--output", opt.output, "Annotated video output path");
    app.add_option("--vis-dir", opt.vis_dir, "Directory for per-frame overlay images");
    app.add_flag("--display", opt.display, "Show annotated frames");
    app.add_option("--frame-width", opt.frame_size.width, "Frame width for replays without a header");
    app.add_option("--frame-height", opt.frame_size.height, "Frame height for replays without a header");
    app.add_option("--output-dir", cfg.storage.output_dir, "Directory for exported data");
    app.add_option("--save-interval", cfg.storage.save_interval_seconds, "Seconds between exports");
    app.add_option("--bucket-width", cfg.storage.bucket_width_kmh, "Speed distribution bin width in km/h");
    app.add_flag("--session-files", cfg.storage.session_files, "Name output files after the session id");
    app.add_option("--match-threshold", cfg.tracker.match_threshold, "Minimum overlap ratio to keep an identity");
    app.add_option("--max-disappeared", cfg.tracker.max_disappeared_frames, "Missed frames before a track is retired");
    app.add_option("--overlap-policy", overlap, "iou or smaller")
        ->check(CLI::IsMember({"iou", "smaller"}));
    app.add_option("--detection-line", cfg.tracker.line_position, "Detection line position (0-1)");
    app.add_option("--line-axis", axis, "horizontal or vertical")
        ->check(CLI::IsMember({"horizontal", "vertical"}));
    auto* ref_px_opt = app.add_option("--reference-pixels", ref_px, "Pixel span of the reference");
    app.add_option("--lane-width", cfg.calibration.reference_span_meters, "Real span of the reference in meters");
    auto* mpp_opt = app.add_option("--meters-per-pixel", mpp, "Precomputed scale, overrides the reference");
    app.add_option("--smoothing-window", cfg.speed.smoothing_window, "Speed samples averaged per track");
    app.add_option("--min-area", cfg.detector.min_vehicle_area, "Minimum vehicle contour area in pixels");
    app.add_flag("--verbose", verbose, "Debug logging");
    CLI11_PARSE(app, argc, argv);

    if (verbose) Logger::setLevel(Logger::DEBUG);

    try {
        cfg.tracker.overlap_policy = parse_overlap_policy(overlap);
        cfg.tracker.line_axis = parse_line_axis(axis);
        if (*ref_px_opt) cfg.calibration.reference_span_pixels = ref_px;
        if (*mpp_opt) cfg.calibration.meters_per_pixel = mpp;
        cfg.validate();

        if ((opt.mode == "video" || opt.mode == "replay") && opt.input.empty()) {
            Logger::error("--input is required in " + opt.mode + " mode");
            return 1;
        }

        const Config& config = cfg;
        return opt.mode == "replay" ? run_replay(config, opt) : run_capture(config, opt);
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return 1;
    }
}
