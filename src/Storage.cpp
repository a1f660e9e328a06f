#include "Storage.hpp"
#include "Logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

std::ofstream open_for_write(const fs::path& path)
{
    std::ofstream out(path);
    if (!out) throw std::runtime_error("Failed to open for writing: " + path.string());
    return out;
}

double round2(double v) { return std::round(v * 100.0) / 100.0; }

std::string format_time(Storage::Clock::time_point tp, const char* fmt)
{
    std::time_t t = Storage::Clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, fmt);
    return out.str();
}

nlohmann::ordered_json optional_number(const std::optional<double>& v)
{
    if (!v) return nullptr;
    return round2(*v);
}

} // namespace

std::string SpeedBucket::label() const
{
    std::ostringstream out;
    out << bin_start << "-" << bin_end << " km/h";
    return out.str();
}

std::vector<SpeedBucket> speed_buckets(const std::vector<double>& speeds_kmh, double bin_width)
{
    std::vector<SpeedBucket> buckets;
    if (speeds_kmh.empty() || bin_width <= 0.0) return buckets;

    // bin index as a double first, so a runaway speed cannot overflow int
    auto bin_of = [bin_width](double s, int limit) {
        double b = std::floor(std::max(0.0, s) / bin_width);
        return b < limit ? static_cast<int>(b) : limit;
    };

    double top = *std::max_element(speeds_kmh.begin(), speeds_kmh.end());
    int n = bin_of(top, kMaxSpeedBuckets - 1) + 1;
    for (int i = 0; i < n; ++i)
        buckets.push_back({i * bin_width, (i + 1) * bin_width, 0, 0.0});

    for (double s : speeds_kmh) ++buckets[bin_of(s, n - 1)].count;
    for (auto& b : buckets)
        b.percentage = round2(100.0 * b.count / speeds_kmh.size());
    return buckets;
}

// -----------------------------------------------------------------------------

Storage::Storage(const StorageConfig& cfg, Clock::time_point session_start)
    : cfg_(cfg),
      session_start_(session_start),
      session_id_(format_time(session_start, "%Y%m%d_%H%M%S"))
{
}

fs::path Storage::file_path(const std::string& stem, const std::string& ext) const
{
    fs::path dir(cfg_.output_dir);
    if (cfg_.session_files) return dir / (stem + "_" + session_id_ + ext);
    return dir / (stem + ext);
}

int Storage::crossed_count() const
{
    int n = 0;
    for (const auto& [id, s] : tracks_)
        if (s.crossed) ++n;
    return n;
}

std::vector<double> Storage::known_speeds() const
{
    std::vector<double> out;
    for (const auto& [id, s] : tracks_)
        if (s.avg_speed_kmh) out.push_back(*s.avg_speed_kmh);
    return out;
}

void Storage::save(const SessionSummary& session) const
{
    fs::path dir(cfg_.output_dir);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw std::runtime_error("Failed to create directory: " + dir.string() + " : " + ec.message());

    write_detections(file_path("detections", ".csv"));
    write_tracks(file_path("tracks", ".json"));
    write_summary(file_path("summary", ".json"), session);
    Logger::debug("saved " + std::to_string(records_.size()) + " detection records to " + dir.string());
}

void Storage::write_detections(const fs::path& path) const
{
    auto out = open_for_write(path);
    out << "track_id,frame_index,timestamp,x,y,width,height,speed_kmh,crossed\n";
    out << std::setprecision(10);
    for (const auto& r : records_) {
        out << r.track_id << ","
            << r.frame_index << ","
            << r.timestamp << ","
            << r.bbox.x << ","
            << r.bbox.y << ","
            << r.bbox.width << ","
            << r.bbox.height << ","
            << (r.speed_kmh ? round2(*r.speed_kmh) : -1.0) << ","
            << (r.crossed ? 1 : 0) << "\n";
    }
}

void Storage::write_tracks(const fs::path& path) const
{
    nlohmann::ordered_json j = nlohmann::json::array();
    for (const auto& [id, s] : tracks_) {
        j.push_back({
            {"track_id", s.track_id},
            {"avg_speed_kmh", optional_number(s.avg_speed_kmh)},
            {"samples", s.samples},
            {"first_seen", s.first_seen},
            {"last_seen", s.last_seen},
            {"first_seen_frame", s.first_seen_frame},
            {"last_seen_frame", s.last_seen_frame},
            {"crossed", s.crossed}
        });
    }
    auto out = open_for_write(path);
    out << std::setw(2) << j;
}

void Storage::write_summary(const fs::path& path, const SessionSummary& session) const
{
    auto speeds = known_speeds();

    nlohmann::ordered_json j;
    j["session_id"] = session_id_;
    j["start_time"] = format_time(session_start_, "%Y-%m-%d %H:%M:%S");
    j["end_time"] = format_time(Clock::now(), "%Y-%m-%d %H:%M:%S");
    j["unique_count"] = session.unique_count;
    j["crossed_line"] = crossed_count();
    j["duration"] = session.duration;
    j["active_tracks"] = session.active_tracks;
    j["tracks_seen"] = tracks_.size();
    j["rate_per_minute"] = round2(session.rate_per_minute);

    if (!speeds.empty()) {
        double sum = 0.0;
        for (double s : speeds) sum += s;
        double mean = sum / speeds.size();
        double var = 0.0;
        for (double s : speeds) var += (s - mean) * (s - mean);
        double std_dev = speeds.size() > 1 ? std::sqrt(var / (speeds.size() - 1)) : 0.0;

        j["avg_speed_kmh"] = round2(mean);
        j["min_speed_kmh"] = round2(*std::min_element(speeds.begin(), speeds.end()));
        j["max_speed_kmh"] = round2(*std::max_element(speeds.begin(), speeds.end()));
        j["std_speed_kmh"] = round2(std_dev);
    } else {
        j["avg_speed_kmh"] = nullptr;
        j["min_speed_kmh"] = nullptr;
        j["max_speed_kmh"] = nullptr;
        j["std_speed_kmh"] = nullptr;
    }

    j["speed_distribution_buckets"] = nlohmann::json::array();
    for (const auto& b : speed_buckets(speeds, cfg_.bucket_width_kmh)) {
        j["speed_distribution_buckets"].push_back({
            {"bin_start", b.bin_start},
            {"bin_end", b.bin_end},
            {"label", b.label()},
            {"count", b.count},
            {"percentage", b.percentage}
        });
    }

    auto out = open_for_write(path);
    out << std::setw(2) << j;
}
