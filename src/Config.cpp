#include "Config.hpp"
#include "Logger.hpp"
#include <fstream>
#include <regex>
#include <stdexcept>

namespace {

double to_double(const std::string& key, const std::string& v)
{
    try {
        size_t used = 0;
        double d = std::stod(v, &used);
        if (used != v.size()) throw std::invalid_argument(v);
        return d;
    } catch (const std::exception&) {
        throw std::invalid_argument("option '" + key + "' expects a number, got '" + v + "'");
    }
}

int to_int(const std::string& key, const std::string& v)
{
    try {
        size_t used = 0;
        int i = std::stoi(v, &used);
        if (used != v.size()) throw std::invalid_argument(v);
        return i;
    } catch (const std::exception&) {
        throw std::invalid_argument("option '" + key + "' expects an integer, got '" + v + "'");
    }
}

bool to_bool(const std::string& key, const std::string& v)
{
    if (v == "true" || v == "1" || v == "yes")  return true;
    if (v == "false" || v == "0" || v == "no")  return false;
    throw std::invalid_argument("option '" + key + "' expects true or false, got '" + v + "'");
}

} // namespace

// -----------------------------------------------------------------------------

OverlapPolicy parse_overlap_policy(const std::string& s)
{
    if (s == "iou")     return OverlapPolicy::IoU;
    if (s == "smaller") return OverlapPolicy::OverSmaller;
    throw std::invalid_argument("overlap_policy must be 'iou' or 'smaller', got '" + s + "'");
}

LineAxis parse_line_axis(const std::string& s)
{
    if (s == "horizontal") return LineAxis::Horizontal;
    if (s == "vertical")   return LineAxis::Vertical;
    throw std::invalid_argument("line_axis must be 'horizontal' or 'vertical', got '" + s + "'");
}

std::string to_string(OverlapPolicy p)
{
    return p == OverlapPolicy::IoU ? "iou" : "smaller";
}

std::string to_string(LineAxis a)
{
    return a == LineAxis::Horizontal ? "horizontal" : "vertical";
}

// -----------------------------------------------------------------------------

std::map<std::string, std::string> read_ini_section(const std::string& path,
                                                    const std::string& section)
{
    std::map<std::string, std::string> values;
    std::ifstream file(path);
    if (!file.is_open()) return values;

    std::string line, current_section;
    std::regex section_re(R"(^\s*\[(.*?)\]\s*$)");
    std::regex keyval_re(R"(^\s*([^=#;]+?)\s*=\s*(.*?)\s*(?:[#;].*)?$)");
    std::smatch match;

    while (std::getline(file, line)) {
        if (std::regex_match(line, match, section_re)) {
            current_section = match[1].str();
        } else if (current_section == section && std::regex_match(line, match, keyval_re)) {
            values[match[1].str()] = match[2].str();
        }
    }
    return values;
}

Config Config::from_ini(const std::string& path)
{
    Config cfg;
    auto values = read_ini_section(path, "speedtrack");
    if (!values.empty())
        Logger::info("loading " + std::to_string(values.size()) + " option(s) from " + path);
    for (const auto& [key, value] : values) cfg.set(key, value);
    return cfg;
}

void Config::set(const std::string& key, const std::string& value)
{
    if      (key == "match_threshold")        tracker.match_threshold = to_double(key, value);
    else if (key == "max_disappeared_frames") tracker.max_disappeared_frames = to_int(key, value);
    else if (key == "overlap_policy")         tracker.overlap_policy = parse_overlap_policy(value);
    else if (key == "detection_line_relative_position") tracker.line_position = to_double(key, value);
    else if (key == "line_axis")              tracker.line_axis = parse_line_axis(value);
    else if (key == "speed_smoothing_window") speed.smoothing_window = to_int(key, value);
    else if (key == "reference_span_pixels")  calibration.reference_span_pixels = to_double(key, value);
    else if (key == "reference_span_meters")  calibration.reference_span_meters = to_double(key, value);
    else if (key == "meters_per_pixel")       calibration.meters_per_pixel = to_double(key, value);
    else if (key == "min_vehicle_area")       detector.min_vehicle_area = to_double(key, value);
    else if (key == "output_dir")             storage.output_dir = value;
    else if (key == "save_interval_seconds")  storage.save_interval_seconds = to_double(key, value);
    else if (key == "bucket_width_kmh")       storage.bucket_width_kmh = to_double(key, value);
    else if (key == "session_files")          storage.session_files = to_bool(key, value);
    else throw std::invalid_argument("unknown option '" + key + "'");
}

void Config::validate() const
{
    if (!(tracker.match_threshold >= 0.0 && tracker.match_threshold <= 1.0))
        throw std::invalid_argument("match_threshold must lie in [0, 1]");
    if (tracker.max_disappeared_frames < 1)
        throw std::invalid_argument("max_disappeared_frames must be a positive integer");
    if (!(tracker.line_position > 0.0 && tracker.line_position < 1.0))
        throw std::invalid_argument("detection_line_relative_position must lie in (0, 1)");
    if (speed.smoothing_window < 1)
        throw std::invalid_argument("speed_smoothing_window must be a positive integer");
    if (!(detector.min_vehicle_area >= 0.0))
        throw std::invalid_argument("min_vehicle_area must not be negative");
    if (!(storage.save_interval_seconds > 0.0))
        throw std::invalid_argument("save_interval_seconds must be positive");
    if (!(storage.bucket_width_kmh > 0.0))
        throw std::invalid_argument("bucket_width_kmh must be positive");
    if (storage.output_dir.empty())
        throw std::invalid_argument("output_dir must not be empty");
}
