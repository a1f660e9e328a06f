#pragma once
#include "Calibrator.hpp"
#include "Config.hpp"
#include "Counter.hpp"
#include "SpeedAggregator.hpp"
#include "Storage.hpp"
#include "Tracker.hpp"
#include <optional>
#include <vector>

struct FrameResult
{
    FrameUpdate                frame;
    std::vector<CrossingEvent> counted;       // crossings that raised the count
    int                        unique_count = 0;
    int                        samples_added = 0;
};

/*
 * One frame in, one FrameResult out: Tracker -> SpeedAggregator -> Counter
 * -> Storage records. Calibration is resolved in the constructor, so a
 * degenerate scale fails before the first frame is accepted.
 */
class Pipeline
{
public:
    Pipeline(const Config& cfg, const cv::Size& frame_size);

    FrameResult process(const std::vector<Detection>& dets, int frame_index, double timestamp);

    SessionSummary summary() const;
    void save() const { storage_.save(summary()); }

    const Tracker&         tracker() const { return tracker_; }
    const SpeedAggregator& speeds() const { return speeds_; }
    const Counter&         counter() const { return counter_; }
    const Storage&         storage() const { return storage_; }
    const Calibrator&      calibrator() const { return calibrator_; }

private:
    TrackSummary summarise(const Track& t) const;

    Calibrator            calibrator_;
    Tracker               tracker_;
    SpeedAggregator       speeds_;
    Counter               counter_;
    Storage               storage_;
    std::optional<double> first_ts_;
    double                last_ts_ = 0.0;
};
