#pragma once
#include "RollingWindow.hpp"

// Processing rate averaged over the last few frames.
class FpsMeter
{
public:
    explicit FpsMeter(std::size_t frames = 10) : durations_(frames) {}

    void add(double seconds) { durations_.push(seconds); }

    double fps() const
    {
        double mean = durations_.mean();
        return mean > 0.0 ? 1.0 / mean : 0.0;
    }

private:
    RollingWindow<double> durations_;
};
