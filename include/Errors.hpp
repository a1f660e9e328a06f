#pragma once
#include <stdexcept>
#include <string>

/** Calibration input was non-positive or non-finite. Fatal at startup. */
class InvalidCalibrationError : public std::runtime_error
{
public:
    explicit InvalidCalibrationError(const std::string& what)
        : std::runtime_error("invalid calibration: " + what) {}
};

/** Two history points whose timestamps do not advance. Drops one speed sample. */
class NonMonotonicTimestampError : public std::runtime_error
{
public:
    explicit NonMonotonicTimestampError(const std::string& what)
        : std::runtime_error("non-monotonic timestamp: " + what) {}
};

/** Detection with non-positive width or height. Dropped before matching. */
class DegenerateDetectionError : public std::runtime_error
{
public:
    explicit DegenerateDetectionError(const std::string& what)
        : std::runtime_error("degenerate detection: " + what) {}
};
