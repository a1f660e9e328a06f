#pragma once
#include <string>

// Timestamped, leveled console logger.
class Logger
{
public:
    enum Level {
        DEBUG   = 0,
        INFO    = 1,
        WARNING = 2,
        ERROR   = 3
    };

    static void log(Level level, const std::string& message);
    static void setLevel(Level level) { min_level_ = level; }
    static Level level() { return min_level_; }

    static void debug(const std::string& m) { log(DEBUG, m); }
    static void info(const std::string& m)  { log(INFO, m); }
    static void warn(const std::string& m)  { log(WARNING, m); }
    static void error(const std::string& m) { log(ERROR, m); }

private:
    static Level min_level_;
};
