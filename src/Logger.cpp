#include "Logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

Logger::Level Logger::min_level_ = Logger::INFO;

void Logger::log(Level level, const std::string& message)
{
    if (level < min_level_) return;

    const char* level_str[] = {"DEBUG", "INFO", "WARN", "ERROR"};

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&t, &tm);

    std::cout << "[" << std::put_time(&tm, "%H:%M:%S")
              << "." << std::setfill('0') << std::setw(3) << ms.count()
              << "] [" << level_str[level] << "] " << message << std::endl;
}
