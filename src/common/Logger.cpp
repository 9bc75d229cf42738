#include "edgelog/common/Logger.h"

#include <iostream>
#include <chrono>
#include <iomanip>
#include <ctime>
#include <cstdlib>
#include <cstring>
#include <unistd.h>

namespace edgelog {
namespace common {

namespace {

std::string FormatNow() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    struct tm tmLocal;
    localtime_r(&in_time_t, &tmLocal);

    std::stringstream ss;
    ss << std::put_time(&tmLocal, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

const char* LevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

// ANSI color codes
const char* LevelToColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[36m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        case LogLevel::FATAL: return "\033[35m";
        default: return "\033[0m";
    }
}

// __FILE__ carries the build path; keep from "src/" on.
const char* ShortFile(const char* file) {
    const char* p = std::strstr(file, "src/");
    return p ? p : file;
}

} // namespace

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : color_(::isatty(STDOUT_FILENO) == 1) {}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

void Logger::SetColor(bool on) {
    std::lock_guard<std::mutex> lock(mutex_);
    color_ = on;
}

LogLevel Logger::ParseLevel(const std::string& levelStr) const {
    if (levelStr == "DEBUG") return LogLevel::DEBUG;
    if (levelStr == "INFO") return LogLevel::INFO;
    if (levelStr == "WARN") return LogLevel::WARN;
    if (levelStr == "ERROR") return LogLevel::ERROR;
    if (levelStr == "FATAL") return LogLevel::FATAL;
    return LogLevel::INFO;
}

void Logger::Log(LogLevel level, const char* file, int line, const std::string& msg) {
    {
        std::lock_guard<std::mutex> lock(mutex_);

        // Format: [Time] [Level] [File:Line] Message
        if (color_) std::cout << LevelToColor(level);
        std::cout << "[" << FormatNow() << "] "
                  << "[" << LevelToString(level) << "] "
                  << "[" << ShortFile(file) << ":" << line << "] "
                  << msg;
        if (color_) std::cout << "\033[0m";
        std::cout << std::endl;
    }
    // FATAL marks reactor setup the process cannot run without.
    if (level == LogLevel::FATAL) {
        std::exit(EXIT_FAILURE);
    }
}

} // namespace common
} // namespace edgelog
