#pragma once

#include <string>
#include <mutex>
#include <sstream>

namespace edgelog {
namespace common {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel level);
    LogLevel GetLevel() const { return level_; }
    LogLevel ParseLevel(const std::string& levelStr) const;

    // Colors are on by default only when stdout is a terminal.
    void SetColor(bool on);

    void Log(LogLevel level, const char* file, int line, const std::string& msg);

private:
    Logger();
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel level_ = LogLevel::INFO;
    bool color_ = false;
    std::mutex mutex_;
};

// Stream wrapper to allow usage like: LOG_INFO << "Message " << 123;
class LogStream {
public:
    LogStream(LogLevel level, const char* file, int line)
        : level_(level), file_(file), line_(line) {}

    ~LogStream() {
        Logger::Instance().Log(level_, file_, line_, ss_.str());
    }

    template <typename T>
    LogStream& operator<<(const T& val) {
        ss_ << val;
        return *this;
    }

private:
    LogLevel level_;
    const char* file_;
    int line_;
    std::stringstream ss_;
};

} // namespace common
} // namespace edgelog

// Macros for easy usage. The empty branch keeps a caller's trailing else
// bound to the caller's own if.
#define LOG_DEBUG \
    if (edgelog::common::LogLevel::DEBUG < edgelog::common::Logger::Instance().GetLevel()) {} \
    else edgelog::common::LogStream(edgelog::common::LogLevel::DEBUG, __FILE__, __LINE__)

#define LOG_INFO \
    if (edgelog::common::LogLevel::INFO < edgelog::common::Logger::Instance().GetLevel()) {} \
    else edgelog::common::LogStream(edgelog::common::LogLevel::INFO, __FILE__, __LINE__)

#define LOG_WARN \
    if (edgelog::common::LogLevel::WARN < edgelog::common::Logger::Instance().GetLevel()) {} \
    else edgelog::common::LogStream(edgelog::common::LogLevel::WARN, __FILE__, __LINE__)

#define LOG_ERROR \
    if (edgelog::common::LogLevel::ERROR < edgelog::common::Logger::Instance().GetLevel()) {} \
    else edgelog::common::LogStream(edgelog::common::LogLevel::ERROR, __FILE__, __LINE__)

#define LOG_FATAL \
    if (edgelog::common::LogLevel::FATAL < edgelog::common::Logger::Instance().GetLevel()) {} \
    else edgelog::common::LogStream(edgelog::common::LogLevel::FATAL, __FILE__, __LINE__)
