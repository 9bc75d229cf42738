#pragma once

#include "edgelog/common/noncopyable.h"

#include <cstdio>
#include <mutex>
#include <string>

namespace edgelog {
namespace store {

// Append-only text log, one line per record, flushed after every line.
class AccessLog : edgelog::common::noncopyable {
public:
    explicit AccessLog(const std::string& path);
    ~AccessLog();

    bool ok() const { return fp_ != nullptr; }
    const std::string& path() const { return path_; }
    const std::string& openError() const { return openError_; }

    // Thread-safe; lines from concurrent callers never interleave.
    bool AppendLine(const std::string& line, std::string* err);

private:
    std::string path_;
    std::string openError_;
    std::mutex mutex_;
    std::FILE* fp_{nullptr};
};

} // namespace store
} // namespace edgelog
