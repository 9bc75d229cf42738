#include "edgelog/store/AccessLog.h"
#include "edgelog/common/Logger.h"

#include <cerrno>
#include <cstring>

namespace edgelog {
namespace store {

AccessLog::AccessLog(const std::string& path) : path_(path) {
    if (path_.empty()) {
        openError_ = "empty path";
        return;
    }
    fp_ = std::fopen(path_.c_str(), "a");
    if (!fp_) {
        openError_ = std::strerror(errno);
        LOG_ERROR << "AccessLog fopen failed path=" << path_ << ": " << openError_;
    }
}

AccessLog::~AccessLog() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fp_) {
        std::fflush(fp_);
        std::fclose(fp_);
        fp_ = nullptr;
    }
}

bool AccessLog::AppendLine(const std::string& line, std::string* err) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!fp_) {
        if (err) *err = "log " + path_ + " not open";
        return false;
    }
    const bool written = std::fwrite(line.data(), 1, line.size(), fp_) == line.size() &&
                         std::fwrite("\n", 1, 1, fp_) == 1 &&
                         std::fflush(fp_) == 0;
    if (!written) {
        if (err) *err = "write " + path_ + ": " + std::strerror(errno);
        return false;
    }
    return true;
}

} // namespace store
} // namespace edgelog
