#include "edgelog/store/ConnectionRecorder.h"
#include "edgelog/common/Logger.h"
#include "edgelog/common/TimeUtil.h"

#include <sstream>

namespace edgelog {
namespace store {

std::unique_ptr<ConnectionRecorder> ConnectionRecorder::Open(const Options& opts, std::string* err) {
    ConnectionStore::Config cfg;
    cfg.path = opts.dbPath;
    cfg.busyTimeoutMs = opts.busyTimeoutMs;
    auto store = std::make_unique<ConnectionStore>(cfg);
    if (!store->Open(err)) return nullptr;

    auto log = std::make_unique<AccessLog>(opts.logPath);
    if (!log->ok()) {
        if (err) *err = "open " + opts.logPath + ": " + log->openError();
        return nullptr;
    }
    return std::make_unique<ConnectionRecorder>(std::move(store), std::move(log));
}

ConnectionRecorder::ConnectionRecorder(std::unique_ptr<ConnectionStore> store, std::unique_ptr<AccessLog> log)
    : store_(std::move(store)), log_(std::move(log)) {}

std::string ConnectionRecorder::FormatLogLine(const ConnectionRecord& rec) {
    std::ostringstream oss;
    oss << rec.timestamp << " | " << rec.clientIp << " | " << rec.country << " | "
        << rec.method << " " << rec.path << " | " << rec.host << " | " << rec.userAgent;
    return oss.str();
}

bool ConnectionRecorder::Record(ConnectionRecord& rec, std::string* err) {
    if (rec.timestamp.empty()) rec.timestamp = common::NowLocalString();

    std::string firstErr;
    std::string e;
    if (!store_->Insert(&rec, &e)) {
        firstErr = "store insert: " + e;
        LOG_ERROR << "record insert failed ip=" << rec.clientIp << " host=" << rec.host << ": " << e;
    }
    e.clear();
    if (!log_->AppendLine(FormatLogLine(rec), &e)) {
        if (firstErr.empty()) firstErr = "text log: " + e;
        LOG_ERROR << "record log append failed: " << e;
    }
    if (!firstErr.empty()) {
        if (err) *err = firstErr;
        return false;
    }
    return true;
}

} // namespace store
} // namespace edgelog
