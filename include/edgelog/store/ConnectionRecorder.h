#pragma once

#include "edgelog/common/noncopyable.h"
#include "edgelog/store/AccessLog.h"
#include "edgelog/store/ConnectionRecord.h"
#include "edgelog/store/ConnectionStore.h"

#include <memory>
#include <string>

namespace edgelog {
namespace store {

// The single write path for connection records, shared by the proxy and the
// log ingester. Each record goes to the SQLite store first and is then appended
// to the text log whether or not the insert succeeded, so the text log holds
// every record the store holds and possibly more.
class ConnectionRecorder : edgelog::common::noncopyable {
public:
    struct Options {
        std::string dbPath;
        std::string logPath;
        int busyTimeoutMs{5000};
    };

    // Opens the store and the text log. Null (and err set) when either fails.
    static std::unique_ptr<ConnectionRecorder> Open(const Options& opts, std::string* err);

    ConnectionRecorder(std::unique_ptr<ConnectionStore> store, std::unique_ptr<AccessLog> log);

    // Fills an empty timestamp with the current local time, inserts, then logs.
    // False when either write failed; err names the first failure.
    bool Record(ConnectionRecord& rec, std::string* err);

    const ConnectionStore& store() const { return *store_; }

    // "ts | ip | country | METHOD path | host | user-agent"
    static std::string FormatLogLine(const ConnectionRecord& rec);

private:
    std::unique_ptr<ConnectionStore> store_;
    std::unique_ptr<AccessLog> log_;
};

} // namespace store
} // namespace edgelog
