#pragma once

#include "edgelog/common/noncopyable.h"
#include "edgelog/store/ConnectionRecord.h"

#include <mutex>
#include <string>

struct sqlite3;

namespace edgelog {
namespace store {

// SQLite-backed table of connection records.
//
// Two handles on the same file, both opened in serialized (full-mutex) mode:
// a writer used for schema setup and inserts, and a reader for queries. The
// database runs in WAL mode so readers never block the writer.
class ConnectionStore : edgelog::common::noncopyable {
public:
    struct Config {
        std::string path;
        int busyTimeoutMs{5000};
    };

    explicit ConnectionStore(Config cfg);
    ~ConnectionStore();

    // Opens both handles, switches to WAL and creates the table and indexes.
    bool Open(std::string* err);
    bool isOpen() const { return writer_ != nullptr && reader_ != nullptr; }
    const std::string& path() const { return cfg_.path; }

    // Writes rec->id on success.
    bool Insert(ConnectionRecord* rec, std::string* err);

    sqlite3* reader() const { return reader_; }

private:
    bool Exec(sqlite3* db, const char* sql, std::string* err);
    void Close();

    Config cfg_;
    sqlite3* writer_{nullptr};
    sqlite3* reader_{nullptr};
    // Insert and last_insert_rowid must pair up.
    std::mutex writeMu_;
};

} // namespace store
} // namespace edgelog
