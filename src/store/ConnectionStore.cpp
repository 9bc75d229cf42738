#include "edgelog/store/ConnectionStore.h"
#include "edgelog/store/Statement.h"
#include "edgelog/common/Logger.h"

#include <sqlite3.h>

namespace edgelog {
namespace store {

static const char* kSchemaSql =
    "CREATE TABLE IF NOT EXISTS connections ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " timestamp DATETIME DEFAULT CURRENT_TIMESTAMP,"
    " client_ip TEXT NOT NULL,"
    " country TEXT,"
    " method TEXT,"
    " path TEXT,"
    " host TEXT,"
    " user_agent TEXT,"
    " referer TEXT);"
    "CREATE INDEX IF NOT EXISTS idx_timestamp ON connections(timestamp);"
    "CREATE INDEX IF NOT EXISTS idx_client_ip ON connections(client_ip);"
    "CREATE INDEX IF NOT EXISTS idx_country ON connections(country);"
    "CREATE INDEX IF NOT EXISTS idx_host ON connections(host);";

static const char* kInsertSql =
    "INSERT INTO connections (timestamp, client_ip, country, method, path, host, user_agent, referer)"
    " VALUES (?, ?, ?, ?, ?, ?, ?, ?)";

ConnectionStore::ConnectionStore(Config cfg) : cfg_(std::move(cfg)) {}

ConnectionStore::~ConnectionStore() {
    Close();
}

void ConnectionStore::Close() {
    if (reader_) {
        sqlite3_close(reader_);
        reader_ = nullptr;
    }
    if (writer_) {
        sqlite3_close(writer_);
        writer_ = nullptr;
    }
}

bool ConnectionStore::Exec(sqlite3* db, const char* sql, std::string* err) {
    char* msg = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &msg) != SQLITE_OK) {
        if (err) *err = msg ? msg : sqlite3_errmsg(db);
        sqlite3_free(msg);
        return false;
    }
    return true;
}

bool ConnectionStore::Open(std::string* err) {
    Close();
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(cfg_.path.c_str(), &writer_, flags, nullptr) != SQLITE_OK) {
        if (err) *err = "open " + cfg_.path + ": " + (writer_ ? sqlite3_errmsg(writer_) : "out of memory");
        Close();
        return false;
    }
    sqlite3_busy_timeout(writer_, cfg_.busyTimeoutMs);

    std::string e;
    if (!Exec(writer_, "PRAGMA journal_mode=WAL;", &e) || !Exec(writer_, kSchemaSql, &e)) {
        if (err) *err = "init " + cfg_.path + ": " + e;
        Close();
        return false;
    }

    if (sqlite3_open_v2(cfg_.path.c_str(), &reader_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX, nullptr) != SQLITE_OK) {
        if (err) *err = "open reader " + cfg_.path + ": " + (reader_ ? sqlite3_errmsg(reader_) : "out of memory");
        Close();
        return false;
    }
    sqlite3_busy_timeout(reader_, cfg_.busyTimeoutMs);

    LOG_INFO << "connection store ready: " << cfg_.path << " (WAL, busy_timeout=" << cfg_.busyTimeoutMs << "ms)";
    return true;
}

bool ConnectionStore::Insert(ConnectionRecord* rec, std::string* err) {
    if (!writer_) {
        if (err) *err = "store not open";
        return false;
    }
    std::lock_guard<std::mutex> lock(writeMu_);
    Statement stmt(writer_, kInsertSql);
    if (!stmt.ok()) {
        if (err) *err = stmt.error();
        return false;
    }
    const bool bound = stmt.Bind(1, rec->timestamp) &&
                       stmt.Bind(2, rec->clientIp) &&
                       stmt.Bind(3, rec->country) &&
                       stmt.Bind(4, rec->method) &&
                       stmt.Bind(5, rec->path) &&
                       stmt.Bind(6, rec->host) &&
                       stmt.Bind(7, rec->userAgent) &&
                       stmt.Bind(8, rec->referer);
    if (!bound || stmt.Step() != Statement::kDone) {
        if (err) *err = stmt.error();
        return false;
    }
    rec->id = static_cast<std::int64_t>(sqlite3_last_insert_rowid(writer_));
    return true;
}

} // namespace store
} // namespace edgelog
