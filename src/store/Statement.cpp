#include "edgelog/store/Statement.h"

#include <sqlite3.h>

namespace edgelog {
namespace store {

Statement::Statement(sqlite3* db, const std::string& sql) : db_(db) {
    if (!db_) {
        error_ = "database not open";
        return;
    }
    if (sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &stmt_, nullptr) != SQLITE_OK) {
        CaptureError();
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
    }
}

Statement::~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

void Statement::CaptureError() {
    error_ = db_ ? sqlite3_errmsg(db_) : "database not open";
}

bool Statement::Bind(int idx, const std::string& value) {
    if (!stmt_) return false;
    if (sqlite3_bind_text(stmt_, idx, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT) != SQLITE_OK) {
        CaptureError();
        return false;
    }
    return true;
}

bool Statement::Bind(int idx, std::int64_t value) {
    if (!stmt_) return false;
    if (sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(value)) != SQLITE_OK) {
        CaptureError();
        return false;
    }
    return true;
}

Statement::StepResult Statement::Step() {
    if (!stmt_) return kError;
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return kRow;
    if (rc == SQLITE_DONE) return kDone;
    CaptureError();
    return kError;
}

std::string Statement::ColumnText(int col) const {
    const unsigned char* text = sqlite3_column_text(stmt_, col);
    if (!text) return std::string();
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
}

std::int64_t Statement::ColumnInt64(int col) const {
    return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, col));
}

} // namespace store
} // namespace edgelog
