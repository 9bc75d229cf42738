#pragma once

#include "edgelog/common/noncopyable.h"

#include <cstdint>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace edgelog {
namespace store {

// Prepared statement, finalized on destruction.
class Statement : edgelog::common::noncopyable {
public:
    enum StepResult { kRow, kDone, kError };

    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    bool ok() const { return stmt_ != nullptr; }
    const std::string& error() const { return error_; }

    // Parameters are 1-based, as in sqlite3_bind_*.
    bool Bind(int idx, const std::string& value);
    bool Bind(int idx, std::int64_t value);

    StepResult Step();

    // Columns are 0-based. NULL text reads as "".
    std::string ColumnText(int col) const;
    std::int64_t ColumnInt64(int col) const;

private:
    void CaptureError();

    sqlite3* db_;
    sqlite3_stmt* stmt_{nullptr};
    std::string error_;
};

} // namespace store
} // namespace edgelog
