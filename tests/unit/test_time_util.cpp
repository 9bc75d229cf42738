#include "edgelog/common/TimeUtil.h"
#include "edgelog/common/Logger.h"

#include <cassert>
#include <cstdlib>
#include <ctime>
#include <string>

using namespace edgelog::common;

static bool looksLikeLocalTime(const std::string& s) {
    if (s.size() != 19) return false;
    return s[4] == '-' && s[7] == '-' && s[10] == ' ' && s[13] == ':' && s[16] == ':';
}

int main() {
    // Pin the local zone so conversions are deterministic.
    ::setenv("TZ", "UTC", 1);
    ::tzset();
    Logger::Instance().SetLevel(LogLevel::INFO);

    assert(FormatLocalTime(0) == "1970-01-01 00:00:00");
    assert(looksLikeLocalTime(NowLocalString()));

    std::string out;
    assert(Rfc3339ToLocal("2024-01-15T10:30:00Z", &out));
    assert(out == "2024-01-15 10:30:00");

    assert(Rfc3339ToLocal("2024-01-15T10:30:00.123456Z", &out));
    assert(out == "2024-01-15 10:30:00");

    assert(Rfc3339ToLocal("2024-01-15T10:30:00+02:00", &out));
    assert(out == "2024-01-15 08:30:00");

    assert(Rfc3339ToLocal("2024-12-31T23:30:00-01:00", &out));
    assert(out == "2025-01-01 00:30:00");

    out = "untouched";
    assert(!Rfc3339ToLocal("", &out));
    assert(!Rfc3339ToLocal("2024-01-15 10:30:00", &out));
    assert(!Rfc3339ToLocal("2024-01-15T10:30:00", &out));
    assert(!Rfc3339ToLocal("2024-01-15T10:30:00Zjunk", &out));
    assert(!Rfc3339ToLocal("2024-01-15T10:30:00+0200", &out));
    assert(out == "untouched");

    LOG_INFO << "TimeUtil PASS";
    return 0;
}
