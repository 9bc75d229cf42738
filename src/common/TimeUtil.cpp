#include "edgelog/common/TimeUtil.h"

#include <cctype>
#include <cstring>

namespace edgelog {
namespace common {

std::string FormatLocalTime(std::time_t t) {
    struct tm tmv;
    localtime_r(&t, &tmv);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tmv);
    return buf;
}

std::string NowLocalString() {
    return FormatLocalTime(std::time(nullptr));
}

bool Rfc3339ToLocal(const std::string& text, std::string* out) {
    struct tm tmv;
    std::memset(&tmv, 0, sizeof(tmv));
    const char* p = ::strptime(text.c_str(), "%Y-%m-%dT%H:%M:%S", &tmv);
    if (p == nullptr) return false;

    // optional fractional seconds
    if (*p == '.') {
        ++p;
        if (!std::isdigit(static_cast<unsigned char>(*p))) return false;
        while (std::isdigit(static_cast<unsigned char>(*p))) ++p;
    }

    long offset = 0;
    if (*p == 'Z' || *p == 'z') {
        ++p;
    } else if (*p == '+' || *p == '-') {
        const int sign = (*p == '-') ? -1 : 1;
        ++p;
        if (!std::isdigit(static_cast<unsigned char>(p[0])) || !std::isdigit(static_cast<unsigned char>(p[1])) || p[2] != ':' ||
            !std::isdigit(static_cast<unsigned char>(p[3])) || !std::isdigit(static_cast<unsigned char>(p[4]))) {
            return false;
        }
        const int hh = (p[0] - '0') * 10 + (p[1] - '0');
        const int mm = (p[3] - '0') * 10 + (p[4] - '0');
        if (hh > 23 || mm > 59) return false;
        offset = sign * (hh * 3600L + mm * 60L);
        p += 5;
    } else {
        return false;
    }
    if (*p != '\0') return false;

    const std::time_t utc = ::timegm(&tmv) - offset;
    *out = FormatLocalTime(utc);
    return true;
}

} // namespace common
} // namespace edgelog
