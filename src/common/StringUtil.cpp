#include "edgelog/common/StringUtil.h"

#include <cctype>

namespace edgelog {
namespace common {

static char LowerAscii(char c) {
    if (c >= 'A' && c <= 'Z') return static_cast<char>(c - 'A' + 'a');
    return c;
}

bool IEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (LowerAscii(a[i]) != LowerAscii(b[i])) return false;
    }
    return true;
}

bool IContains(const std::string& s, const std::string& needle) {
    if (needle.empty()) return true;
    if (s.size() < needle.size()) return false;
    for (size_t i = 0; i + needle.size() <= s.size(); ++i) {
        bool ok = true;
        for (size_t j = 0; j < needle.size(); ++j) {
            if (LowerAscii(s[i + j]) != LowerAscii(needle[j])) {
                ok = false;
                break;
            }
        }
        if (ok) return true;
    }
    return false;
}

std::string ToLowerAscii(std::string s) {
    for (char& c : s) c = LowerAscii(c);
    return s;
}

std::string TrimCopy(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

bool HeaderContainsTokenCI(const std::string& headerValue, const std::string& token) {
    size_t i = 0;
    while (i < headerValue.size()) {
        while (i < headerValue.size() && (headerValue[i] == ' ' || headerValue[i] == '\t' || headerValue[i] == ',')) ++i;
        size_t start = i;
        while (i < headerValue.size() && headerValue[i] != ',') ++i;
        size_t end = i;
        while (end > start && (headerValue[end - 1] == ' ' || headerValue[end - 1] == '\t')) --end;
        if (end > start && IEquals(headerValue.substr(start, end - start), token)) return true;
        if (i < headerValue.size() && headerValue[i] == ',') ++i;
    }
    return false;
}

std::vector<std::string> SplitString(const std::string& s, char sep) {
    std::vector<std::string> out;
    size_t pos = 0;
    while (true) {
        size_t next = s.find(sep, pos);
        if (next == std::string::npos) {
            out.push_back(s.substr(pos));
            break;
        }
        out.push_back(s.substr(pos, next - pos));
        pos = next + 1;
    }
    return out;
}

static int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string UrlDecode(const std::string& s, bool plusAsSpace) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        if (c == '%' && i + 2 < s.size()) {
            const int hi = HexValue(s[i + 1]);
            const int lo = HexValue(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        if (c == '+' && plusAsSpace) {
            out.push_back(' ');
            continue;
        }
        out.push_back(c);
    }
    return out;
}

std::string ExtractQueryParam(const std::string& query, const std::string& key) {
    if (key.empty()) return {};
    std::string q = query;
    if (!q.empty() && q[0] == '?') q.erase(0, 1);
    size_t pos = 0;
    while (pos < q.size()) {
        size_t amp = q.find('&', pos);
        if (amp == std::string::npos) amp = q.size();
        size_t eq = q.find('=', pos);
        if (eq != std::string::npos && eq < amp) {
            if (UrlDecode(q.substr(pos, eq - pos)) == key) {
                return UrlDecode(q.substr(eq + 1, amp - (eq + 1)));
            }
        } else if (UrlDecode(q.substr(pos, amp - pos)) == key) {
            return "";
        }
        pos = (amp < q.size()) ? amp + 1 : q.size();
    }
    return {};
}

} // namespace common
} // namespace edgelog
