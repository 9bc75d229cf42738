#pragma once

#include <string>
#include <vector>

namespace edgelog {
namespace common {

bool IEquals(const std::string& a, const std::string& b);
bool IContains(const std::string& s, const std::string& needle);
std::string ToLowerAscii(std::string s);
std::string TrimCopy(const std::string& s);

// Token match on a comma-separated header value, case-insensitive.
bool HeaderContainsTokenCI(const std::string& headerValue, const std::string& token);

std::vector<std::string> SplitString(const std::string& s, char sep);

// Percent-decodes %XX escapes; '+' becomes a space when plusAsSpace is set.
std::string UrlDecode(const std::string& s, bool plusAsSpace = true);

// Value of `key` in an "a=1&b=2" query (a leading '?' is skipped), percent-decoded.
// Empty when absent.
std::string ExtractQueryParam(const std::string& query, const std::string& key);

} // namespace common
} // namespace edgelog
