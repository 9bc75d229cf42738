#pragma once

#include <ctime>
#include <string>

namespace edgelog {
namespace common {

// "YYYY-MM-DD HH:MM:SS" in the local time zone.
std::string FormatLocalTime(std::time_t t);
std::string NowLocalString();

// Parses an RFC3339 timestamp ("2024-01-01T00:00:00Z", "...T08:30:00.123+02:00")
// and writes it as local "YYYY-MM-DD HH:MM:SS". Returns false if the text is not RFC3339.
bool Rfc3339ToLocal(const std::string& text, std::string* out);

} // namespace common
} // namespace edgelog
