#pragma once

#include <map>
#include <string>
#include <vector>

namespace edgelog {
namespace common {

// Minimal JSON support for the two shapes the project reads: flat objects
// (log lines, route entries) and arrays of objects (route file). Writing is
// done by callers with JsonQuote()/JsonEscape().
struct JsonValue {
    enum Type { kNull, kBool, kNumber, kString, kObject, kArray };

    Type type{kNull};
    // kString: decoded text. kNumber: number literal as written.
    // kObject/kArray: raw JSON text of the nested value.
    std::string text;
    bool boolean{false};

    bool isString() const { return type == kString; }
};

using JsonObject = std::map<std::string, JsonValue>;

std::string JsonEscape(const std::string& s);
std::string JsonQuote(const std::string& s);

// Parses one JSON object. Nested objects/arrays are kept as raw text.
// Trailing non-whitespace after the closing brace is an error.
bool ParseJsonObject(const std::string& text, JsonObject* out, std::string* err);

// Parses a JSON array whose elements are all objects, returning each element's raw text.
bool SplitJsonObjectArray(const std::string& text, std::vector<std::string>* objects, std::string* err);

// Convenience accessors: empty / default when the key is missing or of another type.
std::string JsonGetString(const JsonObject& obj, const std::string& key);
bool JsonGetBool(const JsonObject& obj, const std::string& key, bool defaultVal = false);

} // namespace common
} // namespace edgelog
