#include "edgelog/common/Json.h"

#include <cstdint>

namespace edgelog {
namespace common {

namespace {

class JsonReader {
public:
    explicit JsonReader(const std::string& text) : s_(text) {}

    bool ReadObject(JsonObject* out) {
        SkipWs();
        if (!Expect('{')) return false;
        SkipWs();
        if (Peek() == '}') {
            ++pos_;
            return true;
        }
        while (true) {
            SkipWs();
            std::string key;
            if (!ReadString(&key)) return false;
            SkipWs();
            if (!Expect(':')) return false;
            SkipWs();
            JsonValue v;
            if (!ReadValue(&v)) return false;
            (*out)[key] = std::move(v);
            SkipWs();
            if (Peek() == ',') {
                ++pos_;
                continue;
            }
            return Expect('}');
        }
    }

    bool ReadObjectArray(std::vector<std::string>* objects) {
        SkipWs();
        if (!Expect('[')) return false;
        SkipWs();
        if (Peek() == ']') {
            ++pos_;
            return true;
        }
        while (true) {
            SkipWs();
            if (Peek() != '{') return Fail("array element is not an object");
            const size_t start = pos_;
            if (!SkipContainer()) return false;
            objects->push_back(s_.substr(start, pos_ - start));
            SkipWs();
            if (Peek() == ',') {
                ++pos_;
                continue;
            }
            return Expect(']');
        }
    }

    bool AtEnd() {
        SkipWs();
        return pos_ >= s_.size();
    }

    const std::string& error() const { return err_; }
    size_t pos() const { return pos_; }

private:
    char Peek() const { return pos_ < s_.size() ? s_[pos_] : '\0'; }

    void SkipWs() {
        while (pos_ < s_.size() && (s_[pos_] == ' ' || s_[pos_] == '\t' || s_[pos_] == '\r' || s_[pos_] == '\n')) ++pos_;
    }

    bool Fail(const std::string& what) {
        if (err_.empty()) err_ = what + " at offset " + std::to_string(pos_);
        return false;
    }

    bool Expect(char c) {
        if (Peek() != c) return Fail(std::string("expected '") + c + "'");
        ++pos_;
        return true;
    }

    static void AppendUtf8(uint32_t cp, std::string* out) {
        if (cp < 0x80) {
            out->push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out->push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out->push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out->push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out->push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    bool ReadHex4(uint32_t* out) {
        if (pos_ + 4 > s_.size()) return Fail("truncated \\u escape");
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i) {
            const char c = s_[pos_ + i];
            v <<= 4;
            if (c >= '0' && c <= '9') v |= static_cast<uint32_t>(c - '0');
            else if (c >= 'a' && c <= 'f') v |= static_cast<uint32_t>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') v |= static_cast<uint32_t>(c - 'A' + 10);
            else return Fail("bad \\u escape");
        }
        pos_ += 4;
        *out = v;
        return true;
    }

    bool ReadString(std::string* out) {
        if (!Expect('"')) return false;
        while (pos_ < s_.size()) {
            const char c = s_[pos_++];
            if (c == '"') return true;
            if (static_cast<unsigned char>(c) < 0x20) return Fail("control character in string");
            if (c != '\\') {
                out->push_back(c);
                continue;
            }
            if (pos_ >= s_.size()) break;
            const char e = s_[pos_++];
            switch (e) {
                case '"': out->push_back('"'); break;
                case '\\': out->push_back('\\'); break;
                case '/': out->push_back('/'); break;
                case 'b': out->push_back('\b'); break;
                case 'f': out->push_back('\f'); break;
                case 'n': out->push_back('\n'); break;
                case 'r': out->push_back('\r'); break;
                case 't': out->push_back('\t'); break;
                case 'u': {
                    uint32_t cp = 0;
                    if (!ReadHex4(&cp)) return false;
                    if (cp >= 0xD800 && cp <= 0xDBFF && pos_ + 1 < s_.size() && s_[pos_] == '\\' && s_[pos_ + 1] == 'u') {
                        pos_ += 2;
                        uint32_t lo = 0;
                        if (!ReadHex4(&lo)) return false;
                        if (lo >= 0xDC00 && lo <= 0xDFFF) {
                            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                        } else {
                            AppendUtf8(cp, out);
                            cp = lo;
                        }
                    }
                    AppendUtf8(cp, out);
                    break;
                }
                default:
                    return Fail("bad escape");
            }
        }
        return Fail("unterminated string");
    }

    bool ReadNumber(std::string* out) {
        const size_t start = pos_;
        if (Peek() == '-') ++pos_;
        size_t digits = 0;
        while (pos_ < s_.size()) {
            const char c = s_[pos_];
            if ((c >= '0' && c <= '9') || c == '.' || c == 'e' || c == 'E' || c == '+' || c == '-') {
                if (c >= '0' && c <= '9') ++digits;
                ++pos_;
                continue;
            }
            break;
        }
        if (digits == 0) return Fail("bad number");
        out->assign(s_, start, pos_ - start);
        return true;
    }

    bool ReadLiteral(const char* lit) {
        const std::string l(lit);
        if (s_.compare(pos_, l.size(), l) != 0) return Fail("bad literal");
        pos_ += l.size();
        return true;
    }

    // Skips a balanced object or array, honoring strings.
    bool SkipContainer() {
        int depth = 0;
        while (pos_ < s_.size()) {
            const char c = s_[pos_];
            if (c == '"') {
                std::string ignored;
                if (!ReadString(&ignored)) return false;
                continue;
            }
            ++pos_;
            if (c == '{' || c == '[') {
                ++depth;
            } else if (c == '}' || c == ']') {
                --depth;
                if (depth == 0) return true;
                if (depth < 0) return Fail("unbalanced brackets");
            }
        }
        return Fail("unterminated container");
    }

    bool ReadValue(JsonValue* v) {
        const char c = Peek();
        if (c == '"') {
            v->type = JsonValue::kString;
            return ReadString(&v->text);
        }
        if (c == '{' || c == '[') {
            v->type = (c == '{') ? JsonValue::kObject : JsonValue::kArray;
            const size_t start = pos_;
            if (!SkipContainer()) return false;
            v->text = s_.substr(start, pos_ - start);
            return true;
        }
        if (c == 't') {
            v->type = JsonValue::kBool;
            v->boolean = true;
            return ReadLiteral("true");
        }
        if (c == 'f') {
            v->type = JsonValue::kBool;
            v->boolean = false;
            return ReadLiteral("false");
        }
        if (c == 'n') {
            v->type = JsonValue::kNull;
            return ReadLiteral("null");
        }
        v->type = JsonValue::kNumber;
        return ReadNumber(&v->text);
    }

    const std::string& s_;
    size_t pos_{0};
    std::string err_;
};

} // namespace

std::string JsonEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (unsigned char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"': out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    static const char* hex = "0123456789abcdef";
                    out += "\\u00";
                    out.push_back(hex[(c >> 4) & 0xF]);
                    out.push_back(hex[c & 0xF]);
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    return out;
}

std::string JsonQuote(const std::string& s) {
    return "\"" + JsonEscape(s) + "\"";
}

bool ParseJsonObject(const std::string& text, JsonObject* out, std::string* err) {
    JsonReader reader(text);
    JsonObject parsed;
    if (!reader.ReadObject(&parsed)) {
        if (err) *err = reader.error();
        return false;
    }
    if (!reader.AtEnd()) {
        if (err) *err = "trailing data at offset " + std::to_string(reader.pos());
        return false;
    }
    *out = std::move(parsed);
    return true;
}

bool SplitJsonObjectArray(const std::string& text, std::vector<std::string>* objects, std::string* err) {
    JsonReader reader(text);
    std::vector<std::string> parsed;
    if (!reader.ReadObjectArray(&parsed)) {
        if (err) *err = reader.error();
        return false;
    }
    if (!reader.AtEnd()) {
        if (err) *err = "trailing data at offset " + std::to_string(reader.pos());
        return false;
    }
    *objects = std::move(parsed);
    return true;
}

std::string JsonGetString(const JsonObject& obj, const std::string& key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->second.isString()) return {};
    return it->second.text;
}

bool JsonGetBool(const JsonObject& obj, const std::string& key, bool defaultVal) {
    auto it = obj.find(key);
    if (it == obj.end() || it->second.type != JsonValue::kBool) return defaultVal;
    return it->second.boolean;
}

} // namespace common
} // namespace edgelog
