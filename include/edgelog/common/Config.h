#pragma once

#include <iosfwd>
#include <string>
#include <map>
#include <mutex>
#include <optional>
#include "edgelog/common/noncopyable.h"

namespace edgelog {
namespace common {

// INI-style settings: [section] headers, "key = value" lines, '#' or ';' comments.
// Keys before the first header land in section "global".
class Config : noncopyable {
public:
    static Config& Instance();

    bool Load(const std::string& filename);
    // Parse INI text into in-memory settings (does not change loaded filename).
    bool LoadFromString(const std::string& iniText);
    void Clear();

    void SetString(const std::string& section, const std::string& key, const std::string& value);

    // Copy environment variable `env` into section/key when it is set and non-empty.
    // Returns true if an override was applied.
    bool ApplyEnvOverride(const std::string& env, const std::string& section, const std::string& key);

    std::optional<std::string> LoadedFilename() const;

    // Get value as string, return default if not found
    std::string GetString(const std::string& section, const std::string& key, const std::string& defaultVal = "") const;

    // Get value as int
    int GetInt(const std::string& section, const std::string& key, int defaultVal = 0) const;

    // Accepts 1/0, true/false, yes/no, on/off (case-insensitive).
    bool GetBool(const std::string& section, const std::string& key, bool defaultVal = false) const;

    // File path setting. Unset or empty yields baseDir/defaultName; a relative
    // value is taken relative to baseDir.
    std::string GetPath(const std::string& section, const std::string& key,
                        const std::string& baseDir, const std::string& defaultName) const;

private:
    Config() = default;
    static std::string Trim(const std::string& s);
    static bool ParseInto(std::istream& in, std::map<std::string, std::map<std::string, std::string>>* out);

    mutable std::mutex mutex_;
    // map<section, map<key, value>>
    std::map<std::string, std::map<std::string, std::string>> settings_;
    std::string loadedFilename_;
};

} // namespace common
} // namespace edgelog
