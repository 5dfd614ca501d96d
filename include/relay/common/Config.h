#pragma once

#include <string>
#include <map>
#include <mutex>
#include <optional>
#include "relay/common/noncopyable.h"

namespace relay {
namespace common {

// Process-wide INI settings: "[section]" headers, "key = value" lines, '#'/';' comments.
// Keys before the first header belong to "global".
class Config : noncopyable {
public:
    static Config& Instance();

    bool Load(const std::string& filename);
    // Parse INI text into in-memory settings (does not change loaded filename).
    bool LoadFromString(const std::string& iniText);

    void SetString(const std::string& section, const std::string& key, const std::string& value);

    // Returns the last loaded config filename if available.
    std::optional<std::string> LoadedFilename() const;

    // Dump current settings to INI text.
    std::string DumpIni() const;

    // Get value as string, return default if not found
    std::string GetString(const std::string& section, const std::string& key, const std::string& defaultVal = "");
    
    // Get value as int
    int GetInt(const std::string& section, const std::string& key, int defaultVal = 0);

private:
    using SettingsMap = std::map<std::string, std::map<std::string, std::string>>;

    Config() = default;
    static std::string Trim(const std::string& s);
    static void ParseIni(std::istream& in, SettingsMap* out);

    mutable std::mutex mutex_;
    // map<section, map<key, value>>
    SettingsMap settings_;
    std::string loadedFilename_;
};

} // namespace common
} // namespace relay
