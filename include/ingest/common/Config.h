#pragma once

#include <iosfwd>
#include <string>
#include <map>
#include <optional>

namespace ingest {
namespace common {

// INI reader: "[section]" headers, "key = value" lines, '#' and ';' comments.
// Keys before the first section land in "global".
class IniConfig {
public:
    using Section = std::map<std::string, std::string>;

    IniConfig() = default;

    bool Load(const std::string& filename);
    bool LoadFromString(const std::string& iniText);

    std::optional<std::string> LoadedFilename() const;

    bool HasKey(const std::string& section, const std::string& key) const;

    // Get value as string, return default if not found
    std::string GetString(const std::string& section, const std::string& key, const std::string& defaultVal = "") const;

    // Unparseable numbers fall back to the default.
    int GetInt(const std::string& section, const std::string& key, int defaultVal = 0) const;
    long long GetInt64(const std::string& section, const std::string& key, long long defaultVal = 0) const;

    // Accepts true/false, yes/no, on/off, 1/0 (case-insensitive).
    bool GetBool(const std::string& section, const std::string& key, bool defaultVal = false) const;

    // Whole section; empty when absent.
    Section GetSection(const std::string& section) const;

    void SetString(const std::string& section, const std::string& key, const std::string& value);

private:
    static std::string Trim(const std::string& s);
    static bool ParseInto(std::istream& in, std::map<std::string, Section>* out);

    std::map<std::string, Section> settings_;
    std::string loadedFilename_;
};

} // namespace common
} // namespace ingest
