#include "ingest/common/Config.h"
#include "ingest/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace ingest {
namespace common {

std::string IniConfig::Trim(const std::string& s) {
    auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
    auto start = std::find_if_not(s.begin(), s.end(), isSpace);
    auto end = std::find_if_not(s.rbegin(), s.rend(), isSpace).base();
    return (start < end) ? std::string(start, end) : std::string();
}

bool IniConfig::ParseInto(std::istream& in, std::map<std::string, Section>* out) {
    std::string line, section = "global";
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = Trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[' && line.back() == ']') {
            section = Trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto delimiterPos = line.find('=');
        if (delimiterPos == std::string::npos) {
            LOG_WARN << "IniConfig: ignoring line " << lineNo << " without '=': " << line;
            continue;
        }
        std::string key = Trim(line.substr(0, delimiterPos));
        std::string value = Trim(line.substr(delimiterPos + 1));
        if (!key.empty()) (*out)[section][key] = value;
    }
    return !in.bad();
}

bool IniConfig::Load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        LOG_ERROR << "Failed to open config file: " << filename;
        return false;
    }

    std::map<std::string, Section> parsed;
    if (!ParseInto(file, &parsed)) {
        LOG_ERROR << "Failed to read config file: " << filename;
        return false;
    }
    settings_ = std::move(parsed);
    loadedFilename_ = filename;

    LOG_INFO << "Loaded config file: " << filename;
    return true;
}

bool IniConfig::LoadFromString(const std::string& iniText) {
    std::istringstream in(iniText);
    std::map<std::string, Section> parsed;
    if (!ParseInto(in, &parsed)) return false;
    settings_ = std::move(parsed);
    return true;
}

std::optional<std::string> IniConfig::LoadedFilename() const {
    if (loadedFilename_.empty()) return std::nullopt;
    return loadedFilename_;
}

bool IniConfig::HasKey(const std::string& section, const std::string& key) const {
    auto sit = settings_.find(section);
    return sit != settings_.end() && sit->second.count(key) != 0;
}

std::string IniConfig::GetString(const std::string& section, const std::string& key, const std::string& defaultVal) const {
    auto sit = settings_.find(section);
    if (sit == settings_.end()) return defaultVal;
    auto kit = sit->second.find(key);
    if (kit == sit->second.end()) return defaultVal;
    return kit->second;
}

int IniConfig::GetInt(const std::string& section, const std::string& key, int defaultVal) const {
    std::string val = GetString(section, key, "");
    if (val.empty()) return defaultVal;
    try {
        size_t used = 0;
        int v = std::stoi(val, &used);
        if (used != val.size()) return defaultVal;
        return v;
    } catch (const std::exception&) {
        LOG_WARN << "IniConfig: [" << section << "] " << key << " is not an integer: " << val;
        return defaultVal;
    }
}

long long IniConfig::GetInt64(const std::string& section, const std::string& key, long long defaultVal) const {
    std::string val = GetString(section, key, "");
    if (val.empty()) return defaultVal;
    try {
        size_t used = 0;
        long long v = std::stoll(val, &used);
        if (used != val.size()) return defaultVal;
        return v;
    } catch (const std::exception&) {
        LOG_WARN << "IniConfig: [" << section << "] " << key << " is not an integer: " << val;
        return defaultVal;
    }
}

bool IniConfig::GetBool(const std::string& section, const std::string& key, bool defaultVal) const {
    std::string val = GetString(section, key, "");
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (val == "true" || val == "yes" || val == "on" || val == "1") return true;
    if (val == "false" || val == "no" || val == "off" || val == "0") return false;
    return defaultVal;
}

IniConfig::Section IniConfig::GetSection(const std::string& section) const {
    auto sit = settings_.find(section);
    if (sit == settings_.end()) return Section();
    return sit->second;
}

void IniConfig::SetString(const std::string& section, const std::string& key, const std::string& value) {
    if (section.empty() || key.empty()) return;
    settings_[section][key] = value;
}

} // namespace common
} // namespace ingest
