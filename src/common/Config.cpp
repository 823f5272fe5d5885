#include "backend/common/Config.h"
#include "backend/common/Logger.h"
#include <fstream>
#include <algorithm>
#include <sstream>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace backend {
namespace common {

Config& Config::Instance() {
    static Config instance;
    return instance;
}

std::string Config::Trim(const std::string& s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto start = std::find_if(s.begin(), s.end(), notSpace);
    auto end = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    return (start < end) ? std::string(start, end) : std::string();
}

bool Config::Parse(std::istream& in, Settings* out) {
    std::string line, section = "global";
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = Trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[') {
            if (line.back() != ']' || line.size() < 3) {
                LOG_ERROR << "Config: malformed section header at line " << lineNo << ": " << line;
                return false;
            }
            section = Trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto delimiterPos = line.find('=');
        if (delimiterPos == std::string::npos) {
            LOG_ERROR << "Config: expected key = value at line " << lineNo << ": " << line;
            return false;
        }
        std::string key = Trim(line.substr(0, delimiterPos));
        std::string value = Trim(line.substr(delimiterPos + 1));
        // Trailing comment after the value.
        auto hash = value.find(" #");
        if (hash != std::string::npos) value = Trim(value.substr(0, hash));
        if (key.empty()) {
            LOG_ERROR << "Config: empty key at line " << lineNo;
            return false;
        }
        (*out)[section][key] = value;
    }
    return true;
}

bool Config::Load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        LOG_ERROR << "Failed to open config file: " << filename;
        return false;
    }

    Settings parsed;
    if (!Parse(file, &parsed)) {
        LOG_ERROR << "Failed to parse config file: " << filename;
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_ = std::move(parsed);
        loadedFilename_ = filename;
    }
    LOG_INFO << "Loaded config file: " << filename;
    return true;
}

bool Config::LoadFromString(const std::string& iniText) {
    std::istringstream in(iniText);
    Settings parsed;
    if (!Parse(in, &parsed)) return false;

    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = std::move(parsed);
    return true;
}

void Config::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.clear();
    loadedFilename_.clear();
}

void Config::SetString(const std::string& section, const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_[section][key] = value;
}

bool Config::Has(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto sit = settings_.find(section);
    return sit != settings_.end() && sit->second.count(key) != 0;
}

std::optional<std::string> Config::LoadedFilename() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (loadedFilename_.empty()) return std::nullopt;
    return loadedFilename_;
}

std::string Config::GetString(const std::string& section, const std::string& key, const std::string& defaultVal) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto sit = settings_.find(section);
    if (sit != settings_.end()) {
        auto kit = sit->second.find(key);
        if (kit != sit->second.end()) {
            return kit->second;
        }
    }
    return defaultVal;
}

bool Config::LookupInt(const std::string& section, const std::string& key, int* out) const {
    const std::string val = GetString(section, key, "");
    if (val.empty()) return !Has(section, key);
    char* endp = nullptr;
    errno = 0;
    const long v = std::strtol(val.c_str(), &endp, 10);
    if (endp == val.c_str() || *endp != '\0' || errno == ERANGE ||
        v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        return false;
    }
    *out = static_cast<int>(v);
    return true;
}

bool Config::LookupDouble(const std::string& section, const std::string& key, double* out) const {
    const std::string val = GetString(section, key, "");
    if (val.empty()) return !Has(section, key);
    char* endp = nullptr;
    errno = 0;
    const double v = std::strtod(val.c_str(), &endp);
    if (endp == val.c_str() || *endp != '\0' || errno == ERANGE || !std::isfinite(v)) {
        return false;
    }
    *out = v;
    return true;
}

int Config::GetInt(const std::string& section, const std::string& key, int defaultVal) const {
    int v = defaultVal;
    if (!LookupInt(section, key, &v)) {
        LOG_WARN << "Config: [" << section << "] " << key << " = " << GetString(section, key)
                 << " is not an int, using " << defaultVal;
        return defaultVal;
    }
    return v;
}

double Config::GetDouble(const std::string& section, const std::string& key, double defaultVal) const {
    double v = defaultVal;
    if (!LookupDouble(section, key, &v)) {
        LOG_WARN << "Config: [" << section << "] " << key << " = " << GetString(section, key)
                 << " is not a number, using " << defaultVal;
        return defaultVal;
    }
    return v;
}

} // namespace common
} // namespace backend
