#pragma once

#include <string>
#include <map>
#include <mutex>
#include <optional>
#include <iosfwd>
#include "backend/common/noncopyable.h"

namespace backend {
namespace common {

// INI-style settings: "[section]" headers, "key = value" lines, '#' or ';' comments.
// Keys outside any section belong to "global".
class Config : noncopyable {
public:
    static Config& Instance();

    bool Load(const std::string& filename);
    // Parse INI text into in-memory settings (does not change loaded filename).
    bool LoadFromString(const std::string& iniText);
    void Clear();

    void SetString(const std::string& section, const std::string& key, const std::string& value);
    bool Has(const std::string& section, const std::string& key) const;

    std::optional<std::string> LoadedFilename() const;

    // Get value as string, return default if not found
    std::string GetString(const std::string& section, const std::string& key, const std::string& defaultVal = "") const;

    // Get value as int, return default if missing, not a number or out of int range
    int GetInt(const std::string& section, const std::string& key, int defaultVal = 0) const;

    double GetDouble(const std::string& section, const std::string& key, double defaultVal = 0.0) const;

    // Strict variants for callers that must reject bad input rather than
    // fall back. A missing key leaves *out alone and returns true; a present
    // key returns false unless the whole value is a number that fits.
    bool LookupInt(const std::string& section, const std::string& key, int* out) const;
    bool LookupDouble(const std::string& section, const std::string& key, double* out) const;

private:
    using Settings = std::map<std::string, std::map<std::string, std::string>>;

    Config() = default;
    static std::string Trim(const std::string& s);
    static bool Parse(std::istream& in, Settings* out);

    mutable std::mutex mutex_;
    // map<section, map<key, value>>
    Settings settings_;
    std::string loadedFilename_;
};

} // namespace common
} // namespace backend
