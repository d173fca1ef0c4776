#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace delve {

/// JSON-backed configuration with dot-notation key paths
/// (e.g. "pathfinding.allow_diagonals"). Missing keys and type mismatches
/// fall back to the caller-supplied default.
class Config {
public:
    /// Load configuration from a JSON file. Returns false if the file
    /// cannot be read or parsed; the current data is kept on failure.
    bool loadFromFile(const std::string& path);

    /// Load configuration from a JSON string (useful for testing).
    bool loadFromString(const std::string& jsonStr);

    /// Merge another JSON file on top of the current configuration.
    /// Keys present in the overlay win; other keys are preserved.
    bool mergeFromFile(const std::string& path);

    /// Merge a JSON string on top of the current configuration.
    bool mergeFromString(const std::string& jsonStr);

    std::string getString(const std::string& key, const std::string& defaultVal = "") const;
    int         getInt(const std::string& key, int defaultVal = 0) const;
    float       getFloat(const std::string& key, float defaultVal = 0.0f) const;
    bool        getBool(const std::string& key, bool defaultVal = false) const;

    bool hasKey(const std::string& key) const;

    const nlohmann::json& raw() const { return m_data; }

private:
    const nlohmann::json* resolve(const std::string& key) const;
    bool mergeParsed(const nlohmann::json& overlay);

    /// Recursively merge `overlay` into `base`; objects merge key by key,
    /// everything else replaces outright.
    static void mergeJson(nlohmann::json& base, const nlohmann::json& overlay);

    nlohmann::json m_data = nlohmann::json::object();
};

} // namespace delve
