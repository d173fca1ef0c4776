#include "engine/Config.hpp"
#include "engine/Log.hpp"

#include <fstream>
#include <sstream>

namespace delve {

bool Config::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Config: cannot open '{}'", path);
        return false;
    }

    try {
        m_data = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        LOG_ERROR("Config: parse error in '{}': {}", path, e.what());
        return false;
    }
    return true;
}

bool Config::loadFromString(const std::string& jsonStr) {
    try {
        m_data = nlohmann::json::parse(jsonStr);
    } catch (const nlohmann::json::parse_error&) {
        return false;
    }
    return true;
}

bool Config::mergeFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    nlohmann::json overlay;
    try {
        overlay = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        LOG_ERROR("Config: parse error in overlay '{}': {}", path, e.what());
        return false;
    }
    return mergeParsed(overlay);
}

bool Config::mergeFromString(const std::string& jsonStr) {
    nlohmann::json overlay;
    try {
        overlay = nlohmann::json::parse(jsonStr);
    } catch (const nlohmann::json::parse_error&) {
        return false;
    }
    return mergeParsed(overlay);
}

bool Config::mergeParsed(const nlohmann::json& overlay) {
    // Merge into a copy so that m_data is unchanged if mergeJson throws.
    nlohmann::json merged = m_data;
    mergeJson(merged, overlay);
    m_data = std::move(merged);
    return true;
}

// ---------------------------------------------------------------------------
// Key resolution
// ---------------------------------------------------------------------------

const nlohmann::json* Config::resolve(const std::string& key) const {
    const nlohmann::json* current = &m_data;
    std::istringstream stream(key);
    std::string segment;

    while (std::getline(stream, segment, '.')) {
        if (!current->is_object() || !current->contains(segment)) {
            return nullptr;
        }
        current = &(*current)[segment];
    }
    return current;
}

// ---------------------------------------------------------------------------
// Getters
// ---------------------------------------------------------------------------

bool Config::hasKey(const std::string& key) const {
    return resolve(key) != nullptr;
}

std::string Config::getString(const std::string& key, const std::string& defaultVal) const {
    const auto* val = resolve(key);
    if (val && val->is_string()) {
        return val->get<std::string>();
    }
    return defaultVal;
}

int Config::getInt(const std::string& key, int defaultVal) const {
    const auto* val = resolve(key);
    if (val && val->is_number_integer()) {
        return val->get<int>();
    }
    return defaultVal;
}

float Config::getFloat(const std::string& key, float defaultVal) const {
    const auto* val = resolve(key);
    if (val && val->is_number()) {
        return val->get<float>();
    }
    return defaultVal;
}

bool Config::getBool(const std::string& key, bool defaultVal) const {
    const auto* val = resolve(key);
    if (val && val->is_boolean()) {
        return val->get<bool>();
    }
    return defaultVal;
}

// ---------------------------------------------------------------------------
// JSON merge
// ---------------------------------------------------------------------------

void Config::mergeJson(nlohmann::json& base, const nlohmann::json& overlay) {
    if (!overlay.is_object()) {
        base = overlay;
        return;
    }
    if (!base.is_object()) {
        base = nlohmann::json::object();
    }
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        if (it->is_object() && base.contains(it.key()) && base[it.key()].is_object()) {
            mergeJson(base[it.key()], *it);
        } else {
            base[it.key()] = *it;
        }
    }
}

} // namespace delve
