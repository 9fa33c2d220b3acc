/**
 * @file config.cpp
 * @brief Config implementation
 */

#include <marginalia/core/config.hpp>

#include <fstream>
#include <sstream>

namespace marginalia {

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

Result<void> Config::loadFromFile(const std::string& configFile, bool merge) {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        MARGINALIA_LOG_DEBUG("Failed to open config file: {}", configFile);
        return Err(ErrorCode::FileNotFound, "Failed to open config file: " + configFile);
    }

    nlohmann::json newConfig;
    try {
        file >> newConfig;
    } catch (const nlohmann::json::exception& e) {
        MARGINALIA_LOG_DEBUG("Failed to parse config file: {} - {}", configFile, e.what());
        return Err(ErrorCode::ParseError,
            "Failed to parse config file " + configFile + ": " + e.what());
    }

    auto result = loadFromJson(newConfig, merge);
    if (result.ok()) {
        MARGINALIA_LOG_INFO("Configuration loaded from file: {}", configFile);
    }
    return result;
}

Result<void> Config::loadFromJson(const nlohmann::json& json, bool merge) {
    if (!json.is_object()) {
        return Err(ErrorCode::InvalidArgument,
            std::string("Configuration must be a JSON object, got ") + json.type_name());
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (merge) {
        m_config.merge_patch(json);
    } else {
        m_config = json;
    }
    return Ok();
}

bool Config::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return find(key) != nullptr;
}

nlohmann::json Config::toJson() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_config;
}

void Config::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = nlohmann::json::object();
}

std::vector<std::string> Config::splitKey(const std::string& key) {
    std::vector<std::string> segments;
    std::stringstream ss(key);
    std::string segment;

    while (std::getline(ss, segment, '.')) {
        if (!segment.empty()) {
            segments.push_back(segment);
        }
    }
    return segments;
}

const nlohmann::json* Config::find(const std::string& key) const {
    const auto segments = splitKey(key);
    if (segments.empty()) {
        return nullptr;
    }

    const nlohmann::json* current = &m_config;
    for (const auto& seg : segments) {
        if (!current->is_object()) {
            return nullptr;
        }
        auto it = current->find(seg);
        if (it == current->end()) {
            return nullptr;
        }
        current = &*it;
    }
    return current;
}

nlohmann::json& Config::slot(const std::string& key) {
    nlohmann::json* current = &m_config;
    for (const auto& seg : splitKey(key)) {
        if (!current->is_object()) {
            *current = nlohmann::json::object();
        }
        current = &(*current)[seg];
    }
    return *current;
}

} // namespace marginalia
