/**
 * @file config.hpp
 * @brief Process-wide JSON configuration
 *
 * Keys are addressed with dot-separated paths, e.g. "logging.level".
 */

#pragma once

#include <marginalia/core/logger.hpp>
#include <marginalia/core/result.hpp>

#include <nlohmann/json.hpp>

#include <mutex>
#include <string>
#include <vector>

namespace marginalia {

class Config {
public:
    static Config& getInstance();

    /**
     * @brief Load configuration from a JSON file
     *
     * @param configFile Path to the configuration file
     * @param merge Merge into the current configuration (true) or replace it (false)
     * @return FileNotFound if the file cannot be opened, ParseError if it is not JSON
     */
    Result<void> loadFromFile(const std::string& configFile, bool merge = true);

    /**
     * @brief Load configuration from a JSON object
     *
     * @param json Configuration object
     * @param merge Merge (RFC 7386 merge patch) or replace
     * @return InvalidArgument if json is not an object
     */
    Result<void> loadFromJson(const nlohmann::json& json, bool merge = true);

    /**
     * @brief Get a configuration value
     *
     * Returns defaultValue when the key is missing or holds a value
     * that cannot be converted to T.
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        const nlohmann::json* node = find(key);
        if (!node) {
            return defaultValue;
        }

        try {
            return node->get<T>();
        } catch (const nlohmann::json::exception& e) {
            MARGINALIA_LOG_WARN("Config key '{}' has unexpected type, using default: {}", key, e.what());
            return defaultValue;
        }
    }

    /// Set a configuration value, creating intermediate objects as needed
    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        slot(key) = nlohmann::json(value);
    }

    /// Check whether a key is present
    bool has(const std::string& key) const;

    /// Copy of the whole configuration
    nlohmann::json toJson() const;

    /// Drop all configuration
    void clear();

private:
    Config() = default;
    ~Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    static std::vector<std::string> splitKey(const std::string& key);

    /// Caller holds m_mutex. nullptr if any path segment is missing.
    const nlohmann::json* find(const std::string& key) const;

    /// Caller holds m_mutex.
    nlohmann::json& slot(const std::string& key);

    nlohmann::json m_config = nlohmann::json::object();
    mutable std::mutex m_mutex;
};

} // namespace marginalia
