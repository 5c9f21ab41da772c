/**
 * @file config_manager.h
 * @brief Centralized Configuration Management
 *
 * Provides access to environment variables with explicit overrides.
 * Features:
 * - Environment variable access with defaults
 * - Type-safe configuration retrieval
 * - Thread-safe singleton pattern
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace uln {
namespace config {

/**
 * @brief Configuration Manager (Singleton)
 */
class ConfigManager {
private:
    std::map<std::string, std::string> config_;
    mutable std::mutex mutex_;

    static std::unique_ptr<ConfigManager> instance_;
    static std::once_flag initFlag_;

    ConfigManager();

    std::optional<std::string> lookup(const std::string& key) const;

public:
    /**
     * @brief Get singleton instance
     */
    static ConfigManager& getInstance();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * @brief Get string configuration value
     * @param key Configuration key
     * @param defaultValue Default value if key not found
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Get boolean configuration value
     *
     * Accepts true/false, 1/0, yes/no, on/off (case-insensitive).
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    /**
     * @brief Check if configuration key exists
     */
    bool has(const std::string& key) const;

    /**
     * @brief Set configuration value (overrides environment)
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @brief Remove an override
     */
    void unset(const std::string& key);

    /**
     * @brief Load known keys from environment
     */
    void loadFromEnvironment();

    /**
     * @brief Get environment variable
     */
    static std::string getEnv(const std::string& key, const std::string& defaultValue = "");

    /// @name Predefined Configuration Keys
    static constexpr const char* LOG_LEVEL = "ULN_LOG_LEVEL";
    static constexpr const char* LOG_TO_FILE = "ULN_LOG_TO_FILE";
    static constexpr const char* LOG_FILE = "ULN_LOG_FILE";

    /// @name Defaults
    static constexpr const char* DEFAULT_LOG_LEVEL = "info";
    static constexpr const char* DEFAULT_LOG_FILE = "uln-check.log";
};

} // namespace config
} // namespace uln
