/**
 * @file config_manager.cpp
 * @brief Implementation of Configuration Manager
 */

#include "uln/config/config_manager.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <spdlog/spdlog.h>

namespace uln {
namespace config {

std::unique_ptr<ConfigManager> ConfigManager::instance_ = nullptr;
std::once_flag ConfigManager::initFlag_;

ConfigManager::ConfigManager() {
    loadFromEnvironment();
}

ConfigManager& ConfigManager::getInstance() {
    std::call_once(initFlag_, []() {
        instance_.reset(new ConfigManager());
    });
    return *instance_;
}

std::optional<std::string> ConfigManager::lookup(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = config_.find(key);
    if (it != config_.end()) {
        return it->second;
    }

    if (const char* env = std::getenv(key.c_str())) {
        return std::string(env);
    }
    return std::nullopt;
}

std::string ConfigManager::getString(const std::string& key, const std::string& defaultValue) const {
    return lookup(key).value_or(defaultValue);
}

bool ConfigManager::getBool(const std::string& key, bool defaultValue) const {
    std::string value = getString(key);
    if (value.empty()) {
        return defaultValue;
    }

    std::string lowerValue = value;
    std::transform(lowerValue.begin(), lowerValue.end(), lowerValue.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lowerValue == "true" || lowerValue == "1" || lowerValue == "yes" || lowerValue == "on") {
        return true;
    } else if (lowerValue == "false" || lowerValue == "0" || lowerValue == "no" || lowerValue == "off") {
        return false;
    }

    spdlog::warn("Invalid boolean config '{}': {} (using default: {})",
                 key, value, defaultValue);
    return defaultValue;
}

bool ConfigManager::has(const std::string& key) const {
    return lookup(key).has_value();
}

void ConfigManager::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_[key] = value;
    spdlog::debug("Config set: {} = {}", key, value);
}

void ConfigManager::unset(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.erase(key);
}

void ConfigManager::loadFromEnvironment() {
    for (const char* key : {LOG_LEVEL, LOG_TO_FILE, LOG_FILE}) {
        if (const char* env = std::getenv(key)) {
            set(key, env);
        }
    }
    spdlog::debug("Configuration loaded from environment");
}

std::string ConfigManager::getEnv(const std::string& key, const std::string& defaultValue) {
    const char* env = std::getenv(key.c_str());
    return env ? std::string(env) : defaultValue;
}

} // namespace config
} // namespace uln
