/**
 * @file config_manager.cpp
 * @brief Process-wide configuration lookup
 */

#include "certmon/common/config_manager.h"
#include "certmon/common/exceptions.h"
#include "certmon/utils/string_utils.h"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <spdlog/spdlog.h>

namespace certmon::common {

std::unique_ptr<ConfigManager> ConfigManager::instance_;
std::once_flag ConfigManager::initFlag_;

ConfigManager& ConfigManager::getInstance() {
    std::call_once(initFlag_, []() {
        instance_.reset(new ConfigManager());
    });
    return *instance_;
}

std::optional<std::string> ConfigManager::lookup(const std::string& key) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = explicit_.find(key);
        if (it != explicit_.end()) {
            return it->second;
        }
    }
    if (const char* env = std::getenv(key.c_str())) {
        return std::string(env);
    }
    return std::nullopt;
}

std::string ConfigManager::getString(const std::string& key, const std::string& defaultValue) const {
    return lookup(key).value_or(defaultValue);
}

int ConfigManager::getInt(const std::string& key, int defaultValue) const {
    auto raw = lookup(key);
    if (!raw) {
        return defaultValue;
    }

    std::string value = utils::trim(*raw);
    if (value.empty()) {
        return defaultValue;
    }

    bool negative = value[0] == '-';
    std::string digits = negative || value[0] == '+' ? value.substr(1) : value;
    if (!utils::isDigits(digits)) {
        throw ConfigException(key + " is not an integer: '" + *raw + "'");
    }

    errno = 0;
    long parsed = std::strtol(value.c_str(), nullptr, 10);
    if (errno == ERANGE || parsed < INT_MIN || parsed > INT_MAX) {
        throw ConfigException(key + " is out of range: '" + *raw + "'");
    }
    return static_cast<int>(parsed);
}

void ConfigManager::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    explicit_[key] = value;
    spdlog::debug("[ConfigManager] {} = {}", key, value);
}

void ConfigManager::unset(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    explicit_.erase(key);
}

} // namespace certmon::common
