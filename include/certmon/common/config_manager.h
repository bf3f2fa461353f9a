/**
 * @file config_manager.h
 * @brief Process-wide configuration lookup
 *
 * A key resolves to, in order: a value given with set() (CLI flags), the
 * environment variable of the same name, the caller's default.
 *
 * @author SmartCore Inc.
 * @date 2026-09-14
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace certmon::common {

/**
 * @brief Configuration Manager (Singleton)
 */
class ConfigManager {
public:
    static ConfigManager& getInstance();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Integer value of key
     * @throws ConfigException if the value is set but is not a whole decimal integer
     */
    int getInt(const std::string& key, int defaultValue = 0) const;

    /// Explicit value; takes precedence over the environment
    void set(const std::string& key, const std::string& value);

    /// Drop an explicit value so the environment or default applies again
    void unset(const std::string& key);

    // Targets
    static constexpr const char* TARGETS_FILE = "CERTMON_TARGETS_FILE";
    static constexpr const char* EXPIRY_THRESHOLD_DAYS = "CERTMON_EXPIRY_THRESHOLD_DAYS";

    // Probing
    static constexpr const char* MAX_PARALLEL = "CERTMON_MAX_PARALLEL";
    static constexpr const char* PROBE_TIMEOUT_SEC = "CERTMON_PROBE_TIMEOUT_SEC";
    static constexpr const char* DEADLINE_SEC = "CERTMON_DEADLINE_SEC";
    static constexpr const char* NETWORK_RETRIES = "CERTMON_NETWORK_RETRIES";
    static constexpr const char* CA_FILE = "CERTMON_CA_FILE";

    // Output
    static constexpr const char* REPORT_FILE = "CERTMON_REPORT_FILE";
    static constexpr const char* STATUSES_FILE = "CERTMON_STATUSES_FILE";
    static constexpr const char* LOG_LEVEL = "LOG_LEVEL";
    static constexpr const char* LOG_FILE = "LOG_FILE";

private:
    ConfigManager() = default;

    std::optional<std::string> lookup(const std::string& key) const;

    std::map<std::string, std::string> explicit_;
    mutable std::mutex mutex_;

    static std::unique_ptr<ConfigManager> instance_;
    static std::once_flag initFlag_;
};

} // namespace certmon::common
