/**
 * @file app_config.cpp
 * @brief Invocation configuration
 */

#include "certmon/service/app_config.h"
#include "certmon/common/config_manager.h"
#include "certmon/common/exceptions.h"
#include "certmon/common/logger.h"

namespace certmon::service {

namespace {

constexpr int MAX_THRESHOLD_DAYS = 3650;
constexpr int MAX_PARALLEL = 256;
constexpr int MAX_TIMEOUT_SEC = 3600;
constexpr int MAX_RETRIES = 3;

void requireRange(const char* key, int value, int min, int max) {
    if (value < min || value > max) {
        throw common::ConfigException(std::string(key) + " must be in " + std::to_string(min) +
                                      ".." + std::to_string(max) + ", got " + std::to_string(value));
    }
}

} // namespace

void AppConfig::loadFromEnv() {
    using common::ConfigManager;
    auto& config = ConfigManager::getInstance();

    targetsFile = config.getString(ConfigManager::TARGETS_FILE, targetsFile);
    expiryThresholdDays = config.getInt(ConfigManager::EXPIRY_THRESHOLD_DAYS, expiryThresholdDays);
    maxParallel = config.getInt(ConfigManager::MAX_PARALLEL, maxParallel);
    probeTimeoutSec = config.getInt(ConfigManager::PROBE_TIMEOUT_SEC, probeTimeoutSec);
    deadlineSec = config.getInt(ConfigManager::DEADLINE_SEC, deadlineSec);
    networkRetries = config.getInt(ConfigManager::NETWORK_RETRIES, networkRetries);
    caFile = config.getString(ConfigManager::CA_FILE, caFile);
    reportFile = config.getString(ConfigManager::REPORT_FILE, reportFile);
    statusesFile = config.getString(ConfigManager::STATUSES_FILE, statusesFile);
    logLevel = config.getString(ConfigManager::LOG_LEVEL, logLevel);
    logFile = config.getString(ConfigManager::LOG_FILE, logFile);
}

void AppConfig::validate() const {
    using common::ConfigManager;

    requireRange(ConfigManager::EXPIRY_THRESHOLD_DAYS, expiryThresholdDays, 0, MAX_THRESHOLD_DAYS);
    requireRange(ConfigManager::MAX_PARALLEL, maxParallel, 1, MAX_PARALLEL);
    requireRange(ConfigManager::PROBE_TIMEOUT_SEC, probeTimeoutSec, 1, MAX_TIMEOUT_SEC);
    requireRange(ConfigManager::DEADLINE_SEC, deadlineSec, 1, MAX_TIMEOUT_SEC);
    requireRange(ConfigManager::NETWORK_RETRIES, networkRetries, 0, MAX_RETRIES);

    if (!common::Logger::parseLevel(logLevel)) {
        throw common::ConfigException(std::string(ConfigManager::LOG_LEVEL) + " must be one of "
                                      "trace, debug, info, warn, error, critical, got '" + logLevel + "'");
    }
}

check::TargetDefaults AppConfig::targetDefaults() const {
    check::TargetDefaults defaults;
    defaults.expiryThreshold = std::chrono::hours(24) * expiryThresholdDays;
    return defaults;
}

check::CoordinatorOptions AppConfig::coordinatorOptions() const {
    check::CoordinatorOptions options;
    options.maxParallel = static_cast<size_t>(maxParallel);
    options.probeTimeout = std::chrono::seconds(probeTimeoutSec);
    options.overallDeadline = std::chrono::seconds(deadlineSec);
    options.networkRetries = networkRetries;
    return options;
}

tls::TlsProbeOptions AppConfig::probeOptions() const {
    tls::TlsProbeOptions options;
    options.caFile = caFile;
    return options;
}

} // namespace certmon::service
