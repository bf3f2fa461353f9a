/**
 * @file app_config.h
 * @brief Invocation configuration
 */

#pragma once

#include <string>

#include "certmon/check/check_coordinator.h"
#include "certmon/check/target_parser.h"
#include "certmon/tls/tls_certificate_probe.h"

namespace certmon::service {

struct AppConfig {
    std::string targetsFile;
    int expiryThresholdDays = 14;
    int maxParallel = 8;
    int probeTimeoutSec = 10;
    int deadlineSec = 60;
    int networkRetries = 0;
    std::string caFile;
    std::string reportFile;     // empty: stdout
    std::string statusesFile;   // empty: no status document
    std::string logLevel = "info";
    std::string logFile;

    /**
     * @brief Read every field from ConfigManager (explicit values, then environment)
     * @throws common::ConfigException if a numeric key is not an integer
     */
    void loadFromEnv();

    /**
     * @brief Range-check all fields
     * @throws common::ConfigException naming the first offending key
     */
    void validate() const;

    check::TargetDefaults targetDefaults() const;
    check::CoordinatorOptions coordinatorOptions() const;
    tls::TlsProbeOptions probeOptions() const;
};

} // namespace certmon::service
