/**
 * @file exceptions.h
 * @brief Invocation-level exception hierarchy
 *
 * Only faults that invalidate a whole check run are thrown. Per-domain
 * problems (network, handshake, expiry) are carried as DomainOutcome values
 * and never reach these types.
 *
 * @author SmartCore Inc.
 * @date 2026-09-14
 */

#pragma once

#include <stdexcept>
#include <string>

namespace certmon::common {

/**
 * @brief Base exception for all cert-monitor exceptions
 */
class CertMonException : public std::runtime_error {
public:
    explicit CertMonException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Malformed target line or invalid application configuration
 */
class ConfigException : public CertMonException {
public:
    explicit ConfigException(const std::string& message)
        : CertMonException("Configuration error: " + message) {}
};

/**
 * @brief Target list could not be read from its source
 */
class SourceException : public CertMonException {
public:
    explicit SourceException(const std::string& message)
        : CertMonException("Source error: " + message) {}
};

/**
 * @brief Report could not be delivered to its sink
 */
class SinkException : public CertMonException {
public:
    explicit SinkException(const std::string& message)
        : CertMonException("Sink error: " + message) {}
};

/**
 * @brief Report or status document JSON does not have the expected shape
 */
class ReportFormatException : public CertMonException {
public:
    explicit ReportFormatException(const std::string& message)
        : CertMonException("Report format error: " + message) {}
};

} // namespace certmon::common
