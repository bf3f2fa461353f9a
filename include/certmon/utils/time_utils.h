/**
 * @file time_utils.h
 * @brief Time and date utilities
 *
 * Provides conversion between OpenSSL ASN1_TIME and std::chrono,
 * plus the ISO 8601 formatting used in reports.
 */

#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <cstdint>
#include <openssl/asn1.h>

namespace certmon {
namespace utils {

/**
 * @brief Convert ASN1_TIME to system_clock time_point
 *
 * Used for certificate validity periods (notBefore, notAfter).
 * Handles both UTCTime and GeneralizedTime encodings.
 *
 * @param asn1Time OpenSSL ASN1_TIME structure (non-owning)
 * @return std::chrono time_point, or std::nullopt on error
 */
std::optional<std::chrono::system_clock::time_point> asn1TimeToTimePoint(
    const ASN1_TIME* asn1Time
);

/**
 * @brief Format time_point as ISO 8601 UTC string
 *
 * Sub-second precision is truncated.
 *
 * @param tp std::chrono time_point
 * @return ISO 8601 string (e.g., "2026-02-02T12:34:56Z")
 */
std::string formatIso8601(const std::chrono::system_clock::time_point& tp);

/**
 * @brief Parse ISO 8601 UTC string ("YYYY-MM-DDTHH:MM:SSZ")
 *
 * @param iso8601 ISO 8601 formatted string
 * @return std::chrono time_point, or std::nullopt on error
 */
std::optional<std::chrono::system_clock::time_point> parseIso8601(
    const std::string& iso8601
);

/**
 * @brief Whole days contained in a duration, rounded toward negative infinity
 *
 * @param d Duration (may be negative)
 * @return floor(d / 24h)
 */
int floorDays(std::chrono::system_clock::duration d);

/**
 * @brief Convert Unix timestamp (seconds since epoch) to time_point
 */
inline std::chrono::system_clock::time_point fromUnixTimestamp(int64_t timestamp) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(timestamp));
}

/**
 * @brief Convert time_point to Unix timestamp (seconds since epoch)
 */
inline int64_t toUnixTimestamp(const std::chrono::system_clock::time_point& tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

} // namespace utils
} // namespace certmon
