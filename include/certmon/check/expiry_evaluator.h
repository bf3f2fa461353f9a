/**
 * @file expiry_evaluator.h
 * @brief Time-based certificate validity evaluation
 *
 * Pure functions: the reference time is always passed in, never read from
 * the system clock.
 */

#pragma once

#include <chrono>

#include "types.h"

namespace certmon::check {

/// @brief Expiry verdict category
enum class ExpiryStatus {
    HEALTHY,      ///< notAfter - now >= threshold
    NEAR_EXPIRY,  ///< now <= notAfter and notAfter - now < threshold
    EXPIRED       ///< now > notAfter
};

/// @brief Result of evaluating one certificate's upper validity bound
struct ExpiryVerdict {
    ExpiryStatus status = ExpiryStatus::HEALTHY;
    TimePoint notAfter{};
    int daysLeft = 0;  ///< floor((notAfter - now) / 1 day); meaningful for NEAR_EXPIRY
};

/**
 * @brief Evaluate notAfter against a threshold
 *
 * Only the upper bound is inspected; a notBefore in the future is the TLS
 * layer's concern. The threshold comparison is strict: a certificate with
 * exactly `threshold` remaining is HEALTHY, and one expiring at exactly
 * `now` is NEAR_EXPIRY with daysLeft == 0.
 *
 * @param facts Certificate facts from a successful probe
 * @param threshold Near-expiry window
 * @param now Reference time
 * @return Verdict
 */
ExpiryVerdict evaluateExpiry(const CertificateFacts& facts,
                             std::chrono::seconds threshold,
                             TimePoint now);

} // namespace certmon::check
