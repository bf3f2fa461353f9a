/**
 * @file expiry_evaluator.cpp
 * @brief Expiry evaluation implementation
 */

#include "certmon/check/expiry_evaluator.h"
#include "certmon/utils/time_utils.h"

namespace certmon::check {

ExpiryVerdict evaluateExpiry(const CertificateFacts& facts,
                             std::chrono::seconds threshold,
                             TimePoint now) {
    ExpiryVerdict verdict;
    verdict.notAfter = facts.notAfter;

    if (now > facts.notAfter) {
        verdict.status = ExpiryStatus::EXPIRED;
        return verdict;
    }

    auto remaining = facts.notAfter - now;
    verdict.daysLeft = utils::floorDays(remaining);

    if (remaining < threshold) {
        verdict.status = ExpiryStatus::NEAR_EXPIRY;
    } else {
        verdict.status = ExpiryStatus::HEALTHY;
    }
    return verdict;
}

} // namespace certmon::check
