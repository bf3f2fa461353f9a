/**
 * @file outcome_classifier.cpp
 * @brief Outcome classification implementation
 */

#include "certmon/check/outcome_classifier.h"
#include "certmon/check/expiry_evaluator.h"

namespace certmon::check {

DomainOutcome classifyOutcome(const CheckTarget& target, const ProbeResult& result, TimePoint now) {
    switch (result.status) {
        case ProbeStatus::NETWORK_ERROR:
            return DomainOutcome::issue(target.domain, target.port,
                                        IssueReason::networkError(result.error));

        case ProbeStatus::HANDSHAKE_ERROR:
            return DomainOutcome::issue(target.domain, target.port,
                                        IssueReason::handshakeError(result.error));

        case ProbeStatus::OK:
            break;
    }

    if (!result.facts) {
        return DomainOutcome::issue(target.domain, target.port,
                                    IssueReason::handshakeError("no peer certificate presented"));
    }

    const CertificateFacts& facts = *result.facts;
    if (!facts.chainTrusted) {
        return DomainOutcome::issue(target.domain, target.port,
                                    IssueReason::handshakeError("certificate chain not trusted"));
    }

    ExpiryVerdict verdict = evaluateExpiry(facts, target.expiryThreshold, now);
    switch (verdict.status) {
        case ExpiryStatus::HEALTHY:
            return DomainOutcome::healthy(target.domain, target.port);
        case ExpiryStatus::EXPIRED:
            return DomainOutcome::issue(target.domain, target.port,
                                        IssueReason::expired(verdict.notAfter));
        case ExpiryStatus::NEAR_EXPIRY:
            return DomainOutcome::issue(target.domain, target.port,
                                        IssueReason::nearExpiry(verdict.notAfter, verdict.daysLeft));
    }

    return DomainOutcome::issue(target.domain, target.port,
                                IssueReason::handshakeError("unclassified probe result"));
}

} // namespace certmon::check
