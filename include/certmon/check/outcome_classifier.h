/**
 * @file outcome_classifier.h
 * @brief Maps probe and expiry results to one DomainOutcome per target
 */

#pragma once

#include "types.h"

namespace certmon::check {

/**
 * @brief Classify a probe result for a target
 *
 * Probe failures pass through as Issue(NETWORK_ERROR | HANDSHAKE_ERROR).
 * Successful probes are evaluated against target.expiryThreshold at `now`.
 * A successful probe whose chain was not trusted is a HANDSHAKE_ERROR.
 *
 * @param target Target that was probed
 * @param result Probe result
 * @param now Reference time for expiry evaluation
 * @return Outcome carrying target.domain
 */
DomainOutcome classifyOutcome(const CheckTarget& target, const ProbeResult& result, TimePoint now);

} // namespace certmon::check
