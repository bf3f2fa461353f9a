/**
 * @file report_aggregator.h
 * @brief Folds per-domain outcomes into the two-variant Report
 */

#pragma once

#include <string>
#include <vector>

#include "types.h"

namespace certmon::check {

/**
 * @brief Render an issue reason as report text
 *
 * Examples:
 *   - "network error: connection refused"
 *   - "handshake error: certificate verify failed: certificate has expired"
 *   - "expired (not_after=2026-10-17T00:00:00Z)"
 *   - "expires in 5 days (not_after=2026-10-23T00:00:00Z)"
 */
std::string renderReason(const IssueReason& reason);

/**
 * @brief Render one issue line: "{domain}: {reason}"
 * @pre !outcome.isHealthy()
 */
std::string renderIssueLine(const DomainOutcome& outcome);

/**
 * @brief Fold outcomes into a Report
 *
 * All healthy (including no outcomes at all) yields Report::valid().
 * Otherwise the message is "Found N issues." followed by one line per
 * issue, in the order of `outcomes`.
 */
Report aggregateReport(const std::vector<DomainOutcome>& outcomes);

} // namespace certmon::check
