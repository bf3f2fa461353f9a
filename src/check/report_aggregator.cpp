/**
 * @file report_aggregator.cpp
 * @brief Report aggregation implementation
 */

#include "certmon/check/report_aggregator.h"
#include "certmon/utils/time_utils.h"

#include <spdlog/spdlog.h>

namespace certmon::check {

std::string renderReason(const IssueReason& reason) {
    switch (reason.kind) {
        case IssueKind::NETWORK_ERROR:
            return "network error: " + reason.detail;
        case IssueKind::HANDSHAKE_ERROR:
            return "handshake error: " + reason.detail;
        case IssueKind::EXPIRED:
            return "expired (not_after=" + utils::formatIso8601(reason.notAfter) + ")";
        case IssueKind::NEAR_EXPIRY:
            return "expires in " + std::to_string(reason.daysLeft) + " days (not_after=" +
                   utils::formatIso8601(reason.notAfter) + ")";
    }
    return "unknown issue";
}

std::string renderIssueLine(const DomainOutcome& outcome) {
    return outcome.domain() + ": " + renderReason(outcome.reason());
}

Report aggregateReport(const std::vector<DomainOutcome>& outcomes) {
    std::vector<std::string> lines;
    for (const auto& outcome : outcomes) {
        if (!outcome.isHealthy()) {
            lines.push_back(renderIssueLine(outcome));
        }
    }

    if (lines.empty()) {
        spdlog::info("[ReportAggregator] All {} domain(s) healthy", outcomes.size());
        return Report::valid();
    }

    std::string message = "Found " + std::to_string(lines.size()) + " issues.";
    for (const auto& line : lines) {
        message += "\n";
        message += line;
    }

    spdlog::info("[ReportAggregator] {} of {} domain(s) have issues", lines.size(), outcomes.size());
    return Report::invalid(std::move(message));
}

} // namespace certmon::check
