/**
 * @file test_report_aggregator.cpp
 * @brief Unit tests for issue rendering and report folding
 */

#include <gtest/gtest.h>
#include <certmon/check/report_aggregator.h>
#include <certmon/utils/time_utils.h>

using namespace certmon::check;
using certmon::utils::fromUnixTimestamp;

namespace {

// 2026-10-17T00:00:00Z
const TimePoint YESTERDAY = fromUnixTimestamp(1792195200);
// 2026-10-23T00:00:00Z
const TimePoint NEXT_WEEK = fromUnixTimestamp(1792713600);

} // namespace

// ============================================================================
// renderReason
// ============================================================================

TEST(ReportAggregatorTest, RenderNetworkError) {
    EXPECT_EQ(renderReason(IssueReason::networkError("timeout")), "network error: timeout");
}

TEST(ReportAggregatorTest, RenderHandshakeError) {
    EXPECT_EQ(renderReason(IssueReason::handshakeError("certificate verify failed: self-signed certificate")),
              "handshake error: certificate verify failed: self-signed certificate");
}

TEST(ReportAggregatorTest, RenderExpired) {
    EXPECT_EQ(renderReason(IssueReason::expired(YESTERDAY)), "expired (not_after=2026-10-17T00:00:00Z)");
}

TEST(ReportAggregatorTest, RenderNearExpiry) {
    EXPECT_EQ(renderReason(IssueReason::nearExpiry(NEXT_WEEK, 5)),
              "expires in 5 days (not_after=2026-10-23T00:00:00Z)");
}

// ============================================================================
// aggregateReport
// ============================================================================

TEST(ReportAggregatorTest, NoOutcomesIsValid) {
    EXPECT_EQ(aggregateReport({}), Report::valid());
}

TEST(ReportAggregatorTest, AllHealthyIsValid) {
    std::vector<DomainOutcome> outcomes = {
        DomainOutcome::healthy("a.example"),
        DomainOutcome::healthy("b.example", 8443),
    };
    EXPECT_TRUE(aggregateReport(outcomes).isValid());
}

TEST(ReportAggregatorTest, GoodAndExpiredScenario) {
    std::vector<DomainOutcome> outcomes = {
        DomainOutcome::healthy("good.example"),
        DomainOutcome::issue("expired.example", 443, IssueReason::expired(YESTERDAY)),
    };

    Report report = aggregateReport(outcomes);
    ASSERT_FALSE(report.isValid());
    EXPECT_EQ(report.message(),
              "Found 1 issues.\nexpired.example: expired (not_after=2026-10-17T00:00:00Z)");
}

TEST(ReportAggregatorTest, IssuesKeepInputOrder) {
    std::vector<DomainOutcome> outcomes = {
        DomainOutcome::issue("z.example", 443, IssueReason::networkError("timeout")),
        DomainOutcome::healthy("m.example"),
        DomainOutcome::issue("a.example", 443, IssueReason::nearExpiry(NEXT_WEEK, 5)),
        DomainOutcome::issue("k.example", 443, IssueReason::handshakeError("wrong version number")),
    };

    Report report = aggregateReport(outcomes);
    EXPECT_EQ(report.message(),
              "Found 3 issues.\n"
              "z.example: network error: timeout\n"
              "a.example: expires in 5 days (not_after=2026-10-23T00:00:00Z)\n"
              "k.example: handshake error: wrong version number");
}

TEST(ReportAggregatorTest, DuplicateDomainsReportedTwice) {
    std::vector<DomainOutcome> outcomes = {
        DomainOutcome::issue("dup.example", 443, IssueReason::networkError("timeout")),
        DomainOutcome::issue("dup.example", 443, IssueReason::networkError("timeout")),
    };
    EXPECT_EQ(aggregateReport(outcomes).message(),
              "Found 2 issues.\ndup.example: network error: timeout\ndup.example: network error: timeout");
}

TEST(ReportAggregatorTest, SameInputSameReport) {
    std::vector<DomainOutcome> outcomes = {
        DomainOutcome::issue("a.example", 443, IssueReason::expired(YESTERDAY)),
        DomainOutcome::healthy("b.example"),
    };
    EXPECT_EQ(aggregateReport(outcomes), aggregateReport(outcomes));
}

TEST(ReportAggregatorTest, InvalidReportRequiresMessage) {
    EXPECT_THROW(Report::invalid(""), std::invalid_argument);
}
