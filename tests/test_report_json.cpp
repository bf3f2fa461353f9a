/**
 * @file test_report_json.cpp
 * @brief Unit tests for Report and status document JSON
 */

#include <gtest/gtest.h>
#include <certmon/report/report_json.h>
#include <certmon/common/exceptions.h>
#include <certmon/utils/time_utils.h>

using namespace certmon::check;
using namespace certmon::report;
using certmon::common::ReportFormatException;
using certmon::utils::fromUnixTimestamp;

namespace {

// 2026-10-17T00:00:00Z
const TimePoint YESTERDAY = fromUnixTimestamp(1792195200);
// 2026-10-23T00:00:00Z
const TimePoint NEXT_WEEK = fromUnixTimestamp(1792713600);

} // namespace

// ============================================================================
// Report
// ============================================================================

TEST(ReportJsonTest, ValidReportWireForm) {
    EXPECT_EQ(reportToJson(Report::valid()), "{\"Valid\":null}");
}

TEST(ReportJsonTest, InvalidReportWireForm) {
    Report report = Report::invalid("Found 1 issues.\nexpired.example: expired (not_after=2026-10-17T00:00:00Z)");
    EXPECT_EQ(reportToJson(report),
              "{\"Invalid\":\"Found 1 issues.\\nexpired.example: expired (not_after=2026-10-17T00:00:00Z)\"}");
}

TEST(ReportJsonTest, ParseValid) {
    EXPECT_EQ(reportFromJson("{\"Valid\":null}"), Report::valid());
    EXPECT_EQ(reportFromJson("  { \"Valid\" : null }\n"), Report::valid());
}

TEST(ReportJsonTest, ParseInvalidRestoresNewlines) {
    Report report = reportFromJson("{\"Invalid\":\"Found 1 issues.\\na.example: network error: timeout\"}");
    ASSERT_FALSE(report.isValid());
    EXPECT_EQ(report.message(), "Found 1 issues.\na.example: network error: timeout");
}

TEST(ReportJsonTest, ParseRejectsOtherShapes) {
    EXPECT_THROW(reportFromJson("not json"), ReportFormatException);
    EXPECT_THROW(reportFromJson("[]"), ReportFormatException);
    EXPECT_THROW(reportFromJson("{}"), ReportFormatException);
    EXPECT_THROW(reportFromJson("{\"Valid\":true}"), ReportFormatException);
    EXPECT_THROW(reportFromJson("{\"Invalid\":\"\"}"), ReportFormatException);
    EXPECT_THROW(reportFromJson("{\"Invalid\":42}"), ReportFormatException);
    EXPECT_THROW(reportFromJson("{\"Valid\":null,\"Invalid\":\"x\"}"), ReportFormatException);
    EXPECT_THROW(reportFromJson("{\"Unknown\":null}"), ReportFormatException);
}

// ============================================================================
// Status entries
// ============================================================================

TEST(ReportJsonTest, HealthyEntry) {
    Json::Value entry = outcomeToJson(DomainOutcome::healthy("good.example", 8443));
    EXPECT_EQ(entry["domain"].asString(), "good.example");
    EXPECT_EQ(entry["port"].asInt(), 8443);
    EXPECT_TRUE(entry["valid"].asBool());
    EXPECT_TRUE(entry["error"].isNull());
    EXPECT_FALSE(entry.isMember("kind"));
}

TEST(ReportJsonTest, ExpiredEntry) {
    Json::Value entry = outcomeToJson(DomainOutcome::issue("old.example", 443, IssueReason::expired(YESTERDAY)));
    EXPECT_FALSE(entry["valid"].asBool());
    EXPECT_EQ(entry["error"].asString(), "expired (not_after=2026-10-17T00:00:00Z)");
    EXPECT_EQ(entry["kind"].asString(), "EXPIRED");
    EXPECT_EQ(entry["not_after"].asString(), "2026-10-17T00:00:00Z");
}

TEST(ReportJsonTest, NearExpiryEntry) {
    Json::Value entry = outcomeToJson(
        DomainOutcome::issue("soon.example", 443, IssueReason::nearExpiry(NEXT_WEEK, 5)));
    EXPECT_EQ(entry["kind"].asString(), "NEAR_EXPIRY");
    EXPECT_EQ(entry["days_left"].asInt(), 5);
    EXPECT_EQ(entry["not_after"].asString(), "2026-10-23T00:00:00Z");
}

TEST(ReportJsonTest, EntriesRebuildEveryKind) {
    std::vector<DomainOutcome> outcomes = {
        DomainOutcome::healthy("a.example"),
        DomainOutcome::issue("b.example", 443, IssueReason::networkError("connect timed out")),
        DomainOutcome::issue("c.example", 993, IssueReason::handshakeError("wrong version number")),
        DomainOutcome::issue("d.example", 443, IssueReason::expired(YESTERDAY)),
        DomainOutcome::issue("e.example", 443, IssueReason::nearExpiry(NEXT_WEEK, 5)),
    };
    for (const auto& outcome : outcomes) {
        EXPECT_EQ(outcomeFromJson(outcomeToJson(outcome)), outcome) << outcome.domain();
    }
}

TEST(ReportJsonTest, EntryMissingFieldsRejected) {
    Json::Value entry(Json::objectValue);
    EXPECT_THROW(outcomeFromJson(entry), ReportFormatException);

    entry["domain"] = "x.example";
    EXPECT_THROW(outcomeFromJson(entry), ReportFormatException);  // no "valid"

    entry["valid"] = false;
    EXPECT_THROW(outcomeFromJson(entry), ReportFormatException);  // no "kind"

    entry["kind"] = "EXPIRED";
    EXPECT_THROW(outcomeFromJson(entry), ReportFormatException);  // no "not_after"

    entry["not_after"] = "yesterday";
    EXPECT_THROW(outcomeFromJson(entry), ReportFormatException);

    entry["kind"] = "MELTED";
    EXPECT_THROW(outcomeFromJson(entry), ReportFormatException);

    entry["kind"] = "NETWORK_ERROR";
    entry["detail"] = "timeout";
    entry["port"] = 70000;
    EXPECT_THROW(outcomeFromJson(entry), ReportFormatException);
}

TEST(ReportJsonTest, PortDefaultsWhenAbsent) {
    Json::Value entry(Json::objectValue);
    entry["domain"] = "x.example";
    entry["valid"] = true;
    EXPECT_EQ(outcomeFromJson(entry), DomainOutcome::healthy("x.example", 443));
}

// ============================================================================
// Status documents
// ============================================================================

TEST(ReportJsonTest, CheckRunDocument) {
    CheckRun run;
    run.runId = "8d2f4a1e-1111-4222-8333-444455556666";
    run.checkedAt = fromUnixTimestamp(1792281600);
    run.outcomes = {
        DomainOutcome::healthy("good.example"),
        DomainOutcome::issue("expired.example", 443, IssueReason::expired(YESTERDAY)),
    };

    std::string json = checkRunToJson(run);
    EXPECT_NE(json.find("\"req_id\""), std::string::npos);
    EXPECT_NE(json.find("2026-10-18T00:00:00Z"), std::string::npos);

    CheckRun parsed = checkRunFromJson(json);
    EXPECT_EQ(parsed.runId, run.runId);
    EXPECT_EQ(parsed.checkedAt, run.checkedAt);
    EXPECT_EQ(parsed.outcomes, run.outcomes);
    EXPECT_EQ(statusesFromJson(json), run.outcomes);
}

TEST(ReportJsonTest, StatusesOnlyDocument) {
    auto outcomes = statusesFromJson(
        "{\"statuses\":["
        "{\"domain\":\"a.example\",\"valid\":true,\"error\":null},"
        "{\"domain\":\"b.example\",\"port\":8443,\"valid\":false,\"kind\":\"HANDSHAKE_ERROR\","
        "\"detail\":\"certificate verify failed: unable to get local issuer certificate\"}"
        "]}");

    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_TRUE(outcomes[0].isHealthy());
    EXPECT_EQ(outcomes[1].port(), 8443);
    EXPECT_EQ(outcomes[1].reason(),
              IssueReason::handshakeError("certificate verify failed: unable to get local issuer certificate"));
}

TEST(ReportJsonTest, MalformedDocumentsRejected) {
    EXPECT_THROW(statusesFromJson("{"), ReportFormatException);
    EXPECT_THROW(statusesFromJson("[]"), ReportFormatException);
    EXPECT_THROW(statusesFromJson("{\"statuses\":{}}"), ReportFormatException);
    EXPECT_THROW(statusesFromJson("{\"checked_at\":\"now\",\"statuses\":[]}"), ReportFormatException);
    EXPECT_THROW(statusesFromJson("{\"statuses\":[42]}"), ReportFormatException);
}

TEST(ReportJsonTest, EmptyStatusesDocument) {
    EXPECT_TRUE(statusesFromJson("{\"statuses\":[]}").empty());
}
