/**
 * @file test_outcome_classifier.cpp
 * @brief Unit tests for combining probe results and expiry verdicts
 */

#include <gtest/gtest.h>
#include <certmon/check/outcome_classifier.h>
#include <certmon/utils/time_utils.h>
#include "test_helpers.h"

using namespace certmon::check;
using namespace test_helpers;
using std::chrono::hours;

class OutcomeClassifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        target_.domain = "svc.example";
        target_.port = 8443;
    }

    CheckTarget target_;
    const TimePoint now_ = certmon::utils::fromUnixTimestamp(1792281600);
};

TEST_F(OutcomeClassifierTest, NetworkErrorPassedThrough) {
    auto outcome = classifyOutcome(target_, ProbeResult::networkError("connect failed: Connection refused"), now_);
    ASSERT_FALSE(outcome.isHealthy());
    EXPECT_EQ(outcome.domain(), "svc.example");
    EXPECT_EQ(outcome.port(), 8443);
    EXPECT_EQ(outcome.reason(), IssueReason::networkError("connect failed: Connection refused"));
}

TEST_F(OutcomeClassifierTest, HandshakeErrorPassedThrough) {
    auto outcome = classifyOutcome(
        target_, ProbeResult::handshakeError("certificate verify failed: self-signed certificate"), now_);
    ASSERT_FALSE(outcome.isHealthy());
    EXPECT_EQ(outcome.reason().kind, IssueKind::HANDSHAKE_ERROR);
    EXPECT_EQ(outcome.reason().detail, "certificate verify failed: self-signed certificate");
}

TEST_F(OutcomeClassifierTest, HealthyCertificate) {
    auto outcome = classifyOutcome(target_, ProbeResult::ok(trustedFacts(now_ + hours(24 * 365))), now_);
    EXPECT_TRUE(outcome.isHealthy());
    EXPECT_EQ(outcome, DomainOutcome::healthy("svc.example", 8443));
}

TEST_F(OutcomeClassifierTest, ExpiredCertificate) {
    auto notAfter = now_ - hours(24);
    auto outcome = classifyOutcome(target_, ProbeResult::ok(trustedFacts(notAfter)), now_);
    ASSERT_FALSE(outcome.isHealthy());
    EXPECT_EQ(outcome.reason(), IssueReason::expired(notAfter));
}

TEST_F(OutcomeClassifierTest, NearExpiryUsesTargetThreshold) {
    auto notAfter = now_ + hours(24 * 20);

    target_.expiryThreshold = std::chrono::hours(24 * 14);
    EXPECT_TRUE(classifyOutcome(target_, ProbeResult::ok(trustedFacts(notAfter)), now_).isHealthy());

    target_.expiryThreshold = std::chrono::hours(24 * 30);
    auto outcome = classifyOutcome(target_, ProbeResult::ok(trustedFacts(notAfter)), now_);
    ASSERT_FALSE(outcome.isHealthy());
    EXPECT_EQ(outcome.reason(), IssueReason::nearExpiry(notAfter, 20));
}

TEST_F(OutcomeClassifierTest, UntrustedChainIsHandshakeError) {
    CertificateFacts facts = trustedFacts(now_ + hours(24 * 365));
    facts.chainTrusted = false;

    auto outcome = classifyOutcome(target_, ProbeResult::ok(facts), now_);
    ASSERT_FALSE(outcome.isHealthy());
    EXPECT_EQ(outcome.reason().kind, IssueKind::HANDSHAKE_ERROR);
}

TEST_F(OutcomeClassifierTest, OkWithoutFactsIsHandshakeError) {
    ProbeResult result;
    result.status = ProbeStatus::OK;

    auto outcome = classifyOutcome(target_, result, now_);
    ASSERT_FALSE(outcome.isHealthy());
    EXPECT_EQ(outcome.reason(), IssueReason::handshakeError("no peer certificate presented"));
}
