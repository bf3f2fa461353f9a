/**
 * @file types.h
 * @brief Common types for the certificate check engine
 *
 * Every sum type here is a tagged struct: an enum discriminator plus the
 * payload fields that are meaningful for that tag. Consumers switch over
 * the enum without a default so that adding a variant is a compile warning
 * everywhere it is not handled.
 *
 * @author SmartCore Inc.
 * @date 2026-09-16
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace certmon::check {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

constexpr uint16_t DEFAULT_PORT = 443;
constexpr std::chrono::seconds DEFAULT_EXPIRY_THRESHOLD{14 * 24 * 3600};

/// @brief One configured domain to check
struct CheckTarget {
    std::string domain;
    uint16_t port = DEFAULT_PORT;
    std::chrono::seconds expiryThreshold = DEFAULT_EXPIRY_THRESHOLD;
    int lineNumber = 0;  ///< 1-based line in the source text (0 if built in code)

    /// "domain:port", used in logs and network error details
    std::string endpoint() const { return domain + ":" + std::to_string(port); }
};

/// @brief Facts extracted from the leaf certificate of one handshake
struct CertificateFacts {
    TimePoint notBefore{};
    TimePoint notAfter{};
    std::string subjectIdentity;  ///< Subject CN, or full subject DN if no CN
    bool chainTrusted = false;    ///< Peer chain verified against the trust store
};

// --- Probe result ---

/// @brief Probe outcome category
enum class ProbeStatus {
    OK,               ///< Handshake completed, facts available
    NETWORK_ERROR,    ///< DNS, TCP connect or timeout
    HANDSHAKE_ERROR   ///< TLS layer rejected the peer or the protocol
};

/// @brief Result of a single TLS probe
struct ProbeResult {
    ProbeStatus status = ProbeStatus::NETWORK_ERROR;
    std::optional<CertificateFacts> facts;  ///< Set iff status == OK
    std::string error;                      ///< Set iff status != OK

    static ProbeResult ok(CertificateFacts facts) {
        ProbeResult r;
        r.status = ProbeStatus::OK;
        r.facts = std::move(facts);
        return r;
    }

    static ProbeResult networkError(std::string detail) {
        ProbeResult r;
        r.status = ProbeStatus::NETWORK_ERROR;
        r.error = std::move(detail);
        return r;
    }

    static ProbeResult handshakeError(std::string detail) {
        ProbeResult r;
        r.status = ProbeStatus::HANDSHAKE_ERROR;
        r.error = std::move(detail);
        return r;
    }
};

// --- Issue reason ---

/// @brief Issue category
enum class IssueKind {
    NETWORK_ERROR,    ///< Transient: DNS, connect, timeout
    HANDSHAKE_ERROR,  ///< Certificate or protocol rejected by the TLS layer
    EXPIRED,          ///< notAfter is in the past
    NEAR_EXPIRY       ///< Still valid, but within the expiry threshold
};

/**
 * @brief Why a domain is not healthy
 *
 * Payload by kind:
 *   - NETWORK_ERROR, HANDSHAKE_ERROR: detail
 *   - EXPIRED: notAfter
 *   - NEAR_EXPIRY: notAfter, daysLeft
 */
struct IssueReason {
    IssueKind kind = IssueKind::NETWORK_ERROR;
    std::string detail;
    TimePoint notAfter{};
    int daysLeft = 0;

    static IssueReason networkError(std::string detail) {
        IssueReason r;
        r.kind = IssueKind::NETWORK_ERROR;
        r.detail = std::move(detail);
        return r;
    }

    static IssueReason handshakeError(std::string detail) {
        IssueReason r;
        r.kind = IssueKind::HANDSHAKE_ERROR;
        r.detail = std::move(detail);
        return r;
    }

    static IssueReason expired(TimePoint notAfter) {
        IssueReason r;
        r.kind = IssueKind::EXPIRED;
        r.notAfter = notAfter;
        return r;
    }

    static IssueReason nearExpiry(TimePoint notAfter, int daysLeft) {
        IssueReason r;
        r.kind = IssueKind::NEAR_EXPIRY;
        r.notAfter = notAfter;
        r.daysLeft = daysLeft;
        return r;
    }

    bool operator==(const IssueReason& other) const {
        return kind == other.kind && detail == other.detail &&
               notAfter == other.notAfter && daysLeft == other.daysLeft;
    }
    bool operator!=(const IssueReason& other) const { return !(*this == other); }
};

/// @brief Convert IssueKind to its stable wire name
inline std::string issueKindToString(IssueKind k) {
    switch (k) {
        case IssueKind::NETWORK_ERROR:   return "NETWORK_ERROR";
        case IssueKind::HANDSHAKE_ERROR: return "HANDSHAKE_ERROR";
        case IssueKind::EXPIRED:         return "EXPIRED";
        case IssueKind::NEAR_EXPIRY:     return "NEAR_EXPIRY";
    }
    return "UNKNOWN";
}

/// @brief Parse a wire name produced by issueKindToString
inline std::optional<IssueKind> issueKindFromString(const std::string& s) {
    if (s == "NETWORK_ERROR") return IssueKind::NETWORK_ERROR;
    if (s == "HANDSHAKE_ERROR") return IssueKind::HANDSHAKE_ERROR;
    if (s == "EXPIRED") return IssueKind::EXPIRED;
    if (s == "NEAR_EXPIRY") return IssueKind::NEAR_EXPIRY;
    return std::nullopt;
}

// --- Domain outcome ---

/**
 * @brief Final per-target verdict: Healthy, or Issue(domain, reason)
 *
 * Constructed only through healthy()/issue() so that reason() is present
 * exactly when the outcome is an issue.
 */
class DomainOutcome {
public:
    static DomainOutcome healthy(std::string domain, uint16_t port = DEFAULT_PORT) {
        return DomainOutcome(std::move(domain), port, std::nullopt);
    }

    static DomainOutcome issue(std::string domain, uint16_t port, IssueReason reason) {
        return DomainOutcome(std::move(domain), port, std::move(reason));
    }

    bool isHealthy() const { return !reason_.has_value(); }
    const std::string& domain() const { return domain_; }
    uint16_t port() const { return port_; }

    /// @pre !isHealthy()
    const IssueReason& reason() const { return *reason_; }

    bool operator==(const DomainOutcome& other) const {
        return domain_ == other.domain_ && port_ == other.port_ && reason_ == other.reason_;
    }
    bool operator!=(const DomainOutcome& other) const { return !(*this == other); }

private:
    DomainOutcome(std::string domain, uint16_t port, std::optional<IssueReason> reason)
        : domain_(std::move(domain)), port_(port), reason_(std::move(reason)) {}

    std::string domain_;
    uint16_t port_;
    std::optional<IssueReason> reason_;
};

// --- Report ---

/// @brief Report variant
enum class ReportStatus {
    VALID,    ///< Every outcome is Healthy
    INVALID   ///< At least one Issue; message is non-empty
};

/**
 * @brief The single aggregated result of one invocation
 */
class Report {
public:
    static Report valid() { return Report(ReportStatus::VALID, ""); }

    /// @throws std::invalid_argument if message is empty
    static Report invalid(std::string message);

    ReportStatus status() const { return status_; }
    bool isValid() const { return status_ == ReportStatus::VALID; }

    /// Aggregated issue text; empty for VALID
    const std::string& message() const { return message_; }

    bool operator==(const Report& other) const {
        return status_ == other.status_ && message_ == other.message_;
    }
    bool operator!=(const Report& other) const { return !(*this == other); }

private:
    Report(ReportStatus status, std::string message)
        : status_(status), message_(std::move(message)) {}

    ReportStatus status_;
    std::string message_;
};

inline Report Report::invalid(std::string message) {
    if (message.empty()) {
        throw std::invalid_argument("Report::invalid: message cannot be empty");
    }
    return Report(ReportStatus::INVALID, std::move(message));
}

// --- Check run ---

/// @brief Per-invocation record of every outcome, in target order
struct CheckRun {
    std::string runId;
    TimePoint checkedAt{};
    std::vector<DomainOutcome> outcomes;
};

} // namespace certmon::check
