/**
 * @file providers.h
 * @brief Collaborator interfaces for infrastructure abstraction
 *
 * These interfaces decouple the check engine from transports:
 *   - ICertificateProbe: TLS handshake (TlsCertificateProbe, test fakes)
 *   - IConfigSource: target list text (FileConfigSource, StringConfigSource)
 *   - IReportSink: report delivery (StreamReportSink, FileReportSink, MemoryReportSink)
 *
 * @author SmartCore Inc.
 * @date 2026-09-16
 */

#pragma once

#include <chrono>
#include <string>

#include "types.h"

namespace certmon::check {

/**
 * @brief Performs one TLS handshake against a target
 *
 * Implementations must be safe to call concurrently from several threads.
 * Per-domain failures are returned as ProbeResult values; an exception
 * escaping probe() is recorded by the coordinator as a NETWORK_ERROR for
 * that target only.
 */
class ICertificateProbe {
public:
    virtual ~ICertificateProbe() = default;

    /**
     * @brief Handshake with target.domain:target.port and extract leaf facts
     * @param target Target to probe
     * @param timeout Upper bound for the whole attempt, name resolution included
     * @return OK with facts, or NETWORK_ERROR / HANDSHAKE_ERROR with detail
     */
    virtual ProbeResult probe(const CheckTarget& target, std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief Supplies the raw target list text
 */
class IConfigSource {
public:
    virtual ~IConfigSource() = default;

    /**
     * @brief Load target list text
     * @throws common::SourceException if the text cannot be obtained
     */
    virtual std::string load() = 0;

    /// @brief Human-readable origin, for logs
    virtual std::string describe() const = 0;
};

/**
 * @brief Receives the final report of an invocation
 */
class IReportSink {
public:
    virtual ~IReportSink() = default;

    /**
     * @brief Deliver the report
     * @throws common::SinkException if delivery fails
     */
    virtual void publish(const Report& report) = 0;
};

} // namespace certmon::check
