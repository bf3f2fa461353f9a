/**
 * @file tls_certificate_probe.h
 * @brief OpenSSL-backed certificate probe
 *
 * @author SmartCore Inc.
 * @date 2026-09-23
 */

#pragma once

#include <chrono>
#include <string>

#include <openssl/ssl.h>

#include "certmon/check/providers.h"

namespace certmon::tls {

/// @brief Trust store configuration for the probe
struct TlsProbeOptions {
    std::string caFile;                  ///< Extra PEM trust anchors, empty for none
    bool useDefaultVerifyPaths = true;   ///< Load the system trust store
    bool tolerateExpiredLeaf = true;     ///< Let an expired leaf through so it is reported as EXPIRED
};

/**
 * @brief Performs a full TLS client handshake and extracts leaf facts
 *
 * The peer chain is verified during the handshake against the configured
 * trust store, with the target domain as the expected host name (or IP
 * address for IP literals). Any verification failure is reported as
 * HANDSHAKE_ERROR; DNS, connect and timeout failures as NETWORK_ERROR.
 *
 * With tolerateExpiredLeaf, the only error accepted is an expired leaf
 * certificate (depth 0); its facts are returned and the expiry check
 * classifies it. Expired intermediates are still rejected.
 *
 * One SSL_CTX is shared by all probes; probe() is safe to call from
 * several threads at once.
 */
class TlsCertificateProbe : public check::ICertificateProbe {
public:
    /**
     * @brief Constructor
     * @param options Trust store configuration
     * @throws common::ConfigException if the CA file cannot be loaded
     * @throws common::CertMonException if the TLS context cannot be created
     */
    explicit TlsCertificateProbe(TlsProbeOptions options = {});
    ~TlsCertificateProbe() override;

    TlsCertificateProbe(const TlsCertificateProbe&) = delete;
    TlsCertificateProbe& operator=(const TlsCertificateProbe&) = delete;

    check::ProbeResult probe(const check::CheckTarget& target,
                             std::chrono::milliseconds timeout) override;

private:
    TlsProbeOptions options_;
    SSL_CTX* ctx_;
};

} // namespace certmon::tls
