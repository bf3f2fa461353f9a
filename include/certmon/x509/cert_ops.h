/**
 * @file cert_ops.h
 * @brief Leaf certificate inspection for the TLS probe
 *
 * Functions borrow the X509 they are given; only CertificatePtr owns one.
 */

#pragma once

#include <optional>
#include <string>
#include <openssl/x509.h>

#include "certmon/check/types.h"

namespace certmon::x509 {

/**
 * @brief Owning handle for a peer certificate (move-only)
 */
class CertificatePtr {
public:
    explicit CertificatePtr(X509* cert = nullptr) : cert_(cert) {}
    ~CertificatePtr() { X509_free(cert_); }

    CertificatePtr(CertificatePtr&& other) noexcept : cert_(other.release()) {}
    CertificatePtr& operator=(CertificatePtr&& other) noexcept {
        if (this != &other) {
            X509_free(cert_);
            cert_ = other.release();
        }
        return *this;
    }

    CertificatePtr(const CertificatePtr&) = delete;
    CertificatePtr& operator=(const CertificatePtr&) = delete;

    X509* get() const { return cert_; }
    X509* release() {
        X509* cert = cert_;
        cert_ = nullptr;
        return cert;
    }
    explicit operator bool() const { return cert_ != nullptr; }

private:
    X509* cert_;
};

/// Subject name in OpenSSL one-line form ("/O=Example/CN=example.com"), empty for null
std::string getSubjectDn(X509* cert);

/// Issuer name in OpenSSL one-line form, empty for null
std::string getIssuerDn(X509* cert);

/// First subject CN as UTF-8; empty when the subject has none
std::string getSubjectCommonName(X509* cert);

/// Lowercase hex SHA-256 over the DER encoding; empty on failure
std::string getCertificateFingerprint(X509* cert);

/**
 * @brief Validity window and identity of a leaf certificate
 *
 * subjectIdentity is the subject CN, or the one-line subject name when the
 * certificate carries no CN.
 *
 * @param cert Leaf certificate
 * @param chainTrusted Result of chain verification during the handshake
 * @return std::nullopt for a null certificate or an unreadable validity time
 */
std::optional<check::CertificateFacts> extractCertificateFacts(X509* cert, bool chainTrusted);

} // namespace certmon::x509
