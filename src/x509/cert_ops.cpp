/**
 * @file cert_ops.cpp
 * @brief X.509 certificate operations implementation
 */

#include "certmon/x509/cert_ops.h"
#include "certmon/utils/time_utils.h"

#include <iomanip>
#include <sstream>

#include <openssl/evp.h>
#include <openssl/objects.h>

namespace certmon::x509 {

namespace {

std::string nameToString(X509_NAME* name) {
    if (!name) return "";

    char* text = X509_NAME_oneline(name, nullptr, 0);
    if (!text) return "";
    std::string result(text);
    OPENSSL_free(text);
    return result;
}

} // namespace

// --- DN Extraction ---

std::string getSubjectDn(X509* cert) {
    return cert ? nameToString(X509_get_subject_name(cert)) : "";
}

std::string getIssuerDn(X509* cert) {
    return cert ? nameToString(X509_get_issuer_name(cert)) : "";
}

std::string getSubjectCommonName(X509* cert) {
    if (!cert) return "";

    X509_NAME* name = X509_get_subject_name(cert);
    if (!name) return "";

    int idx = X509_NAME_get_index_by_NID(name, NID_commonName, -1);
    if (idx < 0) return "";

    X509_NAME_ENTRY* entry = X509_NAME_get_entry(name, idx);
    ASN1_STRING* data = entry ? X509_NAME_ENTRY_get_data(entry) : nullptr;
    if (!data) return "";

    unsigned char* utf8 = nullptr;
    int len = ASN1_STRING_to_UTF8(&utf8, data);
    if (len < 0 || !utf8) return "";

    std::string result(reinterpret_cast<char*>(utf8), static_cast<size_t>(len));
    OPENSSL_free(utf8);
    return result;
}

// --- Fingerprint ---

std::string getCertificateFingerprint(X509* cert) {
    if (!cert) return "";

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdLen = 0;

    if (X509_digest(cert, EVP_sha256(), md, &mdLen) != 1) {
        return "";
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < mdLen; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(md[i]);
    }
    return oss.str();
}

// --- Facts ---

std::optional<check::CertificateFacts> extractCertificateFacts(X509* cert, bool chainTrusted) {
    if (!cert) return std::nullopt;

    auto notBefore = utils::asn1TimeToTimePoint(X509_get0_notBefore(cert));
    auto notAfter = utils::asn1TimeToTimePoint(X509_get0_notAfter(cert));
    if (!notBefore || !notAfter) {
        return std::nullopt;
    }

    check::CertificateFacts facts;
    facts.notBefore = *notBefore;
    facts.notAfter = *notAfter;
    facts.subjectIdentity = getSubjectCommonName(cert);
    if (facts.subjectIdentity.empty()) {
        facts.subjectIdentity = getSubjectDn(cert);
    }
    facts.chainTrusted = chainTrusted;
    return facts;
}

} // namespace certmon::x509
