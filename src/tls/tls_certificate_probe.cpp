/**
 * @file tls_certificate_probe.cpp
 * @brief OpenSSL-backed certificate probe implementation
 */

#include "certmon/tls/tls_certificate_probe.h"
#include "certmon/common/exceptions.h"
#include "certmon/x509/cert_ops.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <climits>
#include <condition_variable>
#include <cstring>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>

#include <openssl/err.h>
#include <openssl/x509v3.h>
#include <spdlog/spdlog.h>

namespace certmon::tls {

namespace {

using SteadyClock = std::chrono::steady_clock;
using Deadline = SteadyClock::time_point;

/// Owns a socket descriptor
class Socket {
public:
    explicit Socket(int fd = -1) : fd_(fd) {}
    ~Socket() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    Socket(Socket&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    Socket& operator=(Socket&& other) noexcept {
        if (this != &other) {
            if (fd_ >= 0) ::close(fd_);
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    int fd() const { return fd_; }
    explicit operator bool() const { return fd_ >= 0; }

private:
    int fd_;
};

std::string errnoString(int err) {
    char buf[256];
    // GNU strerror_r may return a static string instead of filling buf
    const char* msg = strerror_r(err, buf, sizeof(buf));
    return msg ? std::string(msg) : std::to_string(err);
}

/// Oldest queued OpenSSL error as text; clears the queue
std::string takeSslError() {
    unsigned long err = ERR_get_error();
    ERR_clear_error();
    if (err == 0) return "";

    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return buf;
}

int remainingMs(Deadline deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now()).count();
    if (left <= 0) return 0;
    return left > INT_MAX ? INT_MAX : static_cast<int>(left);
}

/// @return >0 ready, 0 deadline passed, <0 poll error (errno set)
int waitFor(int fd, short events, Deadline deadline) {
    while (true) {
        int timeoutMs = remainingMs(deadline);
        if (timeoutMs == 0) return 0;

        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = events;
        int rc = ::poll(&pfd, 1, timeoutMs);
        if (rc < 0 && errno == EINTR) continue;
        return rc;
    }
}

bool isIpLiteral(const std::string& host) {
    unsigned char buf[sizeof(in6_addr)];
    return inet_pton(AF_INET, host.c_str(), buf) == 1 ||
           inet_pton(AF_INET6, host.c_str(), buf) == 1;
}

using AddressList = std::unique_ptr<addrinfo, decltype(&freeaddrinfo)>;

/// One getaddrinfo call, shared by the caller and the resolver thread
struct Resolution {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;       // guarded by mutex
    bool abandoned = false;  // guarded by mutex; the resolver frees the result
    int rc = 0;
    addrinfo* result = nullptr;
};

/**
 * getaddrinfo bounded by the deadline. The lookup runs on a detached thread
 * that touches only its Resolution; a result arriving after the caller gave
 * up is freed there without logging.
 */
AddressList resolve(const std::string& host, uint16_t port, Deadline deadline, std::string& error) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;
    const std::string service = std::to_string(port);

    auto state = std::make_shared<Resolution>();
    try {
        std::thread([state, host, service, hints]() {
            addrinfo* res = nullptr;
            int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);

            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->abandoned) {
                if (rc == 0) freeaddrinfo(res);
                return;
            }
            state->rc = rc;
            state->result = res;
            state->done = true;
            state->cv.notify_all();
        }).detach();
    } catch (const std::system_error& e) {
        error = std::string("dns lookup failed: ") + e.what();
        return AddressList(nullptr, &freeaddrinfo);
    }

    std::unique_lock<std::mutex> lock(state->mutex);
    if (!state->cv.wait_until(lock, deadline, [&state] { return state->done; })) {
        state->abandoned = true;
        error = "dns lookup timed out";
        return AddressList(nullptr, &freeaddrinfo);
    }
    if (state->rc != 0) {
        error = "dns lookup failed: " + std::string(gai_strerror(state->rc));
        return AddressList(nullptr, &freeaddrinfo);
    }
    return AddressList(state->result, &freeaddrinfo);
}

/**
 * Resolve and connect with a non-blocking socket, trying each address in
 * turn. On failure returns an invalid Socket and sets error.
 */
Socket connectTcp(const std::string& host, uint16_t port, Deadline deadline, std::string& error) {
    AddressList addresses = resolve(host, port, deadline, error);
    if (!addresses) {
        return Socket();
    }

    std::string lastError = "no usable address";
    for (addrinfo* ai = addresses.get(); ai != nullptr; ai = ai->ai_next) {
        if (remainingMs(deadline) == 0) {
            error = "connect timed out";
            return Socket();
        }

        Socket sock(::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol));
        if (!sock) {
            lastError = "socket failed: " + errnoString(errno);
            continue;
        }

        int flags = fcntl(sock.fd(), F_GETFL, 0);
        if (flags < 0 || fcntl(sock.fd(), F_SETFL, flags | O_NONBLOCK) < 0) {
            lastError = "fcntl failed: " + errnoString(errno);
            continue;
        }

        if (::connect(sock.fd(), ai->ai_addr, ai->ai_addrlen) == 0) {
            return sock;
        }
        if (errno != EINPROGRESS) {
            lastError = "connect failed: " + errnoString(errno);
            continue;
        }

        int ready = waitFor(sock.fd(), POLLOUT, deadline);
        if (ready == 0) {
            error = "connect timed out";
            return Socket();
        }
        if (ready < 0) {
            lastError = "poll failed: " + errnoString(errno);
            continue;
        }

        int soError = 0;
        socklen_t len = sizeof(soError);
        if (getsockopt(sock.fd(), SOL_SOCKET, SO_ERROR, &soError, &len) < 0) {
            soError = errno;
        }
        if (soError == 0) {
            return sock;
        }
        lastError = "connect failed: " + errnoString(soError);
    }

    error = lastError;
    return Socket();
}

int verifyAllowExpiredLeaf(int preverifyOk, X509_STORE_CTX* storeCtx) {
    if (preverifyOk) return 1;

    if (X509_STORE_CTX_get_error_depth(storeCtx) == 0 &&
        X509_STORE_CTX_get_error(storeCtx) == X509_V_ERR_CERT_HAS_EXPIRED) {
        X509_STORE_CTX_set_error(storeCtx, X509_V_OK);
        return 1;
    }
    return 0;
}

} // namespace

TlsCertificateProbe::TlsCertificateProbe(TlsProbeOptions options)
    : options_(std::move(options))
    , ctx_(SSL_CTX_new(TLS_client_method()))
{
    if (!ctx_) {
        throw common::CertMonException("SSL_CTX_new failed: " + takeSslError());
    }

    SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER,
                       options_.tolerateExpiredLeaf ? verifyAllowExpiredLeaf : nullptr);

    if (options_.useDefaultVerifyPaths && SSL_CTX_set_default_verify_paths(ctx_) != 1) {
        spdlog::warn("[TlsCertificateProbe] Failed to load default trust store: {}", takeSslError());
    }

    if (!options_.caFile.empty()) {
        if (SSL_CTX_load_verify_locations(ctx_, options_.caFile.c_str(), nullptr) != 1) {
            std::string reason = takeSslError();
            SSL_CTX_free(ctx_);
            throw common::ConfigException("cannot load CA file '" + options_.caFile + "': " + reason);
        }
        spdlog::info("[TlsCertificateProbe] Loaded CA file: {}", options_.caFile);
    }
}

TlsCertificateProbe::~TlsCertificateProbe() {
    SSL_CTX_free(ctx_);
}

check::ProbeResult TlsCertificateProbe::probe(const check::CheckTarget& target,
                                              std::chrono::milliseconds timeout) {
    ERR_clear_error();
    Deadline deadline = SteadyClock::now() + timeout;
    const std::string endpoint = target.endpoint();

    std::unique_ptr<SSL, decltype(&SSL_free)> ssl(SSL_new(ctx_), &SSL_free);
    if (!ssl) {
        return check::ProbeResult::handshakeError("SSL_new failed: " + takeSslError());
    }

    int hostSet = 0;
    if (isIpLiteral(target.domain)) {
        hostSet = X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(ssl.get()), target.domain.c_str());
    } else if (SSL_set_tlsext_host_name(ssl.get(), target.domain.c_str()) == 1) {
        hostSet = SSL_set1_host(ssl.get(), target.domain.c_str());
    }
    if (hostSet != 1) {
        std::string detail = takeSslError();
        spdlog::warn("[TlsCertificateProbe] {}: cannot set expected host: {}", endpoint, detail);
        return check::ProbeResult::handshakeError("cannot set expected host");
    }

    std::string error;
    Socket sock = connectTcp(target.domain, target.port, deadline, error);
    if (!sock) {
        spdlog::debug("[TlsCertificateProbe] {}: {}", endpoint, error);
        return check::ProbeResult::networkError(error);
    }

    if (SSL_set_fd(ssl.get(), sock.fd()) != 1) {
        return check::ProbeResult::handshakeError("SSL_set_fd failed: " + takeSslError());
    }

    while (true) {
        int rc = SSL_connect(ssl.get());
        if (rc == 1) break;

        int sslError = SSL_get_error(ssl.get(), rc);
        if (sslError == SSL_ERROR_WANT_READ || sslError == SSL_ERROR_WANT_WRITE) {
            int ready = waitFor(sock.fd(), sslError == SSL_ERROR_WANT_READ ? POLLIN : POLLOUT, deadline);
            if (ready == 0) {
                spdlog::debug("[TlsCertificateProbe] {}: handshake timed out", endpoint);
                return check::ProbeResult::networkError("handshake timed out");
            }
            if (ready < 0) {
                return check::ProbeResult::networkError("poll failed: " + errnoString(errno));
            }
            continue;
        }

        long verifyResult = SSL_get_verify_result(ssl.get());
        if (verifyResult != X509_V_OK) {
            ERR_clear_error();
            std::string detail = std::string("certificate verify failed: ") +
                                 X509_verify_cert_error_string(verifyResult);
            spdlog::debug("[TlsCertificateProbe] {}: {}", endpoint, detail);
            return check::ProbeResult::handshakeError(detail);
        }

        std::string detail = takeSslError();
        if (detail.empty()) {
            detail = sslError == SSL_ERROR_SYSCALL || sslError == SSL_ERROR_ZERO_RETURN
                ? "connection closed during handshake"
                : "handshake failed (ssl error " + std::to_string(sslError) + ")";
        }
        spdlog::debug("[TlsCertificateProbe] {}: {}", endpoint, detail);
        return check::ProbeResult::handshakeError(detail);
    }

    bool chainTrusted = SSL_get_verify_result(ssl.get()) == X509_V_OK;
    x509::CertificatePtr cert(SSL_get_peer_certificate(ssl.get()));

    SSL_set_quiet_shutdown(ssl.get(), 1);
    SSL_shutdown(ssl.get());

    if (!cert) {
        return check::ProbeResult::handshakeError("no peer certificate presented");
    }

    auto facts = x509::extractCertificateFacts(cert.get(), chainTrusted);
    if (!facts) {
        return check::ProbeResult::handshakeError("certificate validity period could not be parsed");
    }

    spdlog::debug("[TlsCertificateProbe] {}: subject={}, issuer={}, trusted={}, sha256={}",
                  endpoint, facts->subjectIdentity, x509::getIssuerDn(cert.get()),
                  chainTrusted, x509::getCertificateFingerprint(cert.get()));
    return check::ProbeResult::ok(std::move(*facts));
}

} // namespace certmon::tls
