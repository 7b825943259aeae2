/*
 * Part of the Infinity client (INF) project.
 *
 * SPDX-FileCopyrightText: 2025 Infinity client contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of the Infinity client (INF). See LICENSE for details.
 */

#include "inf/transport.hpp"
#include "inf/log.hpp"

#include "inf/internal/http_low.hpp"
#include "inf/internal/http_parser.hpp"
#include "inf/internal/tls_cli_ctx.hpp"
#include "inf/internal/url.hpp"
#include "inf/internal/utils.hpp"

#include <openssl/ssl.h>
#include <openssl/x509v3.h>
#include <openssl/err.h>

#include <algorithm>
#include <chrono>
#include <climits>
#include <cstring>
#include <limits>
#include <memory>
#include <mutex>
#include <sstream>
#include <strings.h> // strcasecmp

#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <cerrno>
#include <ctime>
#include <fcntl.h>
#include <sys/socket.h>
#include <arpa/inet.h>

namespace {

// Returns remaining milliseconds until deadline, clamped to [0, INT_MAX].
[[nodiscard]] inline int remaining_ms(std::chrono::steady_clock::time_point deadline) noexcept {
    using namespace std::chrono;
    const auto now = steady_clock::now();
    if (now >= deadline) return 0;
    const auto ms = duration_cast<milliseconds>(deadline - now).count();
    if (ms <= 0) return 0;
    if (ms > static_cast<long long>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(ms);
}

[[nodiscard]] bool wait_fd(int fd, short ev, int ms) {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = ev;
    int pr = 0;
    do {
        pr = ::poll(&pfd, 1, ms);
    } while (pr < 0 && errno == EINTR);
    return pr > 0;
}

// TLS handshake that handles WANT_READ/WANT_WRITE within a bounded deadline.
// Works with both blocking and non-blocking sockets.
[[nodiscard]] bool ssl_connect_with_deadline(SSL* ssl, int fd, int timeout_sec, std::string& why) {
    const int effective_timeout = std::max(1, timeout_sec);
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(effective_timeout);

    while (true) {
        ::ERR_clear_error();
        const int rc = ::SSL_connect(ssl);
        if (rc == 1) {
            return true;
        }

        const int ssl_err = ::SSL_get_error(ssl, rc);

        if (ssl_err == SSL_ERROR_WANT_READ || ssl_err == SSL_ERROR_WANT_WRITE) {
            const short ev = (ssl_err == SSL_ERROR_WANT_READ) ? POLLIN : POLLOUT;
            const int ms = remaining_ms(deadline);
            if (ms <= 0 || !wait_fd(fd, ev, ms)) {
                why = "TLS handshake timeout";
                return false;
            }
            continue;
        }

        if (ssl_err == SSL_ERROR_SYSCALL) {
            const int e = errno;
            if (e == EINTR) continue;
            if (e == EAGAIN || e == EWOULDBLOCK) {
                const int ms = remaining_ms(deadline);
                if (ms <= 0 || !wait_fd(fd, POLLIN, ms)) {
                    why = "TLS handshake timeout";
                    return false;
                }
                continue;
            }
            why = std::string("TLS handshake: ") + (e ? std::strerror(e) : "unexpected EOF");
            const std::string ossl = inf::internal::openssl_errors();
            if (!ossl.empty()) why += " (" + ossl + ")";
            return false;
        }

        // Protocol / certificate / other SSL-layer error.
        why = "TLS handshake failed: ssl_error=" + std::to_string(ssl_err);
        const long vr = ::SSL_get_verify_result(ssl);
        if (vr != X509_V_OK) why += std::string(", ") + ::X509_verify_cert_error_string(vr);
        const std::string ossl = inf::internal::openssl_errors();
        if (!ossl.empty()) why += " (" + ossl + ")";
        return false;
    }
}

// Holds SIGPIPE blocked on the calling thread and discards one raised while
// blocked, so a peer reset surfaces as EPIPE instead of killing the process.
class SigpipeBlock {
public:
    SigpipeBlock() {
        sigset_t pipe_set;
        sigemptyset(&pipe_set);
        sigaddset(&pipe_set, SIGPIPE);
        sigset_t pending;
        sigemptyset(&pending);
        _was_pending = (::sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1);
        _blocked = (::pthread_sigmask(SIG_BLOCK, &pipe_set, &_old) == 0);
    }
    ~SigpipeBlock() {
        if (!_blocked) return;
        if (!_was_pending) {
            sigset_t pipe_set;
            sigemptyset(&pipe_set);
            sigaddset(&pipe_set, SIGPIPE);
            sigset_t pending;
            sigemptyset(&pending);
            if (::sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1) {
                const timespec zero{0, 0};
                int rc = 0;
                do {
                    rc = ::sigtimedwait(&pipe_set, nullptr, &zero);
                } while (rc < 0 && errno == EINTR);
            }
        }
        (void)::pthread_sigmask(SIG_SETMASK, &_old, nullptr);
    }

    SigpipeBlock(const SigpipeBlock&) = delete;
    SigpipeBlock& operator=(const SigpipeBlock&) = delete;

private:
    sigset_t _old{};
    bool _blocked = false;
    bool _was_pending = false;
};

// One request's connection: TCP, optionally wrapped in TLS.
struct Conn {
    inf::internal::TcpConn tcp;
    std::unique_ptr<SSL, void(*)(SSL*)> ssl{nullptr, [](SSL* s){ if(s){ if (SSL_is_init_finished(s)) SSL_shutdown(s); SSL_free(s); } }};

    bool write_all(const char* d, std::size_t len) {
        if (!ssl) return tcp.send_all(d, len);
        // SSL_write goes through write(2), which has no MSG_NOSIGNAL.
        SigpipeBlock no_sigpipe;
        std::size_t off = 0;
        while (off < len) {
            const int chunk = (int)std::min<std::size_t>(len - off, INT_MAX);
            int n = SSL_write(ssl.get(), d + off, chunk);
            if (n <= 0) { (void)SSL_get_error(ssl.get(), n); return false; }
            off += (std::size_t)n;
        }
        return true;
    }

    long read_some(char* d, std::size_t len) {
        if (!ssl) return tcp.recv_some(d, len);
        const int n = SSL_read(ssl.get(), d, (int)std::min<std::size_t>(len, INT_MAX));
        if (n > 0) return n;
        const int e = SSL_get_error(ssl.get(), n);
        if (e == SSL_ERROR_ZERO_RETURN) return 0;
        return -1;
    }
};

bool has_header(const inf::HttpRequest& req, const char* name) {
    for (const auto& kv : req.headers) {
        if (strcasecmp(kv.first.c_str(), name) == 0) return true;
    }
    return false;
}

} // namespace

namespace inf {

struct HttpTransport::Impl {
    TransportConfig cfg;
    std::shared_ptr<LogSink> errorlog;

    std::once_flag tls_once;
    std::unique_ptr<internal::TlsClientContext> tls;

    Impl(const TransportConfig& c, std::shared_ptr<LogSink> log)
        : cfg(c), errorlog(std::move(log)) {}

    bool fail(Error& err, const std::string& why) {
        log_line(errorlog, "[HTTP] " + why);
        err = Error{err_id::kTransport, why};
        return false;
    }

    SSL_CTX* tls_ctx() {
        std::call_once(tls_once, [this]{
            tls = std::make_unique<internal::TlsClientContext>(cfg, errorlog.get());
        });
        return tls ? tls->ctx() : nullptr;
    }

    bool start_tls(Conn& conn, const internal::Url& u, std::string& why) {
        SSL_CTX* ctx = tls_ctx();
        if (!ctx) { why = "TLS context not ready"; return false; }

        SSL* s = SSL_new(ctx);
        if (!s) { why = "SSL_new failed: " + internal::openssl_errors(); return false; }
        conn.ssl.reset(s);
        SSL_set_fd(s, conn.tcp.fd());

        const std::string sni = cfg.tls_sni.empty() ? u.host : cfg.tls_sni;
        unsigned char tmp[16];
        const bool is_ipv4 = (::inet_pton(AF_INET, sni.c_str(), tmp) == 1);
        const bool is_ipv6 = (!is_ipv4 && (::inet_pton(AF_INET6, sni.c_str(), tmp) == 1));
        if (!is_ipv4 && !is_ipv6) SSL_set_tlsext_host_name(s, sni.c_str());

        // Chain validation alone does not check the name; configure it explicitly.
        if (cfg.tls_verify_peer) {
            X509_VERIFY_PARAM* param = SSL_get0_param(s);
            if (!param) { why = "SSL_get0_param failed"; return false; }
            if (is_ipv4 || is_ipv6) {
                if (X509_VERIFY_PARAM_set1_ip_asc(param, sni.c_str()) != 1) {
                    why = "X509_VERIFY_PARAM_set1_ip_asc failed";
                    return false;
                }
            } else if (SSL_set1_host(s, sni.c_str()) != 1) {
                why = "SSL_set1_host failed";
                return false;
            }
        }

        const int fd = conn.tcp.fd();
        const int old_flags = ::fcntl(fd, F_GETFL, 0);
        if (old_flags < 0 || ::fcntl(fd, F_SETFL, old_flags | O_NONBLOCK) < 0) {
            why = "fcntl(O_NONBLOCK) failed";
            return false;
        }
        const bool hs_ok = ssl_connect_with_deadline(s, fd, cfg.connect_timeout_sec, why);
        (void)::fcntl(fd, F_SETFL, old_flags);
        if (!hs_ok) return false;

        if (cfg.tls_verify_peer) {
            const long vr = SSL_get_verify_result(s);
            if (vr != X509_V_OK) {
                why = std::string("TLS verify failed: ") + X509_verify_cert_error_string(vr);
                return false;
            }
        }
        return true;
    }
};

HttpTransport::HttpTransport()
    : _p(std::make_unique<Impl>(TransportConfig{}, nullptr)) {}

HttpTransport::HttpTransport(const TransportConfig& cfg, std::shared_ptr<LogSink> errorlog)
    : _p(std::make_unique<Impl>(cfg, std::move(errorlog))) {}

HttpTransport::~HttpTransport() = default;

bool HttpTransport::send(const HttpRequest& req, HttpResponse& out, Error& err) {
    internal::Url u;
    if (!internal::parse_url(req.url, u, err)) return false;
    if (u.scheme != "http" && u.scheme != "https") {
        return _p->fail(err, "unsupported protocol scheme \"" + u.scheme + "\"");
    }
    if (u.host.empty()) return _p->fail(err, "no host in request URL " + req.url);
    if (req.body && !has_header(req, "Content-Length")) {
        return _p->fail(err, "request body without Content-Length");
    }

    Conn conn;
    std::string why;
    if (!conn.tcp.open(u.host, u.effective_port(), _p->cfg.connect_timeout_sec, _p->cfg.io_timeout_sec, why)) {
        return _p->fail(err, why);
    }
    if (u.scheme == "https" && !_p->start_tls(conn, u, why)) {
        return _p->fail(err, why);
    }

    const std::string method = internal::upper_copy(req.method);
    std::ostringstream head;
    head << method << " " << u.target << " HTTP/1.1\r\n";
    head << "Host: " << u.host_header() << "\r\n";
    if (!has_header(req, "User-Agent")) head << "User-Agent: " << _p->cfg.user_agent << "\r\n";
    for (const auto& kv : req.headers) {
        head << kv.first << ": " << kv.second << "\r\n";
    }
    head << "Connection: close\r\n";
    head << "\r\n";

    const std::string h = head.str();
    std::string write_why;
    if (!conn.write_all(h.data(), h.size())) {
        write_why = "write request to " + u.host_header() + " failed";
    } else if (req.body && !req.body->empty() && !conn.write_all(req.body->data(), req.body->size())) {
        write_why = "write request body to " + u.host_header() + " failed";
    }

    // A server may answer (413, 401 ...) and close before taking the whole
    // body; that reply is still the result of the exchange.
    const internal::ReadFn reader = [&conn](char* d, std::size_t len) { return conn.read_some(d, len); };
    if (!internal::read_http_response(reader, method == "HEAD", _p->cfg.max_response_bytes, out, why)) {
        return _p->fail(err, write_why.empty() ? why : write_why);
    }
    if (!write_why.empty()) {
        log_line(_p->errorlog, "[HTTP] " + write_why + "; server replied " + std::to_string(out.status_code));
    }
    return true;
}

std::shared_ptr<Transport> default_transport() {
    static const std::shared_ptr<Transport> t = std::make_shared<HttpTransport>();
    return t;
}

} // namespace inf
