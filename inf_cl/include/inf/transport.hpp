/*
 * Part of the Infinity client (INF) project.
 *
 * SPDX-FileCopyrightText: 2025 Infinity client contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of the Infinity client (INF). See LICENSE for details.
 */

#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include "inf/http_request.hpp"
#include "inf/http_response.hpp"
#include "inf/log.hpp"
#include "inf/types.hpp"

namespace inf {

// Executes one HTTP exchange. Implementations shared between clients must be
// safe for concurrent send() calls.
class Transport {
public:
    virtual ~Transport() = default;

    // Returns false and fills err when no complete response was received.
    // Any status code (including 4xx/5xx) counts as a received response.
    virtual bool send(const HttpRequest& req, HttpResponse& out, Error& err) = 0;
};

struct TransportConfig {
    // Timeouts
    int connect_timeout_sec = 10;  // TCP connect + TLS handshake
    int io_timeout_sec      = 30;  // per recv/send

    // TLS, used for https:// URLs
    bool tls_verify_peer = true;       // verify server certificate and host name
    std::string tls_ca_file;           // optional CA file path, system store otherwise
    std::string tls_sni;               // optional SNI servername override
    std::string tls_client_cert_file;  // optional mTLS
    std::string tls_client_key_file;   // optional mTLS

    std::string user_agent = "inf-client/1";
    std::size_t max_response_bytes = 64u << 20;
};

// HTTP/1.1 over plain TCP or OpenSSL TLS. One connection per request
// ("Connection: close"); only the SSL_CTX is shared between calls.
class HttpTransport final : public Transport {
public:
    HttpTransport();
    explicit HttpTransport(const TransportConfig& cfg, std::shared_ptr<LogSink> errorlog = nullptr);
    ~HttpTransport() override;

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    bool send(const HttpRequest& req, HttpResponse& out, Error& err) override;

private:
    struct Impl;
    std::unique_ptr<Impl> _p;
};

// Process-wide HttpTransport with default settings, created on first use.
std::shared_ptr<Transport> default_transport();

} // namespace inf
