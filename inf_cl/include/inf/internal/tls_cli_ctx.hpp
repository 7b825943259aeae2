/*
 * Part of the Infinity client (INF) project.
 *
 * SPDX-FileCopyrightText: 2025 Infinity client contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of the Infinity client (INF). See LICENSE for details.
 */

#pragma once
#include <openssl/ssl.h>
#include <string>
#include "inf/log.hpp"
#include "inf/transport.hpp"

namespace inf::internal {

// Minimal TLS client context. Loads system CA or custom CA, sets
// verification and (optionally) mTLS client certificate.
class TlsClientContext {
public:
    TlsClientContext(const inf::TransportConfig& cfg, LogSink* errorlog);
    ~TlsClientContext();

    SSL_CTX* ctx() const { return _ctx; }

    // non-copyable
    TlsClientContext(const TlsClientContext&) = delete;
    TlsClientContext& operator=(const TlsClientContext&) = delete;

private:
    SSL_CTX* _ctx = nullptr;
    LogSink* _log = nullptr;
    void log_last_error(const char* where);
};

// Drain the OpenSSL error queue into one line, "a; b; c".
std::string openssl_errors();

} // namespace inf::internal
