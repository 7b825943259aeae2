/*
 * Part of the Infinity client (INF) project.
 *
 * SPDX-FileCopyrightText: 2025 Infinity client contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of the Infinity client (INF). See LICENSE for details.
 */

#pragma once
#include <functional>
#include <memory>
#include <string>
#include "inf/log.hpp"
#include "inf/transport.hpp"
#include "inf/types.hpp"

namespace inf {

inline constexpr const char* kDefaultUrl      = "https://api.cylance.com/apiv2/";
inline constexpr const char* kAuthHeader      = "X-IAUTH";
inline constexpr const char* kGzipContentType = "application/xgzip";

// Per-instance client configuration. Frozen once Client::create succeeds.
struct ClientConfig {
    std::string key;                       // API key, required
    std::string url = kDefaultUrl;         // always ends with '/'
    std::shared_ptr<Transport> transport;  // default_transport() unless replaced
    std::shared_ptr<LogSink> errorlog;     // optional, critical messages
    std::shared_ptr<LogSink> tracelog;     // optional, request/response dumps
};

// One configuration step. Returns false and fills err to abort construction.
using Option = std::function<bool(ClientConfig&, Error&)>;

Error missing_credentials_error();

// Fails with missing_credentials when key is empty.
Option set_key(std::string key);

// Empty selects kDefaultUrl. Fails with url_parse_error on a malformed URL and
// bad_url when the scheme is not http or https. A trailing '/' is appended
// when missing.
Option set_url(std::string url);

// Null selects default_transport().
Option set_transport(std::shared_ptr<Transport> transport);

Option set_error_log(std::shared_ptr<LogSink> sink);
Option set_trace_log(std::shared_ptr<LogSink> sink);

} // namespace inf
