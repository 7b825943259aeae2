/*
 * Part of the Infinity client (INF) project.
 *
 * SPDX-FileCopyrightText: 2025 Infinity client contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of the Infinity client (INF). See LICENSE for details.
 */

#include "inf/client_config.hpp"
#include "inf/log.hpp"
#include "inf/internal/url.hpp"
#include "inf/internal/utils.hpp"

#include <utility>

namespace inf {

Error missing_credentials_error() {
    return Error{err_id::kMissingCredentials, "You must provide the Infinity API key"};
}

Option set_key(std::string key) {
    return [key = std::move(key)](ClientConfig& c, Error& err) {
        if (key.empty()) {
            err = missing_credentials_error();
            log_line(c.errorlog, "[CLIENT] " + err.to_string());
            return false;
        }
        c.key = key;
        return true;
    };
}

Option set_url(std::string url) {
    return [url = std::move(url)](ClientConfig& c, Error& err) {
        std::string raw = url.empty() ? std::string(kDefaultUrl) : url;
        internal::Url u;
        if (!internal::parse_url(raw, u, err)) {
            log_line(c.errorlog, "[CLIENT] Invalid URL [" + raw + "] - " + err.details);
            return false;
        }
        if (u.scheme != "http" && u.scheme != "https") {
            err = Error{err_id::kBadUrl, "Invalid schema specified [" + raw + "]"};
            log_line(c.errorlog, "[CLIENT] " + err.to_string());
            return false;
        }
        if (!internal::ends_with(raw, "/")) raw += "/";
        c.url = raw;
        return true;
    };
}

Option set_transport(std::shared_ptr<Transport> transport) {
    return [transport = std::move(transport)](ClientConfig& c, Error&) {
        c.transport = transport ? transport : default_transport();
        return true;
    };
}

Option set_error_log(std::shared_ptr<LogSink> sink) {
    return [sink = std::move(sink)](ClientConfig& c, Error&) {
        c.errorlog = sink;
        return true;
    };
}

Option set_trace_log(std::shared_ptr<LogSink> sink) {
    return [sink = std::move(sink)](ClientConfig& c, Error&) {
        c.tracelog = sink;
        return true;
    };
}

} // namespace inf
