/*
 * Part of the Infinity client (INF) project.
 *
 * SPDX-FileCopyrightText: 2025 Infinity client contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of the Infinity client (INF). See LICENSE for details.
 */

#pragma once
#include <cstdint>
#include <string>
#include "inf/types.hpp"

namespace inf::internal {

struct Url {
    std::string scheme;     // lower-cased, may be empty
    std::string host;       // IPv6 literals without brackets
    std::uint16_t port = 0; // 0 when not given
    std::string target;     // path + query, "/" at least when host is set

    // Port to connect to: explicit one, or the scheme default.
    std::uint16_t effective_port() const;
    // "host" or "host:port" as sent in the Host header.
    std::string host_header() const;
};

// Split an absolute or relative URL. Fails with url_parse_error on control
// characters, bad percent escapes, bad ports or an invalid scheme.
bool parse_url(const std::string& raw, Url& out, Error& err);

} // namespace inf::internal
