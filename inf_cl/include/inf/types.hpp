/*
 * Part of the Infinity client (INF) project.
 *
 * SPDX-FileCopyrightText: 2025 Infinity client contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of the Infinity client (INF). See LICENSE for details.
 */

#pragma once
#include <string>
#include <utility>

namespace inf {

// Error identifiers. The set is flat: callers switch on Error::id.
namespace err_id {
inline constexpr const char* kMissingCredentials = "missing_credentials";
inline constexpr const char* kMissingArg         = "missing_arg";
inline constexpr const char* kBadUrl             = "bad_url";
inline constexpr const char* kHttpError          = "http_error";
inline constexpr const char* kUrlParse           = "url_parse_error";
inline constexpr const char* kJson               = "json_error";
inline constexpr const char* kTransport          = "transport_error";
inline constexpr const char* kIo                 = "io_error";
} // namespace err_id

// Error returned by every fallible call of the library, local or remote.
struct Error {
    std::string id;       // machine-readable, one of err_id::*
    std::string details;  // human-readable

    Error() = default;
    Error(std::string i, std::string d) : id(std::move(i)), details(std::move(d)) {}

    bool empty() const { return id.empty(); }
    std::string to_string() const { return id + ": " + details; }
};

} // namespace inf
