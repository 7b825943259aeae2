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
#include <vector>

namespace inf {

struct HttpRequest {
    std::string method;  // upper-case, e.g. "GET"
    std::string url;     // absolute, including the query string
    std::vector<std::pair<std::string, std::string>> headers;  // sent as given, in order
    const std::string* body = nullptr;  // not owned; valid for the duration of Transport::send
};

} // namespace inf
