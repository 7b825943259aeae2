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
#include <unordered_map>

namespace inf {

struct HttpResponse {
    int status_code = 0;
    std::string status_text;
    std::unordered_map<std::string, std::string> headers;
    std::string body;        // de-chunked
};

} // namespace inf
