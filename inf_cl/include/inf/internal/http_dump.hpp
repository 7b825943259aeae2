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
#include "inf/http_request.hpp"
#include "inf/http_response.hpp"

namespace inf::internal {

// Standard reason phrase for a status code, empty if unknown.
const char* status_text(int code);

// HTTP/1.1 wire rendering of the request line and headers (no body).
std::string dump_request(const HttpRequest& req);

// Status line, headers and, if with_body, the body.
std::string dump_response(const HttpResponse& resp, bool with_body);

} // namespace inf::internal
