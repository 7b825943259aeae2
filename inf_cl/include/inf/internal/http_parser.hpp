/*
 * Part of the Infinity client (INF) project.
 *
 * SPDX-FileCopyrightText: 2025 Infinity client contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of the Infinity client (INF). See LICENSE for details.
 */

#pragma once
#include <map>
#include <string>
#include <unordered_map>

namespace inf::internal {

// Query helpers
std::string url_encode(const std::string& s);
// k1=v1&k2=v2 with keys sorted and RFC 3986 percent-encoding.
std::string canonical_query_sorted(const std::map<std::string,std::string>& params);

// Case-insensitive header lookup in a response-hash (utility)
std::string hdr_ci(const std::unordered_map<std::string,std::string>& H, const char* name);

} // namespace inf::internal
