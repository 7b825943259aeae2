/*
 * Part of the Infinity client (INF) project.
 *
 * SPDX-FileCopyrightText: 2025 Infinity client contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of the Infinity client (INF). See LICENSE for details.
 */

#include "inf/internal/time.hpp"
#include <ctime>
#include <cstdio>

namespace inf {

std::string utc_iso8601_now() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char buf[32]{0};
    const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf, n);
}

std::string format_elapsed(std::chrono::steady_clock::duration d) {
    const double ms = std::chrono::duration_cast<std::chrono::microseconds>(d).count() / 1000.0;
    char buf[32]{0};
    std::snprintf(buf, sizeof(buf), "%.3fms", ms);
    return buf;
}

} // namespace inf
