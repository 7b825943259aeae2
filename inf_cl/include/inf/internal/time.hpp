/*
 * Part of the Infinity client (INF) project.
 *
 * SPDX-FileCopyrightText: 2025 Infinity client contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of the Infinity client (INF). See LICENSE for details.
 */

#pragma once
#include <chrono>
#include <string>

namespace inf {
// Return current UTC timestamp in strict ISO8601 "YYYY-MM-DDTHH:MM:SSZ".
std::string utc_iso8601_now();

// "12.345ms" style rendering of a steady_clock interval.
std::string format_elapsed(std::chrono::steady_clock::duration d);
} // namespace inf
