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
#include <vector>

namespace inf::internal {

void trim_inplace(std::string& s);
int  hexval(char c);
std::string upper_copy(std::string s);
std::string lower_copy(std::string s);
bool ends_with(const std::string& s, const std::string& suffix);

std::string join(const std::vector<std::string>& parts, char sep);
// Empty items are dropped; items are trimmed.
std::vector<std::string> split(const std::string& s, char sep);

} // namespace inf::internal
