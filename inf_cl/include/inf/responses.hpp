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
#include <nlohmann/json_fwd.hpp>

namespace inf {

// Envelope present in every per-key entry returned by the service.
struct Common {
    std::string status;
    float status_code = 0;
    std::string error;
};

struct QueryResponse : Common {
    float general_score = 0;
    std::string confirm_code;                  // set when the service wants the file
    std::map<std::string, float> classifiers;  // per-classifier score, if requested
};

struct UploadResponse : Common {};

// Keyed by hash (query) or by the service's file key (upload).
using QueryResult  = std::map<std::string, QueryResponse>;
using UploadResult = std::map<std::string, UploadResponse>;

// Field names match the wire format ("statuscode", "generalscore" ...). Lookup
// is case-insensitive; missing or null fields keep their defaults.
void from_json(const nlohmann::json& j, Common& c);
void from_json(const nlohmann::json& j, QueryResponse& r);
void from_json(const nlohmann::json& j, UploadResponse& r);

void to_json(nlohmann::json& j, const Common& c);
void to_json(nlohmann::json& j, const QueryResponse& r);
void to_json(nlohmann::json& j, const UploadResponse& r);

} // namespace inf
