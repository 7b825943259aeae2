/*
 * Part of the Infinity client (INF) project.
 *
 * SPDX-FileCopyrightText: 2025 Infinity client contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of the Infinity client (INF). See LICENSE for details.
 */

#include "inf/responses.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <strings.h> // strcasecmp
#include <utility>

namespace inf {

namespace {

// Exact key first, then a case-insensitive match. Null counts as absent.
const nlohmann::json* field(const nlohmann::json& j, const char* key) {
    // Called for the throw: get_ref raises type_error 303 unless j is an object.
    (void)j.get_ref<const nlohmann::json::object_t&>();
    auto it = j.find(key);
    if (it == j.end()) {
        for (auto i = j.begin(); i != j.end(); ++i) {
            if (strcasecmp(i.key().c_str(), key) == 0) { it = i; break; }
        }
    }
    if (it == j.end() || it->is_null()) return nullptr;
    return &*it;
}

template <typename T>
void read_field(const nlohmann::json& j, const char* key, T& out) {
    if (const nlohmann::json* v = field(j, key)) v->get_to(out);
}

// Scores go out the way the service sends them: 1 rather than 1.0, and the
// shortest decimal that reads back as the same float (0.1, not 0.100000001).
nlohmann::json number(float f) {
    if (std::isfinite(f) && std::trunc(f) == f && std::fabs(f) < 9.0e15f) {
        return static_cast<std::int64_t>(f);
    }
    char buf[32];
    for (int prec = 1; prec <= 9; ++prec) {
        std::snprintf(buf, sizeof(buf), "%.*g", prec, static_cast<double>(f));
        if (std::strtof(buf, nullptr) == f) break;
    }
    return std::strtod(buf, nullptr);
}

} // namespace

void from_json(const nlohmann::json& j, Common& c) {
    read_field(j, "status", c.status);
    read_field(j, "statuscode", c.status_code);
    read_field(j, "error", c.error);
}

void from_json(const nlohmann::json& j, QueryResponse& r) {
    from_json(j, static_cast<Common&>(r));
    read_field(j, "generalscore", r.general_score);
    read_field(j, "confirmcode", r.confirm_code);
    read_field(j, "classifiers", r.classifiers);
}

void from_json(const nlohmann::json& j, UploadResponse& r) {
    from_json(j, static_cast<Common&>(r));
}

void to_json(nlohmann::json& j, const Common& c) {
    j = nlohmann::json{{"status", c.status}, {"statuscode", number(c.status_code)}, {"error", c.error}};
}

void to_json(nlohmann::json& j, const QueryResponse& r) {
    to_json(j, static_cast<const Common&>(r));
    j["generalscore"] = number(r.general_score);
    j["confirmcode"] = r.confirm_code;
    nlohmann::json classifiers = nlohmann::json::object();
    for (const auto& kv : r.classifiers) classifiers[kv.first] = number(kv.second);
    j["classifiers"] = std::move(classifiers);
}

void to_json(nlohmann::json& j, const UploadResponse& r) {
    to_json(j, static_cast<const Common&>(r));
}

} // namespace inf
