/*
 * Part of the Infinity client (INF) project.
 *
 * SPDX-FileCopyrightText: 2025 Infinity client contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of the Infinity client (INF). See LICENSE for details.
 */

#pragma once
#include <functional>
#include <ostream>
#include <string>
#include <nlohmann/json.hpp>

namespace inf {

// Where a successful response body goes. The kind is an explicit tag:
//  - None: body is discarded
//  - Raw:  body is copied verbatim into a caller stream
//  - Json: body is parsed and converted into a typed target via from_json
class Destination {
public:
    enum class Kind { None, Raw, Json };

    Destination() = default;

    static Destination raw(std::ostream& os) {
        Destination d;
        d._kind = Kind::Raw;
        d._os = &os;
        return d;
    }

    template <typename T>
    static Destination json(T& target) {
        Destination d;
        d._kind = Kind::Json;
        d._decode = [&target](const std::string& body) {
            const nlohmann::json j = nlohmann::json::parse(body);
            if (!j.is_null()) j.get_to(target);
        };
        return d;
    }

    Kind kind() const { return _kind; }
    std::ostream* stream() const { return _os; }

    // Throws nlohmann::json::exception on malformed or mistyped input.
    void decode(const std::string& body) const { _decode(body); }

private:
    Kind _kind = Kind::None;
    std::ostream* _os = nullptr;
    std::function<void(const std::string&)> _decode;
};

} // namespace inf
