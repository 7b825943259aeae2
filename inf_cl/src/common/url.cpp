/*
 * Part of the Infinity client (INF) project.
 *
 * SPDX-FileCopyrightText: 2025 Infinity client contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of the Infinity client (INF). See LICENSE for details.
 */

#include "inf/internal/url.hpp"
#include "inf/internal/utils.hpp"
#include <cctype>

namespace inf::internal {

namespace {

bool fail(Error& err, const std::string& raw, const std::string& why) {
    err = Error{err_id::kUrlParse, "parse \"" + raw + "\": " + why};
    return false;
}

bool valid_scheme(const std::string& s) {
    if (s.empty() || !std::isalpha((unsigned char)s[0])) return false;
    for (char c : s) {
        if (!std::isalnum((unsigned char)c) && c != '+' && c != '-' && c != '.') return false;
    }
    return true;
}

bool parse_port(const std::string& p, std::uint16_t& out) {
    if (p.empty()) { out = 0; return true; }
    unsigned long v = 0;
    for (char c : p) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + (unsigned long)(c - '0');
        if (v > 65535) return false;
    }
    out = (std::uint16_t)v;
    return true;
}

} // namespace

std::uint16_t Url::effective_port() const {
    if (port != 0) return port;
    return scheme == "https" ? 443 : 80;
}

std::string Url::host_header() const {
    const std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    if (port == 0) return h;
    if ((scheme == "http" && port == 80) || (scheme == "https" && port == 443)) return h;
    return h + ":" + std::to_string(port);
}

bool parse_url(const std::string& raw, Url& out, Error& err) {
    out = Url{};

    for (std::size_t i = 0; i < raw.size(); ++i) {
        const unsigned char c = (unsigned char)raw[i];
        if (c < 0x20 || c == 0x7f || c == ' ') {
            return fail(err, raw, "invalid character in URL");
        }
        if (c == '%') {
            if (i + 2 >= raw.size() || hexval(raw[i+1]) < 0 || hexval(raw[i+2]) < 0) {
                return fail(err, raw, "invalid URL escape \"" + raw.substr(i, 3) + "\"");
            }
        }
    }

    std::string rest = raw;
    const std::size_t frag = rest.find('#');
    if (frag != std::string::npos) rest.erase(frag);

    // scheme ":" only counts before the first '/', '?'
    const std::size_t colon = rest.find_first_of(":/?");
    if (colon != std::string::npos && rest[colon] == ':') {
        if (colon == 0) return fail(err, raw, "missing protocol scheme");
        const std::string scheme = rest.substr(0, colon);
        if (!valid_scheme(scheme)) {
            return fail(err, raw, "first path segment in URL cannot contain colon");
        }
        out.scheme = lower_copy(scheme);
        rest.erase(0, colon + 1);
    }

    if (rest.compare(0, 2, "//") == 0) {
        rest.erase(0, 2);
        const std::size_t auth_end = rest.find_first_of("/?");
        std::string authority = rest.substr(0, auth_end);
        rest = (auth_end == std::string::npos) ? std::string() : rest.substr(auth_end);

        const std::size_t at = authority.rfind('@');
        if (at != std::string::npos) authority.erase(0, at + 1);

        std::string port_s;
        if (!authority.empty() && authority[0] == '[') {
            const std::size_t rb = authority.find(']');
            if (rb == std::string::npos) return fail(err, raw, "missing ']' in host");
            out.host = authority.substr(1, rb - 1);
            const std::string tail = authority.substr(rb + 1);
            if (!tail.empty()) {
                if (tail[0] != ':') return fail(err, raw, "invalid port \"" + tail + "\" after host");
                port_s = tail.substr(1);
            }
        } else {
            const std::size_t pc = authority.rfind(':');
            if (pc != std::string::npos) {
                out.host = authority.substr(0, pc);
                port_s = authority.substr(pc + 1);
            } else {
                out.host = authority;
            }
        }
        if (!parse_port(port_s, out.port)) {
            return fail(err, raw, "invalid port \":" + port_s + "\" after host");
        }
        if (rest.empty() || rest[0] != '/') rest.insert(0, "/");
    }

    out.target = rest;
    return true;
}

} // namespace inf::internal
