/*
 * Part of the Infinity client (INF) project.
 *
 * SPDX-FileCopyrightText: 2025 Infinity client contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of the Infinity client (INF). See LICENSE for details.
 */

#include "inf/client.hpp"
#include "inf/http_request.hpp"
#include "inf/http_response.hpp"
#include "inf/log.hpp"

#include "inf/internal/gzip.hpp"
#include "inf/internal/http_dump.hpp"
#include "inf/internal/http_parser.hpp"
#include "inf/internal/time.hpp"
#include "inf/internal/utils.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <utility>

namespace inf {

Client::Client(ClientConfig cfg) : _cfg(std::move(cfg)) {}

std::unique_ptr<Client> Client::create(const std::vector<Option>& options, Error& err) {
    ClientConfig cfg;
    cfg.transport = default_transport();

    for (const auto& option : options) {
        if (option && !option(cfg, err)) return nullptr;
    }
    log_line(cfg.tracelog, "[CLIENT] Using URL [" + cfg.url + "]");

    if (cfg.key.empty()) {
        log_line(cfg.errorlog, "[CLIENT] Missing credentials");
        err = missing_credentials_error();
        return nullptr;
    }
    return std::unique_ptr<Client>(new Client(std::move(cfg)));
}

void Client::errorf(const std::string& line) const { log_line(_cfg.errorlog, line); }
void Client::tracef(const std::string& line) const { log_line(_cfg.tracelog, line); }

bool Client::check_status(const HttpResponse& resp, Error& err) const {
    if (resp.status_code >= 200 && resp.status_code < 300) return true;

    if (_cfg.errorlog) errorf(internal::dump_response(resp, true));
    const std::string msg = "Unexpected status code: " + std::to_string(resp.status_code) +
                            " (" + internal::status_text(resp.status_code) + ")";
    errorf("[CLIENT] " + msg);
    err = Error{err_id::kHttpError, msg};
    return false;
}

bool Client::request(const std::string& method,
                     const std::string& path,
                     const std::map<std::string, std::string>& query,
                     const std::string* body,
                     std::size_t body_length,
                     const Destination& dst,
                     Error& err) const
{
    std::string rel = path;
    const std::string qs = internal::canonical_query_sorted(query);
    if (!qs.empty()) rel += "?" + qs;

    HttpRequest req;
    req.method = internal::upper_copy(method);
    req.url = _cfg.url + rel;
    req.headers.emplace_back("Accept", "application/json");
    req.headers.emplace_back(kAuthHeader, _cfg.key);
    if (body) {
        // The service rejects unsized uploads: the length is always explicit.
        req.headers.emplace_back("Content-Type", kGzipContentType);
        req.headers.emplace_back("Content-Length", std::to_string(body_length));
        req.body = body;
    }

    std::chrono::steady_clock::time_point t0;
    if (_cfg.tracelog) {
        tracef(internal::dump_request(req));
        t0 = std::chrono::steady_clock::now();
        tracef("[CLIENT] Start request " + rel + " at " + utc_iso8601_now());
    }

    HttpResponse resp;
    const bool sent = _cfg.transport->send(req, resp, err);

    if (_cfg.tracelog) {
        tracef("[CLIENT] End request " + rel + " at " + utc_iso8601_now() +
               " - took " + format_elapsed(std::chrono::steady_clock::now() - t0));
    }
    if (!sent) {
        errorf("[CLIENT] " + req.method + " " + rel + ": " + err.to_string());
        return false;
    }
    if (_cfg.tracelog) tracef(internal::dump_response(resp, true));

    if (!check_status(resp, err)) return false;

    switch (dst.kind()) {
    case Destination::Kind::None:
        return true;
    case Destination::Kind::Raw: {
        std::ostream& os = *dst.stream();
        os.write(resp.body.data(), static_cast<std::streamsize>(resp.body.size()));
        if (!os) {
            err = Error{err_id::kIo, "copy response body: output stream failed"};
            errorf("[CLIENT] " + err.to_string());
            return false;
        }
        return true;
    }
    case Destination::Kind::Json:
        try {
            dst.decode(resp.body);
        } catch (const nlohmann::json::exception& e) {
            if (_cfg.errorlog) errorf(internal::dump_response(resp, true));
            err = Error{err_id::kJson, e.what()};
            return false;
        }
        return true;
    }
    return true;
}

bool Client::query(const std::string& classifiers,
                   const std::vector<std::string>& hashes,
                   QueryResult& out,
                   Error& err) const
{
    if (hashes.empty()) {
        err = Error{err_id::kMissingArg, "hash is required"};
        return false;
    }
    out.clear();
    const std::map<std::string, std::string> params{
        {"c", classifiers.empty() ? std::string("all") : classifiers},
        {"h", internal::join(hashes, ',')},
    };
    return request("GET", "q", params, nullptr, 0, Destination::json(out), err);
}

bool Client::upload(const std::string& confirm_code,
                    std::istream* data,
                    UploadResult& out,
                    Error& err) const
{
    if (confirm_code.empty()) {
        err = Error{err_id::kMissingArg, "Confirmation code is required"};
        return false;
    }
    if (!data) {
        err = Error{err_id::kMissingArg, "Data is required"};
        return false;
    }

    // The upload endpoint needs Content-Length up front, so the whole
    // compressed payload is buffered in memory.
    internal::GzipBuffer buf;
    if (!internal::gzip_stream(*data, buf, err)) {
        errorf("[CLIENT] " + err.to_string());
        return false;
    }

    out.clear();
    return request("PUT", "u/" + internal::url_encode(confirm_code), {},
                   &buf.data, buf.length, Destination::json(out), err);
}

bool Client::upload_file(const std::string& confirm_code,
                         const std::string& path,
                         UploadResult& out,
                         Error& err) const
{
    if (confirm_code.empty()) {
        err = Error{err_id::kMissingArg, "Confirmation code is required"};
        return false;
    }
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f) {
        err = Error{err_id::kIo, "open " + path + ": " + std::strerror(errno)};
        errorf("[CLIENT] " + err.to_string());
        return false;
    }
    return upload(confirm_code, &f, out, err);
}

} // namespace inf
