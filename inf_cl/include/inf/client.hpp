/*
 * Part of the Infinity client (INF) project.
 *
 * SPDX-FileCopyrightText: 2025 Infinity client contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of the Infinity client (INF). See LICENSE for details.
 */

#pragma once
#include <cstddef>
#include <istream>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "inf/client_config.hpp"
#include "inf/destination.hpp"
#include "inf/responses.hpp"
#include "inf/types.hpp"

namespace inf {

// Client for the Infinity reputation API. Immutable after create(); calls may
// run concurrently as long as the configured Transport allows it.
class Client {
public:
    // Applies options in order to a default configuration and stops at the
    // first failing one. Returns null and fills err on failure, including
    // missing_credentials when no key was set.
    //
    //   inf::Error err;
    //   auto cli = inf::Client::create({inf::set_key("..."),
    //                                    inf::set_url("https://host:8443/api"),
    //                                    inf::set_error_log(sink)}, err);
    static std::unique_ptr<Client> create(const std::vector<Option>& options, Error& err);

    // Reputation lookup for MD5, SHA1 or SHA256 hashes.
    // classifiers: none | ml | industry | human | all (empty selects "all").
    bool query(const std::string& classifiers,
               const std::vector<std::string>& hashes,
               QueryResult& out,
               Error& err) const;

    // Gzips the whole stream in memory and uploads it under confirm_code.
    bool upload(const std::string& confirm_code,
                std::istream* data,
                UploadResult& out,
                Error& err) const;

    bool upload_file(const std::string& confirm_code,
                     const std::string& path,
                     UploadResult& out,
                     Error& err) const;

    // Generic request against url + path:
    //  method: "GET", "PUT" ...
    //  path:   relative to the base URL, e.g. "q"
    //  query:  encoded and appended when non-empty
    //  body:   optional gzip payload, sent with Content-Length: body_length
    //  dst:    decoding target for a 2xx response
    bool request(const std::string& method,
                 const std::string& path,
                 const std::map<std::string, std::string>& query,
                 const std::string* body,
                 std::size_t body_length,
                 const Destination& dst,
                 Error& err) const;

    const ClientConfig& config() const { return _cfg; }

private:
    explicit Client(ClientConfig cfg);

    void errorf(const std::string& line) const;
    void tracef(const std::string& line) const;
    bool check_status(const HttpResponse& resp, Error& err) const;

    const ClientConfig _cfg;
};

} // namespace inf
