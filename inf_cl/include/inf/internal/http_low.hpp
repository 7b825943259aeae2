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
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include "inf/http_response.hpp"

namespace inf::internal {

// RAII TCP connection with timeouts and basic send/recv helpers.
class TcpConn {
public:
    TcpConn() = default;
    ~TcpConn();

    TcpConn(const TcpConn&) = delete;
    TcpConn& operator=(const TcpConn&) = delete;

    // Open TCP connection to host:port with timeouts. why is set on failure.
    bool open(const std::string& host, std::uint16_t port,
              int connect_timeout_sec, int io_timeout_sec, std::string& why);

    void close();
    int  fd() const { return _fd; }

    bool send_all(const char* d, std::size_t len);
    // >0 bytes read, 0 on orderly close, <0 on error/timeout.
    long recv_some(char* d, std::size_t len);

private:
    int _fd = -1;
};

// Parse status line + headers. hdr_end_off points past the blank line.
bool parse_http_response(const std::string& head_and_maybe_body,
                         std::size_t& hdr_end_off,
                         int& status_code,
                         std::string& status_text,
                         std::unordered_map<std::string,std::string>& headers);

// Incremental decoder for Transfer-Encoding: chunked. Trailers are skipped.
class ChunkedDecoder {
public:
    enum class State { NeedMore, Done, Bad };

    State feed(const char* d, std::size_t len, std::string& body);
    State state() const { return _state; }

private:
    enum class Step { Size, Data, DataCrlf, Trailer };

    Step _step = Step::Size;
    State _state = State::NeedMore;
    std::string _line;
    std::size_t _remaining = 0;
};

// >0 bytes read, 0 on orderly close, <0 on error.
using ReadFn = std::function<long(char*, std::size_t)>;

// Read one full response: headers, then body framed by chunked encoding,
// Content-Length, or connection close. Body-less responses (1xx, 204, 304,
// replies to HEAD) read no body.
bool read_http_response(const ReadFn& read_some,
                        bool head_request,
                        std::size_t max_body,
                        HttpResponse& out,
                        std::string& why);

} // namespace inf::internal
