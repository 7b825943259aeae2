// SPDX-License-Identifier: Apache-2.0
// Part of the Infinity client (INF) project.
// inf_cl/src/client/http_low.cpp

#include "inf/internal/http_low.hpp"
#include "inf/internal/http_parser.hpp"
#include "inf/internal/utils.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <unistd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <fcntl.h>
#include <poll.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sstream>

namespace inf::internal {

namespace {
constexpr std::size_t kMaxHeaderBytes = 1u << 20;
constexpr std::size_t kMaxChunkLine   = 4096;
} // namespace

TcpConn::~TcpConn() { close(); }

bool TcpConn::open(const std::string& host, std::uint16_t port,
                   int connect_timeout_sec, int io_timeout_sec, std::string& why) {
    close();

    struct addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    int rc = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
    if (rc != 0 || !res) {
        why = std::string("getaddrinfo ") + host + ": " + gai_strerror(rc);
        return false;
    }

    const int connect_timeout_ms = std::max(1, connect_timeout_sec) * 1000;

    int s_ok = -1;
    int last_errno = 0;
    for (auto* p = res; p; p = p->ai_next) {
        int s = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (s < 0) { last_errno = errno; continue; }

        // Switch to non-blocking for a bounded-time connect
        int flags = fcntl(s, F_GETFL, 0);
        if (flags < 0 || fcntl(s, F_SETFL, flags | O_NONBLOCK) < 0) {
            last_errno = errno;
            ::close(s);
            continue;
        }

        int ret = ::connect(s, p->ai_addr, p->ai_addrlen);
        if (ret < 0 && errno == EINPROGRESS) {
            struct pollfd pfd{};
            pfd.fd     = s;
            pfd.events = POLLOUT;

            int pr = 0;
            do {
                pr = ::poll(&pfd, 1, connect_timeout_ms);
            } while (pr < 0 && errno == EINTR);
            if (pr <= 0 || !(pfd.revents & POLLOUT)) {
                last_errno = (pr == 0) ? ETIMEDOUT : errno;
                ::close(s);
                continue;
            }
            int soerr = 0;
            socklen_t slen = sizeof(soerr);
            if (getsockopt(s, SOL_SOCKET, SO_ERROR, &soerr, &slen) < 0 || soerr != 0) {
                last_errno = soerr ? soerr : errno;
                ::close(s);
                continue;
            }
        } else if (ret < 0) {
            last_errno = errno;
            ::close(s);
            continue;
        }

        // Back to blocking mode for normal I/O (SO_*TIMEO will work)
        (void)fcntl(s, F_SETFL, flags);

        int one = 1;
        setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

        timeval tv{std::max(1, io_timeout_sec), 0};
        setsockopt(s, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        s_ok = s;
        break;
    }
    freeaddrinfo(res);

    if (s_ok < 0) {
        why = "dial " + host + ":" + std::to_string(port) + ": " + std::strerror(last_errno);
        return false;
    }

    _fd = s_ok;
    return true;
}

void TcpConn::close(){
    if (_fd>=0) { ::close(_fd); _fd=-1; }
}

bool TcpConn::send_all(const char* d, std::size_t len) {
    std::size_t off = 0;
    while (off < len) {
        ssize_t n = ::send(_fd, d + off, len - off, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        off += (std::size_t)n;
    }
    return true;
}

long TcpConn::recv_some(char* d, std::size_t len) {
    ssize_t n = 0;
    do {
        n = ::recv(_fd, d, len, 0);
    } while (n < 0 && errno == EINTR);
    return (long)n;
}

bool parse_http_response(const std::string& head_and_maybe_body,
                         std::size_t& hdr_end_off,
                         int& status_code,
                         std::string& status_text,
                         std::unordered_map<std::string,std::string>& headers)
{
    std::size_t hdr_end = head_and_maybe_body.find("\r\n\r\n");
    if (hdr_end == std::string::npos) return false;
    hdr_end_off = hdr_end + 4;

    std::string hdrs = head_and_maybe_body.substr(0, hdr_end);
    std::size_t line_end = hdrs.find("\r\n");
    if (line_end == std::string::npos) line_end = hdrs.size();
    std::string status = hdrs.substr(0, line_end);

    // "HTTP/1.1 200 OK"
    std::istringstream iss(status);
    std::string httpver;
    if (!(iss >> httpver >> status_code)) return false;
    if (httpver.compare(0, 5, "HTTP/") != 0) return false;
    if (status_code < 100 || status_code > 999) return false;
    status_text.clear();
    std::getline(iss, status_text);
    trim_inplace(status_text);

    headers.clear();
    std::size_t pos = line_end + 2;
    while (pos < hdrs.size()) {
        std::size_t next = hdrs.find("\r\n", pos);
        if (next == std::string::npos) next = hdrs.size();
        std::string line = hdrs.substr(pos, next - pos);
        pos = next + 2;
        std::size_t c = line.find(':');
        if (c != std::string::npos) {
            std::string k = line.substr(0, c), v = line.substr(c + 1);
            trim_inplace(k);
            trim_inplace(v);
            auto it = headers.find(k);
            if (it != headers.end()) it->second += ", " + v;  // repeated field
            else headers[k] = v;
        }
    }
    return true;
}

ChunkedDecoder::State ChunkedDecoder::feed(const char* d, std::size_t len, std::string& body) {
    std::size_t i = 0;
    while (i < len && _state == State::NeedMore) {
        switch (_step) {
        case Step::Size: {
            const char c = d[i++];
            if (c != '\n') {
                _line.push_back(c);
                if (_line.size() > kMaxChunkLine) _state = State::Bad;
                break;
            }
            std::string line;
            line.swap(_line);
            const std::size_t semi = line.find(';');  // chunk extensions
            if (semi != std::string::npos) line.erase(semi);
            trim_inplace(line);
            if (line.empty() || line.size() > 15) { _state = State::Bad; break; }
            std::size_t n = 0;
            for (char h : line) {
                const int v = hexval(h);
                if (v < 0) { _state = State::Bad; break; }
                n = (n << 4) | (std::size_t)v;
            }
            if (_state == State::Bad) break;
            _remaining = n;
            _step = (n == 0) ? Step::Trailer : Step::Data;
            break;
        }
        case Step::Data: {
            const std::size_t n = std::min(_remaining, len - i);
            body.append(d + i, n);
            i += n;
            _remaining -= n;
            if (_remaining == 0) _step = Step::DataCrlf;
            break;
        }
        case Step::DataCrlf: {
            const char c = d[i++];
            if (c == '\r') break;
            if (c == '\n') _step = Step::Size;
            else _state = State::Bad;
            break;
        }
        case Step::Trailer: {
            const char c = d[i++];
            if (c != '\n') {
                _line.push_back(c);
                if (_line.size() > kMaxChunkLine) _state = State::Bad;
                break;
            }
            if (!_line.empty() && _line.back() == '\r') _line.pop_back();
            if (_line.empty()) _state = State::Done;
            _line.clear();
            break;
        }
        }
    }
    return _state;
}

bool read_http_response(const ReadFn& read_some,
                        bool head_request,
                        std::size_t max_body,
                        HttpResponse& out,
                        std::string& why)
{
    char buf[4096];
    std::string head;

    // Interim 1xx responses (except 101) are skipped.
    std::size_t hdr_end_off = 0;
    for (;;) {
        while (head.find("\r\n\r\n") == std::string::npos) {
            const long n = read_some(buf, sizeof(buf));
            if (n < 0) { why = "read response headers: " + std::string(std::strerror(errno)); return false; }
            if (n == 0) { why = "connection closed before response headers"; return false; }
            head.append(buf, buf + n);
            if (head.size() > kMaxHeaderBytes) { why = "response headers too large"; return false; }
        }
        if (!parse_http_response(head, hdr_end_off, out.status_code, out.status_text, out.headers)) {
            why = "malformed HTTP response";
            return false;
        }
        if (out.status_code >= 100 && out.status_code < 200 && out.status_code != 101) {
            head.erase(0, hdr_end_off);
            continue;
        }
        break;
    }

    const std::string rest = head.substr(hdr_end_off);
    out.body.clear();

    const int sc = out.status_code;
    if (head_request || (sc >= 100 && sc < 200) || sc == 204 || sc == 304) return true;

    const std::string te = lower_copy(hdr_ci(out.headers, "Transfer-Encoding"));
    if (te.find("chunked") != std::string::npos) {
        ChunkedDecoder dec;
        ChunkedDecoder::State st = dec.feed(rest.data(), rest.size(), out.body);
        while (st == ChunkedDecoder::State::NeedMore) {
            if (out.body.size() > max_body) { why = "response body too large"; return false; }
            const long n = read_some(buf, sizeof(buf));
            if (n <= 0) { why = "connection closed inside chunked body"; return false; }
            st = dec.feed(buf, (std::size_t)n, out.body);
        }
        if (st == ChunkedDecoder::State::Bad) { why = "malformed chunked body"; return false; }
        if (out.body.size() > max_body) { why = "response body too large"; return false; }
        return true;
    }

    const std::string cl = hdr_ci(out.headers, "Content-Length");
    if (!cl.empty()) {
        std::size_t content_len = 0;
        if (cl.size() > 19 || cl.find_first_not_of("0123456789") != std::string::npos) {
            why = "bad Content-Length: " + cl;
            return false;
        }
        content_len = (std::size_t)std::stoull(cl);
        if (content_len > max_body) { why = "response body too large"; return false; }

        out.body.assign(rest, 0, std::min(rest.size(), content_len));
        while (out.body.size() < content_len) {
            const std::size_t need = content_len - out.body.size();
            const long n = read_some(buf, std::min<std::size_t>(sizeof(buf), need));
            if (n <= 0) {
                why = "connection closed after " + std::to_string(out.body.size()) +
                      " of " + std::to_string(content_len) + " body bytes";
                return false;
            }
            out.body.append(buf, buf + n);
        }
        return true;
    }

    // No framing: body runs until the peer closes.
    out.body = rest;
    for (;;) {
        if (out.body.size() > max_body) { why = "response body too large"; return false; }
        const long n = read_some(buf, sizeof(buf));
        if (n == 0) break;
        if (n < 0) { why = "read response body: " + std::string(std::strerror(errno)); return false; }
        out.body.append(buf, buf + n);
    }
    return true;
}

} // namespace inf::internal
