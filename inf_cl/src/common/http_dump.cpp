/*
 * Part of the Infinity client (INF) project.
 *
 * SPDX-FileCopyrightText: 2025 Infinity client contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of the Infinity client (INF). See LICENSE for details.
 */

#include "inf/internal/http_dump.hpp"
#include "inf/internal/url.hpp"

#include <algorithm>
#include <sstream>
#include <vector>

namespace inf::internal {

const char* status_text(int code) {
    switch (code) {
    case 100: return "Continue";
    case 101: return "Switching Protocols";
    case 102: return "Processing";
    case 103: return "Early Hints";
    case 200: return "OK";
    case 201: return "Created";
    case 202: return "Accepted";
    case 203: return "Non-Authoritative Information";
    case 204: return "No Content";
    case 205: return "Reset Content";
    case 206: return "Partial Content";
    case 207: return "Multi-Status";
    case 208: return "Already Reported";
    case 226: return "IM Used";
    case 300: return "Multiple Choices";
    case 301: return "Moved Permanently";
    case 302: return "Found";
    case 303: return "See Other";
    case 304: return "Not Modified";
    case 305: return "Use Proxy";
    case 307: return "Temporary Redirect";
    case 308: return "Permanent Redirect";
    case 400: return "Bad Request";
    case 401: return "Unauthorized";
    case 402: return "Payment Required";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 406: return "Not Acceptable";
    case 407: return "Proxy Authentication Required";
    case 408: return "Request Timeout";
    case 409: return "Conflict";
    case 410: return "Gone";
    case 411: return "Length Required";
    case 412: return "Precondition Failed";
    case 413: return "Request Entity Too Large";
    case 414: return "Request URI Too Long";
    case 415: return "Unsupported Media Type";
    case 416: return "Requested Range Not Satisfiable";
    case 417: return "Expectation Failed";
    case 418: return "I'm a teapot";
    case 421: return "Misdirected Request";
    case 422: return "Unprocessable Entity";
    case 423: return "Locked";
    case 424: return "Failed Dependency";
    case 425: return "Too Early";
    case 426: return "Upgrade Required";
    case 428: return "Precondition Required";
    case 429: return "Too Many Requests";
    case 431: return "Request Header Fields Too Large";
    case 451: return "Unavailable For Legal Reasons";
    case 500: return "Internal Server Error";
    case 501: return "Not Implemented";
    case 502: return "Bad Gateway";
    case 503: return "Service Unavailable";
    case 504: return "Gateway Timeout";
    case 505: return "HTTP Version Not Supported";
    case 506: return "Variant Also Negotiates";
    case 507: return "Insufficient Storage";
    case 508: return "Loop Detected";
    case 510: return "Not Extended";
    case 511: return "Network Authentication Required";
    default:  return "";
    }
}

std::string dump_request(const HttpRequest& req) {
    Url u;
    Error ignored;
    std::string target = req.url;
    std::string host;
    if (parse_url(req.url, u, ignored)) {
        target = u.target.empty() ? "/" : u.target;
        host = u.host_header();
    }

    std::ostringstream oss;
    oss << req.method << " " << target << " HTTP/1.1\r\n";
    if (!host.empty()) oss << "Host: " << host << "\r\n";
    for (const auto& kv : req.headers) {
        oss << kv.first << ": " << kv.second << "\r\n";
    }
    oss << "\r\n";
    return oss.str();
}

std::string dump_response(const HttpResponse& resp, bool with_body) {
    // unordered_map: sort for a stable rendering
    std::vector<std::pair<std::string, std::string>> hs(resp.headers.begin(), resp.headers.end());
    std::sort(hs.begin(), hs.end());

    std::ostringstream oss;
    oss << "HTTP/1.1 " << resp.status_code;
    if (!resp.status_text.empty()) oss << " " << resp.status_text;
    oss << "\r\n";
    for (const auto& kv : hs) {
        oss << kv.first << ": " << kv.second << "\r\n";
    }
    oss << "\r\n";
    if (with_body) oss << resp.body;
    return oss.str();
}

} // namespace inf::internal
