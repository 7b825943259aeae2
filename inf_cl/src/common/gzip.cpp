/*
 * Part of the Infinity client (INF) project.
 *
 * SPDX-FileCopyrightText: 2025 Infinity client contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of the Infinity client (INF). See LICENSE for details.
 */

#include "inf/internal/gzip.hpp"
#include <zlib.h>
#include <memory>

namespace inf::internal {

namespace {

constexpr std::size_t kChunk = 16384;
constexpr int kGzipWindowBits = 15 + 16;  // 32K window, gzip wrapper

std::string zlib_message(const z_stream& zs, int rc) {
    std::string m = "zlib error " + std::to_string(rc);
    if (zs.msg) m += std::string(" (") + zs.msg + ")";
    return m;
}

struct DeflateEnd { void operator()(z_stream* zs) const { deflateEnd(zs); } };
struct InflateEnd { void operator()(z_stream* zs) const { inflateEnd(zs); } };

// Run deflate over [in, in+len) with the given flush mode, appending output.
bool deflate_chunk(z_stream& zs, const char* in, std::size_t len, int flush, std::string& out, Error& err) {
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(in));
    zs.avail_in = (uInt)len;
    unsigned char buf[kChunk];
    int rc = Z_OK;
    do {
        zs.next_out = buf;
        zs.avail_out = sizeof(buf);
        rc = deflate(&zs, flush);
        if (rc == Z_STREAM_ERROR) {
            err = Error{err_id::kIo, "gzip: " + zlib_message(zs, rc)};
            return false;
        }
        out.append(reinterpret_cast<const char*>(buf), sizeof(buf) - zs.avail_out);
    } while (zs.avail_out == 0);
    if (flush == Z_FINISH && rc != Z_STREAM_END) {
        err = Error{err_id::kIo, "gzip: stream not finished: " + zlib_message(zs, rc)};
        return false;
    }
    return true;
}

} // namespace

bool gzip_stream(std::istream& in, GzipBuffer& out, Error& err) {
    out = GzipBuffer{};

    z_stream zs{};
    int rc = deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, kGzipWindowBits, 8, Z_DEFAULT_STRATEGY);
    if (rc != Z_OK) {
        err = Error{err_id::kIo, "gzip: " + zlib_message(zs, rc)};
        return false;
    }
    std::unique_ptr<z_stream, DeflateEnd> guard(&zs);

    char buf[kChunk];
    while (in) {
        in.read(buf, sizeof(buf));
        const std::streamsize n = in.gcount();
        if (n > 0 && !deflate_chunk(zs, buf, (std::size_t)n, Z_NO_FLUSH, out.data, err)) return false;
    }
    if (in.bad()) {
        err = Error{err_id::kIo, "gzip: read error on input stream"};
        return false;
    }

    // The trailer (CRC32 + ISIZE) is only written by Z_FINISH.
    if (!deflate_chunk(zs, nullptr, 0, Z_FINISH, out.data, err)) return false;
    out.length = out.data.size();
    return true;
}

bool gunzip(const std::string& in, std::string& out, Error& err) {
    out.clear();

    z_stream zs{};
    int rc = inflateInit2(&zs, kGzipWindowBits);
    if (rc != Z_OK) {
        err = Error{err_id::kIo, "gunzip: " + zlib_message(zs, rc)};
        return false;
    }
    std::unique_ptr<z_stream, InflateEnd> guard(&zs);

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(in.data()));
    zs.avail_in = (uInt)in.size();
    unsigned char buf[kChunk];
    do {
        zs.next_out = buf;
        zs.avail_out = sizeof(buf);
        rc = inflate(&zs, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            if (rc == Z_BUF_ERROR) {
                err = Error{err_id::kIo, "gunzip: truncated input"};
            } else {
                err = Error{err_id::kIo, "gunzip: " + zlib_message(zs, rc)};
            }
            return false;
        }
        out.append(reinterpret_cast<const char*>(buf), sizeof(buf) - zs.avail_out);
    } while (rc != Z_STREAM_END);
    return true;
}

} // namespace inf::internal
