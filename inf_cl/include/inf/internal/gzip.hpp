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
#include <string>
#include "inf/types.hpp"

namespace inf::internal {

// Finished gzip member and its exact size in bytes.
struct GzipBuffer {
    std::string data;
    std::size_t length = 0;
};

// Compress the whole of in (read to EOF) into out. The deflate stream is
// finished before length is taken. Fails with io_error on a stream read error
// or a zlib failure.
bool gzip_stream(std::istream& in, GzipBuffer& out, Error& err);

// Inverse of gzip_stream; accepts a single gzip member.
bool gunzip(const std::string& in, std::string& out, Error& err);

} // namespace inf::internal
