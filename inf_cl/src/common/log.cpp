/*
 * Part of the Infinity client (INF) project.
 *
 * SPDX-FileCopyrightText: 2025 Infinity client contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of the Infinity client (INF). See LICENSE for details.
 */

#include "inf/log.hpp"
#include <utility>

namespace inf {

StreamLogSink::StreamLogSink(std::ostream& os, std::string prefix)
    : _os(os), _prefix(std::move(prefix)) {}

void StreamLogSink::write(const std::string& line) {
    std::lock_guard<std::mutex> lk(_mtx);
    _os << _prefix << line;
    if (line.empty() || line.back() != '\n') _os << '\n';
    _os.flush();
}

FileLogSink::FileLogSink(const std::string& path)
    : _ofs(path, std::ios::out | std::ios::app) {}

void FileLogSink::write(const std::string& line) {
    std::lock_guard<std::mutex> lk(_mtx);
    if (!_ofs) return;
    _ofs << line;
    if (line.empty() || line.back() != '\n') _ofs << '\n';
    _ofs.flush();
}

void log_line(LogSink* sink, const std::string& line) {
    if (sink) sink->write(line);
}

} // namespace inf
