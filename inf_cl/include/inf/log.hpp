/*
 * Part of the Infinity client (INF) project.
 *
 * SPDX-FileCopyrightText: 2025 Infinity client contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of the Infinity client (INF). See LICENSE for details.
 */

#pragma once
#include <fstream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

namespace inf {

// Destination for pre-formatted diagnostic lines. Implementations must be
// thread-safe: one sink may be shared by several clients.
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const std::string& line) = 0;
};

// Writes lines to a caller-owned stream (std::cerr, a std::ostringstream ...).
class StreamLogSink final : public LogSink {
public:
    explicit StreamLogSink(std::ostream& os, std::string prefix = {});
    void write(const std::string& line) override;

private:
    std::mutex _mtx;
    std::ostream& _os;
    std::string _prefix;
};

// Appends lines to a file, flushed after every line.
class FileLogSink final : public LogSink {
public:
    explicit FileLogSink(const std::string& path);

    bool is_open() const { return _ofs.is_open(); }
    void write(const std::string& line) override;

private:
    std::mutex _mtx;
    std::ofstream _ofs;
};

// No-op when sink is null.
void log_line(LogSink* sink, const std::string& line);
inline void log_line(const std::shared_ptr<LogSink>& sink, const std::string& line) {
    log_line(sink.get(), line);
}

} // namespace inf
