// =============================================================================
// include/core/RunLog.hpp - Run-scoped stdout log file and section timers
// =============================================================================
#pragma once

#include <chrono>
#include <fstream>
#include <iostream>
#include <streambuf>
#include <string>

// YYYYmmdd-HHMMSS in local time
std::string runTimestamp();

// True when /proc/self/status reports a tracer (debugger) attached
bool isDebuggerAttached();

/**
 * Redirects std::cout into <logDir>/<prefix>_<timestamp>_stdout.txt for the
 * lifetime of the object. The original buffer is restored by the destructor,
 * so aborted runs release the file too.
 */
class LogRedirect {
public:
    LogRedirect(const std::string& logDir,
                const std::string& prefix,
                const std::string& timestamp,
                bool enabled = true);
    ~LogRedirect();

    LogRedirect(const LogRedirect&) = delete;
    LogRedirect& operator=(const LogRedirect&) = delete;

    bool active() const { return original_ != nullptr; }
    const std::string& path() const { return path_; }

private:
    std::ofstream file_;
    std::streambuf* original_ = nullptr;
    std::string path_;
};

// Prints "<title> - done in <n>s" when it goes out of scope
class ScopedTimer {
public:
    explicit ScopedTimer(std::string title)
        : title_(std::move(title)), start_(std::chrono::steady_clock::now()) {}
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::string title_;
    std::chrono::steady_clock::time_point start_;
};
