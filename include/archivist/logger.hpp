/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace archivist {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

// Process-wide logger writing one line per message to stderr:
//   [2025-01-31 12:00:00.042] [INFO ] [package-0] [<package id>] message
class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    // ARCHIVIST_LOG_LEVEL when set and valid, otherwise fallback.
    static void configure(LogLevel fallback) noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static bool parseLevel(const std::string& text, LogLevel& out) noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;
    [[nodiscard]] static std::string format(LogLevel level, const std::string& message);

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }
};

// Tags every line logged by the current thread until destroyed. Nested
// contexts restore the outer one.
class LogContext {
public:
    explicit LogContext(std::string context);
    ~LogContext();

    LogContext(const LogContext&) = delete;
    LogContext& operator=(const LogContext&) = delete;

private:
    std::string previous_;
};

[[nodiscard]] const char* toString(LogLevel level) noexcept;

// Name shown in log lines for the calling thread.
void setThreadName(const std::string& name);
std::string workerThreadName(const std::string& prefix, int workerId);

}

#define LOG_ERROR(msg) ::archivist::Logger::error(msg)
#define LOG_WARN(msg)  ::archivist::Logger::warn(msg)
#define LOG_INFO(msg)  ::archivist::Logger::info(msg)
#define LOG_DEBUG(msg) ::archivist::Logger::debug(msg)
#define LOG_TRACE(msg) ::archivist::Logger::trace(msg)
