/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "archivist/logger.hpp"
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <utility>

namespace archivist {

namespace {

constexpr const char* kLevelVariable = "ARCHIVIST_LOG_LEVEL";

// Unset until configure(), setLevel() or the first log call.
constexpr int kUnset = -1;
std::atomic<int> g_level{kUnset};
std::mutex g_write_mutex;

thread_local std::string t_thread_name;
thread_local std::string t_context;

LogLevel levelFromEnvironment(LogLevel fallback) noexcept {
    const char* value = std::getenv(kLevelVariable);
    LogLevel parsed = fallback;
    if (value && Logger::parseLevel(value, parsed)) {
        return parsed;
    }
    return fallback;
}

std::string threadLabel() {
    if (!t_thread_name.empty()) {
        return t_thread_name;
    }
    std::ostringstream oss;
    oss << "T" << std::this_thread::get_id();
    return oss.str();
}

}

void Logger::setLevel(LogLevel level) noexcept {
    g_level.store(static_cast<int>(level));
}

void Logger::configure(LogLevel fallback) noexcept {
    setLevel(levelFromEnvironment(fallback));
}

LogLevel Logger::level() noexcept {
    int current = g_level.load();
    if (current == kUnset) {
        int resolved = static_cast<int>(levelFromEnvironment(LogLevel::INFO));
        g_level.compare_exchange_strong(current, resolved);
        return static_cast<LogLevel>(g_level.load());
    }
    return static_cast<LogLevel>(current);
}

bool Logger::parseLevel(const std::string& text, LogLevel& out) noexcept {
    std::string name(text);
    for (char& c : name) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (name == "error") { out = LogLevel::ERROR; return true; }
    if (name == "warn" || name == "warning") { out = LogLevel::WARN; return true; }
    if (name == "info") { out = LogLevel::INFO; return true; }
    if (name == "debug") { out = LogLevel::DEBUG; return true; }
    if (name == "trace") { out = LogLevel::TRACE; return true; }
    return false;
}

std::string Logger::format(LogLevel level, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream line;
    line << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    line << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
    line << " [" << std::left << std::setfill(' ') << std::setw(5) << toString(level) << "]";
    line << " [" << threadLabel() << "]";
    if (!t_context.empty()) {
        line << " [" << t_context << "]";
    }
    line << " " << message;
    return line.str();
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    try {
        if (static_cast<uint8_t>(level) > static_cast<uint8_t>(Logger::level())) {
            return;
        }
        auto line = format(level, message);

        // stdout belongs to the CLI tools
        std::lock_guard<std::mutex> lock(g_write_mutex);
        std::cerr << line << std::endl;
    } catch (const std::exception&) {
        // Logging never throws
    }
}

LogContext::LogContext(std::string context) : previous_(std::move(t_context)) {
    t_context = std::move(context);
}

LogContext::~LogContext() {
    t_context = std::move(previous_);
}

const char* toString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
    }
    return "UNKNOWN";
}

void setThreadName(const std::string& name) {
    t_thread_name = name;
}

std::string workerThreadName(const std::string& prefix, int workerId) {
    return prefix + "-" + std::to_string(workerId);
}

}
