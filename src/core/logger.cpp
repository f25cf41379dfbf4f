/**
 * @file logger.cpp
 * @brief Logger implementation
 */

#include "tasklane/core/logger.hpp"

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

namespace tasklane {

namespace {

LogLevel level_from_env() noexcept {
    LogLevel level = LogLevel::Warn;
    const char* env = std::getenv("TASKLANE_LOG_LEVEL");
    if (env) {
        Logger::parse_level(env, level);
    }
    return level;
}

std::atomic<std::uint8_t>& threshold() noexcept {
    static std::atomic<std::uint8_t> value{static_cast<std::uint8_t>(level_from_env())};
    return value;
}

std::mutex& output_mutex() {
    static std::mutex m;
    return m;
}

thread_local std::string t_thread_name;

} // namespace

void Logger::set_level(LogLevel level) noexcept {
    threshold().store(static_cast<std::uint8_t>(level), std::memory_order_relaxed);
}

LogLevel Logger::level() noexcept {
    return static_cast<LogLevel>(threshold().load(std::memory_order_relaxed));
}

bool Logger::enabled(LogLevel level) noexcept {
    return static_cast<std::uint8_t>(level) <= threshold().load(std::memory_order_relaxed);
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    if (!enabled(level)) {
        return;
    }

    try {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&time_t, &tm_buf);

        std::ostringstream ss;
        ss << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
        ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
        ss << " [" << level_to_string(level) << "]";
        if (t_thread_name.empty()) {
            ss << " [T" << std::this_thread::get_id() << "]";
        } else {
            ss << " [" << t_thread_name << "]";
        }
        ss << " " << message << '\n';

        std::lock_guard<std::mutex> lock(output_mutex());
        std::cerr << ss.str() << std::flush;
    } catch (...) {
        // A failing log line must not take down the caller
    }
}

bool Logger::parse_level(const std::string& name, LogLevel& out) noexcept {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "error") { out = LogLevel::Error; return true; }
    if (lower == "warn" || lower == "warning") { out = LogLevel::Warn; return true; }
    if (lower == "info") { out = LogLevel::Info; return true; }
    if (lower == "debug") { out = LogLevel::Debug; return true; }
    if (lower == "trace") { out = LogLevel::Trace; return true; }
    return false;
}

void Logger::set_thread_name(const std::string& name) {
    t_thread_name = name;
}

void Logger::clear_thread_name() {
    t_thread_name.clear();
}

const char* Logger::level_to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Info:  return "INFO ";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Trace: return "TRACE";
    }
    return "UNKN ";
}

} // namespace tasklane
