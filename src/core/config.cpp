/**
 * @file config.cpp
 * @brief Engine configuration parsing
 */

#include "tasklane/core/config.hpp"

#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>
#include <thread>

namespace tasklane {

namespace {

std::uint64_t parse_unsigned(const char* name, const char* value) {
    std::string text(value);
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument(std::string(name) + ": expected a non-negative integer, got '" + text + "'");
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(std::string(name) + ": value out of range '" + text + "'");
    }
}

} // namespace

EngineConfig EngineConfig::from_env() {
    EngineConfig config;
    config.apply_env();
    return config;
}

EngineConfig& EngineConfig::apply_env() {
    if (const char* v = std::getenv("TASKLANE_WORKERS")) {
        auto n = parse_unsigned("TASKLANE_WORKERS", v);
        if (n > std::numeric_limits<std::uint32_t>::max()) {
            throw std::invalid_argument("TASKLANE_WORKERS: value out of range");
        }
        num_workers = static_cast<std::uint32_t>(n);
    }
    if (const char* v = std::getenv("TASKLANE_QUEUE_CAPACITY")) {
        queue_capacity = static_cast<std::size_t>(parse_unsigned("TASKLANE_QUEUE_CAPACITY", v));
    }
    if (const char* v = std::getenv("TASKLANE_RESULT_TTL_MS")) {
        result_ttl = std::chrono::milliseconds(
            static_cast<std::chrono::milliseconds::rep>(parse_unsigned("TASKLANE_RESULT_TTL_MS", v)));
    }
    return *this;
}

void EngineConfig::validate() const {
    if (result_ttl.count() < 0) {
        throw std::invalid_argument("result_ttl must not be negative");
    }
    if (worker_name_prefix.empty()) {
        throw std::invalid_argument("worker_name_prefix must not be empty");
    }
}

std::uint32_t EngineConfig::resolved_workers() const noexcept {
    if (num_workers != 0) {
        return num_workers;
    }
    auto n = std::thread::hardware_concurrency();
    return n != 0 ? n : 4;  // Fallback
}

} // namespace tasklane
