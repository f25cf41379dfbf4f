#pragma once

/**
 * @file config.hpp
 * @brief Engine configuration
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace tasklane {

/**
 * @brief Engine configuration
 */
struct EngineConfig {
    std::uint32_t num_workers{0};                   // 0 = auto
    std::size_t queue_capacity{4096};               // 0 = unbounded
    std::chrono::milliseconds result_ttl{std::chrono::minutes(5)};  // 0 = keep forever
    std::string worker_name_prefix{"tasklane-worker"};
    bool enable_metrics{true};

    /**
     * @brief Defaults overlaid with TASKLANE_WORKERS, TASKLANE_QUEUE_CAPACITY
     * and TASKLANE_RESULT_TTL_MS
     * @throws std::invalid_argument on a malformed value
     */
    static EngineConfig from_env();

    /**
     * @brief Overlay environment variables onto an existing configuration
     */
    EngineConfig& apply_env();

    /**
     * @throws std::invalid_argument if the configuration is unusable
     */
    void validate() const;

    /**
     * @brief Worker count with 0 resolved to the host's logical CPU count
     */
    [[nodiscard]] std::uint32_t resolved_workers() const noexcept;
};

} // namespace tasklane
