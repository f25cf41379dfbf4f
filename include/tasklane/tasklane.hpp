#pragma once

/**
 * @file tasklane.hpp
 * @brief Main header for tasklane - concurrent task-execution engine
 *
 * Include this single header to access the full tasklane API.
 */

#include "tasklane/core/errors.hpp"
#include "tasklane/core/outcome.hpp"
#include "tasklane/core/work_item.hpp"
#include "tasklane/core/queue.hpp"
#include "tasklane/core/result_box.hpp"
#include "tasklane/core/batch.hpp"
#include "tasklane/core/worker_pool.hpp"
#include "tasklane/core/metrics.hpp"
#include "tasklane/core/config.hpp"
#include "tasklane/core/logger.hpp"
#include "tasklane/core/engine.hpp"

namespace tasklane {

/**
 * @brief Library version information
 */
constexpr const char* VERSION = "0.1.0";
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

} // namespace tasklane
