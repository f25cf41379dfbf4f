/**
 * @file engine.cpp
 * @brief Engine non-template helpers
 */

#include "tasklane/core/engine.hpp"

namespace tasklane {

// TaskEngine is a class template and lives in the header.

const char* to_string(EngineState state) noexcept {
    switch (state) {
        case EngineState::Created:  return "Created";
        case EngineState::Running:  return "Running";
        case EngineState::Stopping: return "Stopping";
        case EngineState::Stopped:  return "Stopped";
    }
    return "Unknown";
}

} // namespace tasklane
