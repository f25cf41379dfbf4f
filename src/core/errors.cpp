/**
 * @file errors.cpp
 * @brief Engine error messages
 */

#include "tasklane/core/errors.hpp"

namespace tasklane {

QueueFullError::QueueFullError(std::size_t capacity)
    : EngineError("task queue is full (capacity " + std::to_string(capacity) + ")")
    , capacity_(capacity) {}

DuplicateTaskError::DuplicateTaskError(TaskId id)
    : TaskIdError(id, "task '" + id + "' is already pending") {}

UnknownTaskError::UnknownTaskError(TaskId id)
    : TaskIdError(id, "no result for task '" + id + "'") {}

TimeoutError::TimeoutError(TaskId id)
    : TaskIdError(id, "timed out waiting for task '" + id + "'") {}

CancelledError::CancelledError(TaskId id)
    : TaskIdError(id, "task '" + id + "' was cancelled before it ran") {}

TaskError::TaskError(TaskId id, std::exception_ptr original)
    : TaskIdError(id, "task '" + id + "' failed: " + describe(original))
    , original_(std::move(original)) {}

void TaskError::rethrow_original() const {
    std::rethrow_exception(original_);
}

std::string describe(const std::exception_ptr& error) {
    if (!error) {
        return "no error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (const std::string& s) {
        return s;
    } catch (const char* s) {
        return s;
    } catch (...) {
        return "unknown exception";
    }
}

} // namespace tasklane
