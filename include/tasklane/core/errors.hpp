#pragma once

/**
 * @file errors.hpp
 * @brief Error taxonomy reported by the task engine
 */

#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace tasklane {

/**
 * @brief Task identifier type
 */
using TaskId = std::string;

/**
 * @brief Base class for every error raised by the engine itself
 */
class EngineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Operation called in the wrong engine lifecycle state
 */
class InvalidStateError : public EngineError {
public:
    using EngineError::EngineError;
};

/**
 * @brief Submission rejected because the task queue is at capacity
 */
class QueueFullError : public EngineError {
public:
    explicit QueueFullError(std::size_t capacity);

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    std::size_t capacity_;
};

/**
 * @brief Errors tied to one task id
 */
class TaskIdError : public EngineError {
public:
    TaskIdError(TaskId id, const std::string& message)
        : EngineError(message)
        , id_(std::move(id)) {}

    [[nodiscard]] const TaskId& id() const noexcept { return id_; }

private:
    TaskId id_;
};

/**
 * @brief Submitted id is still live in the result store
 */
class DuplicateTaskError : public TaskIdError {
public:
    explicit DuplicateTaskError(TaskId id);
};

/**
 * @brief Id was never submitted, or its result was already consumed or evicted
 */
class UnknownTaskError : public TaskIdError {
public:
    explicit UnknownTaskError(TaskId id);
};

/**
 * @brief Wait budget for a result elapsed
 *
 * The task may still complete; its result stays available for a retry.
 */
class TimeoutError : public TaskIdError {
public:
    explicit TimeoutError(TaskId id);
};

/**
 * @brief Queued task discarded by a non-draining stop before it ran
 */
class CancelledError : public TaskIdError {
public:
    explicit CancelledError(TaskId id);
};

/**
 * @brief A task body threw
 *
 * what() carries the original message; the original exception object is
 * kept and can be rethrown with its real type.
 */
class TaskError : public TaskIdError {
public:
    TaskError(TaskId id, std::exception_ptr original);

    [[nodiscard]] std::exception_ptr original() const noexcept { return original_; }

    [[noreturn]] void rethrow_original() const;

private:
    std::exception_ptr original_;
};

/**
 * @brief Best-effort message of a captured exception
 */
[[nodiscard]] std::string describe(const std::exception_ptr& error);

} // namespace tasklane
