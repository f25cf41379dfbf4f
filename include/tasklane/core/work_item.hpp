#pragma once

/**
 * @file work_item.hpp
 * @brief Unit of work submitted to the engine
 */

#include <chrono>
#include <functional>
#include <tuple>
#include <type_traits>
#include <utility>

#include "tasklane/core/errors.hpp"

namespace tasklane {

/**
 * @brief Timestamp type using steady clock for monotonic timing
 */
using Timestamp = std::chrono::steady_clock::time_point;

/**
 * @brief One submitted task: identifier plus a callable with its arguments bound
 *
 * Immutable once enqueued and consumed exactly once by exactly one worker.
 */
template<typename T>
class WorkItem {
public:
    using Body = std::function<T()>;

    WorkItem() = default;

    WorkItem(TaskId id, Body body)
        : id_(std::move(id))
        , body_(std::move(body))
        , enqueued_at_(std::chrono::steady_clock::now()) {}

    [[nodiscard]] const TaskId& id() const noexcept { return id_; }
    [[nodiscard]] Timestamp enqueued_at() const noexcept { return enqueued_at_; }

    /**
     * @brief Run the task body; exceptions propagate to the caller
     */
    T run() const { return body_(); }

private:
    TaskId id_;
    Body body_;
    Timestamp enqueued_at_{};
};

/**
 * @brief Bind a callable and its arguments into a nullary task body
 *
 * Arguments are decay-copied (or moved) into the closure so the caller's
 * objects need not outlive the task.
 */
template<typename T, typename F, typename... Args>
typename WorkItem<T>::Body bind_task(F&& fn, Args&&... args) {
    static_assert(std::is_invocable_v<std::decay_t<F>&, std::decay_t<Args>&...>,
                  "task callable is not invocable with the given arguments");
    return [f = std::forward<F>(fn),
            bound = std::make_tuple(std::forward<Args>(args)...)]() mutable -> T {
        return std::apply(f, bound);
    };
}

} // namespace tasklane
