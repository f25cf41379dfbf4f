#pragma once

/**
 * @file engine.hpp
 * @brief Task engine: submission, worker lifecycle and result retrieval
 */

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include "tasklane/core/batch.hpp"
#include "tasklane/core/config.hpp"
#include "tasklane/core/errors.hpp"
#include "tasklane/core/logger.hpp"
#include "tasklane/core/metrics.hpp"
#include "tasklane/core/outcome.hpp"
#include "tasklane/core/queue.hpp"
#include "tasklane/core/result_box.hpp"
#include "tasklane/core/work_item.hpp"
#include "tasklane/core/worker_pool.hpp"

namespace tasklane {

/**
 * @brief Engine lifecycle state
 */
enum class EngineState {
    Created,
    Running,
    Stopping,
    Stopped
};

[[nodiscard]] const char* to_string(EngineState state) noexcept;

/**
 * @brief Concurrent task-execution engine
 *
 * A fixed pool of worker threads pulls tasks from one FIFO queue and
 * publishes their outcomes into a result store keyed by task id. Every task
 * returns a T; heterogeneous results can use std::any or a std::variant.
 *
 * Lifecycle: Created -> Running (start) -> Stopping -> Stopped (stop).
 * Submissions are accepted only while Running. Results stay retrievable
 * after stop.
 *
 * @tparam T Task result type (move-constructible, not void)
 */
template<typename T>
class TaskEngine {
    static_assert(!std::is_void_v<T>, "task result type must not be void");
    static_assert(std::is_move_constructible_v<T>, "task result type must be move-constructible");

public:
    using value_type = T;

    explicit TaskEngine(EngineConfig config = {})
        : config_(validated(std::move(config)))
        , queue_(config_.queue_capacity)
        , results_(config_.result_ttl, [this](const TaskId& id) { on_evicted(id); }) {}

    ~TaskEngine() {
        stop(true);
    }

    // Non-copyable, non-movable
    TaskEngine(const TaskEngine&) = delete;
    TaskEngine& operator=(const TaskEngine&) = delete;

    /**
     * @brief Spawn the configured number of workers
     * @throws InvalidStateError if the engine is not in Created
     */
    void start() {
        start(config_.num_workers);
    }

    /**
     * @brief Spawn @p num_workers workers (0 = host logical CPU count)
     * @throws InvalidStateError if the engine is not in Created
     */
    void start(std::uint32_t num_workers) {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (state_.load() != EngineState::Created) {
            throw InvalidStateError(std::string("cannot start engine in state ") +
                                    to_string(state_.load()));
        }

        EngineConfig resolved = config_;
        resolved.num_workers = num_workers;

        WorkerPoolConfig pool_config;
        pool_config.num_workers = resolved.resolved_workers();
        pool_config.name_prefix = config_.worker_name_prefix;

        pool_ = std::make_unique<WorkerPool<T>>(
            pool_config, queue_, results_, metrics_sink());
        try {
            pool_->start();
        } catch (...) {
            // The pool closed the queue and joined whatever had started
            state_.store(EngineState::Stopped);
            throw;
        }
        num_workers_.store(pool_->num_workers());
        state_.store(EngineState::Running);

        TASKLANE_LOG_INFO("engine started with " + std::to_string(pool_config.num_workers) +
                          " workers");
    }

    /**
     * @brief Enqueue fn(args...) under @p id
     *
     * Arguments are copied or moved into the task.
     *
     * @throws InvalidStateError if the engine is not Running
     * @throws DuplicateTaskError if @p id is still pending or unclaimed
     * @throws QueueFullError if the bounded queue is at capacity
     */
    template<typename F, typename... Args>
    void submit(TaskId id, F&& fn, Args&&... args) {
        enqueue(std::move(id),
                bind_task<T>(std::forward<F>(fn), std::forward<Args>(args)...),
                false);
    }

    /**
     * @brief Block until the result of @p id is available
     * @throws TaskError if the task threw
     * @throws CancelledError if the task was cancelled by stop(false)
     * @throws UnknownTaskError if the id is not pending or unclaimed
     */
    T get_result(const TaskId& id) {
        return results_.await(id).unwrap(id);
    }

    /**
     * @brief Block until the result of @p id is available or @p timeout elapses
     * @throws TimeoutError on timeout; the result is kept for a later call
     */
    template<typename Rep, typename Period>
    T get_result(const TaskId& id, std::chrono::duration<Rep, Period> timeout) {
        return results_.await(id, timeout).unwrap(id);
    }

    /**
     * @brief Non-blocking get_result(); nullopt while the task is unfinished
     */
    std::optional<T> try_get_result(const TaskId& id) {
        auto outcome = results_.try_take(id);
        if (!outcome) {
            return std::nullopt;
        }
        return std::move(*outcome).unwrap(id);
    }

    /**
     * @brief Apply @p fn to every item in parallel; results in input order
     *
     * Fail-fast: the first task to fail (in completion order) aborts the wait
     * and its error is thrown. Submission stops, members that have not
     * started by then are skipped and the remaining results are discarded.
     */
    template<typename F, typename U>
    std::vector<T> map_tasks(F&& fn, const std::vector<U>& items) {
        auto tracker = std::make_shared<BatchTracker>(items.size());
        auto ids = submit_batch(std::forward<F>(fn), items, tracker);

        if (auto failed = tracker->wait()) {
            tracker->abort();
            for (const auto& id : ids) {
                results_.discard(id);
            }
            raise_failure(ids[*failed], tracker->error());
        }

        std::vector<T> out;
        out.reserve(ids.size());
        for (const auto& id : ids) {
            out.push_back(results_.await(id).unwrap(id));
        }
        return out;
    }

    /**
     * @brief Like map_tasks() but waits for every item and never throws for
     * task failures
     */
    template<typename F, typename U>
    std::vector<Outcome<T>> map_settled(F&& fn, const std::vector<U>& items) {
        auto ids = submit_batch(std::forward<F>(fn), items, nullptr);

        std::vector<Outcome<T>> out;
        out.reserve(ids.size());
        for (const auto& id : ids) {
            out.push_back(results_.await(id));
        }
        return out;
    }

    /**
     * @brief map_tasks() over consecutive chunks of @p batch_size, one chunk
     * at a time, bounding the number of queued tasks
     * @throws std::invalid_argument if @p batch_size is zero
     */
    template<typename F, typename U>
    std::vector<T> batch_process(F&& fn, const std::vector<U>& items, std::size_t batch_size) {
        if (batch_size == 0) {
            throw std::invalid_argument("batch_size must be positive");
        }

        std::vector<T> out;
        out.reserve(items.size());
        for (std::size_t begin = 0; begin < items.size(); begin += batch_size) {
            auto end = std::min(items.size(), begin + batch_size);
            std::vector<U> chunk(items.begin() + static_cast<std::ptrdiff_t>(begin),
                                 items.begin() + static_cast<std::ptrdiff_t>(end));
            auto part = map_tasks(fn, chunk);
            for (auto& value : part) {
                out.push_back(std::move(value));
            }
        }
        return out;
    }

    /**
     * @brief Stop accepting work and join the workers
     *
     * With @p drain every queued task still runs. Without it, queued tasks
     * that have not started are cancelled and report CancelledError; tasks
     * already running are always allowed to finish. Calling stop() again is
     * a no-op.
     *
     * @return Number of cancelled tasks
     */
    std::size_t stop(bool drain = true) {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        auto state = state_.load();
        if (state == EngineState::Stopped) {
            return 0;
        }
        if (state == EngineState::Created) {
            queue_.close();
            state_.store(EngineState::Stopped);
            TASKLANE_LOG_INFO("engine stopped before start");
            return 0;
        }

        state_.store(EngineState::Stopping);
        TASKLANE_LOG_INFO(std::string("engine stopping (") + (drain ? "drain" : "cancel") + ")");
        queue_.close();

        std::size_t cancelled = 0;
        if (!drain) {
            cancelled = cancel_queued();
        }

        pool_->join();
        state_.store(EngineState::Stopped);

        TASKLANE_LOG_INFO("engine stopped; " + metrics_.format());
        return cancelled;
    }

    [[nodiscard]] EngineState state() const noexcept { return state_.load(); }

    [[nodiscard]] bool is_running() const noexcept {
        return state_.load() == EngineState::Running;
    }

    /**
     * @brief Worker count; zero before start()
     */
    [[nodiscard]] std::uint32_t num_workers() const noexcept {
        return num_workers_.load();
    }

    /**
     * @brief Tasks queued but not yet picked up by a worker
     */
    [[nodiscard]] std::size_t pending() const { return queue_.size(); }

    [[nodiscard]] QueueStats queue_stats() const { return queue_.stats(); }

    /**
     * @brief Per-worker statistics; empty before start()
     */
    [[nodiscard]] std::vector<WorkerStats> worker_stats() const {
        // pool_ is written before state_ leaves Created and never replaced
        if (state_.load() == EngineState::Created) {
            return {};
        }
        return pool_->stats();
    }

    [[nodiscard]] ResultBox<T>& results() noexcept { return results_; }

    [[nodiscard]] MetricsCollector& metrics() noexcept { return metrics_; }
    [[nodiscard]] const MetricsCollector& metrics() const noexcept { return metrics_; }

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    static EngineConfig validated(EngineConfig config) {
        config.validate();
        return config;
    }

    [[noreturn]] static void raise_failure(const TaskId& id, const std::exception_ptr& error) {
        try {
            std::rethrow_exception(error);
        } catch (const CancelledError&) {
            throw;
        } catch (...) {
            throw TaskError(id, error);
        }
    }

    MetricsCollector* metrics_sink() noexcept {
        return config_.enable_metrics ? &metrics_ : nullptr;
    }

    void enqueue(TaskId id, typename WorkItem<T>::Body body, bool blocking,
                 PublishListener on_publish = {}, bool pinned = false) {
        if (state_.load() != EngineState::Running) {
            throw InvalidStateError(std::string("cannot submit task '") + id + "' in state " +
                                    to_string(state_.load()));
        }

        results_.reserve(id, std::move(on_publish), pinned);

        auto* metrics = metrics_sink();
        if (metrics) {
            metrics->queue_depth().increment();
        }

        WorkItem<T> item(id, std::move(body));
        bool pushed = blocking ? queue_.push(std::move(item)) : queue_.try_push(std::move(item));
        if (!pushed) {
            results_.discard(id);
            if (metrics) {
                metrics->queue_depth().decrement();
                metrics->submissions_rejected().increment();
            }
            if (queue_.is_closed()) {
                throw InvalidStateError("cannot submit task '" + id + "': engine is stopping");
            }
            TASKLANE_LOG_WARN("task '" + id + "' rejected: queue full");
            throw QueueFullError(queue_.capacity());
        }

        if (metrics) {
            metrics->tasks_submitted().increment();
        }
        TASKLANE_LOG_TRACE("task '" + id + "' queued");
    }

    template<typename F, typename U>
    std::vector<TaskId> submit_batch(F&& fn, const std::vector<U>& items,
                                     const std::shared_ptr<BatchTracker>& tracker) {
        auto shared_fn = std::make_shared<std::decay_t<F>>(std::forward<F>(fn));
        auto prefix = "tasklane/batch-" + std::to_string(++batch_seq_) + "/";

        std::vector<TaskId> ids;
        ids.reserve(items.size());
        try {
            for (std::size_t i = 0; i < items.size(); i++) {
                // A member already failed; the caller raises it
                if (tracker && tracker->failed()) {
                    TASKLANE_LOG_DEBUG("batch " + prefix + " failed after " +
                                       std::to_string(i) + " submissions");
                    break;
                }

                TaskId id = prefix + std::to_string(i);

                PublishListener listener;
                if (tracker) {
                    listener = [tracker, i](const std::exception_ptr& error) {
                        tracker->record(i, error);
                    };
                }

                typename WorkItem<T>::Body body =
                    [shared_fn, item = items[i], tracker, id]() -> T {
                        if (tracker && tracker->aborted()) {
                            throw CancelledError(id);
                        }
                        return std::invoke(*shared_fn, item);
                    };

                enqueue(id, std::move(body), true, std::move(listener), true);
                ids.push_back(std::move(id));
            }
        } catch (...) {
            if (tracker) {
                tracker->abort();
            }
            for (const auto& id : ids) {
                results_.discard(id);
            }
            throw;
        }
        return ids;
    }

    std::size_t cancel_queued() {
        auto dropped = queue_.drain();
        auto* metrics = metrics_sink();
        for (const auto& item : dropped) {
            results_.publish(item.id(),
                             Outcome<T>::err(std::make_exception_ptr(CancelledError(item.id()))));
            if (metrics) {
                metrics->queue_depth().decrement();
                metrics->tasks_cancelled().increment();
            }
        }
        if (!dropped.empty()) {
            TASKLANE_LOG_WARN("cancelled " + std::to_string(dropped.size()) + " queued tasks");
        }
        return dropped.size();
    }

    void on_evicted(const TaskId& id) {
        if (auto* metrics = metrics_sink()) {
            metrics->results_evicted().increment();
        }
        TASKLANE_LOG_DEBUG("unclaimed result of task '" + id + "' evicted");
    }

    EngineConfig config_;
    MetricsCollector metrics_;
    TaskQueue<WorkItem<T>> queue_;
    ResultBox<T> results_;
    std::unique_ptr<WorkerPool<T>> pool_;

    std::mutex lifecycle_mutex_;
    std::atomic<EngineState> state_{EngineState::Created};
    std::atomic<std::uint32_t> num_workers_{0};
    std::atomic<std::uint64_t> batch_seq_{0};
};

} // namespace tasklane
