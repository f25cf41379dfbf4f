#pragma once

/**
 * @file worker_pool.hpp
 * @brief Worker thread pool management
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "tasklane/core/logger.hpp"
#include "tasklane/core/metrics.hpp"
#include "tasklane/core/outcome.hpp"
#include "tasklane/core/queue.hpp"
#include "tasklane/core/result_box.hpp"
#include "tasklane/core/work_item.hpp"

namespace tasklane {

/**
 * @brief Worker thread statistics
 */
struct WorkerStats {
    std::uint64_t tasks_processed{0};
    std::uint64_t tasks_failed{0};
    std::uint64_t idle_time_ns{0};
    std::uint64_t active_time_ns{0};
};

/**
 * @brief Individual worker thread
 *
 * Runs the dequeue-execute-publish loop until the queue is closed and empty.
 * Whatever a task body throws is captured into an Err outcome; it never
 * leaves the loop.
 */
template<typename T>
class Worker {
public:
    Worker(std::uint32_t id,
           std::string name,
           TaskQueue<WorkItem<T>>& queue,
           ResultBox<T>& results,
           MetricsCollector* metrics)
        : id_(id)
        , name_(std::move(name))
        , queue_(queue)
        , results_(results)
        , metrics_(metrics) {}

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    /**
     * @brief Start the worker thread
     */
    void start() {
        thread_ = std::thread(&Worker::run, this);
    }

    /**
     * @brief Wait for the worker thread to finish
     */
    void join() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    [[nodiscard]] std::uint32_t id() const noexcept { return id_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    [[nodiscard]] WorkerStats stats() const noexcept {
        WorkerStats s;
        s.tasks_processed = processed_.load(std::memory_order_relaxed);
        s.tasks_failed = failed_.load(std::memory_order_relaxed);
        s.idle_time_ns = idle_ns_.load(std::memory_order_relaxed);
        s.active_time_ns = active_ns_.load(std::memory_order_relaxed);
        return s;
    }

private:
    void run() {
        Logger::set_thread_name(name_);
        TASKLANE_LOG_DEBUG("worker started");

        for (;;) {
            auto idle_start = std::chrono::steady_clock::now();
            auto item = queue_.pop();
            auto start = std::chrono::steady_clock::now();
            idle_ns_.fetch_add(elapsed_ns(idle_start, start), std::memory_order_relaxed);

            if (!item) {
                break;  // Closed and empty
            }

            execute(*item);

            active_ns_.fetch_add(elapsed_ns(start, std::chrono::steady_clock::now()),
                                 std::memory_order_relaxed);
        }

        TASKLANE_LOG_DEBUG("worker exiting after " + std::to_string(processed_.load()) + " tasks");
        Logger::clear_thread_name();
    }

    void execute(const WorkItem<T>& item) {
        if (metrics_) {
            metrics_->queue_depth().decrement();
            metrics_->in_flight().increment();
        }

        std::optional<Outcome<T>> outcome;
        try {
            outcome.emplace(Outcome<T>::ok(item.run()));
        } catch (...) {
            outcome.emplace(Outcome<T>::err(std::current_exception()));
        }

        bool failed = outcome->has_error();
        bool cancelled = failed && outcome->template holds_error<CancelledError>();
        if (failed) {
            TASKLANE_LOG_DEBUG("task '" + item.id() + "' failed: " + describe(outcome->error()));
        }

        try {
            if (!results_.publish(item.id(), std::move(*outcome))) {
                TASKLANE_LOG_DEBUG("result for discarded task '" + item.id() + "' dropped");
            }
        } catch (const std::exception& e) {
            TASKLANE_LOG_ERROR("publishing result of task '" + item.id() + "' failed: " + e.what());
        }

        processed_.fetch_add(1, std::memory_order_relaxed);
        if (failed) {
            failed_.fetch_add(1, std::memory_order_relaxed);
        }

        if (metrics_) {
            metrics_->in_flight().decrement();
            if (cancelled) {
                metrics_->tasks_cancelled().increment();
            } else if (failed) {
                metrics_->tasks_failed().increment();
            } else {
                metrics_->tasks_completed().increment();
            }
            auto latency = std::chrono::duration<double>(
                std::chrono::steady_clock::now() - item.enqueued_at());
            metrics_->task_latency().observe(latency.count());
        }
    }

    static std::uint64_t elapsed_ns(std::chrono::steady_clock::time_point from,
                                    std::chrono::steady_clock::time_point to) noexcept {
        auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(to - from).count();
        return static_cast<std::uint64_t>(ns);
    }

    std::uint32_t id_;
    std::string name_;
    TaskQueue<WorkItem<T>>& queue_;
    ResultBox<T>& results_;
    MetricsCollector* metrics_;
    std::thread thread_;

    std::atomic<std::uint64_t> processed_{0};
    std::atomic<std::uint64_t> failed_{0};
    std::atomic<std::uint64_t> idle_ns_{0};
    std::atomic<std::uint64_t> active_ns_{0};
};

/**
 * @brief Configuration for worker pool
 */
struct WorkerPoolConfig {
    std::uint32_t num_workers{1};
    std::string name_prefix{"tasklane-worker"};
};

/**
 * @brief Fixed-size pool of worker threads sharing one task queue
 *
 * The pool has no stop flag of its own: closing the queue is what ends the
 * workers, after they have emptied it.
 */
template<typename T>
class WorkerPool {
public:
    WorkerPool(WorkerPoolConfig config,
               TaskQueue<WorkItem<T>>& queue,
               ResultBox<T>& results,
               MetricsCollector* metrics = nullptr)
        : config_(std::move(config))
        , queue_(queue) {
        if (config_.num_workers == 0) {
            config_.num_workers = 1;
        }
        workers_.reserve(config_.num_workers);
        for (std::uint32_t i = 0; i < config_.num_workers; i++) {
            workers_.push_back(std::make_unique<Worker<T>>(
                i, config_.name_prefix + "-" + std::to_string(i), queue, results, metrics));
        }
    }

    ~WorkerPool() {
        join();
    }

    // Non-copyable, non-movable
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Start all worker threads
     *
     * If a thread cannot be created the queue is closed and the workers
     * already running are joined before the error propagates.
     */
    void start() {
        try {
            for (auto& worker : workers_) {
                worker->start();
            }
        } catch (const std::system_error& e) {
            TASKLANE_LOG_ERROR(std::string("failed to start worker thread: ") + e.what());
            queue_.close();
            join();
            throw;
        }
    }

    /**
     * @brief Wait for every worker to exit
     */
    void join() {
        for (auto& worker : workers_) {
            worker->join();
        }
    }

    [[nodiscard]] std::uint32_t num_workers() const noexcept {
        return config_.num_workers;
    }

    [[nodiscard]] std::vector<WorkerStats> stats() const {
        std::vector<WorkerStats> result;
        result.reserve(workers_.size());
        for (const auto& worker : workers_) {
            result.push_back(worker->stats());
        }
        return result;
    }

private:
    WorkerPoolConfig config_;
    TaskQueue<WorkItem<T>>& queue_;
    std::vector<std::unique_ptr<Worker<T>>> workers_;
};

} // namespace tasklane
