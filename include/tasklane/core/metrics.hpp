#pragma once

/**
 * @file metrics.hpp
 * @brief Engine metrics collection and reporting
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace tasklane {

/**
 * @brief Counter metric (monotonically increasing)
 */
class Counter {
public:
    void increment(std::uint64_t value = 1) noexcept {
        value_.fetch_add(value, std::memory_order_relaxed);
    }

    [[nodiscard]] std::uint64_t value() const noexcept {
        return value_.load(std::memory_order_relaxed);
    }

    void reset() noexcept {
        value_.store(0, std::memory_order_relaxed);
    }

private:
    std::atomic<std::uint64_t> value_{0};
};

/**
 * @brief Gauge metric (can go up and down)
 */
class Gauge {
public:
    void set(std::int64_t value) noexcept {
        value_.store(value, std::memory_order_relaxed);
    }

    void increment(std::int64_t delta = 1) noexcept {
        value_.fetch_add(delta, std::memory_order_relaxed);
    }

    void decrement(std::int64_t delta = 1) noexcept {
        value_.fetch_sub(delta, std::memory_order_relaxed);
    }

    [[nodiscard]] std::int64_t value() const noexcept {
        return value_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<std::int64_t> value_{0};
};

/**
 * @brief Histogram for latency measurements (seconds)
 */
class Histogram {
public:
    explicit Histogram(std::vector<double> buckets = default_buckets())
        : buckets_(std::move(buckets))
        , counts_(buckets_.size() + 1, 0) {}

    void observe(double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        sum_ += value;
        count_++;
        if (value > max_) {
            max_ = value;
        }

        for (std::size_t i = 0; i < buckets_.size(); i++) {
            if (value <= buckets_[i]) {
                counts_[i]++;
                return;
            }
        }
        counts_.back()++;  // +Inf bucket
    }

    [[nodiscard]] double sum() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sum_;
    }

    [[nodiscard]] std::uint64_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_;
    }

    [[nodiscard]] double mean() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_ > 0 ? sum_ / static_cast<double>(count_) : 0.0;
    }

    [[nodiscard]] double max() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return max_;
    }

    /**
     * @brief Per-bucket counts; the last entry is the +Inf bucket
     */
    [[nodiscard]] std::vector<std::uint64_t> bucket_counts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return counts_;
    }

    [[nodiscard]] const std::vector<double>& buckets() const noexcept { return buckets_; }

    static std::vector<double> default_buckets() {
        return {0.001, 0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0};
    }

private:
    mutable std::mutex mutex_;
    std::vector<double> buckets_;
    std::vector<std::uint64_t> counts_;
    double sum_{0.0};
    double max_{0.0};
    std::uint64_t count_{0};
};

/**
 * @brief Engine metrics snapshot
 */
struct EngineMetrics {
    std::uint64_t tasks_submitted{0};
    std::uint64_t tasks_completed{0};
    std::uint64_t tasks_failed{0};
    std::uint64_t tasks_cancelled{0};
    std::uint64_t submissions_rejected{0};
    std::uint64_t results_evicted{0};
    std::int64_t queue_depth{0};
    std::int64_t in_flight{0};
    double avg_latency_ms{0.0};
    double max_latency_ms{0.0};
    std::chrono::steady_clock::time_point timestamp;
};

/**
 * @brief Metrics collector and reporter
 *
 * Latency is measured from submission to publication of the outcome.
 */
class MetricsCollector {
public:
    MetricsCollector() : start_time_(std::chrono::steady_clock::now()) {}

    Counter& tasks_submitted() { return submitted_; }
    Counter& tasks_completed() { return completed_; }
    Counter& tasks_failed() { return failed_; }
    Counter& tasks_cancelled() { return cancelled_; }
    Counter& submissions_rejected() { return rejected_; }
    Counter& results_evicted() { return evicted_; }

    Histogram& task_latency() { return latency_; }

    Gauge& queue_depth() { return queue_depth_; }
    Gauge& in_flight() { return in_flight_; }

    [[nodiscard]] EngineMetrics snapshot() const {
        EngineMetrics m;
        m.timestamp = std::chrono::steady_clock::now();
        m.tasks_submitted = submitted_.value();
        m.tasks_completed = completed_.value();
        m.tasks_failed = failed_.value();
        m.tasks_cancelled = cancelled_.value();
        m.submissions_rejected = rejected_.value();
        m.results_evicted = evicted_.value();
        m.queue_depth = queue_depth_.value();
        m.in_flight = in_flight_.value();
        m.avg_latency_ms = latency_.mean() * 1000.0;
        m.max_latency_ms = latency_.max() * 1000.0;
        return m;
    }

    /**
     * @brief Format metrics as string
     */
    [[nodiscard]] std::string format() const {
        auto m = snapshot();
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2);
        oss << "Submitted: " << m.tasks_submitted
            << " | Completed: " << m.tasks_completed
            << " | Failed: " << m.tasks_failed
            << " | Cancelled: " << m.tasks_cancelled
            << " | Queue: " << m.queue_depth
            << " | In-flight: " << m.in_flight
            << " | Latency: " << m.avg_latency_ms << " ms";
        return oss.str();
    }

    [[nodiscard]] std::chrono::milliseconds uptime() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time_
        );
    }

private:
    std::chrono::steady_clock::time_point start_time_;

    Counter submitted_;
    Counter completed_;
    Counter failed_;
    Counter cancelled_;
    Counter rejected_;
    Counter evicted_;
    Histogram latency_;
    Gauge queue_depth_;
    Gauge in_flight_;
};

} // namespace tasklane
