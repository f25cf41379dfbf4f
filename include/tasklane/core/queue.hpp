#pragma once

/**
 * @file queue.hpp
 * @brief Thread-safe FIFO task queue with optional capacity bound
 */

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace tasklane {

/**
 * @brief Queue statistics for monitoring
 */
struct QueueStats {
    std::uint64_t push_count{0};
    std::uint64_t pop_count{0};
    std::uint64_t push_rejected_count{0};
    std::uint64_t push_blocked_count{0};
    std::uint64_t pop_blocked_count{0};
    std::size_t current_size{0};
    std::size_t capacity{0};
    std::size_t high_watermark{0};
};

/**
 * @brief MPMC (Multi-Producer Multi-Consumer) FIFO queue
 *
 * Items are handed out strictly in push order. A capacity of zero means
 * unbounded; otherwise try_push() rejects and push() blocks while full.
 * Once closed, pushes fail and pops drain what is left.
 *
 * @tparam Item Queued element type (move-constructible)
 */
template<typename Item>
class TaskQueue {
public:
    explicit TaskQueue(std::size_t capacity = 0)
        : capacity_(capacity) {}

    // Non-copyable, non-movable (due to synchronization primitives)
    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;
    TaskQueue(TaskQueue&&) = delete;
    TaskQueue& operator=(TaskQueue&&) = delete;

    /**
     * @brief Push an item, blocking while the queue is full
     * @return true if pushed, false if the queue is closed
     */
    bool push(Item item) {
        std::unique_lock<std::mutex> lock(mutex_);

        while (full_locked() && !closed_) {
            stats_.push_blocked_count++;
            not_full_.wait(lock);
        }

        if (closed_) {
            stats_.push_rejected_count++;
            return false;
        }

        enqueue_locked(std::move(item));

        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Push without blocking
     * @return true if pushed, false if full or closed
     */
    bool try_push(Item item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);

            if (full_locked() || closed_) {
                stats_.push_rejected_count++;
                return false;
            }

            enqueue_locked(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Pop the oldest item, blocking while empty
     * @return Item if available, nullopt if the queue is closed and empty
     */
    std::optional<Item> pop() {
        std::unique_lock<std::mutex> lock(mutex_);

        while (items_.empty() && !closed_) {
            stats_.pop_blocked_count++;
            not_empty_.wait(lock);
        }

        if (items_.empty()) {
            return std::nullopt;
        }

        auto item = dequeue_locked();

        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    /**
     * @brief Pop without blocking
     */
    std::optional<Item> try_pop() {
        std::optional<Item> item;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (items_.empty()) {
                return std::nullopt;
            }
            item = dequeue_locked();
        }
        not_full_.notify_one();
        return item;
    }

    /**
     * @brief Pop with timeout
     * @return Item if available, nullopt on timeout or closed+empty
     */
    template<typename Rep, typename Period>
    std::optional<Item> pop_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);

        if (!not_empty_.wait_for(lock, timeout, [this] {
            return !items_.empty() || closed_;
        })) {
            stats_.pop_blocked_count++;
            return std::nullopt;
        }

        if (items_.empty()) {
            return std::nullopt;
        }

        auto item = dequeue_locked();

        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    /**
     * @brief Remove and return every queued item in FIFO order
     */
    std::vector<Item> drain() {
        std::vector<Item> out;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            out.reserve(items_.size());
            while (!items_.empty()) {
                out.push_back(dequeue_locked());
            }
        }
        not_full_.notify_all();
        return out;
    }

    /**
     * @brief Close the queue (no more pushes accepted)
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    [[nodiscard]] bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    [[nodiscard]] bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.empty();
    }

    [[nodiscard]] bool full() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return full_locked();
    }

    /**
     * @brief Configured capacity, zero when unbounded
     */
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

    [[nodiscard]] QueueStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto s = stats_;
        s.current_size = items_.size();
        s.capacity = capacity_;
        return s;
    }

private:
    bool full_locked() const noexcept {
        return capacity_ != 0 && items_.size() >= capacity_;
    }

    void enqueue_locked(Item item) {
        items_.push_back(std::move(item));
        stats_.push_count++;
        if (items_.size() > stats_.high_watermark) {
            stats_.high_watermark = items_.size();
        }
    }

    Item dequeue_locked() {
        Item item = std::move(items_.front());
        items_.pop_front();
        stats_.pop_count++;
        return item;
    }

    const std::size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;

    std::deque<Item> items_;
    bool closed_{false};

    QueueStats stats_;
};

} // namespace tasklane
