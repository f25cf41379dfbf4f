#pragma once

/**
 * @file batch.hpp
 * @brief Completion tracking for bulk submissions
 */

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <mutex>
#include <optional>

namespace tasklane {

/**
 * @brief Countdown latch that also remembers the first failure
 *
 * Fed from ResultBox publish listeners, so it sees outcomes in completion
 * order. wait() returns as soon as every member completed or one failed.
 * The first failure also aborts the batch, so members still queued skip
 * their body.
 */
class BatchTracker {
public:
    explicit BatchTracker(std::size_t total)
        : remaining_(total) {}

    BatchTracker(const BatchTracker&) = delete;
    BatchTracker& operator=(const BatchTracker&) = delete;

    /**
     * @brief Record the outcome of member @p index; null error means success
     */
    void record(std::size_t index, const std::exception_ptr& error) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (remaining_ > 0) {
                remaining_--;
            }
            if (error && !first_failure_) {
                first_failure_ = index;
                error_ = error;
                aborted_.store(true, std::memory_order_release);
            }
        }
        cv_.notify_all();
    }

    /**
     * @brief Block until all members completed or one failed
     * @return Index of the first failed member, nullopt if all succeeded
     */
    std::optional<std::size_t> wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return remaining_ == 0 || first_failure_.has_value(); });
        return first_failure_;
    }

    /**
     * @brief Non-blocking check for a recorded failure
     */
    [[nodiscard]] bool failed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return first_failure_.has_value();
    }

    [[nodiscard]] std::exception_ptr error() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_;
    }

    /**
     * @brief Ask members that have not started yet to skip their body
     */
    void abort() noexcept { aborted_.store(true, std::memory_order_release); }

    [[nodiscard]] bool aborted() const noexcept {
        return aborted_.load(std::memory_order_acquire);
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t remaining_;
    std::optional<std::size_t> first_failure_;
    std::exception_ptr error_;
    std::atomic<bool> aborted_{false};
};

} // namespace tasklane
