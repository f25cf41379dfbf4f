#pragma once

/**
 * @file result_box.hpp
 * @brief Concurrent store correlating task ids to their outcomes
 */

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include "tasklane/core/errors.hpp"
#include "tasklane/core/outcome.hpp"

namespace tasklane {

/**
 * @brief Called once when an outcome is published; null error means success
 */
using PublishListener = std::function<void(const std::exception_ptr& error)>;

/**
 * @brief Called for every result dropped by TTL eviction
 */
using EvictionListener = std::function<void(const TaskId& id)>;

/**
 * @brief Store of task outcomes keyed by task id
 *
 * Each id gets a slot when it is reserved at submission time. Workers publish
 * into the slot exactly once; readers block on that slot's own condition
 * variable, so awaiting one id never wakes the waiters of another.
 *
 * Results are consumed on read: once every caller waiting at publication
 * time has received the outcome, the slot is removed and the id may be
 * reused. A timed-out await leaves the slot untouched. Published slots that
 * nobody waits on are evicted after the configured TTL (zero keeps them
 * forever); eviction runs lazily on reserve() and publish(). Pinned slots
 * belong to a caller that is certain to collect them and are never evicted.
 */
template<typename T>
class ResultBox {
public:
    explicit ResultBox(std::chrono::milliseconds ttl = std::chrono::milliseconds::zero(),
                       EvictionListener on_evict = {})
        : ttl_(ttl)
        , on_evict_(std::move(on_evict)) {}

    ResultBox(const ResultBox&) = delete;
    ResultBox& operator=(const ResultBox&) = delete;

    /**
     * @brief Create the slot for a newly submitted id
     * @param pinned Exempt the slot from TTL eviction
     * @throws DuplicateTaskError if the id is still live
     */
    void reserve(const TaskId& id, PublishListener on_publish = {}, bool pinned = false) {
        std::vector<TaskId> evicted;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            maybe_evict_locked(std::chrono::steady_clock::now(), evicted);
            if (slots_.count(id) != 0) {
                throw DuplicateTaskError(id);
            }
            auto slot = std::make_shared<Slot>();
            slot->on_publish = std::move(on_publish);
            slot->pinned = pinned;
            slots_.emplace(id, std::move(slot));
        }
        report_evicted(evicted);
    }

    /**
     * @brief Publish the outcome of a reserved id
     * @return false if the id is unknown or was discarded; the outcome is dropped
     */
    bool publish(const TaskId& id, Outcome<T> outcome) {
        std::shared_ptr<Slot> slot;
        PublishListener listener;
        std::exception_ptr error;
        std::vector<TaskId> evicted;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto now = std::chrono::steady_clock::now();
            auto it = slots_.find(id);
            if (it == slots_.end() || it->second->outcome) {
                return false;
            }
            slot = it->second;
            if (outcome.has_error()) {
                error = outcome.error();
            }
            slot->outcome.emplace(std::move(outcome));
            slot->published_at = now;
            listener = std::move(slot->on_publish);
            maybe_evict_locked(now, evicted);
        }
        slot->cv.notify_all();
        if (listener) {
            listener(error);
        }
        report_evicted(evicted);
        return true;
    }

    /**
     * @brief Block until the outcome of @p id is published
     * @throws UnknownTaskError if the id is not live or is discarded meanwhile
     */
    Outcome<T> await(const TaskId& id) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto slot = find_locked(id);
        slot->waiters++;
        slot->cv.wait(lock, [&] { return slot->outcome.has_value() || slot->discarded; });
        slot->waiters--;
        return take_locked(id, slot);
    }

    /**
     * @brief Block until the outcome of @p id is published or @p timeout elapses
     * @throws TimeoutError on timeout; the slot is kept for a later retry
     */
    template<typename Rep, typename Period>
    Outcome<T> await(const TaskId& id, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto slot = find_locked(id);
        slot->waiters++;
        bool ready = slot->cv.wait_for(lock, timeout, [&] {
            return slot->outcome.has_value() || slot->discarded;
        });
        slot->waiters--;
        if (!ready) {
            throw TimeoutError(id);
        }
        return take_locked(id, slot);
    }

    /**
     * @brief Non-blocking read
     * @return nullopt if the outcome is not published yet
     */
    std::optional<Outcome<T>> try_take(const TaskId& id) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto slot = find_locked(id);
        if (!slot->outcome) {
            return std::nullopt;
        }
        return take_locked(id, slot);
    }

    /**
     * @brief Drop the slot of @p id, published or not
     *
     * A later publish for the id is ignored. Waiters are woken and fail with
     * UnknownTaskError.
     */
    bool discard(const TaskId& id) {
        std::shared_ptr<Slot> slot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = slots_.find(id);
            if (it == slots_.end()) {
                return false;
            }
            slot = std::move(it->second);
            slots_.erase(it);
            slot->discarded = true;
        }
        slot->cv.notify_all();
        return true;
    }

    /**
     * @brief Evict published, unclaimed results older than the TTL
     * @return Number of evicted results
     */
    std::size_t evict_expired() {
        std::vector<TaskId> evicted;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            evict_expired_locked(std::chrono::steady_clock::now(), evicted);
        }
        report_evicted(evicted);
        return evicted.size();
    }

    [[nodiscard]] bool contains(const TaskId& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return slots_.count(id) != 0;
    }

    [[nodiscard]] bool is_published(const TaskId& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(id);
        return it != slots_.end() && it->second->outcome.has_value();
    }

    /**
     * @brief Number of live slots, pending or published
     */
    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return slots_.size();
    }

    [[nodiscard]] std::chrono::milliseconds ttl() const noexcept { return ttl_; }

private:
    struct Slot {
        std::condition_variable cv;
        std::optional<Outcome<T>> outcome;
        std::chrono::steady_clock::time_point published_at{};
        PublishListener on_publish;
        std::size_t waiters{0};
        bool discarded{false};
        bool pinned{false};
    };

    std::shared_ptr<Slot> find_locked(const TaskId& id) const {
        auto it = slots_.find(id);
        if (it == slots_.end()) {
            throw UnknownTaskError(id);
        }
        return it->second;
    }

    // Caller holds the lock and has already left the waiter count
    Outcome<T> take_locked(const TaskId& id, const std::shared_ptr<Slot>& slot) {
        if (slot->discarded || !slot->outcome) {
            throw UnknownTaskError(id);
        }
        if constexpr (std::is_copy_constructible_v<T>) {
            if (slot->waiters > 0) {
                // Others are still waiting; the last one out removes the slot
                return *slot->outcome;
            }
        }
        Outcome<T> out = std::move(*slot->outcome);
        slot->outcome.reset();
        slot->discarded = true;
        auto it = slots_.find(id);
        if (it != slots_.end() && it->second == slot) {
            slots_.erase(it);
        }
        if (slot->waiters > 0) {
            slot->cv.notify_all();
        }
        return out;
    }

    // Lazy sweeps run at most twice per TTL period
    void maybe_evict_locked(std::chrono::steady_clock::time_point now,
                            std::vector<TaskId>& evicted) {
        if (ttl_.count() <= 0 || now < next_sweep_) {
            return;
        }
        evict_expired_locked(now, evicted);
    }

    void evict_expired_locked(std::chrono::steady_clock::time_point now,
                              std::vector<TaskId>& evicted) {
        if (ttl_.count() <= 0) {
            return;
        }
        next_sweep_ = now + std::max(ttl_ / 2, std::chrono::milliseconds(1));
        for (auto it = slots_.begin(); it != slots_.end();) {
            const auto& slot = *it->second;
            if (slot.outcome && !slot.pinned && slot.waiters == 0 &&
                now - slot.published_at >= ttl_) {
                evicted.push_back(it->first);
                it = slots_.erase(it);
            } else {
                ++it;
            }
        }
    }

    void report_evicted(const std::vector<TaskId>& evicted) const {
        if (!on_evict_) {
            return;
        }
        for (const auto& id : evicted) {
            on_evict_(id);
        }
    }

    const std::chrono::milliseconds ttl_;
    const EvictionListener on_evict_;

    mutable std::mutex mutex_;
    std::unordered_map<TaskId, std::shared_ptr<Slot>> slots_;
    std::chrono::steady_clock::time_point next_sweep_{};
};

} // namespace tasklane
