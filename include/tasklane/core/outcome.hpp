#pragma once

/**
 * @file outcome.hpp
 * @brief Success/failure result of one executed task
 */

#include <cstddef>
#include <exception>
#include <utility>
#include <variant>

#include "tasklane/core/errors.hpp"

namespace tasklane {

/**
 * @brief Tagged union of a task's value or the exception it raised
 *
 * Exceptions travel between threads as data inside an Outcome rather than
 * unwinding through the worker.
 */
template<typename T>
class Outcome {
public:
    static Outcome ok(T value) {
        return Outcome(std::in_place_index<0>, std::move(value));
    }

    static Outcome err(std::exception_ptr error) {
        return Outcome(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool has_value() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool has_error() const noexcept { return data_.index() == 1; }
    explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] const T& value() const& { return std::get<0>(data_); }
    [[nodiscard]] T& value() & { return std::get<0>(data_); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(data_)); }

    [[nodiscard]] const std::exception_ptr& error() const { return std::get<1>(data_); }

    /**
     * @brief Check if the stored error is of a specific type
     */
    template<typename E>
    [[nodiscard]] bool holds_error() const {
        if (!has_error()) {
            return false;
        }
        try {
            std::rethrow_exception(error());
        } catch (const E&) {
            return true;
        } catch (...) {
            return false;
        }
    }

    /**
     * @brief Return the value, or throw on behalf of task @p id
     *
     * A cancellation is rethrown as it is; anything the task body raised is
     * wrapped in a TaskError keeping the original.
     */
    T unwrap(const TaskId& id) && {
        if (has_value()) {
            return std::get<0>(std::move(data_));
        }
        const auto& e = error();
        if (holds_error<CancelledError>()) {
            std::rethrow_exception(e);
        }
        throw TaskError(id, e);
    }

private:
    template<std::size_t I, typename V>
    Outcome(std::in_place_index_t<I> tag, V&& v)
        : data_(tag, std::forward<V>(v)) {}

    std::variant<T, std::exception_ptr> data_;
};

} // namespace tasklane
