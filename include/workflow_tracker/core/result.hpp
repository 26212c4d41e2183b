#pragma once

#include <workflow_tracker/core/error.hpp>

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace workflow_tracker {

/// Holds either a value of T or an error of E. Accessing the wrong
/// alternative throws std::bad_variant_access.
template <typename T, typename E>
class Result {
public:
    static Result Ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result Err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return state_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return state_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const T& Value() const& { return std::get<0>(state_); }
    [[nodiscard]] T Value() && { return std::get<0>(std::move(state_)); }
    [[nodiscard]] const E& Error() const& { return std::get<1>(state_); }
    [[nodiscard]] E Error() && { return std::get<1>(std::move(state_)); }

    [[nodiscard]] T ValueOr(T fallback) const {
        return IsOk() ? std::get<0>(state_) : std::move(fallback);
    }

    // fn: const T& -> Result<U, E>
    template <typename Fn>
    auto AndThen(Fn&& fn) const -> std::invoke_result_t<Fn, const T&> {
        using Next = std::invoke_result_t<Fn, const T&>;
        if (IsErr()) {
            return Next::Err(std::get<1>(state_));
        }
        return std::forward<Fn>(fn)(std::get<0>(state_));
    }

    // fn: const T& -> U
    template <typename Fn>
    auto Map(Fn&& fn) const -> Result<std::invoke_result_t<Fn, const T&>, E> {
        using Mapped = Result<std::invoke_result_t<Fn, const T&>, E>;
        if (IsErr()) {
            return Mapped::Err(std::get<1>(state_));
        }
        return Mapped::Ok(std::forward<Fn>(fn)(std::get<0>(state_)));
    }

private:
    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v) : state_(tag, std::forward<V>(v)) {}

    std::variant<T, E> state_;
};

/// Outcome of an operation with nothing to return.
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(std::nullopt); }
    static Result Err(E error) { return Result(std::optional<E>(std::move(error))); }

    [[nodiscard]] bool IsOk() const noexcept { return !failure_; }
    [[nodiscard]] bool IsErr() const noexcept { return failure_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& { return failure_.value(); }
    [[nodiscard]] E Error() && { return std::move(failure_).value(); }

private:
    explicit Result(std::optional<E> failure) : failure_(std::move(failure)) {}

    std::optional<E> failure_;
};

} // namespace workflow_tracker
