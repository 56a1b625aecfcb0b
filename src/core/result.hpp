#pragma once

#include "core/error_code.hpp"
#include <functional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

namespace tidesync {

/**
 * Error - what went wrong, classified.
 *
 * `detail` carries the SQLite result code for storage errors and the
 * server's retry-after seconds for RateLimited.
 */
struct Error {
    std::string message;
    ErrorCode code{ErrorCode::InternalError};
    int detail{0};

    Error() = default;
    explicit Error(std::string msg, ErrorCode c = ErrorCode::InternalError, int d = 0)
        : message(std::move(msg)), code(c), detail(d) {}

    [[nodiscard]] bool transient() const noexcept { return is_transient(code); }

    bool operator==(const Error& other) const {
        return message == other.message && code == other.code && detail == other.detail;
    }
};

namespace detail {

[[noreturn]] inline void bad_unwrap(const Error& error) {
    throw std::runtime_error("Result::unwrap() on error [" + std::string(to_string(error.code)) + "]: " +
                             error.message);
}

template<typename E>
[[noreturn]] void bad_unwrap(const E&) {
    throw std::runtime_error("Result::unwrap() on error");
}

[[noreturn]] inline void bad_unwrap_err() {
    throw std::runtime_error("Result::unwrap_err() on success");
}

} // namespace detail

/**
 * Result<T, E> - value or error. Every fallible engine operation returns
 * one; nothing throws across module boundaries.
 *
 *   auto status = repo.get(uuid)
 *       .map([](const std::optional<Entity>& e) { return e ? e->sync_status : SyncStatus::Error; })
 *       .value_or(SyncStatus::Error);
 *
 * unwrap() on an error (and unwrap_err() on a value) throws
 * std::runtime_error; callers check is_ok() first.
 */
template<typename T, typename E = Error>
class Result {
public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return data_.index() == 1; }

    [[nodiscard]] T& unwrap() & {
        if (is_err()) detail::bad_unwrap(std::get<1>(data_));
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& unwrap() const& {
        if (is_err()) detail::bad_unwrap(std::get<1>(data_));
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        if (is_err()) detail::bad_unwrap(std::get<1>(data_));
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) detail::bad_unwrap_err();
        return std::get<1>(data_);
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) detail::bad_unwrap_err();
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T fallback) const& {
        return is_ok() ? std::get<0>(data_) : std::move(fallback);
    }

    [[nodiscard]] T value_or(T fallback) && {
        return is_ok() ? std::get<0>(std::move(data_)) : std::move(fallback);
    }

    // Transform the value; an error passes through.
    template<typename F>
    [[nodiscard]] auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_err()) return Result<U, E>::err(std::get<1>(data_));
        return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(data_)));
    }

    template<typename F>
    [[nodiscard]] auto map(F&& f) && -> Result<std::invoke_result_t<F, T>, E> {
        using U = std::invoke_result_t<F, T>;
        if (is_err()) return Result<U, E>::err(std::get<1>(std::move(data_)));
        return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(std::move(data_))));
    }

    // Chain a step that can fail itself.
    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
        using Next = std::invoke_result_t<F, const T&>;
        if (is_err()) return Next::err(std::get<1>(data_));
        return std::invoke(std::forward<F>(f), std::get<0>(data_));
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) && -> std::invoke_result_t<F, T> {
        using Next = std::invoke_result_t<F, T>;
        if (is_err()) return Next::err(std::get<1>(std::move(data_)));
        return std::invoke(std::forward<F>(f), std::get<0>(std::move(data_)));
    }

    // Recover from an error; a value passes through.
    template<typename F>
    [[nodiscard]] auto or_else(F&& f) const& -> std::invoke_result_t<F, const E&> {
        using Next = std::invoke_result_t<F, const E&>;
        if (is_ok()) return Next::ok(std::get<0>(data_));
        return std::invoke(std::forward<F>(f), std::get<1>(data_));
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    std::variant<T, E> data_;
};

/**
 * Result<void, E> - success without a value.
 */
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok() { return Result(true, E{}); }
    [[nodiscard]] static Result err(E error) { return Result(false, std::move(error)); }

    [[nodiscard]] bool is_ok() const noexcept { return ok_; }
    [[nodiscard]] bool is_err() const noexcept { return !ok_; }

    void unwrap() const {
        if (!ok_) detail::bad_unwrap(error_);
    }

    [[nodiscard]] E& unwrap_err() & {
        if (ok_) detail::bad_unwrap_err();
        return error_;
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (ok_) detail::bad_unwrap_err();
        return error_;
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const -> std::invoke_result_t<F> {
        using Next = std::invoke_result_t<F>;
        if (!ok_) return Next::err(error_);
        return std::invoke(std::forward<F>(f));
    }

    template<typename F>
    [[nodiscard]] auto or_else(F&& f) const -> std::invoke_result_t<F, const E&> {
        using Next = std::invoke_result_t<F, const E&>;
        if (ok_) return Next::ok();
        return std::invoke(std::forward<F>(f), error_);
    }

private:
    Result(bool ok, E error) : ok_(ok), error_(std::move(error)) {}

    bool ok_;
    E error_;
};

} // namespace tidesync
