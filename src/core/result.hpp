#pragma once

#include <variant>
#include <string>
#include <functional>
#include <stdexcept>
#include <type_traits>

namespace weave {

/**
 * Failure categories shared across the engine.
 *
 * Storage errors may also carry a raw SQLite result code in Error::code;
 * DocumentStore maps those to Persistence before they leave the storage layer.
 */
enum class ErrorCode : int {
    None = 0,
    InvalidArgument = 1,
    ProtocolDecode = 100,
    Transport = 101,
    Persistence = 103,
};

/**
 * Error type for Result - a message plus a numeric code.
 */
struct Error {
    std::string message;
    int code{0};

    Error() = default;
    explicit Error(std::string msg, int c = 0) : message(std::move(msg)), code(c) {}
    Error(std::string msg, ErrorCode c) : message(std::move(msg)), code(static_cast<int>(c)) {}

    [[nodiscard]] bool is(ErrorCode c) const noexcept {
        return code == static_cast<int>(c);
    }

    bool operator==(const Error& other) const = default;
};

namespace detail {

template<typename E>
[[noreturn]] void throw_bad_unwrap(const E& error) {
    if constexpr (std::is_same_v<E, Error>) {
        throw std::runtime_error("Result::unwrap() called on error: " + error.message);
    } else {
        throw std::runtime_error("Result::unwrap() called on error");
    }
}

[[noreturn]] inline void throw_bad_unwrap_err() {
    throw std::runtime_error("Result::unwrap_err() called on success");
}

} // namespace detail

/**
 * Result<T, E> - either a value (ok) or an error (err).
 *
 *   Result<Bytes> decode(...);
 *   auto frame = decode(bytes)
 *       .and_then([](Bytes b) { return parse(b); })
 *       .map_err([](Error e) { return Error{"frame: " + e.message, e.code}; });
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

    /**
     * Access the value, throwing if this holds an error.
     * Production code checks is_ok() first; tests unwrap freely.
     */
    [[nodiscard]] T& unwrap() & {
        if (is_err()) detail::throw_bad_unwrap(std::get<1>(data_));
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& unwrap() const& {
        if (is_err()) detail::throw_bad_unwrap(std::get<1>(data_));
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        if (is_err()) detail::throw_bad_unwrap(std::get<1>(data_));
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) detail::throw_bad_unwrap_err();
        return std::get<1>(data_);
    }

    [[nodiscard]] E unwrap_err() && {
        if (is_ok()) detail::throw_bad_unwrap_err();
        return std::get<1>(std::move(data_));
    }

    [[nodiscard]] T value_or(T fallback) const& {
        return is_ok() ? std::get<0>(data_) : std::move(fallback);
    }

    [[nodiscard]] T value_or(T fallback) && {
        return is_ok() ? std::get<0>(std::move(data_)) : std::move(fallback);
    }

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

    template<typename F>
    [[nodiscard]] auto map_err(F&& f) const& -> Result<T, std::invoke_result_t<F, const E&>> {
        using NewE = std::invoke_result_t<F, const E&>;
        if (is_ok()) return Result<T, NewE>::ok(std::get<0>(data_));
        return Result<T, NewE>::err(std::invoke(std::forward<F>(f), std::get<1>(data_)));
    }

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

    /**
     * Run a side effect on the error (usually logging) and pass the Result through.
     */
    template<typename F>
    const Result& inspect_err(F&& f) const& {
        if (is_err()) std::invoke(std::forward<F>(f), std::get<1>(data_));
        return *this;
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    std::variant<T, E> data_;
};

/**
 * Result<void, E> - success without a value, or an error.
 */
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok() { return Result(); }
    [[nodiscard]] static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool is_ok() const noexcept { return ok_; }
    [[nodiscard]] bool is_err() const noexcept { return !ok_; }

    void unwrap() const {
        if (!ok_) detail::throw_bad_unwrap(error_);
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (ok_) detail::throw_bad_unwrap_err();
        return error_;
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const -> std::invoke_result_t<F> {
        using Next = std::invoke_result_t<F>;
        if (!ok_) return Next::err(error_);
        return std::invoke(std::forward<F>(f));
    }

    template<typename F>
    const Result& inspect_err(F&& f) const {
        if (!ok_) std::invoke(std::forward<F>(f), error_);
        return *this;
    }

private:
    Result() : ok_(true) {}
    explicit Result(E error) : ok_(false), error_(std::move(error)) {}

    bool ok_;
    E error_{};
};

template<typename T>
using Res = Result<T, Error>;

} // namespace weave
