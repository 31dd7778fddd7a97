#pragma once

#include <variant>
#include <string>
#include <functional>
#include <stdexcept>
#include <type_traits>

namespace cobalt {

/**
 * Broad classification of a failure reported through Result.
 */
enum class ErrorKind {
    InvalidArgument,
    Parse,
    OutOfRange,
    Duplicate,
    NotFound,
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidArgument: return "invalid argument";
        case ErrorKind::Parse: return "parse error";
        case ErrorKind::OutOfRange: return "out of range";
        case ErrorKind::Duplicate: return "duplicate";
        case ErrorKind::NotFound: return "not found";
    }
    return "unknown";
}

/**
 * Error type for Result - a message plus the kind of failure.
 */
struct Error {
    std::string message;
    ErrorKind kind{ErrorKind::InvalidArgument};

    Error() = default;
    explicit Error(std::string msg, ErrorKind k = ErrorKind::InvalidArgument)
        : message(std::move(msg)), kind(k) {}

    bool operator==(const Error& other) const = default;
};

namespace detail {

[[noreturn]] inline void throw_unwrap_failure(const Error& error) {
    throw std::runtime_error("Result::unwrap() called on error: " + error.message);
}

template<typename E>
[[noreturn]] inline void throw_unwrap_failure(const E&) {
    throw std::runtime_error("Result::unwrap() called on error");
}

} // namespace detail

/**
 * Result<T, E> - either a value (ok) or an error (err).
 *
 * Fallible operations in the core return a Result; the C boundary turns an
 * error into its sentinel value.
 *
 *   auto id = UUID4::parse(text)
 *       .map([](const UUID4& u) { return u.hash(); });
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
     * Get the value, throwing std::runtime_error if this is an error.
     */
    [[nodiscard]] T& unwrap() & {
        if (is_err()) detail::throw_unwrap_failure(std::get<1>(data_));
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& unwrap() const& {
        if (is_err()) detail::throw_unwrap_failure(std::get<1>(data_));
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        if (is_err()) detail::throw_unwrap_failure(std::get<1>(data_));
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T fallback) const& {
        return is_ok() ? std::get<0>(data_) : std::move(fallback);
    }

    [[nodiscard]] T value_or(T fallback) && {
        return is_ok() ? std::get<0>(std::move(data_)) : std::move(fallback);
    }

    /**
     * map : Result<T, E> -> (T -> U) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(data_)));
        }
        return Result<U, E>::err(std::get<1>(data_));
    }

    /**
     * and_then : Result<T, E> -> (T -> Result<U, E>) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
        using ResultU = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(data_));
        }
        return ResultU::err(std::get<1>(data_));
    }

    /**
     * Run a side effect on the error (typically logging) and pass the
     * Result through.
     */
    template<typename F>
    const Result& inspect_err(F&& f) const& {
        if (is_err()) {
            std::invoke(std::forward<F>(f), std::get<1>(data_));
        }
        return *this;
    }

    template<typename OnOk, typename OnErr>
    [[nodiscard]] auto match(OnOk&& on_ok, OnErr&& on_err) const& {
        if (is_ok()) {
            return std::invoke(std::forward<OnOk>(on_ok), std::get<0>(data_));
        }
        return std::invoke(std::forward<OnErr>(on_err), std::get<1>(data_));
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
        if (is_err()) detail::throw_unwrap_failure(error_);
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const -> std::invoke_result_t<F> {
        using ResultU = std::invoke_result_t<F>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f));
        }
        return ResultU::err(error_);
    }

    template<typename F>
    const Result& inspect_err(F&& f) const& {
        if (is_err()) {
            std::invoke(std::forward<F>(f), error_);
        }
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

} // namespace cobalt
