#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace tandem {

/**
 * Failure categories surfaced by the sync core.
 */
enum class ErrorCode : int {
    None = 0,
    Signaling,          // malformed or wrong-kind descriptor, recoverable by re-exchange
    Negotiation,        // handshake setup failed, attempt must be restarted
    Transfer,           // missing frame or size mismatch for one item
    ProtocolViolation,  // message not valid for the current state
    LivenessTimeout,
    ReceiverRejection,
    InvalidState,
    ReadOnly,
    Storage,
};

[[nodiscard]] std::string_view error_code_name(ErrorCode code) noexcept;

/**
 * Error type for Result - a message and a category.
 */
struct Error {
    std::string message;
    ErrorCode code{ErrorCode::None};

    Error() = default;
    explicit Error(std::string msg, ErrorCode c = ErrorCode::None)
        : message(std::move(msg)), code(c) {}

    bool operator==(const Error& other) const {
        return message == other.message && code == other.code;
    }
};

/**
 * Result<T, E> - either a value (Ok) or an error (Err).
 *
 * Every public operation of the sync core reports failure through this type
 * instead of throwing.
 *
 *   auto decoded = network::decodeDescriptor(code)
 *       .and_then([](ConnectionDescriptor d) { return check(d); });
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
     * Get the success value, throwing if this is an error.
     */
    [[nodiscard]] T& unwrap() & {
        check_ok();
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& unwrap() const& {
        check_ok();
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        check_ok();
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) throw std::runtime_error("Result::unwrap_err() called on success");
        return std::get<1>(data_);
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) throw std::runtime_error("Result::unwrap_err() called on success");
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T default_value) const& {
        return is_ok() ? std::get<0>(data_) : std::move(default_value);
    }

    [[nodiscard]] T value_or(T default_value) && {
        return is_ok() ? std::get<0>(std::move(data_)) : std::move(default_value);
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
    [[nodiscard]] auto and_then(F&& f) && -> std::invoke_result_t<F, T> {
        using ResultU = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(std::move(data_)));
        }
        return ResultU::err(std::get<1>(std::move(data_)));
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    void check_ok() const {
        if (is_ok()) return;
        if constexpr (std::is_same_v<E, Error>) {
            throw std::runtime_error("Result::unwrap() called on error: " +
                                     std::get<1>(data_).message);
        } else {
            throw std::runtime_error("Result::unwrap() called on error");
        }
    }

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

    [[nodiscard]] static Result ok() { return Result(true); }
    [[nodiscard]] static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool is_ok() const noexcept { return is_ok_; }
    [[nodiscard]] bool is_err() const noexcept { return !is_ok_; }

    void unwrap() const {
        if (is_ok_) return;
        if constexpr (std::is_same_v<E, Error>) {
            throw std::runtime_error("Result::unwrap() called on error: " + error_.message);
        } else {
            throw std::runtime_error("Result::unwrap() called on error");
        }
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok_) throw std::runtime_error("Result::unwrap_err() called on success");
        return error_;
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const -> std::invoke_result_t<F> {
        using ResultU = std::invoke_result_t<F>;
        if (is_ok_) {
            return std::invoke(std::forward<F>(f));
        }
        return ResultU::err(error_);
    }

private:
    explicit Result(bool ok) : is_ok_(ok) {}
    explicit Result(E error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok_;
    E error_{};
};

/**
 * Shorthand for a failed Result<T> carrying a categorized error.
 */
template<typename T = void>
[[nodiscard]] Result<T, Error> fail(ErrorCode code, std::string message) {
    return Result<T, Error>::err(Error{std::move(message), code});
}

} // namespace tandem
