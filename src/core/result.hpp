#pragma once

#include <variant>
#include <string>
#include <string_view>
#include <functional>
#include <stdexcept>
#include <type_traits>

namespace ksuid {

/**
 * ErrorCode - the ways a KSUID operation can reject its input.
 */
enum class ErrorCode {
    InvalidTimestamp,
    InvalidPayloadLength,
    InvalidKSUID,
    InvalidKSUIDString,
    InvalidBase62Digit,
    RandomSourceUnavailable,
    InvalidArgument,
};

[[nodiscard]] constexpr std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidTimestamp: return "InvalidTimestamp";
        case ErrorCode::InvalidPayloadLength: return "InvalidPayloadLength";
        case ErrorCode::InvalidKSUID: return "InvalidKSUID";
        case ErrorCode::InvalidKSUIDString: return "InvalidKSUIDString";
        case ErrorCode::InvalidBase62Digit: return "InvalidBase62Digit";
        case ErrorCode::RandomSourceUnavailable: return "RandomSourceUnavailable";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
    }
    return "Unknown";
}

/**
 * Error - a rejected input, with a message naming the offending value.
 */
struct Error {
    std::string message;
    ErrorCode code{ErrorCode::InvalidKSUID};

    Error() = default;
    Error(ErrorCode c, std::string msg) : message(std::move(msg)), code(c) {}

    bool operator==(const Error& other) const {
        return message == other.message && code == other.code;
    }
};

/**
 * Result<T, E> - either a value (ok) or an error (err).
 *
 * Every fallible operation in the library returns one of these instead of
 * throwing. Chain with map/and_then:
 *
 *   auto text = Ksuid::parse(input)
 *       .and_then([](const Ksuid& k) { return k.next(); })
 *       .map([](const Ksuid& k) { return k.to_string(); });
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

    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return data_.index() == 1;
    }

    /**
     * Get the value, throwing std::runtime_error if this is an error.
     */
    [[nodiscard]] T& unwrap() & {
        throw_if_err();
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& unwrap() const& {
        throw_if_err();
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        throw_if_err();
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (is_ok()) {
            return std::get<0>(data_);
        }
        return default_value;
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
     * map_err : Result<T, E> -> (E -> F) -> Result<T, F>
     */
    template<typename F>
    [[nodiscard]] auto map_err(F&& f) const& -> Result<T, std::invoke_result_t<F, const E&>> {
        using NewE = std::invoke_result_t<F, const E&>;
        if (is_err()) {
            return Result<T, NewE>::err(std::invoke(std::forward<F>(f), std::get<1>(data_)));
        }
        return Result<T, NewE>::ok(std::get<0>(data_));
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

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    void throw_if_err() const {
        if (is_ok()) return;
        if constexpr (std::is_same_v<E, Error>) {
            throw std::runtime_error("Result::unwrap() called on error: " +
                                     std::get<1>(data_).message);
        } else {
            throw std::runtime_error("Result::unwrap() called on error");
        }
    }

    // Indexed rather than typed access so T and E may be the same type.
    std::variant<T, E> data_;
};

/**
 * Result<void, E> - success carries no value.
 */
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok() {
        return Result(true);
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept {
        return is_ok_;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return !is_ok_;
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

private:
    explicit Result(bool ok) : is_ok_(ok) {}
    explicit Result(E error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok_;
    E error_{};
};

template<typename T>
using Res = Result<T, Error>;

} // namespace ksuid
