/**
 * @file result.hpp
 * @brief Monadic error handling type for lanwake.
 *
 * Provides Result<T, E> as the primary error-handling mechanism. Probe and
 * wake paths never throw; every failure is returned as an Error carrying a
 * typed ErrorCode so callers can tell malformed input from transient
 * network conditions.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace lanwake {

// ─────────────────────────────────────────────
// Error Codes
// ─────────────────────────────────────────────

enum class ErrorCode : uint8_t {
    Failure,                ///< Unclassified
    InvalidMac,
    InvalidIp,
    InvalidBroadcast,
    InvalidInterface,       ///< Interface name contains forbidden characters
    InterfaceNotFound,
    PermissionDenied,       ///< Raw socket / neighbor flush capability missing
    ProbeTimeout,
    AllInterfacesFailed,
    Cancelled,
    Io,
    Config
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Failure:             return "failure";
        case ErrorCode::InvalidMac:          return "invalid_mac";
        case ErrorCode::InvalidIp:           return "invalid_ip";
        case ErrorCode::InvalidBroadcast:    return "invalid_broadcast";
        case ErrorCode::InvalidInterface:    return "invalid_interface";
        case ErrorCode::InterfaceNotFound:   return "interface_not_found";
        case ErrorCode::PermissionDenied:    return "permission_denied";
        case ErrorCode::ProbeTimeout:        return "probe_timeout";
        case ErrorCode::AllInterfacesFailed: return "all_interfaces_failed";
        case ErrorCode::Cancelled:           return "cancelled";
        case ErrorCode::Io:                  return "io";
        case ErrorCode::Config:              return "config";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a code, a descriptive message and optional
 *        per-interface sub-errors.
 */
struct Error {
    ErrorCode code{ErrorCode::Failure};
    std::string message;
    std::vector<std::string> details;

    explicit Error(std::string msg) : message(std::move(msg)) {}

    Error(ErrorCode c, std::string msg, std::vector<std::string> sub_errors = {})
        : code(c), message(std::move(msg)), details(std::move(sub_errors)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
    [[nodiscard]] bool is(ErrorCode c) const noexcept { return code == c; }
};

/**
 * @brief Result<T, E>: a monadic error type.
 *
 * Holds either a success value of type T or an error of type E.
 *
 * @note When C++23 std::expected becomes widely available on target
 *       compilers, this can be replaced with a type alias.
 */
template <typename T, typename E = Error>
class Result {
public:
    // ── Constructors ──────────────────────────

    /// Construct a success result.
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)

    /// Construct an error result.
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    // ── Observers ─────────────────────────────

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value: " + error_message());
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value: " + error_message());
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value: " + error_message());
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    // ── Monadic operations ────────────────────

    /// Transform the success value.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Chain with a function that returns a Result.
    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Provide a fallback value.
    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    [[nodiscard]] std::string error_message() const {
        if constexpr (std::is_same_v<E, Error>) {
            return std::get<E>(storage_).message;
        } else {
            return "unexpected error";
        }
    }

    std::variant<T, E> storage_;
};

/**
 * @brief Specialization of Result for void success type.
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] E& error() & {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

/// Convenience factory for error results.
template <typename T, typename E = Error>
Result<T, E> make_error(std::string message) {
    return Result<T, E>(E{std::move(message)});
}

template <typename T>
Result<T> make_error(ErrorCode code, std::string message) {
    return Result<T>(Error{code, std::move(message)});
}

}  // namespace lanwake
