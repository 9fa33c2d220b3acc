/**
 * @file result.hpp
 * @brief Error handling with Result<T, E> type
 *
 * Identifier validation failures are ordinary, caller-handled outcomes,
 * so the codecs report them through Result instead of throwing.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "types.hpp"

namespace marginalia {

// ============================================================================
// Error Type
// ============================================================================

/// Error class holding an error code and optional message
class Error {
public:
    Error() : m_code(ErrorCode::Unknown) {}

    explicit Error(ErrorCode code) : m_code(code) {}

    Error(ErrorCode code, std::string message)
        : m_code(code), m_message(std::move(message)) {}

    ErrorCode code() const { return m_code; }
    const std::string& message() const { return m_message; }

    const char* what() const {
        if (!m_message.empty()) {
            return m_message.c_str();
        }
        return errorCodeToString(m_code);
    }

    explicit operator bool() const { return m_code != ErrorCode::Ok; }

private:
    ErrorCode m_code;
    std::string m_message;
};

/// Thrown by Result::value() when the result holds an error
class BadResultAccess : public std::runtime_error {
public:
    explicit BadResultAccess(const Error& error)
        : std::runtime_error(error.what()), m_code(error.code()) {}

    ErrorCode code() const { return m_code; }

private:
    ErrorCode m_code;
};

// ============================================================================
// Result<T, E> Template
// ============================================================================

/**
 * @brief Result type for functions that can fail
 *
 * Holds either a success value (T) or an error (E).
 *
 * @tparam T Success value type
 * @tparam E Error type (defaults to Error)
 */
template<typename T, typename E = Error>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Construct success result from value
    Result(T value) : m_data(std::in_place_index<0>, std::move(value)) {}

    /// Construct error result from error
    Result(E error) : m_data(std::in_place_index<1>, std::move(error)) {}

    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;

    // ========== State Queries ==========

    [[nodiscard]] bool ok() const { return m_data.index() == 0; }

    [[nodiscard]] bool isError() const { return m_data.index() == 1; }

    explicit operator bool() const { return ok(); }

    // ========== Value Access ==========

    /// Get value reference (throws BadResultAccess if error)
    T& value() & {
        if (!ok()) {
            throwError();
        }
        return std::get<0>(m_data);
    }

    const T& value() const& {
        if (!ok()) {
            throwError();
        }
        return std::get<0>(m_data);
    }

    T&& value() && {
        if (!ok()) {
            throwError();
        }
        return std::get<0>(std::move(m_data));
    }

    /// Get value with default (no throw)
    T valueOr(T defaultValue) const& {
        if (ok()) {
            return std::get<0>(m_data);
        }
        return defaultValue;
    }

    // ========== Error Access ==========

    /// Get error reference (throws if success)
    const E& error() const& {
        if (ok()) {
            throw std::logic_error("Result::error() called on success value");
        }
        return std::get<1>(m_data);
    }

    // ========== Monadic Operations ==========

    /// Map success value to new type
    template<typename F>
    auto map(F&& f) const -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (ok()) {
            return Result<U, E>(std::forward<F>(f)(std::get<0>(m_data)));
        }
        return Result<U, E>(std::get<1>(m_data));
    }

    /// Flat map (for chaining Result-returning functions)
    template<typename F>
    auto andThen(F&& f) const -> std::invoke_result_t<F, const T&> {
        using ResultType = std::invoke_result_t<F, const T&>;
        if (ok()) {
            return std::forward<F>(f)(std::get<0>(m_data));
        }
        return ResultType(std::get<1>(m_data));
    }

private:
    [[noreturn]] void throwError() const {
        if constexpr (std::is_same_v<E, Error>) {
            throw BadResultAccess(std::get<1>(m_data));
        } else {
            throw std::runtime_error("Result::value() called on error value");
        }
    }

    std::variant<T, E> m_data;
};

// ============================================================================
// Result<void, E> Specialization
// ============================================================================

template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() : m_error(std::nullopt) {}

    Result(E error) : m_error(std::move(error)) {}

    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;

    [[nodiscard]] bool ok() const { return !m_error.has_value(); }

    [[nodiscard]] bool isError() const { return m_error.has_value(); }

    explicit operator bool() const { return ok(); }

    const E& error() const& {
        if (!m_error.has_value()) {
            throw std::logic_error("Result::error() called on success");
        }
        return *m_error;
    }

private:
    std::optional<E> m_error;
};

// ============================================================================
// Helper Factory Functions
// ============================================================================

/// Create success result
template<typename T>
inline Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Create void success result
inline Result<void> Ok() {
    return Result<void>();
}

/// Create error result from code and message
template<typename T = void>
inline Result<T> Err(ErrorCode code, std::string message) {
    return Result<T>(Error(code, std::move(message)));
}

} // namespace marginalia
