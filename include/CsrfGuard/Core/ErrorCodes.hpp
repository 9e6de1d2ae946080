/**
 * @file ErrorCodes.hpp
 * @brief Error codes and result types for the CsrfGuard token library
 * @author CsrfGuard Team
 * @version 1.0.0
 * @date 2024
 *
 * @copyright Copyright (c) 2024 CsrfGuard. All rights reserved.
 *
 * Recoverable failures (malformed token text, unreadable settings files)
 * travel as an ErrorCode inside a Result. Failure of the operating system
 * random source is not recoverable and is reported by exception instead.
 */

#pragma once

#ifndef CSRFGUARD_CORE_ERROR_CODES_HPP
#define CSRFGUARD_CORE_ERROR_CODES_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace CsrfGuard {

/// High byte of every ErrorCode
enum class ErrorCategory : uint8_t {
    None     = 0x00,
    Crypto   = 0x03,  ///< Random source
    Config   = 0x08,  ///< Settings content
    IO       = 0x09,  ///< Settings file access
    Parse    = 0x0A,  ///< Token text
    Internal = 0xFF
};

enum class ErrorCode : uint16_t {
    Success = 0x0000,

    RandomGenerationFailed = 0x0307,  ///< OS random source refused a request

    ConfigInvalid     = 0x0802,  ///< Known key with an unusable value
    ConfigParseFailed = 0x0804,  ///< Line is not "key = value"

    IOError      = 0x0900,
    FileNotFound = 0x0901,
    FileTooLarge = 0x0909,  ///< Above ConfigLoader::Options::max_file_size
    InvalidPath  = 0x090A,  ///< Empty path or a directory
    AccessDenied = 0x090B,

    InvalidBase64      = 0x0A06,  ///< Not canonical padded standard base64
    InvalidTokenLength = 0x0A07,  ///< Decoded size differs from the token size

    InternalError   = 0xFF00,  ///< Default-constructed Result
    InvalidArgument = 0xFF05   ///< Null buffer with a nonzero size
};

[[nodiscard]] constexpr ErrorCategory getErrorCategory(ErrorCode code) noexcept {
    const auto value = static_cast<uint16_t>(code);
    return value == 0 ? ErrorCategory::None : static_cast<ErrorCategory>(value >> 8);
}

[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::Success;
}

[[nodiscard]] constexpr bool isFailure(ErrorCode code) noexcept {
    return code != ErrorCode::Success;
}

/// Short lower-case description, "unknown error" for values outside the enum
[[nodiscard]] std::string_view getErrorMessage(ErrorCode code) noexcept;

/// "Crypto", "Config", "IO", "Parse", "Internal", "None" or "Unknown"
[[nodiscard]] std::string_view getCategoryName(ErrorCategory category) noexcept;

/**
 * @brief Either a T or the ErrorCode that prevented it
 *
 * Reading the wrong side throws std::runtime_error.
 *
 * @code
 * auto secret = SecretToken::fromBase64(session.csrfSecret);
 * if (!secret) {
 *     std::cerr << getErrorMessage(secret.error()) << std::endl;
 * }
 * @endcode
 */
template<typename T>
class Result {
public:
    Result() : m_data(ErrorCode::InternalError) {}
    Result(const T& value) : m_data(value) {}
    Result(T&& value) : m_data(std::move(value)) {}
    Result(ErrorCode error) : m_data(error) {}

    [[nodiscard]] bool isSuccess() const noexcept { return m_data.index() == 0; }
    [[nodiscard]] bool isFailure() const noexcept { return m_data.index() == 1; }
    [[nodiscard]] explicit operator bool() const noexcept { return isSuccess(); }

    [[nodiscard]] T& value() & {
        requireValue();
        return std::get<0>(m_data);
    }

    [[nodiscard]] const T& value() const & {
        requireValue();
        return std::get<0>(m_data);
    }

    [[nodiscard]] T&& value() && {
        requireValue();
        return std::get<0>(std::move(m_data));
    }

    [[nodiscard]] ErrorCode error() const {
        if (isSuccess()) {
            throw std::runtime_error("Result holds a value, not an error");
        }
        return std::get<1>(m_data);
    }

    [[nodiscard]] T valueOr(const T& fallback) const & {
        return isSuccess() ? std::get<0>(m_data) : fallback;
    }

    [[nodiscard]] ErrorCode errorOr(ErrorCode fallback = ErrorCode::Success) const noexcept {
        return isFailure() ? std::get<1>(m_data) : fallback;
    }

    /// Result<U> holding func(value), or this error
    template<typename F>
    [[nodiscard]] auto map(F&& func) const -> Result<decltype(func(std::declval<T>()))> {
        if (isFailure()) {
            return std::get<1>(m_data);
        }
        return func(std::get<0>(m_data));
    }

    /// func(value) where func itself returns a Result, or this error
    template<typename F>
    [[nodiscard]] auto flatMap(F&& func) const -> decltype(func(std::declval<T>())) {
        if (isFailure()) {
            return std::get<1>(m_data);
        }
        return func(std::get<0>(m_data));
    }

private:
    void requireValue() const {
        if (isFailure()) {
            throw std::runtime_error("Result holds an error, not a value");
        }
    }

    std::variant<T, ErrorCode> m_data;
};

/// Outcome of an operation with nothing to return
template<>
class Result<void> {
public:
    Result() = default;
    Result(ErrorCode error) : m_error(error) {}

    [[nodiscard]] static Result Success() { return {}; }

    [[nodiscard]] bool isSuccess() const noexcept { return m_error == ErrorCode::Success; }
    [[nodiscard]] bool isFailure() const noexcept { return m_error != ErrorCode::Success; }
    [[nodiscard]] explicit operator bool() const noexcept { return isSuccess(); }
    [[nodiscard]] ErrorCode error() const noexcept { return m_error; }

private:
    ErrorCode m_error = ErrorCode::Success;
};

/// Return the error of expr from the enclosing function if it failed
#define CSRFGUARD_TRY(expr) \
    do { \
        auto _result = (expr); \
        if (_result.isFailure()) return _result.error(); \
    } while (0)

/// Move the value of expr into var, or return its error
#define CSRFGUARD_TRY_ASSIGN(var, expr) \
    auto _result_##var = (expr); \
    if (_result_##var.isFailure()) return _result_##var.error(); \
    var = std::move(_result_##var.value())

} // namespace CsrfGuard

#endif // CSRFGUARD_CORE_ERROR_CODES_HPP
