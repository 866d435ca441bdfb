/**
 * @file error.h
 * @brief Structured errors and Result<T> built on std::expected.
 *
 * Provides:
 * - ErrorCode taxonomy for bridge failures
 * - Error class carrying the taxonomy code, the native error code,
 *   a message, the native function name and the source location
 * - Result<T> alias for std::expected<T, Error>
 * - Ok(), Err(), make_error() helpers and early-return macros
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <cstdint>
#include <expected>
#include <source_location>
#include <string>
#include <utility>

namespace vcxbridge {

// ─────────────────────────────────────────────────────────────────────────────
// Error Codes
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Failure categories surfaced by the bridge.
 *
 * SubmissionFailure and CallbackFailure describe where a native failure
 * was detected; both produce the same Error shape and carry the native
 * code in Error::native_code().
 */
enum class ErrorCode : int {
    // Success (not stored in Error)
    Ok = 0,

    // General errors (1-99)
    Unknown = 1,
    InvalidArgument = 2,
    InvalidState = 3,

    // Runtime binding errors (100-199)
    InvalidConfiguration = 100,
    NotInitialized = 101,

    // Native call errors (200-299)
    SubmissionFailure = 200,
    CallbackFailure = 201,
    ProtocolViolation = 202,

    // Handle errors (300-399)
    HandleReleased = 300,
};

/**
 * @brief Convert ErrorCode to string representation.
 */
[[nodiscard]] inline constexpr const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::InvalidConfiguration: return "InvalidConfiguration";
        case ErrorCode::NotInitialized: return "NotInitialized";
        case ErrorCode::SubmissionFailure: return "SubmissionFailure";
        case ErrorCode::CallbackFailure: return "CallbackFailure";
        case ErrorCode::ProtocolViolation: return "ProtocolViolation";
        case ErrorCode::HandleReleased: return "HandleReleased";
    }
    return "Unknown";
}

/**
 * @brief True for the two kinds that carry a native error code.
 */
[[nodiscard]] inline constexpr bool is_native_failure(ErrorCode code) noexcept {
    return code == ErrorCode::SubmissionFailure || code == ErrorCode::CallbackFailure;
}

// ─────────────────────────────────────────────────────────────────────────────
// Error Class
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Structured error delivered to callers of the bridge.
 *
 * Used as the error type in Result<T> (std::expected<T, Error>).
 *
 * Example:
 * @code
 *   auto err = Error::native(ErrorCode::CallbackFailure, 1003,
 *                            "Invalid Connection Handle", "vcx_connection_serialize");
 *   std::cerr << err.format() << std::endl;
 *   // CallbackFailure [1003] in vcx_connection_serialize: Invalid Connection Handle
 * @endcode
 */
class Error {
public:
    /**
     * @brief Construct a non-native error.
     * @param code Error category
     * @param message Human-readable description
     * @param location Source location (auto-captured by default)
     */
    Error(ErrorCode code,
          std::string message,
          std::source_location location = std::source_location::current())
        : code_(code)
        , message_(std::move(message))
        , location_(location)
    {}

    /**
     * @brief Create an error describing a native failure.
     *
     * @param code SubmissionFailure or CallbackFailure
     * @param native_code Non-zero code reported by the native layer
     * @param message Message resolved from the native layer (may be empty)
     * @param native_function Name of the native entry point
     */
    [[nodiscard]] static Error native(
        ErrorCode code,
        uint32_t native_code,
        std::string message,
        std::string native_function,
        std::source_location loc = std::source_location::current()
    ) {
        Error err{code, std::move(message), loc};
        err.native_code_ = native_code;
        err.native_function_ = std::move(native_function);
        return err;
    }

    // Accessors
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] uint32_t native_code() const noexcept { return native_code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::string& native_function() const noexcept { return native_function_; }
    [[nodiscard]] const std::source_location& location() const noexcept { return location_; }

    /**
     * @brief Format error for display/logging.
     * @return "CODE [native] in function: message" for native failures,
     *         "CODE at file:line: message" otherwise
     */
    [[nodiscard]] std::string format() const {
        std::string out = error_code_name(code_);
        if (is_native_failure(code_)) {
            out += " [" + std::to_string(native_code_) + "]";
            if (!native_function_.empty()) {
                out += " in " + native_function_;
            }
        } else {
            out += " at ";
            out += location_.file_name();
            out += ":" + std::to_string(location_.line());
        }
        out += ": " + message_;
        return out;
    }

    /**
     * @brief Check if this is a specific error code.
     */
    [[nodiscard]] bool is(ErrorCode code) const noexcept {
        return code_ == code;
    }

private:
    ErrorCode code_;
    uint32_t native_code_ = 0;
    std::string message_;
    std::string native_function_;
    std::source_location location_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Result Type (std::expected alias)
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Result type for fallible operations.
 *
 * @tparam T The success value type
 */
template<typename T>
using Result = std::expected<T, Error>;

// ─────────────────────────────────────────────────────────────────────────────
// Helper Functions
// ─────────────────────────────────────────────────────────────────────────────

template<typename T>
[[nodiscard]] constexpr Result<T> Ok(T value) {
    return Result<T>{std::in_place, std::move(value)};
}

[[nodiscard]] inline constexpr Result<void> Ok() {
    return Result<void>{};
}

[[nodiscard]] inline std::unexpected<Error> Err(Error error) {
    return std::unexpected(std::move(error));
}

/**
 * @brief Create error with code and message.
 *
 * @param code Error code
 * @param msg Error message
 * @param loc Source location (auto-captured)
 * @return std::unexpected<Error>
 */
[[nodiscard]] inline std::unexpected<Error> make_error(
    ErrorCode code,
    std::string msg,
    std::source_location loc = std::source_location::current()
) {
    return std::unexpected(Error{code, std::move(msg), loc});
}

// ─────────────────────────────────────────────────────────────────────────────
// Convenience Macros
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Return error if condition is false.
 *
 * Usage:
 *   VCXBRIDGE_CHECK(!path.empty(), ErrorCode::InvalidConfiguration, "empty path");
 */
#define VCXBRIDGE_CHECK(cond, code, msg) \
    do { \
        if (!(cond)) { \
            return ::vcxbridge::make_error(code, msg); \
        } \
    } while (0)

/**
 * @brief Return early if result is an error.
 *
 * Note: Uses GCC statement expression extension.
 */
#define VCXBRIDGE_TRY(expr) \
    ({ \
        auto&& _vcxbridge_result = (expr); \
        if (!_vcxbridge_result.has_value()) { \
            return ::vcxbridge::Err(_vcxbridge_result.error()); \
        } \
        std::move(_vcxbridge_result).value(); \
    })

} // namespace vcxbridge
