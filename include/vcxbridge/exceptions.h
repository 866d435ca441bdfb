/**
 * @file exceptions.h
 * @brief Exception hierarchy for programming errors and throwing accessors.
 *
 * Expected failures travel as Result<T>. Exceptions are used for
 * broken invariants and by Future<T>::value(), which rethrows a native
 * failure for callers that prefer exceptions.
 */

#pragma once

#include <vcxbridge/error.h>

#include <stdexcept>
#include <string>

namespace vcxbridge {

/**
 * @brief Base class for all vcxbridge exceptions.
 */
class BridgeException : public std::runtime_error {
public:
    explicit BridgeException(const std::string& msg)
        : std::runtime_error(msg)
    {}
};

/**
 * @brief Carries a structured Error out of Future<T>::value().
 */
class NativeCallException : public BridgeException {
public:
    explicit NativeCallException(Error error)
        : BridgeException(error.format())
        , error_(std::move(error))
    {}

    [[nodiscard]] const Error& error() const noexcept { return error_; }
    [[nodiscard]] ErrorCode code() const noexcept { return error_.code(); }
    [[nodiscard]] uint32_t native_code() const noexcept { return error_.native_code(); }

private:
    Error error_;
};

/**
 * @brief Exception replacing abort() in library mode.
 *
 * @note Should only be caught at the top-level boundary.
 */
class FatalException : public BridgeException {
public:
    explicit FatalException(const std::string& msg)
        : BridgeException("Fatal error: " + msg)
        , file_("")
        , line_(0)
    {}

    FatalException(const std::string& msg, const char* file, int line)
        : BridgeException("Fatal error at " + std::string(file) + ":" +
                          std::to_string(line) + ": " + msg)
        , file_(file)
        , line_(line)
    {}

    [[nodiscard]] const char* file() const noexcept { return file_; }
    [[nodiscard]] int line() const noexcept { return line_; }

private:
    const char* file_;
    int line_;
};

} // namespace vcxbridge

// ─────────────────────────────────────────────────────────────────────────────
// Invariant Assertion
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Assert that throws in library mode instead of aborting.
 */
#ifdef VCXBRIDGE_LIBRARY_MODE
    #define VCXBRIDGE_ASSERT(cond, msg) \
        do { \
            if (!(cond)) { \
                throw ::vcxbridge::FatalException( \
                    std::string("Assertion failed: ") + (msg), __FILE__, __LINE__); \
            } \
        } while(0)
#else
    #include <cassert>
    #define VCXBRIDGE_ASSERT(cond, msg) assert((cond) && (msg))
#endif
