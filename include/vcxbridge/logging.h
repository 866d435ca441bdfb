/**
 * @file logging.h
 * @brief Host-routable logging for vcxbridge.
 *
 * - All output goes through a host callback when one is set
 * - Without a callback, messages go to stderr
 * - Fast path (log_raw) for pre-formatted messages
 *
 * Usage:
 *   // Host sets callback
 *   vcxbridge_set_log_callback(my_logger, userdata);
 *
 *   VCXBRIDGE_LOG_WARN("BRIDGE", "callback for unknown token %u", token);
 *
 * @copyright GPL-2.0-or-later
 */

#ifndef VCXBRIDGE_LOGGING_H
#define VCXBRIDGE_LOGGING_H

#include <cstdint>
#include <cstddef>

#ifdef __cplusplus
#include <string_view>
#endif

// ═══════════════════════════════════════════════════════════════════════════════
// C ABI Types (FFI-safe)
// ═══════════════════════════════════════════════════════════════════════════════

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Log severity levels, most to least severe.
 */
typedef enum vcxbridge_log_level {
    VCXBRIDGE_LOG_LEVEL_ERROR = 0,
    VCXBRIDGE_LOG_LEVEL_WARN  = 1,
    VCXBRIDGE_LOG_LEVEL_INFO  = 2,
    VCXBRIDGE_LOG_LEVEL_DEBUG = 3,
    VCXBRIDGE_LOG_LEVEL_TRACE = 4
} vcxbridge_log_level;

/**
 * @brief Log callback function type.
 *
 * @param level     Severity level of the message
 * @param subsystem Subsystem identifier (e.g., "BRIDGE", "RUNTIME")
 * @param message   The log message (null-terminated)
 * @param userdata  User-provided context from registration
 *
 * May be invoked from native callback threads.
 */
typedef void (*vcxbridge_log_callback)(
    vcxbridge_log_level level,
    const char* subsystem,
    const char* message,
    void* userdata
);

/**
 * @brief Set the log callback.
 *
 * @param callback  Function to receive log messages (NULL restores stderr)
 * @param userdata  User context passed to callback
 */
void vcxbridge_set_log_callback(vcxbridge_log_callback callback, void* userdata);

/**
 * @brief Set minimum log level (messages below this are filtered).
 *
 * @param level  Minimum level to log (default: VCXBRIDGE_LOG_LEVEL_INFO)
 */
void vcxbridge_set_log_level(vcxbridge_log_level level);

vcxbridge_log_level vcxbridge_get_log_level(void);

const char* vcxbridge_log_level_name(vcxbridge_log_level level);

#ifdef __cplusplus
} /* extern "C" */
#endif

// ═══════════════════════════════════════════════════════════════════════════════
// C++ API
// ═══════════════════════════════════════════════════════════════════════════════

#ifdef __cplusplus

namespace vcxbridge {

enum class LogLevel : int {
    Error = VCXBRIDGE_LOG_LEVEL_ERROR,
    Warn  = VCXBRIDGE_LOG_LEVEL_WARN,
    Info  = VCXBRIDGE_LOG_LEVEL_INFO,
    Debug = VCXBRIDGE_LOG_LEVEL_DEBUG,
    Trace = VCXBRIDGE_LOG_LEVEL_TRACE
};

[[nodiscard]] inline const char* log_level_name(LogLevel level) noexcept {
    return vcxbridge_log_level_name(static_cast<vcxbridge_log_level>(level));
}

/**
 * @brief Log a pre-formatted message (fast path).
 *
 * @param level     Severity level
 * @param subsystem Subsystem identifier
 * @param message   Pre-formatted message
 */
void log_raw(LogLevel level, const char* subsystem, std::string_view message) noexcept;

/**
 * @brief Log with printf-style formatting.
 */
void log_printf(LogLevel level, const char* subsystem, const char* fmt, ...) noexcept
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

/**
 * @brief Check if a log level is enabled.
 */
[[nodiscard]] inline bool log_level_enabled(LogLevel level) noexcept {
    return static_cast<int>(level) <= static_cast<int>(vcxbridge_get_log_level());
}

namespace detail {

/**
 * @brief Default log handler that writes to stderr.
 */
void default_log_handler(
    vcxbridge_log_level level,
    const char* subsystem,
    const char* message,
    void* userdata
) noexcept;

} // namespace detail

} // namespace vcxbridge

// ═══════════════════════════════════════════════════════════════════════════════
// Logging Macros
// ═══════════════════════════════════════════════════════════════════════════════

#define VCXBRIDGE_LOG_LEVEL_ENABLED(level) \
    ::vcxbridge::log_level_enabled(::vcxbridge::LogLevel::level)

#define VCXBRIDGE_LOG_ERROR(subsys, ...) \
    ::vcxbridge::log_printf(::vcxbridge::LogLevel::Error, subsys, __VA_ARGS__)

#define VCXBRIDGE_LOG_WARN(subsys, ...) \
    ::vcxbridge::log_printf(::vcxbridge::LogLevel::Warn, subsys, __VA_ARGS__)

#define VCXBRIDGE_LOG_INFO(subsys, ...) \
    ::vcxbridge::log_printf(::vcxbridge::LogLevel::Info, subsys, __VA_ARGS__)

#define VCXBRIDGE_LOG_DEBUG(subsys, ...) \
    ::vcxbridge::log_printf(::vcxbridge::LogLevel::Debug, subsys, __VA_ARGS__)

#define VCXBRIDGE_LOG_TRACE(subsys, ...) \
    ::vcxbridge::log_printf(::vcxbridge::LogLevel::Trace, subsys, __VA_ARGS__)

#define VCXBRIDGE_LOG_RAW(level, subsys, msg) \
    ::vcxbridge::log_raw(::vcxbridge::LogLevel::level, subsys, msg)

#endif /* __cplusplus */

#endif /* VCXBRIDGE_LOGGING_H */
