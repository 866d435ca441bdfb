/**
 * @file logging.cpp
 * @brief Implementation of host-routable logging.
 *
 * Thread-safety: callback registration is mutex protected. Log calls
 * copy the callback out under a brief lock and invoke it unlocked, so
 * native callback threads can log concurrently.
 *
 * @copyright GPL-2.0-or-later
 */

#include "vcxbridge/logging.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <mutex>

namespace {

std::mutex g_log_mutex;

vcxbridge_log_callback g_log_callback = nullptr;
void* g_log_userdata = nullptr;

// Atomic for lock-free reads in the level check
std::atomic<vcxbridge_log_level> g_min_log_level{VCXBRIDGE_LOG_LEVEL_INFO};

constexpr size_t LOG_BUFFER_SIZE = 1024;

} // anonymous namespace

// ═══════════════════════════════════════════════════════════════════════════════
// C API Implementation
// ═══════════════════════════════════════════════════════════════════════════════

extern "C" {

void vcxbridge_set_log_callback(vcxbridge_log_callback callback, void* userdata) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_callback = callback;
    g_log_userdata = userdata;
}

void vcxbridge_set_log_level(vcxbridge_log_level level) {
    g_min_log_level.store(level, std::memory_order_relaxed);
}

vcxbridge_log_level vcxbridge_get_log_level(void) {
    return g_min_log_level.load(std::memory_order_relaxed);
}

const char* vcxbridge_log_level_name(vcxbridge_log_level level) {
    switch (level) {
        case VCXBRIDGE_LOG_LEVEL_ERROR: return "ERROR";
        case VCXBRIDGE_LOG_LEVEL_WARN:  return "WARN";
        case VCXBRIDGE_LOG_LEVEL_INFO:  return "INFO";
        case VCXBRIDGE_LOG_LEVEL_DEBUG: return "DEBUG";
        case VCXBRIDGE_LOG_LEVEL_TRACE: return "TRACE";
        default:                  return "UNKNOWN";
    }
}

} // extern "C"

// ═══════════════════════════════════════════════════════════════════════════════
// C++ Implementation
// ═══════════════════════════════════════════════════════════════════════════════

namespace vcxbridge {

namespace detail {

void default_log_handler(
    vcxbridge_log_level level,
    const char* subsystem,
    const char* message,
    void* /*userdata*/
) noexcept {
    std::fprintf(stderr, "[%s] %s: %s\n", vcxbridge_log_level_name(level), subsystem, message);
}

} // namespace detail

void log_raw(LogLevel level, const char* subsystem, std::string_view message) noexcept {
    if (static_cast<int>(level) > static_cast<int>(g_min_log_level.load(std::memory_order_relaxed))) {
        return;
    }

    vcxbridge_log_callback callback = nullptr;
    void* userdata = nullptr;
    {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        callback = g_log_callback;
        userdata = g_log_userdata;
    }

    // Copy into a NUL-terminated buffer, truncating if needed
    char buffer[LOG_BUFFER_SIZE];
    size_t length = message.size() < LOG_BUFFER_SIZE ? message.size() : LOG_BUFFER_SIZE - 1;
    std::memcpy(buffer, message.data(), length);
    buffer[length] = '\0';

    auto c_level = static_cast<vcxbridge_log_level>(level);
    if (callback) {
        callback(c_level, subsystem, buffer, userdata);
    } else {
        detail::default_log_handler(c_level, subsystem, buffer, nullptr);
    }
}

void log_printf(LogLevel level, const char* subsystem, const char* fmt, ...) noexcept {
    if (static_cast<int>(level) > static_cast<int>(g_min_log_level.load(std::memory_order_relaxed))) {
        return;
    }

    char buffer[LOG_BUFFER_SIZE];
    va_list args;
    va_start(args, fmt);
    int written = std::vsnprintf(buffer, LOG_BUFFER_SIZE, fmt, args);
    va_end(args);

    if (written < 0) {
        buffer[0] = '\0';
    } else if (static_cast<size_t>(written) >= LOG_BUFFER_SIZE) {
        // Truncated - add ellipsis
        buffer[LOG_BUFFER_SIZE - 4] = '.';
        buffer[LOG_BUFFER_SIZE - 3] = '.';
        buffer[LOG_BUFFER_SIZE - 2] = '.';
        buffer[LOG_BUFFER_SIZE - 1] = '\0';
    }

    log_raw(level, subsystem, std::string_view(buffer));
}

} // namespace vcxbridge
