/**
 * @file config.h
 * @brief Runtime configuration.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <vcxbridge/error.h>
#include <vcxbridge/logging.h>

#include <optional>
#include <string>
#include <string_view>

namespace vcxbridge {

/// Library path used by from_environment() when VCXBRIDGE_LIBRARY_PATH is unset.
inline constexpr const char* kDefaultLibraryPath = "/usr/lib/libvcx.so";

/// Environment variable naming the native library.
inline constexpr const char* kLibraryPathEnv = "VCXBRIDGE_LIBRARY_PATH";

/// Environment variable selecting the log level.
inline constexpr const char* kLogLevelEnv = "VCXBRIDGE_LOG_LEVEL";

struct RuntimeConfig {
    std::string library_path;           ///< Native library to load (required)
    LogLevel log_level = LogLevel::Info; ///< Applied on initialize

    /**
     * @brief Check the configuration before any loading is attempted.
     * @return InvalidConfiguration for an empty library path
     */
    [[nodiscard]] Result<void> validate() const;

    /**
     * @brief Build a configuration from a possibly-null C path.
     */
    [[nodiscard]] static RuntimeConfig from_path(const char* path);

    /**
     * @brief Read VCXBRIDGE_LIBRARY_PATH and VCXBRIDGE_LOG_LEVEL.
     *
     * Unset variables fall back to kDefaultLibraryPath and Info; an
     * unrecognized level is logged and ignored.
     */
    [[nodiscard]] static RuntimeConfig from_environment();
};

/**
 * @brief Parse "error", "warn", "info", "debug" or "trace" (case-insensitive).
 */
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text);

} // namespace vcxbridge
