/**
 * @file config.cpp
 * @brief RuntimeConfig construction and validation.
 *
 * @copyright GPL-2.0-or-later
 */

#include "vcxbridge/config.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <utility>

namespace vcxbridge {

Result<void> RuntimeConfig::validate() const {
    VCXBRIDGE_CHECK(!library_path.empty(), ErrorCode::InvalidConfiguration,
                    "library path is empty or null");
    return Ok();
}

RuntimeConfig RuntimeConfig::from_path(const char* path) {
    RuntimeConfig config;
    if (path != nullptr) {
        config.library_path = path;
    }
    return config;
}

RuntimeConfig RuntimeConfig::from_environment() {
    RuntimeConfig config;

    const char* path = std::getenv(kLibraryPathEnv);
    config.library_path = (path && *path) ? path : kDefaultLibraryPath;

    if (const char* level = std::getenv(kLogLevelEnv); level && *level) {
        if (auto parsed = parse_log_level(level)) {
            config.log_level = *parsed;
        } else {
            VCXBRIDGE_LOG_WARN("RUNTIME", "ignoring unknown %s '%s'", kLogLevelEnv, level);
        }
    }

    return config;
}

std::optional<LogLevel> parse_log_level(std::string_view text) {
    static constexpr std::array<std::pair<std::string_view, LogLevel>, 5> kLevels{{
        {"error", LogLevel::Error},
        {"warn",  LogLevel::Warn},
        {"info",  LogLevel::Info},
        {"debug", LogLevel::Debug},
        {"trace", LogLevel::Trace},
    }};

    auto it = std::ranges::find_if(kLevels, [text](const auto& entry) {
        return std::ranges::equal(entry.first, text, [](char a, char b) {
            return a == std::tolower(static_cast<unsigned char>(b));
        });
    });
    if (it == kLevels.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace vcxbridge
