/**
 * @file json.h
 * @brief Minimal JSON encoding for arguments built on this side.
 *
 * Payloads returned by the native layer stay strings; only the few
 * arguments the bridge composes itself (tag-name lists) are encoded here.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace vcxbridge {

/**
 * @brief Escape a string for use inside a JSON string literal.
 *
 * Control characters without a short escape are written as \\uXXXX.
 */
[[nodiscard]] std::string json_escape(std::string_view str);

/**
 * @brief Encode a list of strings as a JSON array: ["a","b"].
 */
[[nodiscard]] std::string json_string_array(const std::vector<std::string>& items);

} // namespace vcxbridge
