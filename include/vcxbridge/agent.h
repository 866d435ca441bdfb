/**
 * @file agent.h
 * @brief Library initialization, agent provisioning and messaging.
 *
 * Asynchronous functions return Result<Future<T>>: the outer Result holds
 * failures detected before the native call (NotInitialized), the Future
 * holds the native outcome.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <vcxbridge/error.h>
#include <vcxbridge/future.h>
#include <vcxbridge/runtime.h>

#include <string>

namespace vcxbridge::agent {

/// Message status used by update_messages ("reviewed").
inline constexpr const char* kMessageStatusReviewed = "MS-106";

/**
 * @brief Filters for download_messages; empty fields are not filtered on.
 */
struct DownloadMessagesOptions {
    std::string status;          ///< Comma-separated status codes
    std::string uids;            ///< Comma-separated message ids
    std::string pairwise_dids;   ///< Comma-separated pairwise DIDs
};

/**
 * @brief Initialize the native library from a JSON configuration.
 */
[[nodiscard]] Result<Future<void>> init_with_config(Runtime& runtime,
                                                    const std::string& config_json);

/**
 * @brief Provision an agent with the agency.
 * @return Future resolving to the resulting configuration JSON
 */
[[nodiscard]] Result<Future<std::string>> provision_agent(Runtime& runtime,
                                                          const std::string& config_json);

[[nodiscard]] Result<Future<std::string>> update_agent_info(Runtime& runtime,
                                                            const std::string& options_json);

[[nodiscard]] Result<Future<std::string>> get_ledger_fees(Runtime& runtime);

/**
 * @return Future resolving to the downloaded messages as JSON
 */
[[nodiscard]] Result<Future<std::string>> download_messages(
    Runtime& runtime, const DownloadMessagesOptions& options);

/**
 * @brief Mark messages as reviewed (status MS-106).
 *
 * @param msg_json JSON list of {pairwiseDID, uids}
 */
[[nodiscard]] Result<Future<void>> update_messages(Runtime& runtime,
                                                   const std::string& msg_json);

/**
 * @brief Synchronous: set the institution name and logo.
 */
[[nodiscard]] Result<void> update_institution_info(Runtime& runtime,
                                                   const std::string& name,
                                                   const std::string& logo_url);

/**
 * @brief Synchronous: version string of the loaded library.
 */
[[nodiscard]] Result<std::string> version(Runtime& runtime);

} // namespace vcxbridge::agent
