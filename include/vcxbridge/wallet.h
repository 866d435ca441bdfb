/**
 * @file wallet.h
 * @brief Wallet records, searches and payment tokens.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <vcxbridge/error.h>
#include <vcxbridge/future.h>
#include <vcxbridge/handle_registry.h>
#include <vcxbridge/runtime.h>

#include <cstdint>
#include <string>
#include <vector>

namespace vcxbridge::wallet {

/**
 * @brief A non-secret wallet record.
 */
struct WalletRecord {
    std::string type;
    std::string id;
    std::string value;
    std::string tags_json = "{}";   ///< JSON object of tag name to value
};

using PaymentHandle = vcx_handle_t;

/**
 * @return Future resolving to the token info JSON of a payment address
 *         (payment_handle 0 covers all addresses)
 */
[[nodiscard]] Result<Future<std::string>> get_token_info(Runtime& runtime,
                                                         PaymentHandle payment_handle);

/**
 * @return Future resolving to the payment receipt
 */
[[nodiscard]] Result<Future<std::string>> send_tokens(Runtime& runtime,
                                                      PaymentHandle payment_handle,
                                                      const std::string& tokens,
                                                      const std::string& recipient);

// ─────────────────────────────────────────────────────────────────────────────
// Records
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] Result<Future<void>> add_record(Runtime& runtime, const WalletRecord& record);

/**
 * @brief Replace the value of an existing record; tags are ignored.
 */
[[nodiscard]] Result<Future<void>> update_record_value(Runtime& runtime,
                                                       const WalletRecord& record);

/**
 * @brief Replace all tags of an existing record; the value is ignored.
 */
[[nodiscard]] Result<Future<void>> update_record_tags(Runtime& runtime,
                                                      const WalletRecord& record);

/**
 * @brief Add tags to an existing record, overwriting tags of the same name.
 */
[[nodiscard]] Result<Future<void>> add_record_tags(Runtime& runtime,
                                                   const WalletRecord& record);

/**
 * @brief Remove the named tags from a record.
 */
[[nodiscard]] Result<Future<void>> delete_record_tags(Runtime& runtime,
                                                      const WalletRecord& record,
                                                      const std::vector<std::string>& tag_names);

[[nodiscard]] Result<Future<void>> delete_record(Runtime& runtime,
                                                 const std::string& type,
                                                 const std::string& id);

/**
 * @return Future resolving to the record JSON
 */
[[nodiscard]] Result<Future<std::string>> get_record(Runtime& runtime,
                                                     const std::string& type,
                                                     const std::string& id);

// ─────────────────────────────────────────────────────────────────────────────
// Searches
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Open a search; the returned handle is registered as WalletSearch.
 */
[[nodiscard]] Result<Future<NativeHandle>> open_search(Runtime& runtime,
                                                       const std::string& type,
                                                       const std::string& query_json,
                                                       const std::string& options_json);

/**
 * @brief Fetch up to count records.
 * @return HandleReleased synchronously for a closed search
 */
[[nodiscard]] Result<Future<std::string>> search_next_records(Runtime& runtime,
                                                              NativeHandle search_handle,
                                                              uint32_t count);

/**
 * @brief Close a search through the handle registry.
 */
[[nodiscard]] Result<Future<void>> close_search(Runtime& runtime, NativeHandle search_handle);

} // namespace vcxbridge::wallet
