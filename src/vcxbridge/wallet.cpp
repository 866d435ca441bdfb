/**
 * @file wallet.cpp
 * @brief Wallet entry points.
 *
 * @copyright GPL-2.0-or-later
 */

#include "vcxbridge/wallet.h"
#include "vcxbridge/json.h"

namespace vcxbridge::wallet {

Result<Future<std::string>> get_token_info(Runtime& runtime, PaymentHandle payment_handle) {
    return runtime.call<std::string>(
        "vcx_wallet_get_token_info",
        [&](const NativeApi& api, vcx_command_handle_t token, vcx_str_cb_t cb) {
            return api.vcx_wallet_get_token_info(token, payment_handle, cb);
        });
}

Result<Future<std::string>> send_tokens(Runtime& runtime,
                                        PaymentHandle payment_handle,
                                        const std::string& tokens,
                                        const std::string& recipient) {
    return runtime.call<std::string>(
        "vcx_wallet_send_tokens",
        [&](const NativeApi& api, vcx_command_handle_t token, vcx_str_cb_t cb) {
            return api.vcx_wallet_send_tokens(token, payment_handle,
                                              tokens.c_str(), recipient.c_str(), cb);
        });
}

// ═══════════════════════════════════════════════════════════════════════════════
// Records
// ═══════════════════════════════════════════════════════════════════════════════

Result<Future<void>> add_record(Runtime& runtime, const WalletRecord& record) {
    return runtime.call<void>(
        "vcx_wallet_add_record",
        [&](const NativeApi& api, vcx_command_handle_t token, vcx_cb_t cb) {
            return api.vcx_wallet_add_record(token,
                                             record.type.c_str(),
                                             record.id.c_str(),
                                             record.value.c_str(),
                                             record.tags_json.c_str(),
                                             cb);
        });
}

Result<Future<void>> update_record_value(Runtime& runtime, const WalletRecord& record) {
    return runtime.call<void>(
        "vcx_wallet_update_record_value",
        [&](const NativeApi& api, vcx_command_handle_t token, vcx_cb_t cb) {
            return api.vcx_wallet_update_record_value(token,
                                                      record.type.c_str(),
                                                      record.id.c_str(),
                                                      record.value.c_str(),
                                                      cb);
        });
}

Result<Future<void>> update_record_tags(Runtime& runtime, const WalletRecord& record) {
    return runtime.call<void>(
        "vcx_wallet_update_record_tags",
        [&](const NativeApi& api, vcx_command_handle_t token, vcx_cb_t cb) {
            return api.vcx_wallet_update_record_tags(token,
                                                     record.type.c_str(),
                                                     record.id.c_str(),
                                                     record.tags_json.c_str(),
                                                     cb);
        });
}

Result<Future<void>> add_record_tags(Runtime& runtime, const WalletRecord& record) {
    return runtime.call<void>(
        "vcx_wallet_add_record_tags",
        [&](const NativeApi& api, vcx_command_handle_t token, vcx_cb_t cb) {
            return api.vcx_wallet_add_record_tags(token,
                                                  record.type.c_str(),
                                                  record.id.c_str(),
                                                  record.tags_json.c_str(),
                                                  cb);
        });
}

Result<Future<void>> delete_record_tags(Runtime& runtime,
                                        const WalletRecord& record,
                                        const std::vector<std::string>& tag_names) {
    const std::string names_json = json_string_array(tag_names);
    return runtime.call<void>(
        "vcx_wallet_delete_record_tags",
        [&](const NativeApi& api, vcx_command_handle_t token, vcx_cb_t cb) {
            return api.vcx_wallet_delete_record_tags(token,
                                                     record.type.c_str(),
                                                     record.id.c_str(),
                                                     names_json.c_str(),
                                                     cb);
        });
}

Result<Future<void>> delete_record(Runtime& runtime,
                                   const std::string& type,
                                   const std::string& id) {
    return runtime.call<void>(
        "vcx_wallet_delete_record",
        [&](const NativeApi& api, vcx_command_handle_t token, vcx_cb_t cb) {
            return api.vcx_wallet_delete_record(token, type.c_str(), id.c_str(), cb);
        });
}

Result<Future<std::string>> get_record(Runtime& runtime,
                                       const std::string& type,
                                       const std::string& id) {
    return runtime.call<std::string>(
        "vcx_wallet_get_record",
        [&](const NativeApi& api, vcx_command_handle_t token, vcx_str_cb_t cb) {
            return api.vcx_wallet_get_record(token, type.c_str(), id.c_str(), cb);
        });
}

// ═══════════════════════════════════════════════════════════════════════════════
// Searches
// ═══════════════════════════════════════════════════════════════════════════════

Result<Future<NativeHandle>> open_search(Runtime& runtime,
                                         const std::string& type,
                                         const std::string& query_json,
                                         const std::string& options_json) {
    return runtime.call<uint32_t>(
        "vcx_wallet_open_search",
        [&](const NativeApi& api, vcx_command_handle_t token, vcx_u32_cb_t cb) {
            return api.vcx_wallet_open_search(token,
                                              type.c_str(),
                                              query_json.c_str(),
                                              options_json.c_str(),
                                              cb);
        },
        runtime.register_on_success(HandleKind::WalletSearch));
}

Result<Future<std::string>> search_next_records(Runtime& runtime,
                                                NativeHandle search_handle,
                                                uint32_t count) {
    return runtime.call_on<std::string>(
        HandleKind::WalletSearch, search_handle, "vcx_wallet_search_next_records",
        [&](const NativeApi& api, vcx_command_handle_t token, vcx_str_cb_t cb) {
            return api.vcx_wallet_search_next_records(token, search_handle, count, cb);
        });
}

Result<Future<void>> close_search(Runtime& runtime, NativeHandle search_handle) {
    return runtime.handles().release(HandleKind::WalletSearch, search_handle);
}

} // namespace vcxbridge::wallet
