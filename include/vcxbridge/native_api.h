/**
 * @file native_api.h
 * @brief Resolved function table of the native library.
 *
 * NativeApi holds one pointer per entry point declared in vcx_abi.h.
 * NativeBinding ties a table to the library it was resolved from; it is
 * shared by the Runtime and by every pending call, so the table stays
 * valid until the last callback that needs it has fired.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <vcxbridge/error.h>
#include <vcxbridge/shared_library.h>
#include <vcxbridge/vcx_abi.h>

#include <memory>
#include <string>

namespace vcxbridge {

/**
 * @brief X-macro list of every required native entry point.
 */
#define VCXBRIDGE_NATIVE_FUNCTIONS(X) \
    X(vcx_init_with_config) \
    X(vcx_shutdown) \
    X(vcx_version) \
    X(vcx_error_c_message) \
    X(vcx_agent_provision_async) \
    X(vcx_agent_update_info) \
    X(vcx_ledger_get_fees) \
    X(vcx_messages_download) \
    X(vcx_messages_update_status) \
    X(vcx_update_institution_info) \
    X(vcx_wallet_get_token_info) \
    X(vcx_wallet_send_tokens) \
    X(vcx_wallet_add_record) \
    X(vcx_wallet_update_record_value) \
    X(vcx_wallet_update_record_tags) \
    X(vcx_wallet_add_record_tags) \
    X(vcx_wallet_delete_record_tags) \
    X(vcx_wallet_delete_record) \
    X(vcx_wallet_get_record) \
    X(vcx_wallet_open_search) \
    X(vcx_wallet_search_next_records) \
    X(vcx_wallet_close_search) \
    X(vcx_connection_create) \
    X(vcx_connection_deserialize) \
    X(vcx_connection_connect) \
    X(vcx_connection_serialize) \
    X(vcx_connection_update_state) \
    X(vcx_connection_get_state) \
    X(vcx_connection_sign_data) \
    X(vcx_connection_release) \
    X(vcx_credential_release) \
    X(vcx_proof_release)

/**
 * @brief Function pointers resolved from the native library.
 *
 * Field types are derived from the prototypes in vcx_abi.h.
 */
struct NativeApi {
#define VCXBRIDGE_DECLARE_FIELD(name) decltype(&::name) name = nullptr;
    VCXBRIDGE_NATIVE_FUNCTIONS(VCXBRIDGE_DECLARE_FIELD)
#undef VCXBRIDGE_DECLARE_FIELD

    /**
     * @brief Name of the first unset entry point, or nullptr if complete.
     */
    [[nodiscard]] const char* first_missing() const noexcept;

    /**
     * @brief Resolve every entry point from a loaded library.
     *
     * @return Complete table, or InvalidConfiguration naming the missing symbol
     */
    [[nodiscard]] static Result<NativeApi> resolve(const SharedLibrary& library);
};

/**
 * @brief A loaded native library and its resolved table.
 */
struct NativeBinding {
    std::string path;
    SharedLibrary library;  ///< Empty for in-process tables
    NativeApi api;
};

using BindingPtr = std::shared_ptr<const NativeBinding>;

} // namespace vcxbridge
