/**
 * @file vcx_abi.h
 * @brief C ABI of the native VCX library wrapped by vcxbridge.
 *
 * This header declares the entry points vcxbridge resolves at runtime
 * from the loaded native library. vcxbridge never links against them;
 * the declarations exist so that function-pointer types can be derived
 * with decltype and so that implementations of the ABI are checked
 * against one set of prototypes.
 *
 * CALLING CONVENTION:
 * - Asynchronous entry points take a caller-assigned command handle
 *   (correlation token) first and a completion callback last.
 * - The immediate return value is a submission status: 0 means the
 *   call was accepted and the callback WILL fire exactly once; any
 *   other value means it was rejected and the callback will NOT fire.
 * - Callbacks may fire on any thread, including before the submitting
 *   call returns.
 * - Pointer payloads passed to callbacks are only valid for the
 *   duration of the callback.
 * - String arguments are copied by the library before the call returns.
 *
 * @copyright GPL-2.0-or-later
 */

#ifndef VCXBRIDGE_VCX_ABI_H
#define VCXBRIDGE_VCX_ABI_H

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/* =========================================================================
 * BASIC TYPES
 * ========================================================================= */

typedef uint32_t vcx_command_handle_t;  /**< Correlation token */
typedef uint32_t vcx_error_t;           /**< 0 = success */
typedef uint32_t vcx_handle_t;          /**< Opaque native object handle */
typedef uint8_t  vcx_bool_t;

#define VCX_SUCCESS 0u

/* =========================================================================
 * COMPLETION CALLBACK SHAPES
 * ========================================================================= */

/** Completion with no payload. */
typedef void (*vcx_cb_t)(
    vcx_command_handle_t command_handle,
    vcx_error_t err
);

/** Completion carrying an integer (handle or state). */
typedef void (*vcx_u32_cb_t)(
    vcx_command_handle_t command_handle,
    vcx_error_t err,
    uint32_t value
);

/** Completion carrying a NUL-terminated string (often JSON). */
typedef void (*vcx_str_cb_t)(
    vcx_command_handle_t command_handle,
    vcx_error_t err,
    const char* value
);

/** Completion carrying an opaque byte buffer. */
typedef void (*vcx_bytes_cb_t)(
    vcx_command_handle_t command_handle,
    vcx_error_t err,
    const uint8_t* data,
    uint32_t data_len
);

/* =========================================================================
 * LIBRARY LIFECYCLE
 * ========================================================================= */

/**
 * @brief Initialize the library from a JSON configuration.
 */
vcx_error_t vcx_init_with_config(
    vcx_command_handle_t command_handle,
    const char* config,
    vcx_cb_t cb
);

/**
 * @brief Release all global library state.
 *
 * @param delete_wallet Non-zero to delete the wallet as well
 * @return 0 on success
 */
vcx_error_t vcx_shutdown(vcx_bool_t delete_wallet);

/** @brief Library version string (static storage). */
const char* vcx_version(void);

/**
 * @brief Human-readable message for an error code.
 *
 * @return Static string, or NULL for unknown codes
 */
const char* vcx_error_c_message(vcx_error_t error_code);

/* =========================================================================
 * AGENT / UTILITIES
 * ========================================================================= */

vcx_error_t vcx_agent_provision_async(
    vcx_command_handle_t command_handle,
    const char* config,
    vcx_str_cb_t cb
);

vcx_error_t vcx_agent_update_info(
    vcx_command_handle_t command_handle,
    const char* options,
    vcx_str_cb_t cb
);

vcx_error_t vcx_ledger_get_fees(
    vcx_command_handle_t command_handle,
    vcx_str_cb_t cb
);

vcx_error_t vcx_messages_download(
    vcx_command_handle_t command_handle,
    const char* message_status,
    const char* uids,
    const char* pairwise_dids,
    vcx_str_cb_t cb
);

vcx_error_t vcx_messages_update_status(
    vcx_command_handle_t command_handle,
    const char* message_status,
    const char* msg_json,
    vcx_cb_t cb
);

/** @brief Synchronous: update institution name and logo. */
vcx_error_t vcx_update_institution_info(
    const char* name,
    const char* logo_url
);

/* =========================================================================
 * WALLET
 * ========================================================================= */

vcx_error_t vcx_wallet_get_token_info(
    vcx_command_handle_t command_handle,
    vcx_handle_t payment_handle,
    vcx_str_cb_t cb
);

vcx_error_t vcx_wallet_send_tokens(
    vcx_command_handle_t command_handle,
    vcx_handle_t payment_handle,
    const char* tokens,
    const char* recipient,
    vcx_str_cb_t cb
);

vcx_error_t vcx_wallet_add_record(
    vcx_command_handle_t command_handle,
    const char* type_,
    const char* id,
    const char* value,
    const char* tags_json,
    vcx_cb_t cb
);

vcx_error_t vcx_wallet_update_record_value(
    vcx_command_handle_t command_handle,
    const char* type_,
    const char* id,
    const char* value,
    vcx_cb_t cb
);

vcx_error_t vcx_wallet_update_record_tags(
    vcx_command_handle_t command_handle,
    const char* type_,
    const char* id,
    const char* tags_json,
    vcx_cb_t cb
);

vcx_error_t vcx_wallet_add_record_tags(
    vcx_command_handle_t command_handle,
    const char* type_,
    const char* id,
    const char* tags_json,
    vcx_cb_t cb
);

vcx_error_t vcx_wallet_delete_record_tags(
    vcx_command_handle_t command_handle,
    const char* type_,
    const char* id,
    const char* tag_names_json,
    vcx_cb_t cb
);

vcx_error_t vcx_wallet_delete_record(
    vcx_command_handle_t command_handle,
    const char* type_,
    const char* id,
    vcx_cb_t cb
);

vcx_error_t vcx_wallet_get_record(
    vcx_command_handle_t command_handle,
    const char* type_,
    const char* id,
    vcx_str_cb_t cb
);

vcx_error_t vcx_wallet_open_search(
    vcx_command_handle_t command_handle,
    const char* type_,
    const char* query_json,
    const char* options_json,
    vcx_u32_cb_t cb
);

vcx_error_t vcx_wallet_search_next_records(
    vcx_command_handle_t command_handle,
    vcx_handle_t search_handle,
    uint32_t count,
    vcx_str_cb_t cb
);

vcx_error_t vcx_wallet_close_search(
    vcx_command_handle_t command_handle,
    vcx_handle_t search_handle,
    vcx_cb_t cb
);

/* =========================================================================
 * CONNECTION
 * ========================================================================= */

vcx_error_t vcx_connection_create(
    vcx_command_handle_t command_handle,
    const char* source_id,
    vcx_u32_cb_t cb
);

vcx_error_t vcx_connection_deserialize(
    vcx_command_handle_t command_handle,
    const char* connection_data,
    vcx_u32_cb_t cb
);

vcx_error_t vcx_connection_connect(
    vcx_command_handle_t command_handle,
    vcx_handle_t connection_handle,
    const char* connection_options,
    vcx_str_cb_t cb
);

vcx_error_t vcx_connection_serialize(
    vcx_command_handle_t command_handle,
    vcx_handle_t connection_handle,
    vcx_str_cb_t cb
);

vcx_error_t vcx_connection_update_state(
    vcx_command_handle_t command_handle,
    vcx_handle_t connection_handle,
    vcx_u32_cb_t cb
);

vcx_error_t vcx_connection_get_state(
    vcx_command_handle_t command_handle,
    vcx_handle_t connection_handle,
    vcx_u32_cb_t cb
);

vcx_error_t vcx_connection_sign_data(
    vcx_command_handle_t command_handle,
    vcx_handle_t connection_handle,
    const uint8_t* data_raw,
    uint32_t data_len,
    vcx_bytes_cb_t cb
);

/** @brief Synchronous release; no callback. */
vcx_error_t vcx_connection_release(vcx_handle_t connection_handle);

/* =========================================================================
 * CREDENTIAL / PROOF RELEASE
 * ========================================================================= */

/** @brief Synchronous release; no callback. */
vcx_error_t vcx_credential_release(vcx_handle_t credential_handle);

/** @brief Synchronous release; no callback. */
vcx_error_t vcx_proof_release(vcx_handle_t proof_handle);

#ifdef __cplusplus
}
#endif

#endif /* VCXBRIDGE_VCX_ABI_H */
