/**
 * @file outcome_translator.h
 * @brief Native (error code, payload) → Result<T>.
 *
 * The set of result shapes is closed:
 *
 * | T                      | Native callback | Decoding of a missing payload |
 * |------------------------|-----------------|-------------------------------|
 * | void                   | vcx_cb_t        | -                             |
 * | uint32_t               | vcx_u32_cb_t    | 0                             |
 * | std::string            | vcx_str_cb_t    | ""                            |
 * | std::vector<uint8_t>   | vcx_bytes_cb_t  | empty                         |
 *
 * Each decoder is total. Structured payloads (JSON) are returned as
 * strings and decoded by the caller.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <vcxbridge/error.h>
#include <vcxbridge/native_api.h>

#include <cstdint>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace vcxbridge {

/**
 * @brief Borrowed byte buffer, valid only inside a callback.
 */
struct ByteView {
    const uint8_t* data = nullptr;
    uint32_t size = 0;
};

using NativePayload = std::variant<std::monostate, uint32_t, const char*, ByteView>;

/**
 * @brief What a completion callback delivered.
 *
 * Ephemeral: pointers inside payload are borrowed from the native layer.
 */
struct NativeOutcome {
    vcx_error_t code = VCX_SUCCESS;
    NativePayload payload;
};

// ─────────────────────────────────────────────────────────────────────────────
// Payload Decoding
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] uint32_t decode_integer(const NativePayload& payload);
[[nodiscard]] std::string decode_string(const NativePayload& payload);
[[nodiscard]] std::vector<uint8_t> decode_bytes(const NativePayload& payload);

template<typename T>
inline constexpr bool is_result_shape_v =
    std::is_void_v<T> ||
    std::is_same_v<T, uint32_t> ||
    std::is_same_v<T, std::string> ||
    std::is_same_v<T, std::vector<uint8_t>>;

/**
 * @brief Decode a success payload into the expected shape.
 */
template<typename T>
[[nodiscard]] T decode_payload(const NativePayload& payload) {
    static_assert(is_result_shape_v<T>, "unsupported result shape");
    if constexpr (std::is_same_v<T, uint32_t>) {
        return decode_integer(payload);
    } else if constexpr (std::is_same_v<T, std::string>) {
        return decode_string(payload);
    } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
        return decode_bytes(payload);
    } else {
        (void)payload;
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Error Translation
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Resolve a message through vcx_error_c_message.
 *
 * Never fails: a null table, a null lookup function or a null message
 * all yield an empty string.
 */
[[nodiscard]] std::string native_error_message(const NativeApi* api, vcx_error_t code);

/**
 * @brief Build the Error for a non-zero native code.
 *
 * @param failure_kind SubmissionFailure or CallbackFailure
 */
[[nodiscard]] Error translate_failure(vcx_error_t code,
                                      ErrorCode failure_kind,
                                      const char* native_function,
                                      const NativeApi* api);

/**
 * @brief Translate a native outcome.
 *
 * Submission-time and callback-time codes go through the same path;
 * only failure_kind differs.
 */
template<typename T>
[[nodiscard]] Result<T> translate(const NativeOutcome& outcome,
                                  ErrorCode failure_kind,
                                  const char* native_function,
                                  const NativeApi* api) {
    if (outcome.code != VCX_SUCCESS) {
        return Err(translate_failure(outcome.code, failure_kind, native_function, api));
    }
    if constexpr (std::is_void_v<T>) {
        return Ok();
    } else {
        return Ok(decode_payload<T>(outcome.payload));
    }
}

} // namespace vcxbridge
