/**
 * @file outcome_translator.cpp
 * @brief Payload decoders and native error translation.
 *
 * @copyright GPL-2.0-or-later
 */

#include "vcxbridge/outcome_translator.h"

namespace vcxbridge {

uint32_t decode_integer(const NativePayload& payload) {
    if (const auto* value = std::get_if<uint32_t>(&payload)) {
        return *value;
    }
    return 0;
}

std::string decode_string(const NativePayload& payload) {
    if (const auto* value = std::get_if<const char*>(&payload); value && *value) {
        return std::string(*value);
    }
    return {};
}

std::vector<uint8_t> decode_bytes(const NativePayload& payload) {
    if (const auto* view = std::get_if<ByteView>(&payload); view && view->data && view->size > 0) {
        return std::vector<uint8_t>(view->data, view->data + view->size);
    }
    return {};
}

std::string native_error_message(const NativeApi* api, vcx_error_t code) {
    if (api == nullptr || api->vcx_error_c_message == nullptr) {
        return {};
    }
    const char* message = api->vcx_error_c_message(code);
    return message ? std::string(message) : std::string{};
}

Error translate_failure(vcx_error_t code,
                        ErrorCode failure_kind,
                        const char* native_function,
                        const NativeApi* api) {
    return Error::native(failure_kind,
                         code,
                         native_error_message(api, code),
                         native_function ? native_function : "");
}

} // namespace vcxbridge
