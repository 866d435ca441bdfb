/**
 * @file connection.cpp
 * @brief Connection entry points.
 *
 * @copyright GPL-2.0-or-later
 */

#include "vcxbridge/connection.h"
#include "gsl.hpp"

#include <limits>

namespace vcxbridge::connection {

Result<Future<NativeHandle>> create(Runtime& runtime, const std::string& source_id) {
    return runtime.call<uint32_t>(
        "vcx_connection_create",
        [&](const NativeApi& api, vcx_command_handle_t token, vcx_u32_cb_t cb) {
            return api.vcx_connection_create(token, source_id.c_str(), cb);
        },
        runtime.register_on_success(HandleKind::Connection));
}

Result<Future<NativeHandle>> deserialize(Runtime& runtime, const std::string& connection_json) {
    return runtime.call<uint32_t>(
        "vcx_connection_deserialize",
        [&](const NativeApi& api, vcx_command_handle_t token, vcx_u32_cb_t cb) {
            return api.vcx_connection_deserialize(token, connection_json.c_str(), cb);
        },
        runtime.register_on_success(HandleKind::Connection));
}

Result<Future<std::string>> connect(Runtime& runtime,
                                    NativeHandle handle,
                                    const std::string& options_json) {
    return runtime.call_on<std::string>(
        HandleKind::Connection, handle, "vcx_connection_connect",
        [&](const NativeApi& api, vcx_command_handle_t token, vcx_str_cb_t cb) {
            return api.vcx_connection_connect(token, handle, options_json.c_str(), cb);
        });
}

Result<Future<std::string>> serialize(Runtime& runtime, NativeHandle handle) {
    return runtime.call_on<std::string>(
        HandleKind::Connection, handle, "vcx_connection_serialize",
        [&](const NativeApi& api, vcx_command_handle_t token, vcx_str_cb_t cb) {
            return api.vcx_connection_serialize(token, handle, cb);
        });
}

Result<Future<uint32_t>> update_state(Runtime& runtime, NativeHandle handle) {
    return runtime.call_on<uint32_t>(
        HandleKind::Connection, handle, "vcx_connection_update_state",
        [&](const NativeApi& api, vcx_command_handle_t token, vcx_u32_cb_t cb) {
            return api.vcx_connection_update_state(token, handle, cb);
        });
}

Result<Future<uint32_t>> get_state(Runtime& runtime, NativeHandle handle) {
    return runtime.call_on<uint32_t>(
        HandleKind::Connection, handle, "vcx_connection_get_state",
        [&](const NativeApi& api, vcx_command_handle_t token, vcx_u32_cb_t cb) {
            return api.vcx_connection_get_state(token, handle, cb);
        });
}

Result<Future<std::vector<uint8_t>>> sign_data(Runtime& runtime,
                                               NativeHandle handle,
                                               const std::vector<uint8_t>& data) {
    VCXBRIDGE_CHECK(data.size() <= std::numeric_limits<uint32_t>::max(),
                    ErrorCode::InvalidArgument, "data exceeds 4 GiB");

    const auto data_len = gsl::narrow_cast<uint32_t>(data.size());
    return runtime.call_on<std::vector<uint8_t>>(
        HandleKind::Connection, handle, "vcx_connection_sign_data",
        [&](const NativeApi& api, vcx_command_handle_t token, vcx_bytes_cb_t cb) {
            return api.vcx_connection_sign_data(token, handle, data.data(), data_len, cb);
        });
}

Result<Future<void>> release(Runtime& runtime, NativeHandle handle) {
    return runtime.handles().release(HandleKind::Connection, handle);
}

} // namespace vcxbridge::connection
