/**
 * @file agent.cpp
 * @brief Agent and utility entry points.
 *
 * @copyright GPL-2.0-or-later
 */

#include "vcxbridge/agent.h"

namespace vcxbridge::agent {

Result<Future<void>> init_with_config(Runtime& runtime, const std::string& config_json) {
    return runtime.call<void>(
        "vcx_init_with_config",
        [&](const NativeApi& api, vcx_command_handle_t token, vcx_cb_t cb) {
            return api.vcx_init_with_config(token, config_json.c_str(), cb);
        });
}

Result<Future<std::string>> provision_agent(Runtime& runtime, const std::string& config_json) {
    return runtime.call<std::string>(
        "vcx_agent_provision_async",
        [&](const NativeApi& api, vcx_command_handle_t token, vcx_str_cb_t cb) {
            return api.vcx_agent_provision_async(token, config_json.c_str(), cb);
        });
}

Result<Future<std::string>> update_agent_info(Runtime& runtime, const std::string& options_json) {
    return runtime.call<std::string>(
        "vcx_agent_update_info",
        [&](const NativeApi& api, vcx_command_handle_t token, vcx_str_cb_t cb) {
            return api.vcx_agent_update_info(token, options_json.c_str(), cb);
        });
}

Result<Future<std::string>> get_ledger_fees(Runtime& runtime) {
    return runtime.call<std::string>(
        "vcx_ledger_get_fees",
        [](const NativeApi& api, vcx_command_handle_t token, vcx_str_cb_t cb) {
            return api.vcx_ledger_get_fees(token, cb);
        });
}

Result<Future<std::string>> download_messages(Runtime& runtime,
                                              const DownloadMessagesOptions& options) {
    return runtime.call<std::string>(
        "vcx_messages_download",
        [&](const NativeApi& api, vcx_command_handle_t token, vcx_str_cb_t cb) {
            return api.vcx_messages_download(token,
                                             options.status.c_str(),
                                             options.uids.c_str(),
                                             options.pairwise_dids.c_str(),
                                             cb);
        });
}

Result<Future<void>> update_messages(Runtime& runtime, const std::string& msg_json) {
    return runtime.call<void>(
        "vcx_messages_update_status",
        [&](const NativeApi& api, vcx_command_handle_t token, vcx_cb_t cb) {
            return api.vcx_messages_update_status(token, kMessageStatusReviewed,
                                                  msg_json.c_str(), cb);
        });
}

Result<void> update_institution_info(Runtime& runtime,
                                     const std::string& name,
                                     const std::string& logo_url) {
    auto lease = VCXBRIDGE_TRY(runtime.acquire());
    const vcx_error_t status =
        lease.api().vcx_update_institution_info(name.c_str(), logo_url.c_str());
    if (status != VCX_SUCCESS) {
        return Err(translate_failure(status, ErrorCode::SubmissionFailure,
                                     "vcx_update_institution_info", &lease.api()));
    }
    return Ok();
}

Result<std::string> version(Runtime& runtime) {
    auto lease = VCXBRIDGE_TRY(runtime.acquire());
    const char* text = lease.api().vcx_version();
    return std::string(text ? text : "");
}

} // namespace vcxbridge::agent
