/**
 * @file callback_bridge.cpp
 * @brief Pending table, token minting and trampolines.
 *
 * @copyright GPL-2.0-or-later
 */

#include "vcxbridge/callback_bridge.h"
#include "vcxbridge/exceptions.h"
#include "vcxbridge/logging.h"
#include "gsl.hpp"

#include <limits>

namespace vcxbridge {

CallbackBridge& CallbackBridge::instance() {
    static CallbackBridge bridge;
    return bridge;
}

vcx_command_handle_t CallbackBridge::register_call(std::unique_ptr<detail::PendingCall> call) {
    gsl_Expects(call != nullptr);

    std::lock_guard lock(mutex_);
    VCXBRIDGE_ASSERT(pending_.size() < std::numeric_limits<vcx_command_handle_t>::max() - 1,
                     "correlation token space exhausted");

    // 0 is never minted; a token still pending is skipped after wrap-around
    vcx_command_handle_t token = 0;
    do {
        token = next_token_++;
    } while (token == 0 || pending_.contains(token));

    VCXBRIDGE_LOG_TRACE("BRIDGE", "submit %s as command handle %u",
                        call->native_function(), token);
    pending_.emplace(token, std::move(call));
    return token;
}

std::unique_ptr<detail::PendingCall> CallbackBridge::take(vcx_command_handle_t token) {
    std::lock_guard lock(mutex_);
    auto it = pending_.find(token);
    if (it == pending_.end()) {
        return nullptr;
    }
    auto call = std::move(it->second);
    pending_.erase(it);
    return call;
}

void CallbackBridge::complete(vcx_command_handle_t token, const NativeOutcome& outcome) noexcept {
    auto call = take(token);
    if (!call) {
        record_violation(token, outcome.code, "completion for unknown command handle");
        return;
    }

    VCXBRIDGE_LOG_TRACE("BRIDGE", "%s (command handle %u) completed with %u",
                        call->native_function(), token, outcome.code);
    call->complete(outcome, ErrorCode::CallbackFailure);
}

void CallbackBridge::fail_submission(vcx_command_handle_t token, vcx_error_t status) noexcept {
    auto call = take(token);
    if (!call) {
        // The native layer called back although it rejected the call.
        record_violation(token, status, "callback fired for a rejected submission");
        return;
    }

    VCXBRIDGE_LOG_DEBUG("BRIDGE", "%s rejected at submission with %u",
                        call->native_function(), status);
    call->complete(NativeOutcome{status, std::monostate{}}, ErrorCode::SubmissionFailure);
}

void CallbackBridge::abandon(vcx_command_handle_t token, Error error) noexcept {
    if (auto call = take(token)) {
        VCXBRIDGE_LOG_ERROR("BRIDGE", "%s: %s", call->native_function(), error.message().c_str());
        call->fail(std::move(error));
    }
}

void CallbackBridge::record_violation(vcx_command_handle_t token,
                                      vcx_error_t err,
                                      const char* reason) noexcept {
    protocol_violations_.fetch_add(1, std::memory_order_relaxed);
    VCXBRIDGE_LOG_WARN("BRIDGE", "ProtocolViolation: %s %u (error %u), dropped",
                       reason, token, err);
}

size_t CallbackBridge::pending_count() const {
    std::lock_guard lock(mutex_);
    return pending_.size();
}

bool CallbackBridge::is_pending(vcx_command_handle_t token) const {
    std::lock_guard lock(mutex_);
    return pending_.contains(token);
}

} // namespace vcxbridge

// ═══════════════════════════════════════════════════════════════════════════════
// Trampolines
// ═══════════════════════════════════════════════════════════════════════════════

extern "C" {

void vcxbridge_complete_none(vcx_command_handle_t command_handle, vcx_error_t err) {
    vcxbridge::CallbackBridge::instance().complete(
        command_handle, vcxbridge::NativeOutcome{err, std::monostate{}});
}

void vcxbridge_complete_u32(vcx_command_handle_t command_handle, vcx_error_t err,
                            uint32_t value) {
    vcxbridge::CallbackBridge::instance().complete(
        command_handle, vcxbridge::NativeOutcome{err, vcxbridge::NativePayload{value}});
}

void vcxbridge_complete_str(vcx_command_handle_t command_handle, vcx_error_t err,
                            const char* value) {
    vcxbridge::CallbackBridge::instance().complete(
        command_handle, vcxbridge::NativeOutcome{err, vcxbridge::NativePayload{value}});
}

void vcxbridge_complete_bytes(vcx_command_handle_t command_handle, vcx_error_t err,
                              const uint8_t* data, uint32_t data_len) {
    vcxbridge::CallbackBridge::instance().complete(
        command_handle,
        vcxbridge::NativeOutcome{err, vcxbridge::NativePayload{vcxbridge::ByteView{data, data_len}}});
}

} // extern "C"
