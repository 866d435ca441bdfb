/**
 * @file callback_bridge.h
 * @brief Turns "submit + later callback" native calls into Future<T>.
 *
 * Every asynchronous native entry point receives a correlation token
 * (command handle) and a completion callback. The bridge:
 *
 * 1. mints a token and registers a pending call under it BEFORE the
 *    native function runs, so a callback that fires immediately (even
 *    on another thread, even before the submitting call returns) finds
 *    its receiver;
 * 2. hands the native function one of the static trampolines below;
 * 3. on a non-zero immediate status, removes the pending call and fails
 *    its future with SubmissionFailure;
 * 4. when a trampoline fires, removes the pending call, translates the
 *    outcome and fulfils the future exactly once.
 *
 * A completion for a token that is not pending (duplicate or stale) is a
 * protocol violation: it is logged and counted, never delivered.
 *
 * Ownership: the pending table owns each pending call from registration
 * until its trampoline fires. A pending call holds the native binding,
 * so the library and its function table outlive every outstanding call,
 * including calls whose Future the caller abandoned.
 *
 * Threading: registration and lookup+removal are serialized by one
 * mutex; translation and future fulfilment run outside it.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <vcxbridge/error.h>
#include <vcxbridge/future.h>
#include <vcxbridge/native_api.h>
#include <vcxbridge/outcome_translator.h>
#include <vcxbridge/vcx_abi.h>

#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// ═══════════════════════════════════════════════════════════════════════════════
// Trampolines (C ABI)
// ═══════════════════════════════════════════════════════════════════════════════

extern "C" {

void vcxbridge_complete_none(vcx_command_handle_t command_handle, vcx_error_t err);

void vcxbridge_complete_u32(vcx_command_handle_t command_handle, vcx_error_t err,
                            uint32_t value);

void vcxbridge_complete_str(vcx_command_handle_t command_handle, vcx_error_t err,
                            const char* value);

void vcxbridge_complete_bytes(vcx_command_handle_t command_handle, vcx_error_t err,
                              const uint8_t* data, uint32_t data_len);

} // extern "C"

namespace vcxbridge {

/**
 * @brief Hook run on the callback thread with the translated result,
 *        before the future is fulfilled.
 */
template<typename T>
using CompletionHook = std::function<void(Result<T>&)>;

namespace detail {

// ─────────────────────────────────────────────────────────────────────────────
// Trampoline selection per result shape
// ─────────────────────────────────────────────────────────────────────────────

template<typename T> struct Trampoline;

template<> struct Trampoline<void> {
    using Callback = vcx_cb_t;
    static constexpr Callback function = &vcxbridge_complete_none;
};

template<> struct Trampoline<uint32_t> {
    using Callback = vcx_u32_cb_t;
    static constexpr Callback function = &vcxbridge_complete_u32;
};

template<> struct Trampoline<std::string> {
    using Callback = vcx_str_cb_t;
    static constexpr Callback function = &vcxbridge_complete_str;
};

template<> struct Trampoline<std::vector<uint8_t>> {
    using Callback = vcx_bytes_cb_t;
    static constexpr Callback function = &vcxbridge_complete_bytes;
};

// ─────────────────────────────────────────────────────────────────────────────
// Pending Call
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Type-erased entry of the pending table.
 */
class PendingCall {
public:
    PendingCall(BindingPtr binding, const char* native_function)
        : binding_(std::move(binding))
        , native_function_(native_function ? native_function : "")
    {}

    virtual ~PendingCall() = default;

    PendingCall(const PendingCall&) = delete;
    PendingCall& operator=(const PendingCall&) = delete;

    /**
     * @brief Translate the outcome and fulfil the future. Called once.
     */
    virtual void complete(const NativeOutcome& outcome, ErrorCode failure_kind) noexcept = 0;

    /**
     * @brief Fulfil the future with a locally produced error. Called once.
     */
    virtual void fail(Error error) noexcept = 0;

    [[nodiscard]] const char* native_function() const noexcept { return native_function_; }
    [[nodiscard]] const NativeApi* api() const noexcept {
        return binding_ ? &binding_->api : nullptr;
    }

private:
    BindingPtr binding_;
    const char* native_function_;
};

template<typename T>
class TypedPendingCall final : public PendingCall {
public:
    TypedPendingCall(BindingPtr binding, const char* native_function, CompletionHook<T> hook)
        : PendingCall(std::move(binding), native_function)
        , hook_(std::move(hook))
    {}

    [[nodiscard]] Future<T> get_future() {
        return Future<T>(promise_.get_future());
    }

    void complete(const NativeOutcome& outcome, ErrorCode failure_kind) noexcept override {
        try {
            Result<T> result = translate<T>(outcome, failure_kind, native_function(), api());
            if (hook_) {
                hook_(result);
            }
            promise_.set_value(std::move(result));
        } catch (const std::exception& e) {
            fail(Error{ErrorCode::Unknown, std::string("completion failed: ") + e.what()});
        }
    }

    void fail(Error error) noexcept override {
        try {
            promise_.set_value(Result<T>{std::unexpect, std::move(error)});
        } catch (const std::future_error&) {
            // Already fulfilled by complete(); the first outcome stands.
        }
    }

private:
    std::promise<Result<T>> promise_;
    CompletionHook<T> hook_;
};

} // namespace detail

// ═══════════════════════════════════════════════════════════════════════════════
// Callback Bridge
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Process-wide correlation of native completions to pending calls.
 *
 * The native layer reports completions through plain C callbacks that
 * only carry the token, so the pending table is process-wide and tokens
 * are unique across every Runtime in the process.
 *
 * Example:
 * @code
 *   Future<std::string> fees = CallbackBridge::instance().submit<std::string>(
 *       binding, "vcx_ledger_get_fees",
 *       [&](vcx_command_handle_t token, vcx_str_cb_t cb) {
 *           return binding->api.vcx_ledger_get_fees(token, cb);
 *       });
 * @endcode
 */
class CallbackBridge {
public:
    static CallbackBridge& instance();

    // Non-copyable, non-movable (trampolines route to the instance)
    CallbackBridge(const CallbackBridge&) = delete;
    CallbackBridge& operator=(const CallbackBridge&) = delete;
    CallbackBridge(CallbackBridge&&) = delete;
    CallbackBridge& operator=(CallbackBridge&&) = delete;

    /**
     * @brief Submit a native call.
     *
     * @tparam T      Result shape (void, uint32_t, std::string, std::vector<uint8_t>)
     * @param binding Binding kept alive until the call completes (must not be null)
     * @param native_function Entry point name, for errors and logs (static storage)
     * @param invoke  Callable (token, trampoline) -> vcx_error_t performing the native call
     * @param hook    Optional hook run with the translated result before fulfilment
     * @return Future fulfilled exactly once
     */
    template<typename T, typename Invoke>
    [[nodiscard]] Future<T> submit(BindingPtr binding,
                                   const char* native_function,
                                   Invoke&& invoke,
                                   CompletionHook<T> hook = {}) {
        auto call = std::make_unique<detail::TypedPendingCall<T>>(
            std::move(binding), native_function, std::move(hook));
        Future<T> future = call->get_future();

        const vcx_command_handle_t token = register_call(std::move(call));

        vcx_error_t status = VCX_SUCCESS;
        try {
            status = std::forward<Invoke>(invoke)(token, detail::Trampoline<T>::function);
        } catch (const std::exception& e) {
            abandon(token, Error{ErrorCode::Unknown,
                                 std::string("submission threw: ") + e.what()});
            return future;
        }

        if (status != VCX_SUCCESS) {
            fail_submission(token, status);
        }
        return future;
    }

    /**
     * @brief Deliver a completion. Called by the trampolines.
     *
     * Unknown tokens are counted as protocol violations and dropped.
     */
    void complete(vcx_command_handle_t token, const NativeOutcome& outcome) noexcept;

    [[nodiscard]] size_t pending_count() const;
    [[nodiscard]] bool is_pending(vcx_command_handle_t token) const;
    [[nodiscard]] uint64_t protocol_violation_count() const noexcept {
        return protocol_violations_.load(std::memory_order_relaxed);
    }

private:
    CallbackBridge() = default;

    vcx_command_handle_t register_call(std::unique_ptr<detail::PendingCall> call);
    std::unique_ptr<detail::PendingCall> take(vcx_command_handle_t token);
    void fail_submission(vcx_command_handle_t token, vcx_error_t status) noexcept;
    void abandon(vcx_command_handle_t token, Error error) noexcept;
    void record_violation(vcx_command_handle_t token, vcx_error_t err, const char* reason) noexcept;

    mutable std::mutex mutex_;
    std::unordered_map<vcx_command_handle_t, std::unique_ptr<detail::PendingCall>> pending_;
    vcx_command_handle_t next_token_ = 1;
    std::atomic<uint64_t> protocol_violations_{0};
};

} // namespace vcxbridge
