/**
 * @file runtime.h
 * @brief Native library binding and its lifecycle.
 *
 * State machine:
 * @code
 *   Uninitialized ──initialize──► Initializing ──ok──► Ready
 *        ▲                             │                 │
 *        └────────── load failure ─────┘              shutdown
 *        │                                               │
 *        └──────────────── ShuttingDown ◄────────────────┘
 * @endcode
 *
 * Transitions are serialized by one mutex. The state and the current
 * binding live behind a second, short lock so that calls issued during a
 * transition fail fast with NotInitialized instead of blocking on it.
 *
 * Every native call made through a Runtime holds a BindingLease while it
 * enters the native layer. shutdown() waits for outstanding leases before
 * calling vcx_shutdown, and new leases are refused once it has begun, so
 * no entry point runs against a torn-down native layer. Native code must
 * not call shutdown() from inside an entry point.
 *
 * Pending calls keep a shared reference to the binding until their
 * callback fires, so a shutdown never unloads a table that a callback
 * still needs.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <vcxbridge/callback_bridge.h>
#include <vcxbridge/config.h>
#include <vcxbridge/error.h>
#include <vcxbridge/future.h>
#include <vcxbridge/handle_registry.h>
#include <vcxbridge/native_api.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>

namespace vcxbridge {

enum class RuntimeState : uint8_t {
    Uninitialized = 0,
    Initializing,
    Ready,
    ShuttingDown
};

[[nodiscard]] constexpr const char* to_string(RuntimeState state) noexcept {
    switch (state) {
        case RuntimeState::Uninitialized: return "Uninitialized";
        case RuntimeState::Initializing:  return "Initializing";
        case RuntimeState::Ready:         return "Ready";
        case RuntimeState::ShuttingDown:  return "ShuttingDown";
    }
    return "Unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// Library Loading
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Produces a binding for a library path.
 *
 * Failures must be reported as InvalidConfiguration.
 */
class LibraryLoader {
public:
    virtual ~LibraryLoader() = default;
    [[nodiscard]] virtual Result<BindingPtr> load(const std::string& path) = 0;
};

/**
 * @brief dlopen()s the path and resolves every entry point.
 */
class SharedLibraryLoader final : public LibraryLoader {
public:
    [[nodiscard]] Result<BindingPtr> load(const std::string& path) override;
};

// ─────────────────────────────────────────────────────────────────────────────
// Binding Lease
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Live binding plus a shared hold on the runtime's call gate.
 *
 * Keep it only for the duration of a native entry point; shutdown blocks
 * until every lease is gone.
 */
class BindingLease {
public:
    BindingLease(std::shared_lock<std::shared_mutex> gate, BindingPtr binding)
        : gate_(std::move(gate))
        , binding_(std::move(binding)) {}

    [[nodiscard]] const BindingPtr& binding() const noexcept { return binding_; }
    [[nodiscard]] const NativeApi& api() const noexcept { return binding_->api; }
    const NativeBinding* operator->() const noexcept { return binding_.get(); }

private:
    std::shared_lock<std::shared_mutex> gate_;
    BindingPtr binding_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Runtime
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Owner of the native binding and of the handle registry.
 *
 * Example:
 * @code
 *   Runtime runtime;
 *   if (auto ok = runtime.initialize(RuntimeConfig::from_environment()); !ok) {
 *       std::cerr << ok.error().format() << "\n";
 *       return 1;
 *   }
 *
 *   auto fees = agent::get_ledger_fees(runtime);
 *   if (fees) {
 *       Result<std::string> json = fees->get();
 *   }
 *
 *   runtime.shutdown(false);
 * @endcode
 */
class Runtime final : private HandleReleaser {
public:
    Runtime();
    explicit Runtime(std::unique_ptr<LibraryLoader> loader);
    ~Runtime() override;

    // Non-copyable, non-movable (the registry refers back to this)
    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;
    Runtime(Runtime&&) = delete;
    Runtime& operator=(Runtime&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Load the native library.
     *
     * @return InvalidConfiguration for an empty path, a load failure or a
     *         missing entry point (state stays Uninitialized);
     *         InvalidState when already Ready with a different path.
     *         Ready with the same path only applies config.log_level.
     */
    Result<void> initialize(const RuntimeConfig& config);

    /**
     * @brief Load the native library from a possibly-null C path.
     */
    Result<void> initialize(const char* library_path);

    /**
     * @brief Release all native state.
     *
     * delete_wallet is passed verbatim to vcx_shutdown, once every
     * submission already inside the native layer has returned. The runtime
     * is Uninitialized afterwards even when vcx_shutdown reports an error;
     * that error is returned.
     *
     * @return NotInitialized when not Ready
     */
    Result<void> shutdown(bool delete_wallet);

    [[nodiscard]] RuntimeState state() const;
    [[nodiscard]] bool is_ready() const { return state() == RuntimeState::Ready; }

    /**
     * @brief Path of the loaded library; empty unless Ready.
     */
    [[nodiscard]] std::string library_path() const;

    /**
     * @brief Lease on the live binding.
     * @return NotInitialized unless Ready, including while a shutdown is
     *         in progress (never blocks)
     */
    [[nodiscard]] Result<BindingLease> acquire() const;

    [[nodiscard]] HandleRegistry& handles() noexcept { return *handles_; }
    [[nodiscard]] const HandleRegistry& handles() const noexcept { return *handles_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Native Calls
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Submit an asynchronous native call.
     *
     * @param native_function Entry point name (static storage)
     * @param invoke Callable (const NativeApi&, token, callback) -> vcx_error_t
     * @param hook Optional hook run with the translated result
     * @return NotInitialized synchronously, otherwise the pending future
     */
    template<typename T, typename Invoke>
    [[nodiscard]] Result<Future<T>> call(const char* native_function,
                                         Invoke&& invoke,
                                         CompletionHook<T> hook = {}) {
        auto acquired = acquire();
        if (!acquired) {
            return Err(std::move(acquired).error());
        }
        const BindingLease& lease = *acquired;
        const NativeApi& api = lease.api();

        return CallbackBridge::instance().submit<T>(
            lease.binding(), native_function,
            [&](vcx_command_handle_t token, typename detail::Trampoline<T>::Callback cb) {
                return invoke(api, token, cb);
            },
            std::move(hook));
    }

    /**
     * @brief Like call(), but fails fast with HandleReleased first.
     */
    template<typename T, typename Invoke>
    [[nodiscard]] Result<Future<T>> call_on(HandleKind kind,
                                            NativeHandle handle,
                                            const char* native_function,
                                            Invoke&& invoke,
                                            CompletionHook<T> hook = {}) {
        if (auto live = handles_->assert_live(kind, handle); !live) {
            return Err(std::move(live).error());
        }
        return call<T>(native_function, std::forward<Invoke>(invoke), std::move(hook));
    }

    /**
     * @brief Hook registering the handle delivered by a successful create.
     *
     * The hook holds the registry weakly; a callback arriving after the
     * Runtime is gone registers nothing.
     */
    [[nodiscard]] CompletionHook<uint32_t> register_on_success(HandleKind kind);

private:
    Result<Future<void>> release_native(HandleKind kind, NativeHandle handle) override;

    void set_state(RuntimeState state);

    std::unique_ptr<LibraryLoader> loader_;
    std::shared_ptr<HandleRegistry> handles_;

    std::mutex transition_mutex_;

    // Shared by native entry points in progress, exclusive during shutdown
    mutable std::shared_mutex call_gate_;

    mutable std::mutex state_mutex_;
    RuntimeState state_ = RuntimeState::Uninitialized;
    BindingPtr binding_;
};

} // namespace vcxbridge
