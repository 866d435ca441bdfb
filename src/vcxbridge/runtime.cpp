/**
 * @file runtime.cpp
 * @brief Runtime lifecycle and handle release dispatch.
 *
 * @copyright GPL-2.0-or-later
 */

#include "vcxbridge/runtime.h"
#include "vcxbridge/logging.h"
#include "vcxbridge/shared_library.h"
#include "gsl.hpp"

namespace vcxbridge {

// ═══════════════════════════════════════════════════════════════════════════════
// SharedLibraryLoader
// ═══════════════════════════════════════════════════════════════════════════════

Result<BindingPtr> SharedLibraryLoader::load(const std::string& path) {
    auto library = SharedLibrary::open(path);
    if (!library) {
        return Err(std::move(library).error());
    }

    auto api = NativeApi::resolve(*library);
    if (!api) {
        return Err(std::move(api).error());
    }

    auto binding = std::make_shared<NativeBinding>();
    binding->path = path;
    binding->library = std::move(library).value();
    binding->api = *api;
    return BindingPtr{std::move(binding)};
}

// ═══════════════════════════════════════════════════════════════════════════════
// Runtime
// ═══════════════════════════════════════════════════════════════════════════════

Runtime::Runtime()
    : Runtime(std::make_unique<SharedLibraryLoader>())
{}

Runtime::Runtime(std::unique_ptr<LibraryLoader> loader)
    : loader_(std::move(loader))
    , handles_(std::make_shared<HandleRegistry>(static_cast<HandleReleaser&>(*this)))
{
    gsl_Expects(loader_ != nullptr);
}

Runtime::~Runtime() {
    std::lock_guard lock(state_mutex_);
    if (state_ == RuntimeState::Ready) {
        VCXBRIDGE_LOG_WARN("RUNTIME", "%s dropped without shutdown; native state is kept",
                           binding_ ? binding_->path.c_str() : "");
    }
}

Result<void> Runtime::initialize(const RuntimeConfig& config) {
    if (auto valid = config.validate(); !valid) {
        VCXBRIDGE_LOG_ERROR("RUNTIME", "initialize: %s", valid.error().message().c_str());
        return valid;
    }

    std::lock_guard transition(transition_mutex_);

    {
        std::lock_guard lock(state_mutex_);
        if (state_ == RuntimeState::Ready) {
            if (binding_ && binding_->path == config.library_path) {
                vcxbridge_set_log_level(static_cast<vcxbridge_log_level>(config.log_level));
                VCXBRIDGE_LOG_DEBUG("RUNTIME", "already initialized with %s",
                                    config.library_path.c_str());
                return Ok();
            }
            return make_error(ErrorCode::InvalidState,
                              "already initialized with " +
                              (binding_ ? binding_->path : std::string{}) +
                              "; shut down before loading " + config.library_path);
        }
        state_ = RuntimeState::Initializing;
    }

    vcxbridge_set_log_level(static_cast<vcxbridge_log_level>(config.log_level));

    auto loaded = loader_->load(config.library_path);
    if (!loaded) {
        set_state(RuntimeState::Uninitialized);
        Error error = std::move(loaded).error();
        if (!error.is(ErrorCode::InvalidConfiguration)) {
            error = Error{ErrorCode::InvalidConfiguration, error.message()};
        }
        VCXBRIDGE_LOG_ERROR("RUNTIME", "initialize: %s", error.message().c_str());
        return Err(std::move(error));
    }

    {
        std::lock_guard lock(state_mutex_);
        binding_ = std::move(loaded).value();
        state_ = RuntimeState::Ready;
    }

    VCXBRIDGE_LOG_INFO("RUNTIME", "loaded %s", config.library_path.c_str());
    return Ok();
}

Result<void> Runtime::initialize(const char* library_path) {
    return initialize(RuntimeConfig::from_path(library_path));
}

Result<void> Runtime::shutdown(bool delete_wallet) {
    std::lock_guard transition(transition_mutex_);

    BindingPtr binding;
    {
        std::lock_guard lock(state_mutex_);
        if (state_ != RuntimeState::Ready) {
            return make_error(ErrorCode::NotInitialized,
                              std::string("shutdown while ") + to_string(state_));
        }
        state_ = RuntimeState::ShuttingDown;
        binding = binding_;
    }

    // New leases are refused from here on; wait out the ones in flight.
    std::unique_lock gate(call_gate_);

    const vcx_error_t status = binding->api.vcx_shutdown(delete_wallet ? 1 : 0);
    handles_->clear();

    {
        std::lock_guard lock(state_mutex_);
        binding_.reset();
        state_ = RuntimeState::Uninitialized;
    }
    gate.unlock();

    if (status != VCX_SUCCESS) {
        Error error = translate_failure(status, ErrorCode::SubmissionFailure,
                                        "vcx_shutdown", &binding->api);
        VCXBRIDGE_LOG_ERROR("RUNTIME", "%s", error.format().c_str());
        return Err(std::move(error));
    }

    VCXBRIDGE_LOG_INFO("RUNTIME", "shut down %s (delete_wallet=%d)",
                       binding->path.c_str(), delete_wallet ? 1 : 0);
    return Ok();
}

RuntimeState Runtime::state() const {
    std::lock_guard lock(state_mutex_);
    return state_;
}

std::string Runtime::library_path() const {
    std::lock_guard lock(state_mutex_);
    return (state_ == RuntimeState::Ready && binding_) ? binding_->path : std::string{};
}

Result<BindingLease> Runtime::acquire() const {
    std::shared_lock gate(call_gate_, std::try_to_lock);
    if (!gate.owns_lock()) {
        return make_error(ErrorCode::NotInitialized, "native library is shutting down");
    }

    std::lock_guard lock(state_mutex_);
    if (state_ != RuntimeState::Ready || !binding_) {
        return make_error(ErrorCode::NotInitialized,
                          std::string("native library is ") + to_string(state_));
    }
    return BindingLease{std::move(gate), binding_};
}

CompletionHook<uint32_t> Runtime::register_on_success(HandleKind kind) {
    std::weak_ptr<HandleRegistry> registry = handles_;
    return [registry, kind](Result<uint32_t>& result) {
        if (!result) {
            return;
        }
        if (auto handles = registry.lock()) {
            if (auto registered = handles->register_handle(kind, *result); !registered) {
                VCXBRIDGE_LOG_WARN("HANDLES", "%s", registered.error().message().c_str());
            }
        }
    };
}

Result<Future<void>> Runtime::release_native(HandleKind kind, NativeHandle handle) {
    auto acquired = acquire();
    if (!acquired) {
        return Err(std::move(acquired).error());
    }
    const BindingPtr& binding = acquired->binding();

    auto release_sync = [&](auto release_fn, const char* native_function) {
        const vcx_error_t status = release_fn(handle);
        if (status != VCX_SUCCESS) {
            return Future<void>::ready(Err(translate_failure(
                status, ErrorCode::SubmissionFailure, native_function, &binding->api)));
        }
        return Future<void>::ready(Ok());
    };

    switch (kind) {
        case HandleKind::Connection:
            return release_sync(binding->api.vcx_connection_release, "vcx_connection_release");
        case HandleKind::Credential:
            return release_sync(binding->api.vcx_credential_release, "vcx_credential_release");
        case HandleKind::Proof:
            return release_sync(binding->api.vcx_proof_release, "vcx_proof_release");
        case HandleKind::WalletSearch:
            return CallbackBridge::instance().submit<void>(
                binding, "vcx_wallet_close_search",
                [&](vcx_command_handle_t token, vcx_cb_t cb) {
                    return binding->api.vcx_wallet_close_search(token, handle, cb);
                });
        case HandleKind::Invalid:
            break;
    }
    return make_error(ErrorCode::InvalidArgument,
                      std::string("no release entry point for kind ") + to_string(kind));
}

void Runtime::set_state(RuntimeState state) {
    std::lock_guard lock(state_mutex_);
    state_ = state;
}

} // namespace vcxbridge
