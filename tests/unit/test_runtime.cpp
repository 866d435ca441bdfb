/**
 * @file test_runtime.cpp
 * @brief Unit tests for the Runtime state machine with an injected loader.
 */

#include <gtest/gtest.h>
#include <vcxbridge/runtime.h>

#include "in_process_binding.h"

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

using namespace vcxbridge;

// ─────────────────────────────────────────────────────────────────────────────
// In-process native functions
// ─────────────────────────────────────────────────────────────────────────────

namespace {

std::atomic<int> g_shutdown_calls{0};
std::atomic<int> g_last_delete_wallet{-1};
std::atomic<vcx_error_t> g_shutdown_status{0};

std::mutex g_released_mutex;
std::vector<NativeHandle> g_released_connections;

vcx_error_t fake_shutdown(vcx_bool_t delete_wallet) {
    g_shutdown_calls.fetch_add(1);
    g_last_delete_wallet.store(delete_wallet);
    return g_shutdown_status.load();
}

vcx_error_t fake_connection_release(vcx_handle_t handle) {
    std::lock_guard lock(g_released_mutex);
    for (NativeHandle released : g_released_connections) {
        if (released == handle) {
            return test::kInvalidConnectionHandle;
        }
    }
    g_released_connections.push_back(handle);
    return VCX_SUCCESS;
}

vcx_error_t fake_close_search(vcx_command_handle_t command_handle,
                              vcx_handle_t /*search_handle*/, vcx_cb_t cb) {
    cb(command_handle, VCX_SUCCESS);
    return VCX_SUCCESS;
}

/**
 * @brief Loader producing in-process bindings, or a scripted failure.
 */
class ScriptedLoader final : public LibraryLoader {
public:
    Result<BindingPtr> load(const std::string& path) override {
        loads.fetch_add(1);
        if (gate.valid()) {
            gate.wait();
        }
        if (fail_with != ErrorCode::Ok) {
            return make_error(fail_with, "cannot open " + path);
        }
        auto binding = test::make_binding(path);
        binding->api.vcx_shutdown = &fake_shutdown;
        binding->api.vcx_connection_release = &fake_connection_release;
        binding->api.vcx_wallet_close_search = &fake_close_search;
        return BindingPtr{binding};
    }

    std::atomic<int> loads{0};
    ErrorCode fail_with = ErrorCode::Ok;
    std::shared_future<void> gate;
};

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Test Fixtures
// ─────────────────────────────────────────────────────────────────────────────

class RuntimeTest : public ::testing::Test {
protected:
    void SetUp() override {
        g_shutdown_calls = 0;
        g_last_delete_wallet = -1;
        g_shutdown_status = VCX_SUCCESS;
        std::lock_guard lock(g_released_mutex);
        g_released_connections.clear();
    }

    ScriptedLoader* loader_ = new ScriptedLoader();
    Runtime runtime_{std::unique_ptr<LibraryLoader>(loader_)};
};

// ─────────────────────────────────────────────────────────────────────────────
// Initialization Tests
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(RuntimeTest, StartsUninitialized) {
    EXPECT_EQ(runtime_.state(), RuntimeState::Uninitialized);
    EXPECT_FALSE(runtime_.is_ready());
    EXPECT_TRUE(runtime_.library_path().empty());
}

TEST_F(RuntimeTest, EmptyPathIsInvalidConfiguration) {
    auto result = runtime_.initialize("");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidConfiguration);
    EXPECT_EQ(runtime_.state(), RuntimeState::Uninitialized);
    EXPECT_EQ(loader_->loads.load(), 0);
}

TEST_F(RuntimeTest, NullPathIsInvalidConfiguration) {
    auto result = runtime_.initialize(static_cast<const char*>(nullptr));

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidConfiguration);
    EXPECT_EQ(runtime_.state(), RuntimeState::Uninitialized);
}

TEST_F(RuntimeTest, LoadFailureLeavesRuntimeUninitialized) {
    loader_->fail_with = ErrorCode::InvalidConfiguration;

    auto result = runtime_.initialize("/nonexistent/libvcx.so");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidConfiguration);
    EXPECT_EQ(runtime_.state(), RuntimeState::Uninitialized);
}

TEST_F(RuntimeTest, LoaderErrorsAreReportedAsInvalidConfiguration) {
    loader_->fail_with = ErrorCode::Unknown;

    auto result = runtime_.initialize("libvcx.so");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidConfiguration);
    EXPECT_EQ(result.error().message(), "cannot open libvcx.so");
}

TEST_F(RuntimeTest, InitializeIsIdempotentForSamePath) {
    ASSERT_TRUE(runtime_.initialize("libvcx.so").has_value());
    ASSERT_TRUE(runtime_.initialize("libvcx.so").has_value());

    EXPECT_EQ(runtime_.state(), RuntimeState::Ready);
    EXPECT_EQ(runtime_.library_path(), "libvcx.so");
    EXPECT_EQ(loader_->loads.load(), 1);
}

TEST_F(RuntimeTest, InitializeWithDifferentPathWhileReadyIsInvalidState) {
    ASSERT_TRUE(runtime_.initialize("libvcx.so").has_value());

    auto result = runtime_.initialize("libother.so");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidState);
    EXPECT_EQ(runtime_.library_path(), "libvcx.so");
}

TEST_F(RuntimeTest, ConfigLogLevelIsApplied) {
    const auto saved = vcxbridge_get_log_level();

    RuntimeConfig config;
    config.library_path = "libvcx.so";
    config.log_level = LogLevel::Error;
    ASSERT_TRUE(runtime_.initialize(config).has_value());

    EXPECT_EQ(vcxbridge_get_log_level(), VCXBRIDGE_LOG_LEVEL_ERROR);
    vcxbridge_set_log_level(saved);
}

TEST_F(RuntimeTest, SamePathInitializeStillAppliesLogLevel) {
    const auto saved = vcxbridge_get_log_level();
    ASSERT_TRUE(runtime_.initialize("libvcx.so").has_value());

    RuntimeConfig config;
    config.library_path = "libvcx.so";
    config.log_level = LogLevel::Trace;
    ASSERT_TRUE(runtime_.initialize(config).has_value());

    EXPECT_EQ(vcxbridge_get_log_level(), VCXBRIDGE_LOG_LEVEL_TRACE);
    EXPECT_EQ(loader_->loads.load(), 1);
    vcxbridge_set_log_level(saved);
}

TEST_F(RuntimeTest, CallsDuringInitializationFailFast) {
    std::promise<void> open_gate;
    loader_->gate = open_gate.get_future().share();

    std::thread initializer([&] { EXPECT_TRUE(runtime_.initialize("libvcx.so").has_value()); });

    while (runtime_.state() != RuntimeState::Initializing) {
        std::this_thread::yield();
    }
    auto acquired = runtime_.acquire();
    ASSERT_FALSE(acquired.has_value());
    EXPECT_EQ(acquired.error().code(), ErrorCode::NotInitialized);

    open_gate.set_value();
    initializer.join();
    EXPECT_TRUE(runtime_.acquire().has_value());
}

// ─────────────────────────────────────────────────────────────────────────────
// Call Gating Tests
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(RuntimeTest, CallsBeforeInitializeAreNotInitialized) {
    bool invoked = false;
    auto call = runtime_.call<void>(
        "vcx_test_void",
        [&](const NativeApi&, vcx_command_handle_t, vcx_cb_t) {
            invoked = true;
            return VCX_SUCCESS;
        });

    ASSERT_FALSE(call.has_value());
    EXPECT_EQ(call.error().code(), ErrorCode::NotInitialized);
    EXPECT_FALSE(invoked);
}

TEST_F(RuntimeTest, CallReachesNativeWhenReady) {
    ASSERT_TRUE(runtime_.initialize("libvcx.so").has_value());

    auto call = runtime_.call<std::string>(
        "vcx_test_string",
        [](const NativeApi&, vcx_command_handle_t token, vcx_str_cb_t cb) {
            cb(token, VCX_SUCCESS, "ok");
            return VCX_SUCCESS;
        });

    ASSERT_TRUE(call.has_value());
    EXPECT_EQ(call->value(), "ok");
}

TEST_F(RuntimeTest, CallOnReleasedHandleFailsBeforeNative) {
    ASSERT_TRUE(runtime_.initialize("libvcx.so").has_value());
    ASSERT_TRUE(runtime_.handles().register_handle(HandleKind::Connection, 3).has_value());
    ASSERT_TRUE(runtime_.handles().release(3).has_value());

    bool invoked = false;
    auto call = runtime_.call_on<std::string>(
        HandleKind::Connection, 3, "vcx_connection_serialize",
        [&](const NativeApi&, vcx_command_handle_t, vcx_str_cb_t) {
            invoked = true;
            return VCX_SUCCESS;
        });

    ASSERT_FALSE(call.has_value());
    EXPECT_EQ(call.error().code(), ErrorCode::HandleReleased);
    EXPECT_FALSE(invoked);
}

TEST_F(RuntimeTest, SuccessfulCreateRegistersHandle) {
    ASSERT_TRUE(runtime_.initialize("libvcx.so").has_value());

    auto call = runtime_.call<uint32_t>(
        "vcx_connection_create",
        [](const NativeApi&, vcx_command_handle_t token, vcx_u32_cb_t cb) {
            cb(token, VCX_SUCCESS, 77);
            return VCX_SUCCESS;
        },
        runtime_.register_on_success(HandleKind::Connection));

    ASSERT_TRUE(call.has_value());
    EXPECT_EQ(call->value(), 77u);
    EXPECT_EQ(runtime_.handles().state(77), HandleState::Live);
    EXPECT_EQ(runtime_.handles().kind(77), HandleKind::Connection);
}

TEST_F(RuntimeTest, FailedCreateRegistersNothing) {
    ASSERT_TRUE(runtime_.initialize("libvcx.so").has_value());

    auto call = runtime_.call<uint32_t>(
        "vcx_connection_create",
        [](const NativeApi&, vcx_command_handle_t token, vcx_u32_cb_t cb) {
            cb(token, 1, 78);
            return VCX_SUCCESS;
        },
        runtime_.register_on_success(HandleKind::Connection));

    ASSERT_TRUE(call.has_value());
    EXPECT_FALSE(call->get().has_value());
    EXPECT_EQ(runtime_.handles().state(78), HandleState::Unknown);
}

// ─────────────────────────────────────────────────────────────────────────────
// Release Dispatch Tests
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(RuntimeTest, ConnectionReleaseIsSynchronous) {
    ASSERT_TRUE(runtime_.initialize("libvcx.so").has_value());
    ASSERT_TRUE(runtime_.handles().register_handle(HandleKind::Connection, 5).has_value());

    auto released = runtime_.handles().release(5);

    ASSERT_TRUE(released.has_value());
    EXPECT_TRUE(released->is_ready());
    EXPECT_TRUE(released->get().has_value());
    std::lock_guard lock(g_released_mutex);
    EXPECT_EQ(g_released_connections, std::vector<NativeHandle>{5});
}

TEST_F(RuntimeTest, SecondConnectionReleaseSurfacesNativeCode) {
    ASSERT_TRUE(runtime_.initialize("libvcx.so").has_value());
    ASSERT_TRUE(runtime_.handles().register_handle(HandleKind::Connection, 5).has_value());
    ASSERT_TRUE(runtime_.handles().register_handle(HandleKind::Connection, 6).has_value());
    ASSERT_TRUE(runtime_.handles().release(5)->get().has_value());

    auto again = runtime_.handles().release(5);
    ASSERT_TRUE(again.has_value());
    auto outcome = again->get();

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().native_code(), test::kInvalidConnectionHandle);
    EXPECT_EQ(outcome.error().native_function(), "vcx_connection_release");
    EXPECT_EQ(runtime_.handles().state(6), HandleState::Live);
}

TEST_F(RuntimeTest, WalletSearchReleaseGoesThroughBridge) {
    ASSERT_TRUE(runtime_.initialize("libvcx.so").has_value());
    ASSERT_TRUE(runtime_.handles().register_handle(HandleKind::WalletSearch, 9).has_value());

    auto released = runtime_.handles().release(9);

    ASSERT_TRUE(released.has_value());
    EXPECT_TRUE(released->get().has_value());
    EXPECT_EQ(runtime_.handles().state(9), HandleState::Released);
}

TEST_F(RuntimeTest, ReleaseBeforeInitializeIsNotInitialized) {
    auto released = runtime_.handles().release(HandleKind::Connection, 5);

    ASSERT_FALSE(released.has_value());
    EXPECT_EQ(released.error().code(), ErrorCode::NotInitialized);
}

// ─────────────────────────────────────────────────────────────────────────────
// Shutdown Tests
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(RuntimeTest, ShutdownForwardsDeleteWalletVerbatim) {
    ASSERT_TRUE(runtime_.initialize("libvcx.so").has_value());
    ASSERT_TRUE(runtime_.shutdown(true).has_value());
    EXPECT_EQ(g_last_delete_wallet.load(), 1);

    ASSERT_TRUE(runtime_.initialize("libvcx.so").has_value());
    ASSERT_TRUE(runtime_.shutdown(false).has_value());
    EXPECT_EQ(g_last_delete_wallet.load(), 0);
    EXPECT_EQ(g_shutdown_calls.load(), 2);
}

TEST_F(RuntimeTest, CallsAfterShutdownAreNotInitialized) {
    ASSERT_TRUE(runtime_.initialize("libvcx.so").has_value());
    ASSERT_TRUE(runtime_.shutdown(false).has_value());

    EXPECT_EQ(runtime_.state(), RuntimeState::Uninitialized);
    auto acquired = runtime_.acquire();
    ASSERT_FALSE(acquired.has_value());
    EXPECT_EQ(acquired.error().code(), ErrorCode::NotInitialized);
}

TEST_F(RuntimeTest, ShutdownWhenNotReadyIsNotInitialized) {
    auto result = runtime_.shutdown(false);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::NotInitialized);
    EXPECT_EQ(g_shutdown_calls.load(), 0);
}

TEST_F(RuntimeTest, ShutdownFailureIsReportedAfterTransition) {
    ASSERT_TRUE(runtime_.initialize("libvcx.so").has_value());
    g_shutdown_status = 1;

    auto result = runtime_.shutdown(false);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().native_code(), 1u);
    EXPECT_EQ(result.error().native_function(), "vcx_shutdown");
    EXPECT_EQ(runtime_.state(), RuntimeState::Uninitialized);
}

TEST_F(RuntimeTest, ShutdownClearsHandleRegistry) {
    ASSERT_TRUE(runtime_.initialize("libvcx.so").has_value());
    ASSERT_TRUE(runtime_.handles().register_handle(HandleKind::Connection, 5).has_value());

    ASSERT_TRUE(runtime_.shutdown(false).has_value());

    EXPECT_EQ(runtime_.handles().live_count(), 0u);
    EXPECT_EQ(runtime_.handles().state(5), HandleState::Unknown);
}

TEST_F(RuntimeTest, ReinitializeAfterShutdown) {
    ASSERT_TRUE(runtime_.initialize("libvcx.so").has_value());
    ASSERT_TRUE(runtime_.shutdown(false).has_value());

    ASSERT_TRUE(runtime_.initialize("libother.so").has_value());

    EXPECT_EQ(runtime_.state(), RuntimeState::Ready);
    EXPECT_EQ(runtime_.library_path(), "libother.so");
    EXPECT_EQ(loader_->loads.load(), 2);
}

TEST_F(RuntimeTest, ShutdownWaitsForNativeEntryInProgress) {
    ASSERT_TRUE(runtime_.initialize("libvcx.so").has_value());

    std::thread shutdown_thread;
    int shutdowns_seen_by_native = -1;
    ErrorCode concurrent_acquire = ErrorCode::Ok;

    auto call = runtime_.call<void>(
        "vcx_test_void",
        [&](const NativeApi&, vcx_command_handle_t token, vcx_cb_t cb) {
            shutdown_thread = std::thread([&] {
                EXPECT_TRUE(runtime_.shutdown(false).has_value());
            });
            while (runtime_.state() != RuntimeState::ShuttingDown) {
                std::this_thread::yield();
            }

            // Other callers are turned away without blocking.
            concurrent_acquire = std::async(std::launch::async, [&] {
                auto acquired = runtime_.acquire();
                return acquired ? ErrorCode::Ok : acquired.error().code();
            }).get();

            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            shutdowns_seen_by_native = g_shutdown_calls.load();
            cb(token, VCX_SUCCESS);
            return VCX_SUCCESS;
        });
    shutdown_thread.join();

    ASSERT_TRUE(call.has_value());
    EXPECT_TRUE(call->get().has_value());
    EXPECT_EQ(shutdowns_seen_by_native, 0);
    EXPECT_EQ(concurrent_acquire, ErrorCode::NotInitialized);
    EXPECT_EQ(g_shutdown_calls.load(), 1);
    EXPECT_EQ(runtime_.state(), RuntimeState::Uninitialized);
}

TEST_F(RuntimeTest, ShutdownWaitsForSynchronousRelease) {
    ASSERT_TRUE(runtime_.initialize("libvcx.so").has_value());

    std::optional<BindingLease> lease;
    {
        auto acquired = runtime_.acquire();
        ASSERT_TRUE(acquired.has_value());
        lease.emplace(std::move(acquired).value());
    }

    std::atomic<bool> shutdown_done{false};
    std::thread shutdown_thread([&] {
        EXPECT_TRUE(runtime_.shutdown(false).has_value());
        shutdown_done = true;
    });
    while (runtime_.state() != RuntimeState::ShuttingDown) {
        std::this_thread::yield();
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    EXPECT_FALSE(shutdown_done.load());
    EXPECT_EQ(g_shutdown_calls.load(), 0);
    EXPECT_EQ(lease->api().vcx_connection_release(11), VCX_SUCCESS);

    lease.reset();
    shutdown_thread.join();

    EXPECT_TRUE(shutdown_done.load());
    EXPECT_EQ(g_shutdown_calls.load(), 1);
}

TEST_F(RuntimeTest, PendingCallOutlivesShutdown) {
    ASSERT_TRUE(runtime_.initialize("libvcx.so").has_value());

    vcx_command_handle_t token = 0;
    vcx_str_cb_t callback = nullptr;
    auto call = runtime_.call<std::string>(
        "vcx_test_string",
        [&](const NativeApi&, vcx_command_handle_t t, vcx_str_cb_t cb) {
            token = t;
            callback = cb;
            return VCX_SUCCESS;
        });
    ASSERT_TRUE(call.has_value());

    ASSERT_TRUE(runtime_.shutdown(false).has_value());
    callback(token, 1, nullptr);

    auto result = call->get();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().message(), "Unknown error");
}

TEST(RuntimeStateTest, ToString) {
    EXPECT_STREQ(to_string(RuntimeState::Uninitialized), "Uninitialized");
    EXPECT_STREQ(to_string(RuntimeState::Initializing), "Initializing");
    EXPECT_STREQ(to_string(RuntimeState::Ready), "Ready");
    EXPECT_STREQ(to_string(RuntimeState::ShuttingDown), "ShuttingDown");
}
