/**
 * @file connection.h
 * @brief Pairwise connection objects.
 *
 * Connection handles returned by create() and deserialize() are
 * registered with the runtime's handle registry; operations on a
 * released handle fail with HandleReleased before reaching the native
 * layer. Handles the registry has never seen (e.g. from another
 * process) are passed through and validated natively.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <vcxbridge/error.h>
#include <vcxbridge/future.h>
#include <vcxbridge/handle_registry.h>
#include <vcxbridge/runtime.h>

#include <cstdint>
#include <string>
#include <vector>

namespace vcxbridge::connection {

/**
 * @brief Native connection states reported by update_state/get_state.
 */
enum class ConnectionState : uint32_t {
    Undefined = 0,
    Initialized = 1,
    OfferSent = 2,
    RequestReceived = 3,
    Accepted = 4,
    Unfulfilled = 5,
    Expired = 6,
    Revoked = 7
};

[[nodiscard]] Result<Future<NativeHandle>> create(Runtime& runtime, const std::string& source_id);

[[nodiscard]] Result<Future<NativeHandle>> deserialize(Runtime& runtime,
                                                       const std::string& connection_json);

/**
 * @return Future resolving to the invite details JSON
 */
[[nodiscard]] Result<Future<std::string>> connect(Runtime& runtime,
                                                  NativeHandle handle,
                                                  const std::string& options_json);

[[nodiscard]] Result<Future<std::string>> serialize(Runtime& runtime, NativeHandle handle);

/**
 * @brief Poll the agency and return the new state.
 */
[[nodiscard]] Result<Future<uint32_t>> update_state(Runtime& runtime, NativeHandle handle);

[[nodiscard]] Result<Future<uint32_t>> get_state(Runtime& runtime, NativeHandle handle);

/**
 * @return Future resolving to the signature bytes
 */
[[nodiscard]] Result<Future<std::vector<uint8_t>>> sign_data(Runtime& runtime,
                                                             NativeHandle handle,
                                                             const std::vector<uint8_t>& data);

/**
 * @brief Release a connection. The native release is synchronous; the
 *        returned future is already resolved.
 */
[[nodiscard]] Result<Future<void>> release(Runtime& runtime, NativeHandle handle);

} // namespace vcxbridge::connection
