/**
 * @file handle_registry.h
 * @brief Liveness bookkeeping for native object handles.
 *
 * Native handles are opaque integers minted by the native layer. The
 * registry records which of them this process has seen created and
 * which it has released, so that:
 * - operations on a locally released handle fail fast (assert_live)
 *   instead of reaching the native layer;
 * - release dispatches to the release entry point of the handle's kind;
 * - releasing twice never disturbs the bookkeeping of other handles.
 *
 * The registry is advisory. Handles it has never seen pass assert_live
 * and are validated by the native layer itself.
 *
 * Entries are keyed by (kind, id): each kind has its own native
 * allocator, so the same number may name a connection and a search at
 * once. The id-only overloads resolve the kind from what is recorded
 * and refuse ids that are ambiguous.
 *
 * Retention: released entries are kept as tombstones so that later
 * operations on them fail fast. Only the most recent released_retention
 * tombstones are kept; older ones are forgotten and fall back to native
 * validation. clear() drops everything.
 */

#pragma once

#include <vcxbridge/error.h>
#include <vcxbridge/future.h>
#include <vcxbridge/vcx_abi.h>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace vcxbridge {

using NativeHandle = vcx_handle_t;

// ─────────────────────────────────────────────────────────────────────────────
// Handle Types
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Kind tag; selects the native release entry point.
 */
enum class HandleKind : uint8_t {
    Invalid = 0,
    Connection,     ///< vcx_connection_release (synchronous)
    WalletSearch,   ///< vcx_wallet_close_search (asynchronous)
    Credential,     ///< vcx_credential_release (synchronous)
    Proof           ///< vcx_proof_release (synchronous)
};

[[nodiscard]] constexpr const char* to_string(HandleKind kind) noexcept {
    switch (kind) {
        case HandleKind::Invalid:      return "Invalid";
        case HandleKind::Connection:   return "Connection";
        case HandleKind::WalletSearch: return "WalletSearch";
        case HandleKind::Credential:   return "Credential";
        case HandleKind::Proof:        return "Proof";
    }
    return "Unknown";
}

enum class HandleState : uint8_t {
    Unknown = 0,    ///< Never registered
    Live,
    Released
};

[[nodiscard]] constexpr const char* to_string(HandleState state) noexcept {
    switch (state) {
        case HandleState::Unknown:  return "Unknown";
        case HandleState::Live:     return "Live";
        case HandleState::Released: return "Released";
    }
    return "Unknown";
}

/**
 * @brief Registry key; ids are only unique within one kind.
 */
struct HandleKey {
    HandleKind kind = HandleKind::Invalid;
    NativeHandle handle = 0;

    bool operator==(const HandleKey&) const = default;
};

struct HandleKeyHash {
    size_t operator()(const HandleKey& key) const noexcept {
        return std::hash<uint64_t>{}((static_cast<uint64_t>(key.kind) << 32) | key.handle);
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Release Seam
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Issues the native release call for one handle.
 *
 * Implemented by Runtime; tests substitute their own.
 */
class HandleReleaser {
public:
    virtual ~HandleReleaser() = default;

    /**
     * @return Synchronous failure (e.g. NotInitialized), or a future holding
     *         the native outcome of the release
     */
    [[nodiscard]] virtual Result<Future<void>> release_native(HandleKind kind,
                                                              NativeHandle handle) = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// Handle Registry
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Thread-safe handle registry.
 *
 * Example:
 * @code
 *   HandleRegistry registry(releaser);
 *   registry.register_handle(HandleKind::Connection, 7);
 *
 *   if (auto live = registry.assert_live(HandleKind::Connection, 7); !live) {
 *       return Err(live.error());           // HandleReleased
 *   }
 *
 *   auto released = registry.release(HandleKind::Connection, 7);
 * @endcode
 */
class HandleRegistry {
public:
    static constexpr size_t kDefaultReleasedRetention = 1024;

    explicit HandleRegistry(HandleReleaser& releaser,
                            size_t released_retention = kDefaultReleasedRetention)
        : releaser_(releaser)
        , released_retention_(released_retention) {}

    // Non-copyable, non-movable (contains mutex)
    HandleRegistry(const HandleRegistry&) = delete;
    HandleRegistry& operator=(const HandleRegistry&) = delete;
    HandleRegistry(HandleRegistry&&) = delete;
    HandleRegistry& operator=(HandleRegistry&&) = delete;

    /**
     * @brief Record a handle returned by a successful create.
     *
     * @return InvalidArgument for kind Invalid or handle 0,
     *         InvalidState if the same (kind, handle) is already live
     */
    Result<void> register_handle(HandleKind kind, NativeHandle handle);

    /**
     * @brief Release a registered handle, resolving its kind.
     *
     * The local state becomes Released before the native call is issued,
     * whatever the native outcome. Releasing again re-issues the native
     * call; its failure is reported for that release only.
     *
     * @return InvalidArgument if the handle was never registered, or if it
     *         is recorded under more than one kind
     */
    [[nodiscard]] Result<Future<void>> release(NativeHandle handle);

    /**
     * @brief Release a handle of a known kind, registered or not.
     *
     * Entries of the same id under other kinds are untouched.
     */
    [[nodiscard]] Result<Future<void>> release(HandleKind kind, NativeHandle handle);

    /**
     * @brief Fail fast on a handle known to be released.
     *
     * @return HandleReleased for released handles; Ok for live and unknown ones
     */
    [[nodiscard]] Result<void> assert_live(HandleKind kind, NativeHandle handle) const;

    /**
     * @brief As above, for any kind: fails only when every entry recorded
     *        for the id is released.
     */
    [[nodiscard]] Result<void> assert_live(NativeHandle handle) const;

    [[nodiscard]] HandleState state(HandleKind kind, NativeHandle handle) const;

    /**
     * @brief Live if any kind holds the id live, else Released if any
     *        tombstone remains, else Unknown.
     */
    [[nodiscard]] HandleState state(NativeHandle handle) const;

    /**
     * @brief Kind of the id when unambiguous (the single live entry, or
     *        the single entry of any state); nullopt otherwise.
     */
    [[nodiscard]] std::optional<HandleKind> kind(NativeHandle handle) const;

    [[nodiscard]] size_t live_count() const;

    /**
     * @brief Number of tombstones currently retained.
     */
    [[nodiscard]] size_t released_count() const;

    /**
     * @brief Forget every handle (native global teardown released them).
     */
    void clear();

private:
    struct Entry {
        HandleState state = HandleState::Unknown;
        uint64_t release_seq = 0;   ///< Matches the retention queue record
    };

    using EntryMap = std::unordered_map<HandleKey, Entry, HandleKeyHash>;

    Result<Future<void>> release_key(const HandleKey& key);

    /// Caller holds mutex_. Marks a Live or new entry Released.
    void mark_released(const HandleKey& key, Entry& entry);

    /// Caller holds mutex_. Forgets the oldest tombstones beyond retention.
    void trim_released();

    mutable std::mutex mutex_;
    EntryMap entries_;
    std::deque<std::pair<HandleKey, uint64_t>> released_order_;
    uint64_t next_release_seq_ = 1;
    size_t live_count_ = 0;
    size_t released_count_ = 0;
    HandleReleaser& releaser_;
    size_t released_retention_;
};

} // namespace vcxbridge
