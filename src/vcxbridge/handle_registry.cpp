/**
 * @file handle_registry.cpp
 * @brief HandleRegistry implementation.
 *
 * @copyright GPL-2.0-or-later
 */

#include "vcxbridge/handle_registry.h"
#include "vcxbridge/logging.h"

#include <string>
#include <vector>

namespace vcxbridge {

namespace {

constexpr HandleKind kRegistrableKinds[] = {
    HandleKind::Connection,
    HandleKind::WalletSearch,
    HandleKind::Credential,
    HandleKind::Proof
};

// Entries recorded for handle under every kind.
template<typename Map>
auto find_all(Map& entries, NativeHandle handle) {
    std::vector<decltype(entries.begin())> found;
    for (HandleKind kind : kRegistrableKinds) {
        if (auto it = entries.find(HandleKey{kind, handle}); it != entries.end()) {
            found.push_back(it);
        }
    }
    return found;
}

// The single live entry, or the single entry of any state.
template<typename It>
std::optional<HandleKey> unambiguous(const std::vector<It>& found) {
    std::optional<HandleKey> live;
    for (const auto& it : found) {
        if (it->second.state == HandleState::Live) {
            if (live) {
                return std::nullopt;
            }
            live = it->first;
        }
    }
    if (live) {
        return live;
    }
    if (found.size() == 1) {
        return found.front()->first;
    }
    return std::nullopt;
}

std::string describe(const HandleKey& key) {
    return std::string(to_string(key.kind)) + " handle " + std::to_string(key.handle);
}

} // namespace

Result<void> HandleRegistry::register_handle(HandleKind kind, NativeHandle handle) {
    VCXBRIDGE_CHECK(kind != HandleKind::Invalid, ErrorCode::InvalidArgument,
                    "cannot register a handle of kind Invalid");
    VCXBRIDGE_CHECK(handle != 0, ErrorCode::InvalidArgument,
                    "native handle 0 is never valid");

    const HandleKey key{kind, handle};
    std::lock_guard lock(mutex_);
    auto [it, inserted] = entries_.try_emplace(key, Entry{HandleState::Live, 0});
    if (!inserted) {
        if (it->second.state == HandleState::Live) {
            return make_error(ErrorCode::InvalidState, describe(key) + " is already live");
        }
        // The native layer reused a released id.
        it->second = Entry{HandleState::Live, 0};
        --released_count_;
    }
    ++live_count_;

    VCXBRIDGE_LOG_DEBUG("HANDLES", "registered %s handle %u", to_string(kind), handle);
    return Ok();
}

Result<Future<void>> HandleRegistry::release(NativeHandle handle) {
    std::optional<HandleKey> key;
    {
        std::lock_guard lock(mutex_);
        auto found = find_all(entries_, handle);
        if (found.empty()) {
            return make_error(ErrorCode::InvalidArgument,
                              "handle " + std::to_string(handle) + " was never registered");
        }
        key = unambiguous(found);
        if (!key) {
            return make_error(ErrorCode::InvalidArgument,
                              "handle " + std::to_string(handle) +
                              " is recorded under several kinds; release it by kind");
        }
    }
    return release_key(*key);
}

Result<Future<void>> HandleRegistry::release(HandleKind kind, NativeHandle handle) {
    VCXBRIDGE_CHECK(kind != HandleKind::Invalid, ErrorCode::InvalidArgument,
                    "cannot release a handle of kind Invalid");
    return release_key(HandleKey{kind, handle});
}

Result<Future<void>> HandleRegistry::release_key(const HandleKey& key) {
    {
        std::lock_guard lock(mutex_);
        auto it = entries_.try_emplace(key).first;
        if (it->second.state == HandleState::Released) {
            VCXBRIDGE_LOG_DEBUG("HANDLES", "%s released again", describe(key).c_str());
        } else {
            mark_released(key, it->second);
        }
    }
    return releaser_.release_native(key.kind, key.handle);
}

void HandleRegistry::mark_released(const HandleKey& key, Entry& entry) {
    if (entry.state == HandleState::Live) {
        --live_count_;
    }
    entry.state = HandleState::Released;
    entry.release_seq = next_release_seq_++;
    released_order_.emplace_back(key, entry.release_seq);
    ++released_count_;
    trim_released();
}

void HandleRegistry::trim_released() {
    while (released_order_.size() > released_retention_) {
        const auto [key, seq] = released_order_.front();
        released_order_.pop_front();

        // Records of ids registered again since are stale; skip them.
        auto it = entries_.find(key);
        if (it != entries_.end() && it->second.state == HandleState::Released &&
            it->second.release_seq == seq) {
            entries_.erase(it);
            --released_count_;
        }
    }
}

Result<void> HandleRegistry::assert_live(HandleKind kind, NativeHandle handle) const {
    const HandleKey key{kind, handle};
    std::lock_guard lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end() && it->second.state == HandleState::Released) {
        return make_error(ErrorCode::HandleReleased, describe(key) + " has been released");
    }
    return Ok();
}

Result<void> HandleRegistry::assert_live(NativeHandle handle) const {
    std::lock_guard lock(mutex_);
    auto found = find_all(entries_, handle);
    if (found.empty()) {
        return Ok();
    }
    for (const auto& it : found) {
        if (it->second.state == HandleState::Live) {
            return Ok();
        }
    }
    return make_error(ErrorCode::HandleReleased,
                      describe(found.front()->first) + " has been released");
}

HandleState HandleRegistry::state(HandleKind kind, NativeHandle handle) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(HandleKey{kind, handle});
    return it != entries_.end() ? it->second.state : HandleState::Unknown;
}

HandleState HandleRegistry::state(NativeHandle handle) const {
    std::lock_guard lock(mutex_);
    HandleState result = HandleState::Unknown;
    for (const auto& it : find_all(entries_, handle)) {
        if (it->second.state == HandleState::Live) {
            return HandleState::Live;
        }
        result = it->second.state;
    }
    return result;
}

std::optional<HandleKind> HandleRegistry::kind(NativeHandle handle) const {
    std::lock_guard lock(mutex_);
    if (auto key = unambiguous(find_all(entries_, handle))) {
        return key->kind;
    }
    return std::nullopt;
}

size_t HandleRegistry::live_count() const {
    std::lock_guard lock(mutex_);
    return live_count_;
}

size_t HandleRegistry::released_count() const {
    std::lock_guard lock(mutex_);
    return released_count_;
}

void HandleRegistry::clear() {
    std::lock_guard lock(mutex_);
    entries_.clear();
    released_order_.clear();
    live_count_ = 0;
    released_count_ = 0;
}

} // namespace vcxbridge
