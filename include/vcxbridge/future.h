/**
 * @file future.h
 * @brief Awaitable outcome of a bridged native call.
 *
 * A Future<T> is fulfilled exactly once, from the thread that delivered
 * the native completion callback (or from the submitting thread when
 * the native layer rejected the call). Fulfilment publishes the decoded
 * payload to the waiting thread.
 *
 * Abandoning a Future (letting it go out of scope, or giving up after
 * wait_for) does not cancel the native call: the pending entry stays
 * registered and absorbs the callback when it arrives.
 *
 * Example:
 * @code
 *   auto call = wallet::get_record(runtime, "contact", "alice");
 *   if (!call) { return call.error(); }
 *   Result<std::string> record = call->get();
 * @endcode
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <vcxbridge/error.h>
#include <vcxbridge/exceptions.h>

#include <chrono>
#include <future>
#include <type_traits>
#include <utility>

namespace vcxbridge {

template<typename T>
class Future {
public:
    Future() = default;

    explicit Future(std::future<Result<T>> inner)
        : inner_(std::move(inner)) {}

    /**
     * @brief Create an already-resolved future.
     */
    [[nodiscard]] static Future ready(Result<T> result) {
        std::promise<Result<T>> promise;
        promise.set_value(std::move(result));
        return Future(promise.get_future());
    }

    /**
     * @brief Block until resolved and take the outcome.
     * @pre valid()
     *
     * Single use: the future is invalid afterwards.
     */
    [[nodiscard]] Result<T> get() {
        return inner_.get();
    }

    /**
     * @brief Block until resolved; return the value or throw.
     * @throws NativeCallException carrying the Error
     */
    T value() {
        Result<T> result = get();
        if (!result) {
            throw NativeCallException(std::move(result).error());
        }
        if constexpr (!std::is_void_v<T>) {
            return std::move(result).value();
        }
    }

    /**
     * @brief Wait up to a timeout.
     * @return true if resolved; false if still pending
     */
    template<typename Rep, typename Period>
    [[nodiscard]] bool wait_for(const std::chrono::duration<Rep, Period>& timeout) const {
        return inner_.wait_for(timeout) == std::future_status::ready;
    }

    [[nodiscard]] bool is_ready() const {
        return wait_for(std::chrono::seconds(0));
    }

    [[nodiscard]] bool valid() const noexcept { return inner_.valid(); }

private:
    std::future<Result<T>> inner_;
};

} // namespace vcxbridge
