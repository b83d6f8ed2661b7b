#pragma once

#include "applink/core/flow_types.hpp"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <variant>

namespace applink {
namespace core {

// Either the classified callback or a listener-side failure.
using ListenerEvent = std::variant<CallbackOutcome, FlowError>;

/**
 * @brief Single-assignment slot shared between the callback listener and the
 * flow orchestrator.
 *
 * The first posted event wins; later posts are rejected without blocking the
 * poster. Waiters observe the same event once it is set.
 */
class CallbackChannel {
public:
    CallbackChannel() = default;

    CallbackChannel(const CallbackChannel&) = delete;
    CallbackChannel& operator=(const CallbackChannel&) = delete;

    /**
     * @brief Store @p event if nothing has been stored yet.
     *
     * @return true if this call set the event
     */
    bool post(ListenerEvent event);

    bool resolved() const;

    /**
     * @brief Block until an event is available or @p deadline passes.
     *
     * @return The event, or nullopt on timeout
     */
    std::optional<ListenerEvent> waitUntil(std::chrono::steady_clock::time_point deadline) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::optional<ListenerEvent> event_;
};

} // namespace core
} // namespace applink
