#include "applink/core/callback_channel.hpp"

namespace applink {
namespace core {

bool CallbackChannel::post(ListenerEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (event_) {
            return false;
        }
        event_ = std::move(event);
    }
    cv_.notify_all();
    return true;
}

bool CallbackChannel::resolved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return event_.has_value();
}

std::optional<ListenerEvent> CallbackChannel::waitUntil(std::chrono::steady_clock::time_point deadline) const {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_until(lock, deadline, [this] { return event_.has_value(); })) {
        return std::nullopt;
    }
    return event_;
}

} // namespace core
} // namespace applink
