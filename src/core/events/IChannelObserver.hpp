#pragma once

namespace termroute {

/**
 * @brief Contract for receiving events pushed through a BroadcastChannel.
 * * @details
 * **Pattern:** Observer / Listener.
 * **Thread Safety:** These methods are called directly from the publishing
 * thread, after the publisher has released its own lock. Implementations must
 * be fast and non-blocking (e.g., posting to another executor or updating
 * atomic counters). Calling back into the publisher is allowed.
 */
template <class Event>
struct IChannelObserver {
    virtual ~IChannelObserver() = default;

    // Called once per published event
    virtual void OnEvent(const Event& event) = 0;

    // Called exactly once when the channel is closed
    virtual void OnChannelClosed() {}
};

}  // namespace termroute
