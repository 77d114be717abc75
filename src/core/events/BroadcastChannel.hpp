#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include <boost/lockfree/spsc_queue.hpp>
#include <spdlog/spdlog.h>

#include "IChannelObserver.hpp"

namespace termroute {

template <class Event>
class BroadcastChannel;

/**
 * @brief Consumer end of a BroadcastChannel.
 * Each subscription owns a bounded SPSC ring: the channel is the only producer,
 * the holder of the subscription is the only consumer.
 * Dropping the last shared_ptr unsubscribes.
 */
template <class Event>
class Subscription {
   public:
    explicit Subscription(std::size_t capacity) : queue_(capacity) {}

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    std::optional<Event> try_pop() {
        Event event;
        if (queue_.pop(event)) {
            return event;
        }
        return std::nullopt;
    }

    // Pops everything currently queued
    std::vector<Event> drain() {
        std::vector<Event> out;
        queue_.consume_all([&out](const Event& e) { out.push_back(e); });
        return out;
    }

    bool closed() const noexcept { return closed_.load(std::memory_order_acquire); }

    // Events lost because this subscriber's queue was full
    std::size_t dropped() const noexcept { return dropped_.load(std::memory_order_relaxed); }

   private:
    friend class BroadcastChannel<Event>;

    bool offer(const Event& event) {
        if (!queue_.push(event)) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        return true;
    }

    void mark_closed() noexcept { closed_.store(true, std::memory_order_release); }

    boost::lockfree::spsc_queue<Event> queue_;
    std::atomic<bool> closed_{false};
    std::atomic<std::size_t> dropped_{0};
};

/**
 * @brief Best-effort single-producer / multi-consumer broadcast.
 *
 * @details
 *  - publish() never blocks: a full subscriber queue drops the event for that
 *    subscriber only; a closed channel drops everything.
 *  - close() is terminal and idempotent. No event is delivered after it.
 *  - Observers are held weakly and invoked on the publishing thread outside
 *    the channel lock.
 */
template <class Event>
class BroadcastChannel {
   public:
    using ObserverPtr = std::shared_ptr<IChannelObserver<Event>>;

    explicit BroadcastChannel(std::size_t default_capacity = 256)
        : default_capacity_(default_capacity == 0 ? 1 : default_capacity) {}

    ~BroadcastChannel() { close(); }

    BroadcastChannel(const BroadcastChannel&) = delete;
    BroadcastChannel& operator=(const BroadcastChannel&) = delete;

    /**
     * @brief Creates a new bounded subscription.
     * @param capacity Queue size; 0 selects the channel default.
     * @return The subscription. On a closed channel it is returned already closed.
     */
    std::shared_ptr<Subscription<Event>> subscribe(std::size_t capacity = 0) {
        auto sub = std::make_shared<Subscription<Event>>(capacity == 0 ? default_capacity_
                                                                       : capacity);
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            sub->mark_closed();
            return sub;
        }
        subscriptions_.push_back(sub);
        return sub;
    }

    void attach_observer(const ObserverPtr& observer) {
        if (!observer) return;
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        observers_.push_back(observer);
    }

    /**
     * @brief Delivers the event to every live subscriber and observer.
     * @return false if the channel is closed and the event was discarded.
     */
    bool publish(const Event& event) {
        std::vector<ObserverPtr> observers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }

            for (auto it = subscriptions_.begin(); it != subscriptions_.end();) {
                if (auto sub = it->lock()) {
                    if (!sub->offer(event)) {
                        spdlog::debug("BroadcastChannel: subscriber queue full, event dropped");
                    }
                    ++it;
                } else {
                    it = subscriptions_.erase(it);
                }
            }

            observers = live_observers();
        }

        for (const auto& observer : observers) {
            observer->OnEvent(event);
        }
        return true;
    }

    void close() {
        std::vector<ObserverPtr> observers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return;
            closed_ = true;

            for (auto& weak : subscriptions_) {
                if (auto sub = weak.lock()) sub->mark_closed();
            }
            subscriptions_.clear();

            observers = live_observers();
            observers_.clear();
        }

        for (const auto& observer : observers) {
            observer->OnChannelClosed();
        }
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::size_t subscriber_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t n = 0;
        for (const auto& weak : subscriptions_) {
            if (!weak.expired()) ++n;
        }
        return n;
    }

   private:
    // Requires mutex_ held. Prunes expired observers.
    std::vector<ObserverPtr> live_observers() {
        std::vector<ObserverPtr> out;
        for (auto it = observers_.begin(); it != observers_.end();) {
            if (auto obs = it->lock()) {
                out.push_back(std::move(obs));
                ++it;
            } else {
                it = observers_.erase(it);
            }
        }
        return out;
    }

    mutable std::mutex mutex_;
    std::size_t default_capacity_;
    bool closed_ = false;

    std::vector<std::weak_ptr<Subscription<Event>>> subscriptions_;
    std::vector<std::weak_ptr<IChannelObserver<Event>>> observers_;
};

}  // namespace termroute
