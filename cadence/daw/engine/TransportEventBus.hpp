#pragma once

#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include "TransportState.hpp"

namespace cadence {

/**
 * @brief Handle for one subscriber registration
 *
 * Unsubscribes when destroyed (or on unsubscribe()). Safe to outlive the
 * bus it came from. Move-only; one handle per registration.
 */
class Subscription {
  public:
    Subscription() = default;
    ~Subscription();

    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    void unsubscribe();
    bool isActive() const;

  private:
    friend class TransportEventBus;

    struct Registry;
    Subscription(std::weak_ptr<Registry> registry, int id);

    std::weak_ptr<Registry> registry_;
    int id_ = 0;
};

/**
 * @brief Synchronous fan-out of transport events
 *
 * Delivery is in subscription order, on the publishing thread, without
 * queueing. A subscriber that throws is logged and skipped; the remaining
 * subscribers still receive the event. Subscribing or unsubscribing from
 * inside a callback is allowed.
 */
class TransportEventBus {
  public:
    using Callback = std::function<void(const TransportEvent&)>;

    TransportEventBus();
    ~TransportEventBus() = default;

    Subscription subscribe(Callback callback);
    void publish(const TransportEvent& event) const;

    /** Deliver to one subscriber only (used to replay state to a newcomer) */
    void publishTo(const Subscription& subscription, const TransportEvent& event) const;

    void clear();
    size_t getNumSubscribers() const;

  private:
    std::shared_ptr<Subscription::Registry> registry_;

    static void deliver(const Callback& callback, const TransportEvent& event);

    JUCE_DECLARE_NON_COPYABLE(TransportEventBus)
};

}  // namespace cadence
