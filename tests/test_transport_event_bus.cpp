#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <vector>

#include "cadence/daw/engine/TransportEventBus.hpp"

using cadence::Subscription;
using cadence::TransportEvent;
using cadence::TransportEventBus;

namespace {

TransportEvent makeEvent(const std::string& reason) {
    TransportEvent event;
    event.type = TransportEvent::Type::StateChange;
    event.reason = reason;
    return event;
}

}  // namespace

TEST_CASE("TransportEventBus delivers in subscription order", "[transport_event_bus]") {
    TransportEventBus bus;
    std::vector<int> order;

    auto first = bus.subscribe([&order](const TransportEvent&) { order.push_back(1); });
    auto second = bus.subscribe([&order](const TransportEvent&) { order.push_back(2); });

    bus.publish(makeEvent("play"));
    REQUIRE(order == std::vector<int>{1, 2});
    REQUIRE(bus.getNumSubscribers() == 2);
}

TEST_CASE("TransportEventBus isolates a throwing subscriber", "[transport_event_bus]") {
    TransportEventBus bus;
    int delivered = 0;

    auto faulty = bus.subscribe(
        [](const TransportEvent&) { throw std::runtime_error("subscriber failure"); });
    auto healthy = bus.subscribe([&delivered](const TransportEvent&) { ++delivered; });

    REQUIRE_NOTHROW(bus.publish(makeEvent("stop")));
    REQUIRE(delivered == 1);
}

TEST_CASE("TransportEventBus isolates a subscriber throwing a non-exception value",
          "[transport_event_bus]") {
    TransportEventBus bus;
    int delivered = 0;

    auto faulty = bus.subscribe([](const TransportEvent&) { throw 42; });
    auto healthy = bus.subscribe([&delivered](const TransportEvent&) { ++delivered; });

    REQUIRE_NOTHROW(bus.publish(makeEvent("play")));
    REQUIRE(delivered == 1);
}

TEST_CASE("Subscription handles unsubscribe", "[transport_event_bus]") {
    TransportEventBus bus;
    int delivered = 0;

    SECTION("On destruction") {
        {
            auto subscription = bus.subscribe([&delivered](const TransportEvent&) { ++delivered; });
            REQUIRE(subscription.isActive());
        }
        bus.publish(makeEvent("play"));
        REQUIRE(delivered == 0);
        REQUIRE(bus.getNumSubscribers() == 0);
    }

    SECTION("Explicitly, twice") {
        auto subscription = bus.subscribe([&delivered](const TransportEvent&) { ++delivered; });
        subscription.unsubscribe();
        subscription.unsubscribe();
        REQUIRE_FALSE(subscription.isActive());
        bus.publish(makeEvent("play"));
        REQUIRE(delivered == 0);
    }

    SECTION("Moved handles keep the registration") {
        auto original = bus.subscribe([&delivered](const TransportEvent&) { ++delivered; });
        Subscription moved = std::move(original);
        REQUIRE(moved.isActive());
        bus.publish(makeEvent("play"));
        REQUIRE(delivered == 1);
    }
}

TEST_CASE("Subscribers may unsubscribe while an event is delivered", "[transport_event_bus]") {
    TransportEventBus bus;
    int laterCalls = 0;
    Subscription later;

    auto first = bus.subscribe([&later](const TransportEvent&) { later.unsubscribe(); });
    later = bus.subscribe([&laterCalls](const TransportEvent&) { ++laterCalls; });

    bus.publish(makeEvent("play"));
    REQUIRE(laterCalls == 0);
    REQUIRE(bus.getNumSubscribers() == 1);
}

TEST_CASE("publishTo reaches a single subscriber", "[transport_event_bus]") {
    TransportEventBus bus;
    int a = 0;
    int b = 0;

    auto first = bus.subscribe([&a](const TransportEvent&) { ++a; });
    auto second = bus.subscribe([&b](const TransportEvent&) { ++b; });

    bus.publishTo(second, makeEvent("subscription"));
    REQUIRE(a == 0);
    REQUIRE(b == 1);

    TransportEventBus otherBus;
    otherBus.publishTo(second, makeEvent("subscription"));
    REQUIRE(b == 1);
}

TEST_CASE("A handle may outlive its bus", "[transport_event_bus]") {
    Subscription subscription;
    {
        TransportEventBus bus;
        subscription = bus.subscribe([](const TransportEvent&) {});
        REQUIRE(subscription.isActive());
    }
    REQUIRE_FALSE(subscription.isActive());
    subscription.unsubscribe();
}

TEST_CASE("An empty callback is not registered", "[transport_event_bus]") {
    TransportEventBus bus;
    auto subscription = bus.subscribe(TransportEventBus::Callback());
    REQUIRE_FALSE(subscription.isActive());
    REQUIRE(bus.getNumSubscribers() == 0);
}
