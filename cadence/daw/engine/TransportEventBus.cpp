#include "TransportEventBus.hpp"

#include <algorithm>

namespace cadence {

struct Subscription::Registry {
    std::vector<std::pair<int, TransportEventBus::Callback>> entries;
    int nextId = 1;

    const TransportEventBus::Callback* find(int id) const {
        for (const auto& entry : entries) {
            if (entry.first == id)
                return &entry.second;
        }
        return nullptr;
    }
};

// ===== Subscription =====

Subscription::Subscription(std::weak_ptr<Registry> registry, int id)
    : registry_(std::move(registry)), id_(id) {}

Subscription::~Subscription() {
    unsubscribe();
}

Subscription::Subscription(Subscription&& other) noexcept
    : registry_(std::move(other.registry_)), id_(other.id_) {
    other.registry_.reset();
    other.id_ = 0;
}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        unsubscribe();
        registry_ = std::move(other.registry_);
        id_ = other.id_;
        other.registry_.reset();
        other.id_ = 0;
    }
    return *this;
}

void Subscription::unsubscribe() {
    if (auto registry = registry_.lock()) {
        auto& entries = registry->entries;
        int id = id_;
        entries.erase(std::remove_if(entries.begin(), entries.end(),
                                     [id](const auto& entry) { return entry.first == id; }),
                      entries.end());
    }
    registry_.reset();
    id_ = 0;
}

bool Subscription::isActive() const {
    auto registry = registry_.lock();
    return registry != nullptr && registry->find(id_) != nullptr;
}

// ===== TransportEventBus =====

TransportEventBus::TransportEventBus() : registry_(std::make_shared<Subscription::Registry>()) {}

Subscription TransportEventBus::subscribe(Callback callback) {
    if (!callback)
        return {};

    int id = registry_->nextId++;
    registry_->entries.emplace_back(id, std::move(callback));
    return Subscription(registry_, id);
}

void TransportEventBus::publish(const TransportEvent& event) const {
    // Snapshot the ids: callbacks may subscribe or unsubscribe while we deliver
    std::vector<int> ids;
    ids.reserve(registry_->entries.size());
    for (const auto& entry : registry_->entries)
        ids.push_back(entry.first);

    for (int id : ids) {
        // Copy so an unsubscribe from inside the callback cannot destroy it mid-call
        const auto* callback = registry_->find(id);
        if (callback == nullptr)
            continue;
        auto callbackCopy = *callback;
        deliver(callbackCopy, event);
    }
}

void TransportEventBus::publishTo(const Subscription& subscription,
                                  const TransportEvent& event) const {
    auto registry = subscription.registry_.lock();
    if (registry != registry_)
        return;

    const auto* callback = registry_->find(subscription.id_);
    if (callback == nullptr)
        return;

    auto callbackCopy = *callback;
    deliver(callbackCopy, event);
}

void TransportEventBus::clear() {
    registry_->entries.clear();
}

size_t TransportEventBus::getNumSubscribers() const {
    return registry_->entries.size();
}

void TransportEventBus::deliver(const Callback& callback, const TransportEvent& event) {
    try {
        callback(event);
    } catch (const std::exception& e) {
        juce::Logger::writeToLog(juce::String("TransportEventBus: subscriber threw on ") +
                                 toString(event.type) + ": " + e.what());
    } catch (...) {
        juce::Logger::writeToLog(juce::String("TransportEventBus: subscriber threw unknown "
                                              "exception on ") +
                                 toString(event.type));
    }
}

}  // namespace cadence
