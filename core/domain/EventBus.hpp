#pragma once

#include "../ports/IEventBus.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <queue>

namespace geotrack::domain {

class EventBus : public ports::IEventBus {
public:
    EventBus() = default;
    ~EventBus() override = default;

    void publish(const Event& event) override;
    ports::SubscriptionId subscribe(EventHandler handler) override;
    ports::SubscriptionId subscribe(EventType eventType, EventHandler handler) override;
    bool unsubscribe(ports::SubscriptionId id) override;
    std::size_t processEvents() override;

    std::size_t pendingCount() const;
    std::size_t subscriberCount() const;

private:
    struct Subscription {
        std::optional<EventType> filter;
        EventHandler handler;
    };

    std::map<ports::SubscriptionId, Subscription> handlers_;
    ports::SubscriptionId nextId_ = 1;
    mutable std::mutex handlersMutex_;

    std::queue<Event> eventQueue_;
    mutable std::mutex queueMutex_;

    std::mutex dispatchMutex_;
};

} // namespace geotrack::domain
