#pragma once

#include "../Event.hpp"
#include <cstdint>
#include <functional>

namespace geotrack::ports {

using SubscriptionId = std::uint64_t;

class IEventBus {
public:
    virtual ~IEventBus() = default;

    using EventHandler = std::function<void(const Event&)>;

    virtual void publish(const Event& event) = 0;

    // Handlers registered without an event type receive every event.
    virtual SubscriptionId subscribe(EventHandler handler) = 0;
    virtual SubscriptionId subscribe(EventType eventType, EventHandler handler) = 0;
    virtual bool unsubscribe(SubscriptionId id) = 0;

    // Dispatches queued events on the calling thread; returns the number delivered.
    virtual std::size_t processEvents() = 0;
};

} // namespace geotrack::ports
