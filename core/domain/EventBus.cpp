#include "EventBus.hpp"
#include "../Log.hpp"
#include <exception>
#include <vector>

namespace geotrack::domain {

void EventBus::publish(const Event& event) {
    std::lock_guard<std::mutex> lock(queueMutex_);
    eventQueue_.push(event);
}

ports::SubscriptionId EventBus::subscribe(EventHandler handler) {
    std::lock_guard<std::mutex> lock(handlersMutex_);
    auto id = nextId_++;
    handlers_.emplace(id, Subscription{std::nullopt, std::move(handler)});
    return id;
}

ports::SubscriptionId EventBus::subscribe(EventType eventType, EventHandler handler) {
    std::lock_guard<std::mutex> lock(handlersMutex_);
    auto id = nextId_++;
    handlers_.emplace(id, Subscription{eventType, std::move(handler)});
    return id;
}

bool EventBus::unsubscribe(ports::SubscriptionId id) {
    std::lock_guard<std::mutex> lock(handlersMutex_);
    return handlers_.erase(id) > 0;
}

std::size_t EventBus::processEvents() {
    // A handler that calls processEvents() again must not re-enter dispatch.
    std::unique_lock<std::mutex> dispatchLock(dispatchMutex_, std::try_to_lock);
    if (!dispatchLock.owns_lock()) return 0;

    std::size_t delivered = 0;
    while (true) {
        Event event;
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (eventQueue_.empty()) break;

            event = std::move(eventQueue_.front());
            eventQueue_.pop();
        }

        // Snapshot so handlers may subscribe or unsubscribe while being called.
        std::vector<EventHandler> targets;
        {
            std::lock_guard<std::mutex> lock(handlersMutex_);
            for (const auto& [id, subscription] : handlers_) {
                if (!subscription.filter || *subscription.filter == event.eventType) {
                    targets.push_back(subscription.handler);
                }
            }
        }

        for (const auto& handler : targets) {
            try {
                handler(event);
            } catch (const std::exception& e) {
                Log::get("EventBus")->error("handler for {} threw: {}",
                                            eventTypeToString(event.eventType), e.what());
            }
        }
        ++delivered;
    }

    return delivered;
}

std::size_t EventBus::pendingCount() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return eventQueue_.size();
}

std::size_t EventBus::subscriberCount() const {
    std::lock_guard<std::mutex> lock(handlersMutex_);
    return handlers_.size();
}

} // namespace geotrack::domain
