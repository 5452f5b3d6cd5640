#include "rover_sim/notification_bus.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "rover_sim/logging.hpp"

namespace rover_sim {

void EventBus::notify(std::string_view event_name, const std::optional<RoverData>& payload) {
    std::scoped_lock lock(mutex_);
    queue_events_.push(RoverEvent{std::string{event_name}, payload});
}

Unsubscribe EventBus::subscribe(std::string_view event_name, EventHandler handler) {
    std::scoped_lock lock(mutex_);
    const std::uint64_t identifier = next_subscription_id_++;
    std::string str_event_name{event_name};
    map_subscriptions_[str_event_name].push_back(Subscription{identifier, std::move(handler)});
    return [this, str_event_name, identifier]() {
        remove_subscription(str_event_name, identifier);
    };
}

std::size_t EventBus::dispatch_pending() {
    std::queue<RoverEvent> queue_batch;
    {
        std::scoped_lock lock(mutex_);
        std::swap(queue_batch, queue_events_);
    }

    const std::size_t count_events = queue_batch.size();
    while (!queue_batch.empty()) {
        const RoverEvent event = std::move(queue_batch.front());
        queue_batch.pop();

        std::vector<Subscription> list_handlers;
        {
            std::scoped_lock lock(mutex_);
            const auto iterator_subscriptions = map_subscriptions_.find(event.name);
            if (iterator_subscriptions != map_subscriptions_.end()) {
                list_handlers = iterator_subscriptions->second;
            }
        }

        for (const Subscription& subscription : list_handlers) {
            try {
                subscription.handler(event);
            } catch (const std::exception& exc) {
                get_logger()->error("Subscriber for {} failed: {}", event.name, exc.what());
            }
        }
    }
    return count_events;
}

std::optional<RoverEvent> EventBus::try_consume() {
    std::scoped_lock lock(mutex_);
    if (queue_events_.empty()) {
        return std::nullopt;
    }
    RoverEvent event = queue_events_.front();
    queue_events_.pop();
    return event;
}

std::size_t EventBus::pending_count() const {
    std::scoped_lock lock(mutex_);
    return queue_events_.size();
}

void EventBus::remove_subscription(const std::string& event_name, std::uint64_t identifier) {
    std::scoped_lock lock(mutex_);
    const auto iterator_subscriptions = map_subscriptions_.find(event_name);
    if (iterator_subscriptions == map_subscriptions_.end()) {
        return;
    }
    auto& list_subscriptions = iterator_subscriptions->second;
    list_subscriptions.erase(
        std::remove_if(list_subscriptions.begin(), list_subscriptions.end(), [identifier](const Subscription& subscription) {
            return subscription.identifier == identifier;
        }),
        list_subscriptions.end()
    );
}

}  // namespace rover_sim
