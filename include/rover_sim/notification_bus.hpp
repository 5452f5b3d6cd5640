// === Notification Bus ========================================================
//
// Publish/subscribe surface the registry uses to announce rover lifecycle and
// state changes to UI and render collaborators. `NotificationBus` is the
// abstract contract; `EventBus` is a thread-safe queued implementation whose
// deliveries happen when the host calls `dispatch_pending()`.

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "rover_sim/rover_data.hpp"

namespace rover_sim {

inline constexpr std::string_view k_event_rover_added{"roverAdded"};
inline constexpr std::string_view k_event_rover_updated{"roverUpdated"};
inline constexpr std::string_view k_event_rover_selected{"roverSelected"};

/** @brief Wrapper representing a single rover notification. */
struct RoverEvent final {
    std::string name{};                /**< Event name, e.g. roverUpdated. */
    std::optional<RoverData> rover{};  /**< Snapshot; empty for a deselection. */
};

using EventHandler = std::function<void(const RoverEvent&)>;
using Unsubscribe = std::function<void()>;

/**
 * @brief Abstract publish/subscribe channel.
 *
 * Publishers must not assume delivery happens before notify() returns.
 */
class NotificationBus {
  public:
    virtual ~NotificationBus() = default;

    virtual void notify(std::string_view event_name, const std::optional<RoverData>& payload) = 0;
    /** @brief Register @p handler for @p event_name; the returned callable removes it. */
    [[nodiscard]] virtual Unsubscribe subscribe(std::string_view event_name, EventHandler handler) = 0;
};

/**
 * @brief Thread-safe FIFO of rover events with per-name subscribers.
 *
 * Unsubscribe callables reference the bus and must not outlive it.
 */
class EventBus final : public NotificationBus {
  public:
    void notify(std::string_view event_name, const std::optional<RoverData>& payload) override;
    [[nodiscard]] Unsubscribe subscribe(std::string_view event_name, EventHandler handler) override;

    /**
     * @brief Deliver every queued event to its subscribers.
     *
     * Events published by handlers during delivery are queued for the next
     * call. A handler that throws is logged and skipped.
     *
     * @return Number of events dequeued.
     */
    std::size_t dispatch_pending();
    /** @brief Attempt to consume a pending event without delivering it. */
    [[nodiscard]] std::optional<RoverEvent> try_consume();
    [[nodiscard]] std::size_t pending_count() const;

  private:
    struct Subscription final {
        std::uint64_t identifier{};
        EventHandler handler{};
    };

    void remove_subscription(const std::string& event_name, std::uint64_t identifier);

    mutable std::mutex mutex_;
    std::queue<RoverEvent> queue_events_;
    std::unordered_map<std::string, std::vector<Subscription>> map_subscriptions_;
    std::uint64_t next_subscription_id_{1};
};

}  // namespace rover_sim
