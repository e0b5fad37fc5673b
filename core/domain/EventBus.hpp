#pragma once

#include "../ports/IEventBus.hpp"
#include <unordered_map>
#include <vector>
#include <queue>
#include <mutex>

namespace farmfence::domain {

/**
 * @brief Queued, typed event channel
 *
 * publish() may be called from the sensor thread; handlers run on the thread
 * that calls processEvents(), in publish order. A std::exception from a
 * handler is logged and delivery continues; anything else propagates to the
 * caller, and the events still queued are dispatched by the next call.
 */
class EventBus : public ports::IEventBus {
public:
    EventBus() = default;
    ~EventBus() override = default;

    void publish(const StreamEvent& event) override;
    SubscriptionId subscribe(StreamEventType eventType, EventHandler handler) override;
    void unsubscribe(SubscriptionId id) override;
    void processEvents() override;

    size_t pendingCount() const;

private:
    struct Subscription {
        SubscriptionId id;
        EventHandler handler;
    };

    std::unordered_map<StreamEventType, std::vector<Subscription>> handlers_;
    std::queue<StreamEvent> eventQueue_;
    mutable std::mutex queueMutex_;
    SubscriptionId nextId_ = 1;
    bool processing_ = false;
};

} // namespace farmfence::domain
