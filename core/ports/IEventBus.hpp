#pragma once

#include "../StreamEvent.hpp"
#include <cstddef>
#include <functional>

namespace farmfence::ports {

class IEventBus {
public:
    virtual ~IEventBus() = default;
    
    using EventHandler = std::function<void(const StreamEvent&)>;
    using SubscriptionId = std::size_t;
    
    virtual void publish(const StreamEvent& event) = 0;
    virtual SubscriptionId subscribe(StreamEventType eventType, EventHandler handler) = 0;
    virtual void unsubscribe(SubscriptionId id) = 0;
    virtual void processEvents() = 0;
};

} // namespace farmfence::ports
