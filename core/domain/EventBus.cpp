#include "EventBus.hpp"
#include <algorithm>
#include <exception>
#include <iostream>

namespace farmfence::domain {

namespace {

// Clears the processing flag even when a handler throws something that is not a std::exception
class ProcessingScope {
public:
    explicit ProcessingScope(bool& flag) : flag_(flag) { flag_ = true; }
    ~ProcessingScope() { flag_ = false; }

    ProcessingScope(const ProcessingScope&) = delete;
    ProcessingScope& operator=(const ProcessingScope&) = delete;

private:
    bool& flag_;
};

} // anonymous namespace

void EventBus::publish(const StreamEvent& event) {
    std::lock_guard<std::mutex> lock(queueMutex_);
    eventQueue_.push(event);
}

ports::IEventBus::SubscriptionId EventBus::subscribe(StreamEventType eventType, EventHandler handler) {
    SubscriptionId id = nextId_++;
    handlers_[eventType].push_back({id, std::move(handler)});
    return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
    for (auto& [type, subscriptions] : handlers_) {
        subscriptions.erase(
            std::remove_if(subscriptions.begin(), subscriptions.end(),
                           [id](const Subscription& s) { return s.id == id; }),
            subscriptions.end());
    }
}

size_t EventBus::pendingCount() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return eventQueue_.size();
}

void EventBus::processEvents() {
    if (processing_) return; // Prevent recursive processing
    
    ProcessingScope scope(processing_);
    
    while (true) {
        StreamEvent event;
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (eventQueue_.empty()) break;
            
            event = std::move(eventQueue_.front());
            eventQueue_.pop();
        }
        
        auto it = handlers_.find(eventTypeOf(event));
        if (it == handlers_.end()) continue;

        // Copy so a handler may unsubscribe itself
        auto subscriptions = it->second;
        for (const auto& subscription : subscriptions) {
            try {
                subscription.handler(event);
            } catch (const std::exception& e) {
                std::cerr << "[EventBus] Handler for " << eventTypeToString(eventTypeOf(event))
                          << " failed: " << e.what() << std::endl;
            }
        }
    }
}

} // namespace farmfence::domain
