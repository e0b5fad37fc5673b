#include <gtest/gtest.h>
#include "../core/domain/EventBus.hpp"
#include <stdexcept>
#include <vector>

using namespace farmfence;

class EventBusTest : public ::testing::Test {
protected:
    void SetUp() override {
        eventBus_ = std::make_shared<domain::EventBus>();
    }

    static PositionEvent positionAt(double lat, double lon) {
        PositionEvent event;
        event.position.latitude = lat;
        event.position.longitude = lon;
        return event;
    }

    std::shared_ptr<domain::EventBus> eventBus_;
};

TEST_F(EventBusTest, DeliversByTypeInPublishOrder) {
    std::vector<double> latitudes;
    int permissionCount = 0;

    eventBus_->subscribe(StreamEventType::Position, [&](const StreamEvent& event) {
        latitudes.push_back(std::get<PositionEvent>(event).position.latitude);
    });
    eventBus_->subscribe(StreamEventType::PermissionChanged, [&](const StreamEvent&) {
        permissionCount++;
    });

    eventBus_->publish(positionAt(10.1, 106.0));
    eventBus_->publish(PermissionChangedEvent{PermissionState::Granted});
    eventBus_->publish(positionAt(10.2, 106.0));

    // Nothing is dispatched until processEvents()
    EXPECT_TRUE(latitudes.empty());
    EXPECT_EQ(eventBus_->pendingCount(), 3u);

    eventBus_->processEvents();

    ASSERT_EQ(latitudes.size(), 2u);
    EXPECT_DOUBLE_EQ(latitudes[0], 10.1);
    EXPECT_DOUBLE_EQ(latitudes[1], 10.2);
    EXPECT_EQ(permissionCount, 1);
    EXPECT_EQ(eventBus_->pendingCount(), 0u);
}

TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
    int count = 0;
    auto id = eventBus_->subscribe(StreamEventType::TrackingError, [&](const StreamEvent&) {
        count++;
    });

    eventBus_->publish(TrackingErrorEvent{ErrorKind::Timeout, "timeout"});
    eventBus_->processEvents();
    EXPECT_EQ(count, 1);

    eventBus_->unsubscribe(id);
    eventBus_->publish(TrackingErrorEvent{ErrorKind::Timeout, "timeout"});
    eventBus_->processEvents();
    EXPECT_EQ(count, 1);
}

TEST_F(EventBusTest, FailingHandlerDoesNotBlockOthers) {
    int delivered = 0;
    eventBus_->subscribe(StreamEventType::Geofence, [](const StreamEvent&) {
        throw std::runtime_error("consumer failure");
    });
    eventBus_->subscribe(StreamEventType::Geofence, [&](const StreamEvent&) {
        delivered++;
    });

    eventBus_->publish(GeofenceEvent{});
    EXPECT_NO_THROW(eventBus_->processEvents());
    EXPECT_EQ(delivered, 1);
}

TEST_F(EventBusTest, NonStandardThrowDoesNotWedgeBus) {
    auto id = eventBus_->subscribe(StreamEventType::Position, [](const StreamEvent&) {
        throw 42;
    });
    int delivered = 0;
    eventBus_->subscribe(StreamEventType::Geofence, [&](const StreamEvent&) {
        delivered++;
    });

    eventBus_->publish(positionAt(10.1, 106.0));
    eventBus_->publish(GeofenceEvent{});
    EXPECT_THROW(eventBus_->processEvents(), int);
    EXPECT_EQ(eventBus_->pendingCount(), 1u);

    eventBus_->unsubscribe(id);
    eventBus_->processEvents();
    EXPECT_EQ(delivered, 1);
    EXPECT_EQ(eventBus_->pendingCount(), 0u);
}

TEST_F(EventBusTest, HandlerMayUnsubscribeItself) {
    int count = 0;
    ports::IEventBus::SubscriptionId id = 0;
    id = eventBus_->subscribe(StreamEventType::Position, [&](const StreamEvent&) {
        count++;
        eventBus_->unsubscribe(id);
    });

    eventBus_->publish(positionAt(10.1, 106.0));
    eventBus_->publish(positionAt(10.2, 106.0));
    eventBus_->processEvents();

    EXPECT_EQ(count, 1);
}

TEST_F(EventBusTest, EventsPublishedByHandlersAreDispatched) {
    std::vector<StreamEventType> seen;
    eventBus_->subscribe(StreamEventType::Position, [&](const StreamEvent& event) {
        seen.push_back(eventTypeOf(event));
        eventBus_->publish(GeofenceEvent{});
    });
    eventBus_->subscribe(StreamEventType::Geofence, [&](const StreamEvent& event) {
        seen.push_back(eventTypeOf(event));
    });

    eventBus_->publish(positionAt(10.1, 106.0));
    eventBus_->processEvents();

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], StreamEventType::Position);
    EXPECT_EQ(seen[1], StreamEventType::Geofence);
}

TEST(StreamEventTest, TypeNames) {
    EXPECT_EQ(eventTypeOf(StreamEvent{TrackingErrorEvent{}}), StreamEventType::TrackingError);
    EXPECT_EQ(eventTypeToString(StreamEventType::PermissionChanged), "permission_changed");
    EXPECT_EQ(geofenceTransitionToString(GeofenceTransition::Exit), "exit");
}
