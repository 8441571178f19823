#include "blockship/events/event_bus.hpp"
#include "blockship/events/components.hpp"
#include "blockship/events/events.hpp"

#include <gtest/gtest.h>

using namespace blockship::events;

TEST(MetricsComponentTest, StartsAllCountersAtZero) {
    EventBus bus;
    MetricsComponent metrics(bus);

    const auto snapshot = metrics.snapshot();
    EXPECT_EQ(snapshot.size(), 4u);
    for (const auto& [name, value] : snapshot) {
        EXPECT_EQ(value, 0u) << name;
    }
}

TEST(MetricsComponentTest, TracksSyncAndUploadCounters) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(DirSyncStartedEvent{"/data"});
    bus.emit(DirSyncStartedEvent{"/data"});
    bus.emit(DirSyncFailedEvent{"/data", "scan failed"});
    bus.emit(BlockUploadStartedEvent{"a"});
    bus.emit(BlockUploadStartedEvent{"b"});
    bus.emit(BlockUploadFailedEvent{"b", "upload failed"});
    bus.emit(BlockUploadedEvent{"a"});

    EXPECT_EQ(metrics.counter(kDirSyncsTotal), 2u);
    EXPECT_EQ(metrics.counter(kDirSyncFailuresTotal), 1u);
    EXPECT_EQ(metrics.counter(kUploadsTotal), 2u);
    EXPECT_EQ(metrics.counter(kUploadFailuresTotal), 1u);
}

TEST(MetricsComponentTest, UnknownCounterReadsZero) {
    EventBus bus;
    MetricsComponent metrics(bus);

    EXPECT_EQ(metrics.counter("no_such_counter"), 0u);
    metrics.increment_counter("no_such_counter", 3);
    EXPECT_EQ(metrics.counter("no_such_counter"), 3u);
}
