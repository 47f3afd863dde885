#include "fieldsync/sync/connectivity_monitor.hpp"

#include <gtest/gtest.h>

#include <vector>

using fieldsync::ConnectionKind;
using fieldsync::events::ConnectivityChangedEvent;
using fieldsync::events::EventBus;
using fieldsync::sync::ConnectivityMonitor;
using fieldsync::sync::PlatformSignal;

namespace {

PlatformSignal online(ConnectionKind kind) {
    return PlatformSignal{true, true, kind};
}

PlatformSignal offline() {
    return PlatformSignal{false, false, ConnectionKind::None};
}

} // namespace

TEST(ConnectivityMonitorTest, UnknownUntilFirstSignal) {
    EventBus bus;
    ConnectivityMonitor monitor(bus);

    EXPECT_FALSE(monitor.observed());
    EXPECT_FALSE(monitor.reachable());
    EXPECT_EQ(monitor.state().kind, ConnectionKind::Unknown);
}

TEST(ConnectivityMonitorTest, PublishesTransitionsOnly) {
    EventBus bus;
    ConnectivityMonitor monitor(bus);
    std::vector<ConnectivityChangedEvent> seen;
    auto sub = monitor.subscribe([&](const ConnectivityChangedEvent& e) { seen.push_back(e); });

    EXPECT_TRUE(monitor.on_platform_signal(online(ConnectionKind::Wifi)));
    EXPECT_FALSE(monitor.on_platform_signal(online(ConnectionKind::Wifi)));
    EXPECT_TRUE(monitor.on_platform_signal(online(ConnectionKind::Cellular)));
    EXPECT_TRUE(monitor.on_platform_signal(offline()));
    EXPECT_FALSE(monitor.on_platform_signal(offline()));

    ASSERT_EQ(seen.size(), 3u);
    EXPECT_TRUE(seen[0].came_online());
    EXPECT_EQ(seen[0].current.kind, ConnectionKind::Wifi);
    EXPECT_FALSE(seen[1].came_online());
    EXPECT_EQ(seen[1].previous.kind, ConnectionKind::Wifi);
    EXPECT_EQ(seen[1].current.kind, ConnectionKind::Cellular);
    EXPECT_FALSE(seen[2].current.reachable);
    EXPECT_EQ(seen[2].current.kind, ConnectionKind::None);
}

TEST(ConnectivityMonitorTest, ConnectedWithoutInternetIsUnreachable) {
    EventBus bus;
    ConnectivityMonitor monitor(bus);

    monitor.on_platform_signal(PlatformSignal{true, false, ConnectionKind::Wifi});

    EXPECT_TRUE(monitor.observed());
    EXPECT_FALSE(monitor.reachable());
    EXPECT_EQ(monitor.state().kind, ConnectionKind::Wifi);

    monitor.on_platform_signal(online(ConnectionKind::Wifi));
    EXPECT_TRUE(monitor.reachable());
}

TEST(ConnectivityMonitorTest, FirstOfflineSignalIsPublished) {
    EventBus bus;
    ConnectivityMonitor monitor(bus);
    int events = 0;
    auto sub = monitor.subscribe([&](const ConnectivityChangedEvent& e) {
        events++;
        EXPECT_FALSE(e.came_online());
    });

    EXPECT_TRUE(monitor.on_platform_signal(offline()));
    EXPECT_EQ(events, 1);
}
