#include "fieldsync/sync/auto_sync_scheduler.hpp"

#include "support/fake_transport.hpp"
#include "support/recording_sink.hpp"
#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

using fieldsync::ConnectionKind;
using fieldsync::RetryConfig;
using fieldsync::SyncSettings;
using fieldsync::SyncSettingsPatch;
using fieldsync::SyncTrigger;
using fieldsync::events::EventBus;
using fieldsync::events::SyncStartedEvent;
using fieldsync::sync::AutoSyncScheduler;
using fieldsync::sync::ConnectivityMonitor;
using fieldsync::sync::PlatformSignal;
using fieldsync::sync::RetryPolicy;
using fieldsync::sync::SyncEngine;
using fieldsync::sync::SyncQueue;
using fieldsync::testing::FakeTransport;
using fieldsync::testing::RecordingSink;
using fieldsync::testing::TempDir;
using std::chrono::milliseconds;

namespace {

SyncSettings settings_with(bool auto_sync, std::int64_t interval_ms) {
    SyncSettings settings;
    settings.auto_sync = auto_sync;
    settings.sync_interval_ms = interval_ms;
    return settings;
}

} // namespace

class AutoSyncSchedulerTest : public ::testing::Test {
protected:
    void init(SyncSettings defaults) {
        settings = std::make_unique<fieldsync::storage::SettingsStore>(dir.path(), defaults);
        engine = std::make_unique<SyncEngine>(store, queue, *settings, monitor, transport, sink, bus,
                                              RetryPolicy(RetryConfig{}, 3));
        started_sub = bus.subscribe<SyncStartedEvent>([this](const SyncStartedEvent& e) {
            std::lock_guard lock(mutex);
            triggers.push_back(e.trigger);
            cv.notify_all();
        });
    }

    bool wait_for_cycles(std::size_t count, milliseconds timeout = milliseconds(2000)) {
        std::unique_lock lock(mutex);
        return cv.wait_for(lock, timeout, [&]() { return triggers.size() >= count; });
    }

    std::vector<SyncTrigger> seen_triggers() {
        std::lock_guard lock(mutex);
        return triggers;
    }

    void go_online() { monitor.on_platform_signal(PlatformSignal{true, true, ConnectionKind::Wifi}); }
    void go_offline() { monitor.on_platform_signal(PlatformSignal{false, false, ConnectionKind::None}); }

    TempDir dir;
    EventBus bus;
    fieldsync::storage::LocalStore store{dir.path()};
    SyncQueue queue{dir.path()};
    ConnectivityMonitor monitor{bus};
    FakeTransport transport;
    RecordingSink sink;
    std::unique_ptr<fieldsync::storage::SettingsStore> settings;
    std::unique_ptr<SyncEngine> engine;

    std::mutex mutex;
    std::condition_variable cv;
    std::vector<SyncTrigger> triggers;
    fieldsync::events::Subscription started_sub;
};

TEST_F(AutoSyncSchedulerTest, ComingOnlineTriggersDebouncedSync) {
    init(settings_with(true, 3600000));
    AutoSyncScheduler scheduler(*engine, bus, milliseconds(20));
    scheduler.start();

    go_online();

    ASSERT_TRUE(wait_for_cycles(1));
    scheduler.stop();
    EXPECT_EQ(seen_triggers().front(), SyncTrigger::Connectivity);
}

TEST_F(AutoSyncSchedulerTest, FlappingConnectionSyncsOnce) {
    init(settings_with(true, 3600000));
    AutoSyncScheduler scheduler(*engine, bus, milliseconds(150));
    scheduler.start();

    go_online();
    go_offline();
    go_online();
    go_offline();
    go_online();

    ASSERT_TRUE(wait_for_cycles(1));
    std::this_thread::sleep_for(milliseconds(300));
    scheduler.stop();

    EXPECT_EQ(seen_triggers().size(), 1u);
    EXPECT_EQ(scheduler.requests_issued(), 1u);
}

TEST_F(AutoSyncSchedulerTest, GoingOfflineCancelsPendingDebounce) {
    init(settings_with(true, 3600000));
    AutoSyncScheduler scheduler(*engine, bus, milliseconds(100));
    scheduler.start();

    go_online();
    go_offline();
    std::this_thread::sleep_for(milliseconds(250));
    scheduler.stop();

    EXPECT_EQ(scheduler.requests_issued(), 0u);
}

TEST_F(AutoSyncSchedulerTest, IntervalTimerRequestsSync) {
    init(settings_with(true, 30));
    go_online();
    AutoSyncScheduler scheduler(*engine, bus, milliseconds(10000));
    scheduler.start();

    ASSERT_TRUE(wait_for_cycles(1));
    scheduler.stop();
    EXPECT_EQ(seen_triggers().front(), SyncTrigger::Timer);
    EXPECT_GE(scheduler.requests_issued(), 1u);
}

TEST_F(AutoSyncSchedulerTest, AutoSyncOffSchedulesNothing) {
    init(settings_with(false, 20));
    AutoSyncScheduler scheduler(*engine, bus, milliseconds(10));
    scheduler.start();

    go_online();
    std::this_thread::sleep_for(milliseconds(150));
    scheduler.stop();

    EXPECT_EQ(scheduler.requests_issued(), 0u);
}

TEST_F(AutoSyncSchedulerTest, EnablingAutoSyncRearmsInterval) {
    init(settings_with(false, 30));
    go_online();
    AutoSyncScheduler scheduler(*engine, bus, milliseconds(10000));
    scheduler.start();
    std::this_thread::sleep_for(milliseconds(100));
    EXPECT_EQ(scheduler.requests_issued(), 0u);

    SyncSettingsPatch patch;
    patch.auto_sync = true;
    ASSERT_TRUE(engine->update_settings(patch).is_ok());

    ASSERT_TRUE(wait_for_cycles(1));
    scheduler.stop();
    EXPECT_EQ(seen_triggers().front(), SyncTrigger::Timer);
}

TEST_F(AutoSyncSchedulerTest, StopIsIdempotent) {
    init(settings_with(true, 3600000));
    AutoSyncScheduler scheduler(*engine, bus, milliseconds(10));
    scheduler.start();
    EXPECT_TRUE(scheduler.running());

    scheduler.stop();
    scheduler.stop();
    EXPECT_FALSE(scheduler.running());
}

TEST_F(AutoSyncSchedulerTest, RestartAfterStopResumesTimers) {
    init(settings_with(true, 30));
    go_online();
    AutoSyncScheduler scheduler(*engine, bus, milliseconds(10000));

    scheduler.start();
    ASSERT_TRUE(wait_for_cycles(1));
    scheduler.stop();
    const std::size_t before = seen_triggers().size();
    const auto issued = scheduler.requests_issued();

    scheduler.start();
    EXPECT_TRUE(scheduler.running());
    ASSERT_TRUE(wait_for_cycles(before + 1));
    scheduler.stop();

    EXPECT_GT(scheduler.requests_issued(), issued);
    EXPECT_EQ(seen_triggers().back(), SyncTrigger::Timer);
}
