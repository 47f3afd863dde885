#include "fieldsync/events/event_bus.hpp"
#include "fieldsync/events/components.hpp"
#include "fieldsync/events/events.hpp"

#include <gtest/gtest.h>

using fieldsync::CycleOutcome;
using fieldsync::Direction;
using fieldsync::EntityType;
using fieldsync::QueueKey;
using fieldsync::events::EventBus;
using fieldsync::events::ItemDeadLetteredEvent;
using fieldsync::events::ItemFailedEvent;
using fieldsync::events::ItemSyncedEvent;
using fieldsync::events::LoggerComponent;
using fieldsync::events::MetadataMergedEvent;
using fieldsync::events::MetricsComponent;
using fieldsync::events::SyncAbortedEvent;
using fieldsync::events::SyncFinishedEvent;
using fieldsync::events::SyncSkippedEvent;
using fieldsync::events::SyncStartedEvent;

TEST(MetricsComponentTest, TracksItemCounters) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(ItemSyncedEvent{QueueKey{EntityType::Submission, "s1", Direction::Upload}, 0});
    bus.emit(ItemSyncedEvent{QueueKey{EntityType::MediaFile, "m1", Direction::Download}, 2048});
    bus.emit(ItemFailedEvent{QueueKey{EntityType::Submission, "s2", Direction::Upload}});
    bus.emit(ItemDeadLetteredEvent{QueueKey{EntityType::Submission, "s3", Direction::Upload}});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.items_uploaded.load(), 1u);
    EXPECT_EQ(stats.items_downloaded.load(), 1u);
    EXPECT_EQ(stats.bytes_downloaded.load(), 2048u);
    EXPECT_EQ(stats.item_failures.load(), 1u);
    EXPECT_EQ(stats.dead_letters.load(), 1u);
}

TEST(MetricsComponentTest, TracksCycleOutcomes) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(SyncStartedEvent{});
    bus.emit(SyncStartedEvent{});
    bus.emit(SyncStartedEvent{});

    SyncFinishedEvent clean;
    clean.outcome = CycleOutcome::Success;
    bus.emit(clean);

    SyncFinishedEvent partial;
    partial.outcome = CycleOutcome::PartialFailure;
    partial.issues = 2;
    bus.emit(partial);

    bus.emit(SyncAbortedEvent{});
    bus.emit(SyncSkippedEvent{CycleOutcome::Skipped, "busy"});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.cycles_started.load(), 3u);
    EXPECT_EQ(stats.cycles_succeeded.load(), 1u);
    EXPECT_EQ(stats.cycles_with_issues.load(), 1u);
    EXPECT_EQ(stats.cycles_aborted.load(), 1u);
    EXPECT_EQ(stats.requests_skipped.load(), 1u);
}

TEST(MetricsComponentTest, CountsMergedMetadataByType) {
    EventBus bus;
    MetricsComponent metrics(bus);

    MetadataMergedEvent forms;
    forms.type = EntityType::Form;
    forms.merged_ids = {"f1", "f2"};
    bus.emit(forms);

    MetadataMergedEvent projects;
    projects.type = EntityType::Project;
    projects.merged_ids = {"p1"};
    projects.skipped_unsynced = 1;
    bus.emit(projects);

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.forms_merged.load(), 2u);
    EXPECT_EQ(stats.projects_merged.load(), 1u);
}

TEST(MetricsComponentTest, ComponentsUnsubscribeOnDestruction) {
    EventBus bus;
    {
        LoggerComponent logger(bus);
        MetricsComponent metrics(bus);
        EXPECT_EQ(bus.subscriber_count<SyncStartedEvent>(), 2u);
    }
    EXPECT_EQ(bus.subscriber_count<SyncStartedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<ItemSyncedEvent>(), 0u);
}
