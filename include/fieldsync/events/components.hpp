/**
 * @file components.hpp
 * @brief Observers of the sync engine built on the event bus
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * engine.force_sync();
 * metrics.print_stats();
 */

#pragma once

#include "fieldsync/events/event_bus.hpp"
#include "fieldsync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <vector>

namespace fieldsync::events {

/**
 * @brief Writes every engine event to the spdlog default logger
 *
 * info for cycle boundaries, warn for item failures and dead letters,
 * error for aborted cycles, debug for progress.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) {
        subscriptions_.push_back(bus.subscribe<ConnectivityChangedEvent>(
            [](const ConnectivityChangedEvent& e) {
                spdlog::info("[Connectivity] {} ({}) -> {} ({})",
                             e.previous.reachable ? "online" : "offline",
                             TypeNames::to_string(e.previous.kind),
                             e.current.reachable ? "online" : "offline",
                             TypeNames::to_string(e.current.kind));
            }));

        subscriptions_.push_back(bus.subscribe<SettingsChangedEvent>(
            [](const SettingsChangedEvent& e) {
                spdlog::info("[Settings] autoSync={} syncOnWifiOnly={} syncIntervalMs={} maxRetries={}",
                             e.settings.auto_sync, e.settings.sync_on_wifi_only,
                             e.settings.sync_interval_ms, e.settings.max_retries);
            }));

        subscriptions_.push_back(bus.subscribe<SyncStartedEvent>(
            [](const SyncStartedEvent& e) {
                spdlog::info("[SyncStarted] trigger={} uploads_due={} downloads_due={}",
                             TypeNames::to_string(e.trigger), e.uploads_due, e.downloads_due);
            }));

        subscriptions_.push_back(bus.subscribe<SyncProgressEvent>(
            [](const SyncProgressEvent& e) {
                spdlog::debug("[SyncProgress] phase={} progress={}%",
                              TypeNames::to_string(e.phase), e.progress);
            }));

        subscriptions_.push_back(bus.subscribe<SyncSkippedEvent>(
            [](const SyncSkippedEvent& e) {
                spdlog::debug("[SyncSkipped] outcome={} reason={}",
                              TypeNames::to_string(e.outcome), e.reason);
            }));

        subscriptions_.push_back(bus.subscribe<ItemSyncedEvent>(
            [](const ItemSyncedEvent& e) {
                spdlog::info("[ItemSynced] {} {} {} bytes={}",
                             TypeNames::to_string(e.key.direction),
                             TypeNames::to_string(e.key.entity_type), e.key.id, e.bytes);
            }));

        subscriptions_.push_back(bus.subscribe<ItemFailedEvent>(
            [](const ItemFailedEvent& e) {
                spdlog::warn("[ItemFailed] {} {} {} attempt={} error={}",
                             TypeNames::to_string(e.key.direction),
                             TypeNames::to_string(e.key.entity_type), e.key.id,
                             e.attempt_count, describe(e.error));
            }));

        subscriptions_.push_back(bus.subscribe<ItemDeadLetteredEvent>(
            [](const ItemDeadLetteredEvent& e) {
                spdlog::warn("[DeadLettered] {} {} {} after {} attempts: {}",
                             TypeNames::to_string(e.key.direction),
                             TypeNames::to_string(e.key.entity_type), e.key.id,
                             e.attempt_count, describe(e.error));
            }));

        subscriptions_.push_back(bus.subscribe<MetadataMergedEvent>(
            [](const MetadataMergedEvent& e) {
                spdlog::info("[MetadataMerged] type={} merged={} kept_local={}",
                             TypeNames::to_string(e.type), e.merged_ids.size(), e.skipped_unsynced);
            }));

        subscriptions_.push_back(bus.subscribe<SyncFinishedEvent>(
            [](const SyncFinishedEvent& e) {
                if (e.issues > 0) {
                    spdlog::warn("[SyncFinished] completed with {} issues (uploaded={} downloaded={} {}ms)",
                                 e.issues, e.uploaded, e.downloaded, e.duration.count());
                } else {
                    spdlog::info("[SyncFinished] {} (uploaded={} downloaded={} {}ms)",
                                 TypeNames::to_string(e.outcome), e.uploaded, e.downloaded,
                                 e.duration.count());
                }
            }));

        subscriptions_.push_back(bus.subscribe<SyncAbortedEvent>(
            [](const SyncAbortedEvent& e) {
                spdlog::error("[SyncAborted] phase={} error={}",
                              TypeNames::to_string(e.phase), describe(e.error));
            }));
    }

private:
    std::vector<Subscription> subscriptions_;
};

/**
 * @brief Counts what the engine did since the component was created
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * auto uploaded = metrics.get_stats().items_uploaded.load();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> cycles_started{0};
        std::atomic<std::uint64_t> cycles_succeeded{0};
        std::atomic<std::uint64_t> cycles_with_issues{0};
        std::atomic<std::uint64_t> cycles_aborted{0};
        std::atomic<std::uint64_t> requests_skipped{0};
        std::atomic<std::uint64_t> items_uploaded{0};
        std::atomic<std::uint64_t> items_downloaded{0};
        std::atomic<std::uint64_t> bytes_downloaded{0};
        std::atomic<std::uint64_t> item_failures{0};
        std::atomic<std::uint64_t> dead_letters{0};
        std::atomic<std::uint64_t> forms_merged{0};
        std::atomic<std::uint64_t> projects_merged{0};
    };

    explicit MetricsComponent(EventBus& bus) {
        subscriptions_.push_back(bus.subscribe<SyncStartedEvent>(
            [this](const SyncStartedEvent&) { stats_.cycles_started++; }));

        subscriptions_.push_back(bus.subscribe<SyncSkippedEvent>(
            [this](const SyncSkippedEvent&) { stats_.requests_skipped++; }));

        subscriptions_.push_back(bus.subscribe<SyncFinishedEvent>(
            [this](const SyncFinishedEvent& e) {
                if (e.issues > 0) {
                    stats_.cycles_with_issues++;
                } else {
                    stats_.cycles_succeeded++;
                }
            }));

        subscriptions_.push_back(bus.subscribe<SyncAbortedEvent>(
            [this](const SyncAbortedEvent&) { stats_.cycles_aborted++; }));

        subscriptions_.push_back(bus.subscribe<ItemSyncedEvent>(
            [this](const ItemSyncedEvent& e) { on_item_synced(e); }));

        subscriptions_.push_back(bus.subscribe<ItemFailedEvent>(
            [this](const ItemFailedEvent&) { stats_.item_failures++; }));

        subscriptions_.push_back(bus.subscribe<ItemDeadLetteredEvent>(
            [this](const ItemDeadLetteredEvent&) { stats_.dead_letters++; }));

        subscriptions_.push_back(bus.subscribe<MetadataMergedEvent>(
            [this](const MetadataMergedEvent& e) { on_metadata_merged(e); }));
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Sync Statistics:");
        spdlog::info("  Cycles started:   {}", stats_.cycles_started.load());
        spdlog::info("  Cycles clean:     {}", stats_.cycles_succeeded.load());
        spdlog::info("  Cycles w/ issues: {}", stats_.cycles_with_issues.load());
        spdlog::info("  Cycles aborted:   {}", stats_.cycles_aborted.load());
        spdlog::info("  Requests skipped: {}", stats_.requests_skipped.load());
        spdlog::info("  Items uploaded:   {}", stats_.items_uploaded.load());
        spdlog::info("  Items downloaded: {}", stats_.items_downloaded.load());
        spdlog::info("  Bytes downloaded: {}", stats_.bytes_downloaded.load());
        spdlog::info("  Item failures:    {}", stats_.item_failures.load());
        spdlog::info("  Dead letters:     {}", stats_.dead_letters.load());
        spdlog::info("  Forms merged:     {}", stats_.forms_merged.load());
        spdlog::info("  Projects merged:  {}", stats_.projects_merged.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_item_synced(const ItemSyncedEvent& e) {
        if (e.key.direction == Direction::Upload) {
            stats_.items_uploaded++;
        } else {
            stats_.items_downloaded++;
            stats_.bytes_downloaded += e.bytes;
        }
    }

    void on_metadata_merged(const MetadataMergedEvent& e) {
        if (e.type == EntityType::Project) {
            stats_.projects_merged += e.merged_ids.size();
        } else {
            stats_.forms_merged += e.merged_ids.size();
        }
    }

    Stats stats_;
    std::vector<Subscription> subscriptions_;
};

} // namespace fieldsync::events
