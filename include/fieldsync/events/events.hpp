/**
 * @file events.hpp
 * @brief Event types published by the sync engine and its collaborators
 *
 * NAMING CONVENTION:
 * Events are past tense and describe something that already happened.
 */

#pragma once

#include "fieldsync/core/error.hpp"
#include "fieldsync/model/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace fieldsync::events {

// ════════════════════════════════════════════════════════
// Connectivity / settings
// ════════════════════════════════════════════════════════

/**
 * @brief The platform reported a different reachability or link kind
 *
 * WHO EMITS: ConnectivityMonitor
 * WHO SUBSCRIBES: AutoSyncScheduler (debounced sync on reconnect), logger
 */
struct ConnectivityChangedEvent {
    ConnectivityState previous;
    ConnectivityState current;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};

    bool came_online() const { return !previous.reachable && current.reachable; }
};

struct SettingsChangedEvent {
    SyncSettings settings;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Cycle lifecycle
// ════════════════════════════════════════════════════════

struct SyncStartedEvent {
    SyncTrigger trigger = SyncTrigger::Manual;
    std::size_t uploads_due = 0;
    std::size_t downloads_due = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct SyncProgressEvent {
    SyncPhase phase = SyncPhase::Eligibility;
    int progress = 0;
};

/**
 * @brief A request did not turn into a cycle (offline, wifi-only, nothing to do)
 */
struct SyncSkippedEvent {
    CycleOutcome outcome = CycleOutcome::Skipped;
    std::string reason;
};

struct SyncFinishedEvent {
    CycleOutcome outcome = CycleOutcome::Success;
    std::size_t uploaded = 0;
    std::size_t downloaded = 0;
    std::size_t issues = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief The cycle was aborted by a fatal error; remaining phases did not run
 */
struct SyncAbortedEvent {
    Error error;
    SyncPhase phase = SyncPhase::Eligibility;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Per-item outcomes
// ════════════════════════════════════════════════════════

struct ItemSyncedEvent {
    QueueKey key;
    std::size_t bytes = 0;
};

struct ItemFailedEvent {
    QueueKey key;
    Error error;
    std::uint32_t attempt_count = 0;
    TimePoint next_attempt_at{};
};

struct ItemDeadLetteredEvent {
    QueueKey key;
    Error error;
    std::uint32_t attempt_count = 0;
};

/**
 * @brief Forms or projects fetched from the server were written to the store
 *
 * Carries only the ids that changed, so observers can refresh incrementally.
 */
struct MetadataMergedEvent {
    EntityType type = EntityType::Form;
    std::vector<std::string> merged_ids;
    std::size_t skipped_unsynced = 0;   ///< Local edits not yet uploaded, left alone
};

} // namespace fieldsync::events
