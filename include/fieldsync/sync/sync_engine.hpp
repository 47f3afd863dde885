#pragma once

/**
 * @file sync_engine.hpp
 * @brief Orchestrates sync cycles between LocalStore, SyncQueue and the server
 *
 * CYCLE:
 * 1. Eligibility   reachable, and on wifi when syncOnWifiOnly
 * 2. Uploading     every due upload item, bounded parallelism     progress 0..50
 * 3. Metadata      new forms, form updates, projects since cursor  progress 75
 * 4. Media         every due download item                         progress 75..100
 * 5. Finalizing    lastSyncTime, status, notification
 *
 * Connectivity is re-checked before phases 2-4 start. Once it is gone no new
 * phase work starts and the cycle finalizes as a partial failure.
 *
 * SINGLE-FLIGHT:
 * At most one cycle runs per engine. A request that arrives while a cycle is
 * running returns CycleOutcome::Skipped at once and leaves status and
 * progress alone.
 *
 * ERRORS:
 * Per-item failures stay inside the item loop (bulkhead). Authentication
 * failures abort the cycle; the item being processed is put back to pending
 * and the remaining phases are skipped. A queue or settings file that cannot
 * be written aborts the same way with ErrorKind::Storage.
 */

#include "fieldsync/core/config.hpp"
#include "fieldsync/events/event_bus.hpp"
#include "fieldsync/model/types.hpp"
#include "fieldsync/storage/local_store.hpp"
#include "fieldsync/storage/settings_store.hpp"
#include "fieldsync/sync/connectivity_monitor.hpp"
#include "fieldsync/sync/notification_sink.hpp"
#include "fieldsync/sync/retry_policy.hpp"
#include "fieldsync/sync/sync_queue.hpp"
#include "fieldsync/sync/sync_session.hpp"
#include "fieldsync/sync/transport.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fieldsync::sync {

class SyncEngine {
public:
    SyncEngine(storage::LocalStore& store,
               SyncQueue& queue,
               storage::SettingsStore& settings,
               ConnectivityMonitor& connectivity,
               RemoteTransport& transport,
               NotificationSink& notifications,
               events::EventBus& bus,
               RetryPolicy retry_policy,
               EngineConfig config = {});

    SyncEngine(const SyncEngine&) = delete;
    SyncEngine& operator=(const SyncEngine&) = delete;

    /**
     * @brief Manual sync; runs the cycle on the calling thread
     */
    CycleOutcome force_sync();

    /**
     * @brief Sync requested by the timer or a connectivity transition
     */
    CycleOutcome request_sync(SyncTrigger trigger);

    StatusSnapshot status() const;

    bool is_syncing() const noexcept { return syncing_.load(); }

    /**
     * @brief Merge and persist a settings patch; emits SettingsChangedEvent
     *
     * A running cycle keeps the settings it started with.
     */
    Result<SyncSettings> update_settings(const SyncSettingsPatch& patch);

    SyncSettings settings() const { return settings_.settings(); }

    /**
     * @brief Fetch one form and keep it for offline capture
     *
     * Needs a reachable network (Transient otherwise). The form is stored
     * synced; it replaces any earlier copy.
     */
    Result<Record> download_form_for_offline(const std::string& form_id);

private:
    // Clears the syncing flag on every exit path
    class FlightGuard {
    public:
        explicit FlightGuard(std::atomic<bool>& flag) : flag_(flag) {}
        ~FlightGuard() { flag_.store(false); }
        FlightGuard(const FlightGuard&) = delete;
        FlightGuard& operator=(const FlightGuard&) = delete;

    private:
        std::atomic<bool>& flag_;
    };

    enum class ItemResult {
        Synced,
        Failed,
        DeadLettered,
        Fatal,
        NotRun      ///< Cancelled before start, or item vanished from the queue
    };

    struct ItemOutcome {
        QueueItem item;
        ItemResult result = ItemResult::NotRun;
        std::optional<Error> error;
        std::size_t bytes = 0;
        std::string issue;          ///< Problem that happened after a confirmed transfer
    };

    using ItemHandler = std::function<ItemOutcome(const QueueItem&, const RetryPolicy&)>;

    CycleOutcome run_cycle(SyncTrigger trigger);
    std::optional<std::string> check_eligibility(const SyncSettings& settings) const;
    bool has_work(const SyncSettings& settings, TimePoint now) const;

    void run_upload_phase(SyncSession& session, const RetryPolicy& policy);
    void run_metadata_phase(SyncSession& session);
    void run_media_phase(SyncSession& session, const RetryPolicy& policy);

    /**
     * @brief Process a batch on up to worker_count threads
     *
     * Outcomes are applied to the session on the calling thread; progress
     * moves linearly from progress_from to progress_to as items finish.
     */
    void run_batch(SyncSession& session, const std::vector<QueueItem>& batch,
                   const RetryPolicy& policy, const ItemHandler& handler,
                   int progress_from, int progress_to);

    ItemOutcome upload_item(const QueueItem& item, const RetryPolicy& policy);
    ItemOutcome download_item(const QueueItem& item, const RetryPolicy& policy);
    ItemOutcome handle_failure(const QueueItem& item, const Error& error, const RetryPolicy& policy);

    /**
     * @brief Upsert fetched forms/projects, leaving unsynced local edits alone
     *
     * @return false when a record could not be stored
     */
    bool merge_metadata(SyncSession& session, EntityType type, const std::vector<Record>& records);

    bool boundary_check(SyncSession& session, SyncPhase next);
    void enter_phase(SyncSession& session, SyncPhase phase);
    void publish_progress(SyncSession& session, int progress);
    void finish(SyncSession& session);

    void set_status(SyncStatus status, std::optional<int> progress = std::nullopt);

    storage::LocalStore& store_;
    SyncQueue& queue_;
    storage::SettingsStore& settings_;
    ConnectivityMonitor& connectivity_;
    RemoteTransport& transport_;
    NotificationSink& notifications_;
    events::EventBus& bus_;
    RetryPolicy retry_policy_;
    EngineConfig config_;

    std::atomic<bool> syncing_{false};

    mutable std::mutex status_mutex_;
    SyncStatus status_ = SyncStatus::Idle;
    int progress_ = 0;
    std::size_t issues_ = 0;
    std::string last_error_;
};

} // namespace fieldsync::sync
