#include "fieldsync/sync/sync_engine.hpp"

#include "fieldsync/events/event_queue.hpp"
#include "fieldsync/events/events.hpp"
#include "fieldsync/storage/durable_file.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

namespace fieldsync::sync {
namespace {

constexpr std::size_t kMaxWorkers = 4;

std::string describe_item(const QueueItem& item) {
    return std::string(TypeNames::to_string(item.entity_type)) + " " + item.id;
}

// Joins the phase workers on every exit path
class WorkerGroup {
public:
    WorkerGroup() = default;
    ~WorkerGroup() {
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    WorkerGroup(const WorkerGroup&) = delete;
    WorkerGroup& operator=(const WorkerGroup&) = delete;

    template<typename Fn>
    void spawn(Fn&& fn) {
        workers_.emplace_back(std::forward<Fn>(fn));
    }

private:
    std::vector<std::thread> workers_;
};

} // namespace

SyncEngine::SyncEngine(storage::LocalStore& store,
                       SyncQueue& queue,
                       storage::SettingsStore& settings,
                       ConnectivityMonitor& connectivity,
                       RemoteTransport& transport,
                       NotificationSink& notifications,
                       events::EventBus& bus,
                       RetryPolicy retry_policy,
                       EngineConfig config)
    : store_(store),
      queue_(queue),
      settings_(settings),
      connectivity_(connectivity),
      transport_(transport),
      notifications_(notifications),
      bus_(bus),
      retry_policy_(std::move(retry_policy)),
      config_(config) {
    config_.worker_count = std::clamp<std::size_t>(config_.worker_count, 1, kMaxWorkers);
}

CycleOutcome SyncEngine::force_sync() {
    return run_cycle(SyncTrigger::Manual);
}

CycleOutcome SyncEngine::request_sync(SyncTrigger trigger) {
    return run_cycle(trigger);
}

StatusSnapshot SyncEngine::status() const {
    StatusSnapshot snapshot;
    {
        std::lock_guard lock(status_mutex_);
        snapshot.status = status_;
        snapshot.progress = progress_;
        snapshot.issues = issues_;
        snapshot.last_error = last_error_;
    }
    snapshot.last_sync_time = settings_.last_sync_time();
    snapshot.pending = queue_.pending_counts();
    return snapshot;
}

Result<SyncSettings> SyncEngine::update_settings(const SyncSettingsPatch& patch) {
    auto updated = settings_.update(patch);
    if (updated.is_error()) {
        spdlog::error("Failed to update sync settings: {}", describe(updated.error()));
        return updated;
    }
    bus_.emit(events::SettingsChangedEvent{updated.value()});
    return updated;
}

Result<Record> SyncEngine::download_form_for_offline(const std::string& form_id) {
    if (form_id.empty()) {
        return Err<Record>(ErrorKind::InvalidArgument, "Form id must not be empty");
    }
    if (!connectivity_.reachable()) {
        return Err<Record>(ErrorKind::Transient, "Internet connection required to download forms");
    }

    auto fetched = transport_.fetch_form(form_id);
    if (fetched.is_error()) {
        spdlog::warn("Failed to download form {}: {}", form_id, describe(fetched.error()));
        return fetched;
    }

    Record form = std::move(fetched.value());
    form.type = EntityType::Form;
    form.synced = true;
    auto stored = store_.upsert(std::move(form));
    if (stored.is_error()) {
        spdlog::error("Failed to store form {}: {}", form_id, describe(stored.error()));
        return stored;
    }
    spdlog::info("Form {} available offline", stored.value().id);
    bus_.emit(events::MetadataMergedEvent{EntityType::Form, {stored.value().id}, 0});
    return stored;
}

// ════════════════════════════════════════════════════════
// Cycle
// ════════════════════════════════════════════════════════

CycleOutcome SyncEngine::run_cycle(SyncTrigger trigger) {
    bool expected = false;
    if (!syncing_.compare_exchange_strong(expected, true)) {
        spdlog::debug("Sync request ({}) ignored, a cycle is already running",
                      TypeNames::to_string(trigger));
        bus_.emit(events::SyncSkippedEvent{CycleOutcome::Skipped, "a cycle is already running"});
        return CycleOutcome::Skipped;
    }
    FlightGuard guard(syncing_);

    // Read once; a settings change during the cycle applies to the next one
    const SyncSettings settings = settings_.settings();

    if (auto reason = check_eligibility(settings)) {
        set_status(SyncStatus::Idle);
        bus_.emit(events::SyncSkippedEvent{CycleOutcome::Ineligible, *reason});
        return CycleOutcome::Ineligible;
    }

    if (!has_work(settings, Clock::now())) {
        set_status(SyncStatus::Idle);
        bus_.emit(events::SyncSkippedEvent{CycleOutcome::NoWork, "queue empty and metadata fresh"});
        return CycleOutcome::NoWork;
    }

    const RetryPolicy policy = retry_policy_.with_max_retries(settings.max_retries);
    SyncSession session(trigger);
    set_status(SyncStatus::Syncing, 0);

    const auto pending = queue_.pending_counts();
    events::SyncStartedEvent started;
    started.trigger = trigger;
    started.uploads_due = pending.uploads;
    started.downloads_due = pending.downloads;
    bus_.emit(started);

    try {
        if (boundary_check(session, SyncPhase::Uploading)) {
            run_upload_phase(session, policy);
        }
        if (session.phase() == SyncPhase::Uploading &&
            boundary_check(session, SyncPhase::DownloadingMetadata)) {
            run_metadata_phase(session);
        }
        if (session.phase() == SyncPhase::DownloadingMetadata &&
            boundary_check(session, SyncPhase::DownloadingMedia)) {
            run_media_phase(session, policy);
        }
    } catch (const std::exception& e) {
        spdlog::error("Sync cycle stopped by an unexpected error: {}", e.what());
        if (session.phase() != SyncPhase::Aborted) {
            if (auto res = session.abort(Error{ErrorKind::Storage, e.what()}); res.is_error()) {
                spdlog::error("Failed to abort session: {}", describe(res.error()));
            }
        }
    }

    finish(session);
    return session.outcome();
}

std::optional<std::string> SyncEngine::check_eligibility(const SyncSettings& settings) const {
    const auto state = connectivity_.state();
    if (!state.reachable) {
        return std::string("offline");
    }
    if (settings.sync_on_wifi_only && state.kind != ConnectionKind::Wifi) {
        return std::string("wifi-only sync and connection is ") + TypeNames::to_string(state.kind);
    }
    return std::nullopt;
}

bool SyncEngine::has_work(const SyncSettings& settings, TimePoint now) const {
    if (queue_.has_due(Direction::Upload, now) || queue_.has_due(Direction::Download, now)) {
        return true;
    }
    const auto last = settings_.last_sync_time();
    if (!last) {
        return true;
    }
    return now - *last >= std::chrono::milliseconds(settings.sync_interval_ms);
}

bool SyncEngine::boundary_check(SyncSession& session, SyncPhase next) {
    if (!connectivity_.reachable()) {
        spdlog::warn("Connectivity lost, not starting {}", TypeNames::to_string(next));
        if (auto res = session.interrupt(std::string("connectivity lost before ") +
                                         TypeNames::to_string(next));
            res.is_error()) {
            spdlog::error("Failed to interrupt session: {}", describe(res.error()));
        }
        return false;
    }
    enter_phase(session, next);
    return true;
}

void SyncEngine::enter_phase(SyncSession& session, SyncPhase phase) {
    if (auto res = session.advance_to(phase); res.is_error()) {
        spdlog::error("{}", describe(res.error()));
        return;
    }
    bus_.emit(events::SyncProgressEvent{session.phase(), session.progress()});
}

void SyncEngine::publish_progress(SyncSession& session, int progress) {
    session.set_progress(progress);
    set_status(SyncStatus::Syncing, session.progress());
    bus_.emit(events::SyncProgressEvent{session.phase(), session.progress()});
}

// ════════════════════════════════════════════════════════
// Phases
// ════════════════════════════════════════════════════════

void SyncEngine::run_upload_phase(SyncSession& session, const RetryPolicy& policy) {
    const auto batch = queue_.dequeue_batch(Direction::Upload);
    spdlog::debug("Upload phase: {} item(s) due", batch.size());
    run_batch(session, batch, policy,
              [this](const QueueItem& item, const RetryPolicy& p) { return upload_item(item, p); },
              0, 50);
}

void SyncEngine::run_metadata_phase(SyncSession& session) {
    const TimePoint since = settings_.metadata_cursor().value_or(TimePoint{});

    struct Fetch {
        const char* name;
        EntityType type;
        std::function<Result<std::vector<Record>>(TimePoint)> call;
    };
    const std::vector<Fetch> fetches{
        {"new forms", EntityType::Form,
         [this](TimePoint s) { return transport_.fetch_new_forms(s); }},
        {"form updates", EntityType::Form,
         [this](TimePoint s) { return transport_.fetch_form_updates(s); }},
        {"projects", EntityType::Project,
         [this](TimePoint s) { return transport_.fetch_projects(s); }},
    };

    bool complete = true;
    for (const auto& fetch : fetches) {
        auto fetched = fetch.call(since);
        if (fetched.is_error()) {
            const Error& error = fetched.error();
            if (is_fatal_to_cycle(error.kind)) {
                if (auto res = session.abort(error); res.is_error()) {
                    spdlog::error("Failed to abort session: {}", describe(res.error()));
                }
                return;
            }
            spdlog::warn("Failed to fetch {}: {}", fetch.name, describe(error));
            session.record_issue(std::string("failed to fetch ") + fetch.name + ": " + describe(error));
            complete = false;
            continue;
        }
        if (!merge_metadata(session, fetch.type, fetched.value())) {
            complete = false;
        }
    }

    // A partial fetch is repeated from the same point next cycle
    if (complete) {
        if (auto res = settings_.set_metadata_cursor(session.started_at()); res.is_error()) {
            spdlog::error("Failed to store metadata cursor: {}", describe(res.error()));
            if (auto aborted = session.abort(res.error()); aborted.is_error()) {
                spdlog::error("Failed to abort session: {}", describe(aborted.error()));
            }
            return;
        }
    }
    publish_progress(session, 75);
}

bool SyncEngine::merge_metadata(SyncSession& session, EntityType type, const std::vector<Record>& records) {
    events::MetadataMergedEvent merged;
    merged.type = type;
    bool ok = true;

    for (Record record : records) {
        record.type = type;
        record.synced = true;
        if (record.id.empty()) {
            session.record_issue(std::string("remote ") + TypeNames::to_string(type) + " without id");
            continue;
        }

        // Never overwrite a local edit that has not been uploaded yet
        auto existing = store_.get(type, record.id);
        if (existing.is_ok() && !existing.value().synced) {
            ++merged.skipped_unsynced;
            continue;
        }

        auto stored = store_.upsert(std::move(record));
        if (stored.is_error()) {
            spdlog::error("Failed to store remote {}: {}", TypeNames::to_string(type),
                          describe(stored.error()));
            session.record_issue("failed to store remote " + std::string(TypeNames::to_string(type)) +
                                 ": " + describe(stored.error()));
            ok = false;
            continue;
        }
        merged.merged_ids.push_back(stored.value().id);
        session.record_downloaded();
    }

    if (!merged.merged_ids.empty() || merged.skipped_unsynced > 0) {
        bus_.emit(merged);
    }
    return ok;
}

void SyncEngine::run_media_phase(SyncSession& session, const RetryPolicy& policy) {
    const auto batch = queue_.dequeue_batch(Direction::Download, config_.media_batch_limit);
    spdlog::debug("Media phase: {} item(s) due", batch.size());
    run_batch(session, batch, policy,
              [this](const QueueItem& item, const RetryPolicy& p) { return download_item(item, p); },
              75, 100);
}

void SyncEngine::run_batch(SyncSession& session, const std::vector<QueueItem>& batch,
                           const RetryPolicy& policy, const ItemHandler& handler,
                           int progress_from, int progress_to) {
    if (batch.empty()) {
        publish_progress(session, progress_to);
        return;
    }

    events::ThreadSafeQueue<QueueItem> work;
    events::ThreadSafeQueue<ItemOutcome> results;
    std::atomic<bool> cancelled{false};

    for (const auto& item : batch) {
        work.push(item);
    }
    work.close();

    std::optional<Error> fatal;
    {
        WorkerGroup workers;
        const std::size_t worker_count = std::min(config_.worker_count, batch.size());
        for (std::size_t i = 0; i < worker_count; ++i) {
            workers.spawn([&]() {
                while (auto item = work.pop()) {
                    if (cancelled.load()) {
                        results.push(ItemOutcome{*item, ItemResult::NotRun});
                        continue;
                    }
                    ItemOutcome outcome{*item, ItemResult::NotRun};
                    std::optional<Error> unexpected;
                    try {
                        outcome = handler(*item, policy);
                    } catch (const std::exception& e) {
                        unexpected = Error{ErrorKind::Transient, e.what()};
                    }
                    if (unexpected) {
                        // handle_failure reports through Result and does not throw
                        outcome = handle_failure(*item, *unexpected, policy);
                    }
                    if (outcome.result == ItemResult::Fatal) {
                        cancelled.store(true);
                    }
                    results.push(std::move(outcome));
                }
            });
        }

        const auto total = batch.size();
        for (std::size_t done = 1; done <= total; ++done) {
            auto outcome = results.pop();
            if (!outcome) {
                break;
            }

            const QueueKey key = outcome->item.key();
            switch (outcome->result) {
                case ItemResult::Synced:
                    if (key.direction == Direction::Upload) {
                        session.record_uploaded();
                    } else {
                        session.record_downloaded();
                    }
                    if (!outcome->issue.empty()) {
                        session.record_issue(outcome->issue);
                    }
                    bus_.emit(events::ItemSyncedEvent{key, outcome->bytes});
                    break;
                case ItemResult::Failed: {
                    events::ItemFailedEvent failed;
                    failed.key = key;
                    failed.error = outcome->error.value_or(Error{});
                    failed.attempt_count = outcome->item.attempt_count;
                    failed.next_attempt_at = outcome->item.next_attempt_at;
                    session.record_failure(outcome->item);
                    bus_.emit(failed);
                    break;
                }
                case ItemResult::DeadLettered: {
                    events::ItemDeadLetteredEvent dead;
                    dead.key = key;
                    dead.error = outcome->error.value_or(Error{});
                    dead.attempt_count = outcome->item.attempt_count;
                    session.record_failure(outcome->item);
                    bus_.emit(dead);
                    break;
                }
                case ItemResult::Fatal:
                    if (!fatal) {
                        fatal = outcome->error.value_or(Error{ErrorKind::Authentication, "unauthorized"});
                    }
                    break;
                case ItemResult::NotRun:
                    break;
            }

            const auto span = static_cast<std::size_t>(progress_to - progress_from);
            publish_progress(session, progress_from + static_cast<int>(span * done / total));
        }
    }

    if (fatal) {
        spdlog::error("{} phase aborted: {}", TypeNames::to_string(session.phase()), describe(*fatal));
        if (auto res = session.abort(*fatal); res.is_error()) {
            spdlog::error("Failed to abort session: {}", describe(res.error()));
        }
    }
}

// ════════════════════════════════════════════════════════
// Per-item work (runs on phase workers)
// ════════════════════════════════════════════════════════

SyncEngine::ItemOutcome SyncEngine::upload_item(const QueueItem& item, const RetryPolicy& policy) {
    ItemOutcome outcome{item, ItemResult::NotRun};

    if (auto res = queue_.mark_in_flight(item.key()); res.is_error()) {
        // The queue cannot be written: nothing else in this cycle can be recorded either
        if (res.error().kind == ErrorKind::Storage) {
            outcome.result = ItemResult::Fatal;
            outcome.error = res.error();
            return outcome;
        }
        // Replaced, discarded or cleared since the batch snapshot was taken
        spdlog::debug("Skipping upload of {}: {}", describe_item(item), describe(res.error()));
        return outcome;
    }

    auto record = store_.get(item.entity_type, item.payload_ref);
    if (record.is_error()) {
        if (record.error().kind == ErrorKind::NotFound) {
            return handle_failure(item, Error{ErrorKind::Rejected, "record no longer exists locally"}, policy);
        }
        return handle_failure(item, record.error(), policy);
    }

    Result<UploadAck> ack = Err<UploadAck>(ErrorKind::Rejected, "entity type cannot be uploaded");
    switch (item.entity_type) {
        case EntityType::Submission:
            ack = transport_.upload_submission(record.value());
            break;
        case EntityType::MediaFile:
            ack = transport_.upload_media(record.value());
            break;
        case EntityType::Form:
        case EntityType::Project:
            break;
    }
    if (ack.is_error()) {
        return handle_failure(item, ack.error(), policy);
    }

    outcome.result = ItemResult::Synced;

    // The server has it now; a failure to flag the record is an issue, not a retry
    auto synced = store_.mark_synced(item.entity_type, item.payload_ref, record.value().updated_at);
    if (synced.is_error()) {
        spdlog::error("Uploaded {} but failed to flag it synced: {}", describe_item(item), describe(synced.error()));
        outcome.issue = "failed to flag " + describe_item(item) + " synced: " + describe(synced.error());
    } else if (!synced.value()) {
        // Edited while the upload was in flight; the newer version goes next cycle
        spdlog::info("{} changed during upload, keeping it queued", describe_item(item));
        if (auto res = queue_.release(item.key()); res.is_error() && res.error().kind == ErrorKind::Storage) {
            outcome.result = ItemResult::Fatal;
            outcome.error = res.error();
        }
        return outcome;
    }

    if (auto res = queue_.mark_succeeded(item.key()); res.is_error()) {
        spdlog::error("Uploaded {} but failed to remove it from the queue: {}",
                      describe_item(item), describe(res.error()));
        if (res.error().kind == ErrorKind::Storage) {
            outcome.result = ItemResult::Fatal;
            outcome.error = res.error();
        }
    }
    return outcome;
}

SyncEngine::ItemOutcome SyncEngine::download_item(const QueueItem& item, const RetryPolicy& policy) {
    ItemOutcome outcome{item, ItemResult::NotRun};

    if (auto res = queue_.mark_in_flight(item.key()); res.is_error()) {
        if (res.error().kind == ErrorKind::Storage) {
            outcome.result = ItemResult::Fatal;
            outcome.error = res.error();
            return outcome;
        }
        spdlog::debug("Skipping download of {}: {}", describe_item(item), describe(res.error()));
        return outcome;
    }

    auto body = transport_.fetch_media(item.payload_ref);
    if (body.is_error()) {
        return handle_failure(item, body.error(), policy);
    }

    const auto path = store_.media_root() / item.id;
    if (auto res = storage::DurableFile::write_bytes(path, body.value()); res.is_error()) {
        return handle_failure(item, res.error(), policy);
    }

    Record record;
    if (auto existing = store_.get(EntityType::MediaFile, item.id); existing.is_ok()) {
        record = existing.value();
    } else {
        record.type = EntityType::MediaFile;
        record.id = item.id;
    }
    record.synced = true;
    if (!record.payload.is_object()) {
        record.payload = nlohmann::json{{"data", record.payload}};
    }
    record.payload["ref"] = item.payload_ref;
    record.payload["path"] = path.string();
    record.payload["size"] = body.value().size();

    if (auto res = store_.upsert(std::move(record)); res.is_error()) {
        return handle_failure(item, res.error(), policy);
    }
    outcome.result = ItemResult::Synced;
    outcome.bytes = body.value().size();
    if (auto res = queue_.mark_succeeded(item.key()); res.is_error()) {
        spdlog::error("Downloaded {} but failed to remove it from the queue: {}",
                      describe_item(item), describe(res.error()));
        if (res.error().kind == ErrorKind::Storage) {
            outcome.result = ItemResult::Fatal;
            outcome.error = res.error();
        }
    }
    return outcome;
}

SyncEngine::ItemOutcome SyncEngine::handle_failure(const QueueItem& item, const Error& error,
                                                   const RetryPolicy& policy) {
    ItemOutcome outcome{item, ItemResult::Failed};
    outcome.error = error;
    const QueueKey key = item.key();

    if (is_fatal_to_cycle(error.kind)) {
        // Leave the queue as it was before the cycle touched this item
        if (auto res = queue_.release(key); res.is_error()) {
            spdlog::error("Failed to release {}: {}", describe_item(item), describe(res.error()));
        }
        outcome.result = ItemResult::Fatal;
        return outcome;
    }

    auto status = queue_.mark_failed(key, error, policy);
    if (status.is_error()) {
        spdlog::error("Failed to record failure of {}: {}", describe_item(item), describe(status.error()));
        if (status.error().kind != ErrorKind::Storage) {
            // Discarded or cleared while the item was being processed
            return outcome;
        }
        if (auto res = queue_.release(key); res.is_error()) {
            spdlog::error("Failed to release {}: {}", describe_item(item), describe(res.error()));
        }
        outcome.error = status.error();
        outcome.result = ItemResult::Fatal;
        return outcome;
    }

    if (auto updated = queue_.find(key)) {
        outcome.item = *updated;
    }
    outcome.result = status.value() == QueueStatus::Dead ? ItemResult::DeadLettered : ItemResult::Failed;
    return outcome;
}

// ════════════════════════════════════════════════════════
// Finalize
// ════════════════════════════════════════════════════════

void SyncEngine::finish(SyncSession& session) {
    if (session.phase() != SyncPhase::Aborted) {
        enter_phase(session, SyncPhase::Finalizing);
        if (!session.interrupted()) {
            if (auto res = settings_.set_last_sync_time(Clock::now()); res.is_error()) {
                spdlog::error("Failed to store last sync time: {}", describe(res.error()));
                if (auto aborted = session.abort(res.error()); aborted.is_error()) {
                    spdlog::error("Failed to abort session: {}", describe(aborted.error()));
                }
            } else {
                publish_progress(session, 100);
            }
        }
        if (session.phase() != SyncPhase::Aborted) {
            enter_phase(session, SyncPhase::Done);
        }
    }

    const CycleOutcome outcome = session.outcome();
    const std::size_t issues = session.issue_count();

    {
        std::lock_guard lock(status_mutex_);
        status_ = outcome == CycleOutcome::FatalError ? SyncStatus::Error : SyncStatus::Success;
        progress_ = session.progress();
        issues_ = issues;
        if (session.fatal_error()) {
            last_error_ = describe(*session.fatal_error());
        } else if (!session.issues().empty()) {
            last_error_ = session.issues().back();
        } else if (!session.failures().empty()) {
            last_error_ = session.failures().back().last_error;
        } else {
            last_error_.clear();
        }
    }

    if (outcome == CycleOutcome::FatalError) {
        events::SyncAbortedEvent aborted;
        aborted.error = session.fatal_error().value_or(Error{});
        aborted.phase = session.aborted_in();
        bus_.emit(aborted);
    } else {
        events::SyncFinishedEvent finished;
        finished.outcome = outcome;
        finished.uploaded = session.uploaded_count();
        finished.downloaded = session.downloaded_count();
        finished.issues = issues;
        finished.duration = session.elapsed();
        bus_.emit(finished);
    }

    notifications_.notify(make_notification(outcome, issues, session.fatal_error()));
}

void SyncEngine::set_status(SyncStatus status, std::optional<int> progress) {
    std::lock_guard lock(status_mutex_);
    status_ = status;
    if (progress) {
        progress_ = *progress;
    }
}

} // namespace fieldsync::sync
