#pragma once

#include "fieldsync/core/result.hpp"
#include "fieldsync/model/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace fieldsync::sync {

/**
 * @brief Bookkeeping for one sync cycle; created at cycle start, never persisted
 *
 * PHASE ORDER:
 * Eligibility -> Uploading -> DownloadingMetadata -> DownloadingMedia -> Finalizing -> Done
 *
 * Any working phase may jump to Finalizing (connectivity lost at a phase
 * boundary) or to Aborted (fatal error). Done and Aborted are terminal.
 * Progress never moves backwards within a session.
 */
class SyncSession {
public:
    explicit SyncSession(SyncTrigger trigger);

    SyncTrigger trigger() const noexcept { return trigger_; }
    SyncPhase phase() const noexcept { return phase_; }
    int progress() const noexcept { return progress_; }
    TimePoint started_at() const noexcept { return started_at_; }

    Result<void> advance_to(SyncPhase next);

    /**
     * @brief Stop doing phase work; the cycle finalizes as partially failed
     */
    Result<void> interrupt(std::string reason);

    Result<void> abort(Error error);

    /**
     * @brief Raise progress to `value` (clamped to 0..100); lower values are ignored
     */
    void set_progress(int value);

    void record_uploaded() { ++uploaded_count_; }
    void record_downloaded() { ++downloaded_count_; }
    void record_failure(QueueItem item) { failures_.push_back(std::move(item)); }

    /**
     * @brief A problem that is not tied to a queue item (metadata fetch, storage)
     */
    void record_issue(std::string description) { issues_.push_back(std::move(description)); }

    std::size_t uploaded_count() const noexcept { return uploaded_count_; }
    std::size_t downloaded_count() const noexcept { return downloaded_count_; }
    const std::vector<QueueItem>& failures() const noexcept { return failures_; }
    const std::vector<std::string>& issues() const noexcept { return issues_; }

    std::size_t issue_count() const noexcept { return failures_.size() + issues_.size(); }

    bool interrupted() const noexcept { return interrupted_; }
    const std::optional<Error>& fatal_error() const noexcept { return fatal_error_; }

    /**
     * @brief Phase that was running when abort() was called
     */
    SyncPhase aborted_in() const noexcept { return aborted_in_; }

    /**
     * @brief Outcome of a session that reached Done or Aborted
     */
    CycleOutcome outcome() const;

    std::chrono::milliseconds elapsed() const;

private:
    bool can_transition(SyncPhase target) const noexcept;

    SyncTrigger trigger_;
    TimePoint started_at_;
    std::chrono::steady_clock::time_point started_steady_;
    SyncPhase phase_ = SyncPhase::Eligibility;
    int progress_ = 0;

    std::size_t uploaded_count_ = 0;
    std::size_t downloaded_count_ = 0;
    std::vector<QueueItem> failures_;
    std::vector<std::string> issues_;

    bool interrupted_ = false;
    std::optional<Error> fatal_error_;
    SyncPhase aborted_in_ = SyncPhase::Eligibility;
};

} // namespace fieldsync::sync
