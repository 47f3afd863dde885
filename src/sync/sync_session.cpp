#include "fieldsync/sync/sync_session.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace fieldsync::sync {
namespace {

bool is_forward(SyncPhase current, SyncPhase target) {
    static const std::unordered_map<SyncPhase, std::vector<SyncPhase>> transitions {
        {SyncPhase::Eligibility, {SyncPhase::Uploading, SyncPhase::Finalizing}},
        {SyncPhase::Uploading, {SyncPhase::DownloadingMetadata, SyncPhase::Finalizing}},
        {SyncPhase::DownloadingMetadata, {SyncPhase::DownloadingMedia, SyncPhase::Finalizing}},
        {SyncPhase::DownloadingMedia, {SyncPhase::Finalizing}},
        {SyncPhase::Finalizing, {SyncPhase::Done}},
    };

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed = it->second;
    return std::find(allowed.begin(), allowed.end(), target) != allowed.end();
}

} // namespace

SyncSession::SyncSession(SyncTrigger trigger)
    : trigger_(trigger),
      started_at_(Clock::now()),
      started_steady_(std::chrono::steady_clock::now()) {}

Result<void> SyncSession::advance_to(SyncPhase next) {
    if (phase_ == next) {
        return Ok();
    }
    if (!can_transition(next)) {
        return Err<void>(ErrorKind::InvalidArgument,
                         std::string("Illegal phase transition ") + TypeNames::to_string(phase_) +
                         " -> " + TypeNames::to_string(next));
    }
    phase_ = next;
    return Ok();
}

Result<void> SyncSession::interrupt(std::string reason) {
    if (phase_ == SyncPhase::Done || phase_ == SyncPhase::Aborted) {
        return Err<void>(ErrorKind::InvalidArgument, "Session already finished");
    }
    interrupted_ = true;
    record_issue(std::move(reason));
    return advance_to(SyncPhase::Finalizing);
}

Result<void> SyncSession::abort(Error error) {
    if (!can_transition(SyncPhase::Aborted)) {
        return Err<void>(ErrorKind::InvalidArgument, "Session already finished");
    }
    fatal_error_ = std::move(error);
    aborted_in_ = phase_;
    phase_ = SyncPhase::Aborted;
    return Ok();
}

void SyncSession::set_progress(int value) {
    value = std::clamp(value, 0, 100);
    progress_ = std::max(progress_, value);
}

CycleOutcome SyncSession::outcome() const {
    if (phase_ == SyncPhase::Aborted) {
        return CycleOutcome::FatalError;
    }
    return issue_count() > 0 ? CycleOutcome::PartialFailure : CycleOutcome::Success;
}

std::chrono::milliseconds SyncSession::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_steady_);
}

bool SyncSession::can_transition(SyncPhase target) const noexcept {
    if (phase_ == SyncPhase::Done || phase_ == SyncPhase::Aborted) {
        return false;
    }
    if (target == SyncPhase::Aborted) {
        return true;
    }
    return is_forward(phase_, target);
}

} // namespace fieldsync::sync
