#pragma once

/**
 * @file types.hpp
 * @brief Core data types of the offline synchronization engine
 *
 * WHAT LIVES HERE:
 * - Record:      a captured or downloaded entity (submission, media, form, project)
 * - QueueItem:   one durable pending transfer, keyed by (entity type, id, direction)
 * - SyncSettings: user-tunable sync behaviour, persisted
 * - Status types: what the UI and notification layer get to see
 *
 * TIMESTAMPS:
 * All timestamps are std::chrono::system_clock time points and are persisted
 * as milliseconds since the Unix epoch.
 */

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace fieldsync {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class EntityType {
    Submission,
    MediaFile,
    Form,
    Project
};

/**
 * @brief A domain entity owned by LocalStore
 *
 * The id is client generated and globally unique. `synced` flips to true only
 * after the remote side acknowledged the record (or when it came from the
 * remote side in the first place).
 */
struct Record {
    EntityType type = EntityType::Submission;
    std::string id;
    nlohmann::json payload = nlohmann::json::object();
    bool synced = false;
    TimePoint updated_at{};
};

enum class Direction {
    Upload,
    Download
};

/**
 * @brief Lifecycle of a queue item
 *
 * pending   -> in_flight (engine picked it up)
 * in_flight -> removed    (remote confirmed)
 * in_flight -> failed     (retry scheduled at next_attempt_at)
 * in_flight -> dead       (retry budget exhausted or rejected)
 * failed    -> in_flight  (once next_attempt_at has passed)
 */
enum class QueueStatus {
    Pending,
    InFlight,
    Failed,
    Dead
};

struct QueueKey {
    EntityType entity_type = EntityType::Submission;
    std::string id;
    Direction direction = Direction::Upload;

    bool operator==(const QueueKey& other) const {
        return entity_type == other.entity_type && id == other.id && direction == other.direction;
    }
    bool operator!=(const QueueKey& other) const { return !(*this == other); }
};

struct QueueItem {
    std::string id;
    EntityType entity_type = EntityType::Submission;
    Direction direction = Direction::Upload;
    std::string payload_ref;        ///< Record id for uploads, remote media ref for downloads
    QueueStatus status = QueueStatus::Pending;
    std::uint32_t attempt_count = 0;
    TimePoint next_attempt_at{};
    std::uint64_t seq = 0;          ///< Insertion order, assigned by SyncQueue
    std::string last_error;

    QueueKey key() const { return QueueKey{entity_type, id, direction}; }
};

struct PendingCounts {
    std::size_t uploads = 0;
    std::size_t downloads = 0;
    std::size_t failed = 0;     ///< Waiting for a backoff retry
    std::size_t dead = 0;       ///< Dead-lettered, needs manual action

    std::size_t total_active() const { return uploads + downloads + failed; }
};

struct SyncSettings {
    bool auto_sync = true;
    bool sync_on_wifi_only = false;
    std::int64_t sync_interval_ms = 300000;
    std::uint32_t max_retries = 3;
};

/**
 * @brief Partial update for SyncSettings; unset fields keep their value
 */
struct SyncSettingsPatch {
    std::optional<bool> auto_sync;
    std::optional<bool> sync_on_wifi_only;
    std::optional<std::int64_t> sync_interval_ms;
    std::optional<std::uint32_t> max_retries;

    SyncSettings apply_to(SyncSettings settings) const {
        if (auto_sync) settings.auto_sync = *auto_sync;
        if (sync_on_wifi_only) settings.sync_on_wifi_only = *sync_on_wifi_only;
        if (sync_interval_ms) settings.sync_interval_ms = *sync_interval_ms;
        if (max_retries) settings.max_retries = *max_retries;
        return settings;
    }
};

enum class ConnectionKind {
    Unknown,
    None,
    Wifi,
    Cellular
};

struct ConnectivityState {
    bool reachable = false;
    ConnectionKind kind = ConnectionKind::Unknown;

    bool operator==(const ConnectivityState& other) const {
        return reachable == other.reachable && kind == other.kind;
    }
    bool operator!=(const ConnectivityState& other) const { return !(*this == other); }
};

enum class SyncTrigger {
    Manual,
    Timer,
    Connectivity
};

/**
 * @brief Phases of one cycle, executed strictly in this order
 */
enum class SyncPhase {
    Eligibility,
    Uploading,
    DownloadingMetadata,
    DownloadingMedia,
    Finalizing,
    Done,
    Aborted
};

/**
 * @brief What a sync request ended up doing
 *
 * Skipped:        another cycle was already running (single-flight)
 * Ineligible:     offline, or wifi-only and not on wifi
 * NoWork:         nothing due and metadata still fresh
 * Success:        everything due was transferred
 * PartialFailure: cycle completed, some items failed or were dead-lettered
 * FatalError:     cycle aborted (authentication, storage unavailable)
 */
enum class CycleOutcome {
    Skipped,
    Ineligible,
    NoWork,
    Success,
    PartialFailure,
    FatalError
};

/**
 * @brief Status values surfaced to the UI (idle|syncing|success|error)
 */
enum class SyncStatus {
    Idle,
    Syncing,
    Success,
    Error
};

struct StatusSnapshot {
    SyncStatus status = SyncStatus::Idle;
    int progress = 0;                       ///< 0..100
    std::optional<TimePoint> last_sync_time;
    PendingCounts pending;
    std::size_t issues = 0;                 ///< "completed with N issues"
    std::string last_error;
};

// ════════════════════════════════════════════════════════
// String conversions
// ════════════════════════════════════════════════════════

class TypeNames {
public:
    static const char* to_string(EntityType type) {
        switch (type) {
            case EntityType::Submission: return "submission";
            case EntityType::MediaFile: return "media";
            case EntityType::Form: return "form";
            case EntityType::Project: return "project";
        }
        return "submission";
    }

    static std::optional<EntityType> entity_from_string(const std::string& text) {
        if (text == "submission") return EntityType::Submission;
        if (text == "media") return EntityType::MediaFile;
        if (text == "form") return EntityType::Form;
        if (text == "project") return EntityType::Project;
        return std::nullopt;
    }

    static const char* to_string(Direction direction) {
        return direction == Direction::Upload ? "upload" : "download";
    }

    static std::optional<Direction> direction_from_string(const std::string& text) {
        if (text == "upload") return Direction::Upload;
        if (text == "download") return Direction::Download;
        return std::nullopt;
    }

    static const char* to_string(QueueStatus status) {
        switch (status) {
            case QueueStatus::Pending: return "pending";
            case QueueStatus::InFlight: return "in_flight";
            case QueueStatus::Failed: return "failed";
            case QueueStatus::Dead: return "dead";
        }
        return "pending";
    }

    static std::optional<QueueStatus> status_from_string(const std::string& text) {
        if (text == "pending") return QueueStatus::Pending;
        if (text == "in_flight") return QueueStatus::InFlight;
        if (text == "failed") return QueueStatus::Failed;
        if (text == "dead") return QueueStatus::Dead;
        return std::nullopt;
    }

    static const char* to_string(ConnectionKind kind) {
        switch (kind) {
            case ConnectionKind::Unknown: return "unknown";
            case ConnectionKind::None: return "none";
            case ConnectionKind::Wifi: return "wifi";
            case ConnectionKind::Cellular: return "cellular";
        }
        return "unknown";
    }

    static const char* to_string(SyncTrigger trigger) {
        switch (trigger) {
            case SyncTrigger::Manual: return "manual";
            case SyncTrigger::Timer: return "timer";
            case SyncTrigger::Connectivity: return "connectivity";
        }
        return "manual";
    }

    static const char* to_string(SyncPhase phase) {
        switch (phase) {
            case SyncPhase::Eligibility: return "eligibility";
            case SyncPhase::Uploading: return "uploading";
            case SyncPhase::DownloadingMetadata: return "downloading_metadata";
            case SyncPhase::DownloadingMedia: return "downloading_media";
            case SyncPhase::Finalizing: return "finalizing";
            case SyncPhase::Done: return "done";
            case SyncPhase::Aborted: return "aborted";
        }
        return "eligibility";
    }

    static const char* to_string(CycleOutcome outcome) {
        switch (outcome) {
            case CycleOutcome::Skipped: return "skipped";
            case CycleOutcome::Ineligible: return "ineligible";
            case CycleOutcome::NoWork: return "no_work";
            case CycleOutcome::Success: return "success";
            case CycleOutcome::PartialFailure: return "partial_failure";
            case CycleOutcome::FatalError: return "fatal_error";
        }
        return "skipped";
    }

    static const char* to_string(SyncStatus status) {
        switch (status) {
            case SyncStatus::Idle: return "idle";
            case SyncStatus::Syncing: return "syncing";
            case SyncStatus::Success: return "success";
            case SyncStatus::Error: return "error";
        }
        return "idle";
    }
};

inline std::int64_t to_epoch_ms(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline TimePoint from_epoch_ms(std::int64_t ms) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

} // namespace fieldsync

namespace std {

template<>
struct hash<fieldsync::QueueKey> {
    size_t operator()(const fieldsync::QueueKey& key) const noexcept {
        size_t h = std::hash<std::string>{}(key.id);
        h ^= static_cast<size_t>(key.entity_type) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        h ^= static_cast<size_t>(key.direction) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }
};

} // namespace std
