#pragma once

#include "fieldsync/core/result.hpp"
#include "fieldsync/model/types.hpp"
#include "fieldsync/storage/durable_file.hpp"

#include <filesystem>
#include <mutex>
#include <optional>

namespace fieldsync::storage {

/**
 * @brief Small key-value state: SyncSettings, lastSyncTime and the metadata cursor
 *
 * Persisted as "<data_dir>/state.json". Settings change only through update();
 * readers get a copy, so a running cycle keeps the values it started with.
 */
class SettingsStore {
public:
    SettingsStore(std::filesystem::path data_dir, SyncSettings defaults);

    SettingsStore(const SettingsStore&) = delete;
    SettingsStore& operator=(const SettingsStore&) = delete;

    Result<void> load();

    SyncSettings settings() const;

    /**
     * @brief Merge the fields present in the patch and persist
     *
     * @return The settings now in effect
     */
    Result<SyncSettings> update(const SyncSettingsPatch& patch);

    std::optional<TimePoint> last_sync_time() const;
    Result<void> set_last_sync_time(TimePoint when);

    /**
     * @brief Lower bound passed as `since` to the metadata fetches
     *
     * Advanced only after a successful metadata phase, so a failed fetch is
     * repeated from the same point next cycle.
     */
    std::optional<TimePoint> metadata_cursor() const;
    Result<void> set_metadata_cursor(TimePoint when);

    /**
     * @brief Forget lastSyncTime and the cursor (clear offline data)
     */
    Result<void> reset_sync_state();

private:
    struct State {
        SyncSettings settings;
        std::optional<TimePoint> last_sync_time;
        std::optional<TimePoint> metadata_cursor;
    };

    // Caller must hold the lock; restores `previous` when the write fails
    Result<void> commit_locked(const State& previous);

    DurableFile file_;
    mutable std::mutex mutex_;
    State state_;
};

} // namespace fieldsync::storage
