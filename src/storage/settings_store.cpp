#include "fieldsync/storage/settings_store.hpp"

#include "fieldsync/model/serializer.hpp"

#include <spdlog/spdlog.h>

namespace fieldsync::storage {
using json = nlohmann::json;

SettingsStore::SettingsStore(std::filesystem::path data_dir, SyncSettings defaults)
    : file_(data_dir / "state.json") {
    state_.settings = defaults;
}

Result<void> SettingsStore::load() {
    auto document = file_.read();
    if (document.is_error()) {
        return Err<void>(document.error());
    }
    if (!document.value().has_value()) {
        return Ok();
    }

    const json& root = *document.value();
    State loaded;
    {
        std::lock_guard lock(mutex_);
        loaded.settings = state_.settings;
    }

    try {
        if (root.contains("syncSettings")) {
            loaded.settings = settings_patch_from_json(root.at("syncSettings")).apply_to(loaded.settings);
        }
        if (root.contains("lastSyncTime") && !root.at("lastSyncTime").is_null()) {
            loaded.last_sync_time = from_epoch_ms(root.at("lastSyncTime").get<std::int64_t>());
        }
        if (root.contains("metadataCursor") && !root.at("metadataCursor").is_null()) {
            loaded.metadata_cursor = from_epoch_ms(root.at("metadataCursor").get<std::int64_t>());
        }
    } catch (const std::exception& e) {
        return Err<void>(ErrorKind::Storage, std::string("Failed to decode sync state: ") + e.what());
    }
    if (auto res = validate_settings(loaded.settings); res.is_error()) {
        return Err<void>(ErrorKind::Storage, "Invalid sync settings in " + file_.path().string() + ": " +
                                                 res.error().message);
    }

    std::lock_guard lock(mutex_);
    state_ = loaded;
    return Ok();
}

SyncSettings SettingsStore::settings() const {
    std::lock_guard lock(mutex_);
    return state_.settings;
}

Result<SyncSettings> SettingsStore::update(const SyncSettingsPatch& patch) {
    std::lock_guard lock(mutex_);
    const State previous = state_;
    const SyncSettings next = patch.apply_to(state_.settings);
    if (auto res = validate_settings(next); res.is_error()) {
        return Err<SyncSettings>(res.error());
    }

    state_.settings = next;
    if (auto res = commit_locked(previous); res.is_error()) {
        return Err<SyncSettings>(res.error());
    }
    return Ok(next);
}

std::optional<TimePoint> SettingsStore::last_sync_time() const {
    std::lock_guard lock(mutex_);
    return state_.last_sync_time;
}

Result<void> SettingsStore::set_last_sync_time(TimePoint when) {
    std::lock_guard lock(mutex_);
    const State previous = state_;
    state_.last_sync_time = when;
    return commit_locked(previous);
}

std::optional<TimePoint> SettingsStore::metadata_cursor() const {
    std::lock_guard lock(mutex_);
    return state_.metadata_cursor;
}

Result<void> SettingsStore::set_metadata_cursor(TimePoint when) {
    std::lock_guard lock(mutex_);
    const State previous = state_;
    state_.metadata_cursor = when;
    return commit_locked(previous);
}

Result<void> SettingsStore::reset_sync_state() {
    std::lock_guard lock(mutex_);
    const State previous = state_;
    state_.last_sync_time.reset();
    state_.metadata_cursor.reset();
    return commit_locked(previous);
}

Result<void> SettingsStore::commit_locked(const State& previous) {
    json root{
        {"syncSettings", state_.settings},
        {"lastSyncTime", state_.last_sync_time ? json(to_epoch_ms(*state_.last_sync_time)) : json(nullptr)},
        {"metadataCursor", state_.metadata_cursor ? json(to_epoch_ms(*state_.metadata_cursor)) : json(nullptr)}
    };

    auto res = file_.write(root);
    if (res.is_error()) {
        spdlog::error("Failed to persist sync state: {}", res.error().message);
        state_ = previous;
    }
    return res;
}

} // namespace fieldsync::storage
