#include "fieldsync/sync/capture_service.hpp"

#include "fieldsync/core/platform.hpp"
#include "fieldsync/model/serializer.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <ctime>
#include <filesystem>
#include <system_error>

namespace fieldsync::sync {
namespace {

constexpr std::size_t kIdSuffixLength = 9;

QueueItem upload_item_for(const Record& record) {
    QueueItem item;
    item.id = record.id;
    item.entity_type = record.type;
    item.direction = Direction::Upload;
    item.payload_ref = record.id;
    return item;
}

std::string iso_timestamp(TimePoint tp) {
    const std::time_t seconds = Clock::to_time_t(tp);
    std::tm utc{};
    if (!utc_time(seconds, utc)) {
        return "1970-01-01T00:00:00.000Z";
    }
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
    const auto millis = to_epoch_ms(tp) % 1000;
    char result[40];
    std::snprintf(result, sizeof(result), "%s.%03dZ", buffer, static_cast<int>(millis));
    return result;
}

} // namespace

CaptureService::CaptureService(storage::LocalStore& store,
                               SyncQueue& queue,
                               storage::SettingsStore& settings,
                               const SyncEngine& engine)
    : store_(store),
      queue_(queue),
      settings_(settings),
      engine_(engine),
      rng_(std::random_device{}()) {}

Result<Record> CaptureService::save_submission(const std::string& form_id, const nlohmann::json& data) {
    if (form_id.empty()) {
        return Err<Record>(ErrorKind::InvalidArgument, "Form id must not be empty");
    }
    if (!is_valid_utf8(form_id) || !is_valid_text(data)) {
        return Err<Record>(ErrorKind::InvalidArgument, "Submission contains text that is not valid UTF-8");
    }

    Record record;
    record.type = EntityType::Submission;
    record.id = generate_id("submission");
    record.synced = false;
    record.payload = {
        {"formId", form_id},
        {"data", data},
        {"timestamp", iso_timestamp(Clock::now())},
        {"userId", "anonymous"},
    };
    if (data.is_object() && data.contains("userId") && data["userId"].is_string()) {
        record.payload["userId"] = data["userId"];
    }
    return create_and_enqueue(std::move(record));
}

Result<Record> CaptureService::save_media_file(const nlohmann::json& media) {
    if (!is_valid_text(media)) {
        return Err<Record>(ErrorKind::InvalidArgument, "Media metadata contains text that is not valid UTF-8");
    }

    Record record;
    record.type = EntityType::MediaFile;
    record.id = generate_id("media");
    record.synced = false;
    record.payload = media;
    return create_and_enqueue(std::move(record));
}

Result<Record> CaptureService::edit_record(EntityType type, const std::string& id, const nlohmann::json& payload) {
    if (type != EntityType::Submission && type != EntityType::MediaFile) {
        return Err<Record>(ErrorKind::InvalidArgument,
                           std::string("Records of type ") + TypeNames::to_string(type) + " are read-only");
    }

    auto existing = store_.get(type, id);
    if (existing.is_error()) {
        return existing;
    }

    if (!is_valid_text(payload)) {
        return Err<Record>(ErrorKind::InvalidArgument, "Payload contains text that is not valid UTF-8");
    }

    // Reserve the upload slot first so an in-flight upload refuses the edit before anything is written
    const QueueItem upload = upload_item_for(existing.value());
    if (auto res = queue_.enqueue(upload); res.is_error()) {
        return Err<Record>(res.error());
    }

    Record edited = existing.value();
    edited.payload = payload;
    edited.synced = false;

    auto stored = store_.upsert(std::move(edited));
    if (stored.is_error()) {
        // The pending item only causes an idempotent re-upload of the unchanged record
        return stored;
    }

    // An upload that started after the reservation either saw this version or is
    // released by the engine's version check. One that already finished removed the item.
    if (auto res = queue_.enqueue(upload); res.is_error() && res.error().kind != ErrorKind::Busy) {
        spdlog::error("Edited {} but failed to queue its upload: {}", id, describe(res.error()));
        return Err<Record>(res.error());
    }
    return stored;
}

Result<QueueKey> CaptureService::request_media_download(const std::string& ref) {
    if (ref.empty()) {
        return Err<QueueKey>(ErrorKind::InvalidArgument, "Media ref must not be empty");
    }
    if (!is_valid_utf8(ref)) {
        return Err<QueueKey>(ErrorKind::InvalidArgument, "Media ref is not valid UTF-8");
    }

    QueueItem item;
    item.id = ref;
    item.entity_type = EntityType::MediaFile;
    item.direction = Direction::Download;
    item.payload_ref = ref;

    if (auto res = queue_.enqueue(item); res.is_error()) {
        return Err<QueueKey>(res.error());
    }
    return Ok(item.key());
}

Result<void> CaptureService::clear_offline_data() {
    if (engine_.is_syncing()) {
        return Err<void>(ErrorKind::Busy, "Cannot clear offline data while a sync is running");
    }

    if (auto res = queue_.clear(); res.is_error()) {
        return res;
    }
    if (auto res = store_.clear(); res.is_error()) {
        return res;
    }
    if (auto res = settings_.reset_sync_state(); res.is_error()) {
        return res;
    }

    std::error_code ec;
    std::filesystem::remove_all(store_.media_root(), ec);
    if (ec) {
        return Err<void>(ErrorKind::Storage, "Failed to remove media directory: " + ec.message());
    }

    spdlog::info("Offline data cleared");
    return Ok();
}

std::size_t CaptureService::offline_data_size() const {
    return store_.data_size_bytes();
}

Result<Record> CaptureService::create_and_enqueue(Record record) {
    auto stored = store_.upsert(std::move(record));
    if (stored.is_error()) {
        return stored;
    }

    if (auto res = queue_.enqueue(upload_item_for(stored.value())); res.is_error()) {
        if (auto undo = store_.remove(stored.value().type, stored.value().id); undo.is_error()) {
            spdlog::error("Failed to undo record {} after enqueue failure: {}",
                          stored.value().id, describe(undo.error()));
        }
        return Err<Record>(res.error());
    }

    spdlog::debug("Captured {} {}", TypeNames::to_string(stored.value().type), stored.value().id);
    return stored;
}

std::string CaptureService::generate_id(const char* prefix) {
    static constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";

    std::string suffix(kIdSuffixLength, '0');
    {
        std::lock_guard lock(rng_mutex_);
        std::uniform_int_distribution<int> pick(0, 35);
        for (auto& c : suffix) {
            c = kAlphabet[pick(rng_)];
        }
    }
    return std::string(prefix) + "_" + std::to_string(to_epoch_ms(Clock::now())) + "_" + suffix;
}

} // namespace fieldsync::sync
