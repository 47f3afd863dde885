#pragma once

/**
 * @file capture_service.hpp
 * @brief Entry point for records created or edited on the device
 *
 * Every write here goes to LocalStore and SyncQueue together: if the enqueue
 * fails the record write is undone, so there is never a record with
 * synced=false that no queue item will pick up. Items are enqueued whether or
 * not the device is online; the queue is durable.
 */

#include "fieldsync/core/result.hpp"
#include "fieldsync/model/types.hpp"
#include "fieldsync/storage/local_store.hpp"
#include "fieldsync/storage/settings_store.hpp"
#include "fieldsync/sync/sync_engine.hpp"
#include "fieldsync/sync/sync_queue.hpp"

#include <nlohmann/json.hpp>

#include <mutex>
#include <random>
#include <string>

namespace fieldsync::sync {

class CaptureService {
public:
    CaptureService(storage::LocalStore& store,
                   SyncQueue& queue,
                   storage::SettingsStore& settings,
                   const SyncEngine& engine);

    CaptureService(const CaptureService&) = delete;
    CaptureService& operator=(const CaptureService&) = delete;

    /**
     * @brief Store a filled-in form and queue it for upload
     *
     * The record id is "submission_<epoch ms>_<9 base36 chars>"; the payload
     * is {"formId", "data", "timestamp"}.
     */
    Result<Record> save_submission(const std::string& form_id, const nlohmann::json& data);

    /**
     * @brief Store a captured media file's metadata and queue it for upload
     */
    Result<Record> save_media_file(const nlohmann::json& media);

    /**
     * @brief Replace a record's payload and queue it for upload again
     *
     * Busy when the record's upload is in flight right now.
     */
    Result<Record> edit_record(EntityType type, const std::string& id, const nlohmann::json& payload);

    /**
     * @brief Queue a media body held by the server for download
     *
     * The MediaFile record id equals the remote ref, so asking twice does
     * not create a second item.
     */
    Result<QueueKey> request_media_download(const std::string& ref);

    /**
     * @brief Drop every record, queue item, downloaded media body and the
     *        sync timestamps. Busy while a cycle is running.
     */
    Result<void> clear_offline_data();

    std::size_t offline_data_size() const;

private:
    Result<Record> create_and_enqueue(Record record);
    std::string generate_id(const char* prefix);

    storage::LocalStore& store_;
    SyncQueue& queue_;
    storage::SettingsStore& settings_;
    const SyncEngine& engine_;

    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
};

} // namespace fieldsync::sync
