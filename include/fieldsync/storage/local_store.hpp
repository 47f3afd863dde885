#pragma once

/**
 * @file local_store.hpp
 * @brief Durable record storage that survives process restarts
 *
 * WHAT IT DOES:
 * Plain CRUD over Records, keyed by (entity type, id). It knows nothing about
 * syncing: saving a record never enqueues anything. The capture layer and the
 * engine make the enqueue call themselves.
 *
 * DURABILITY:
 * The full record set is written to "<data_dir>/records.json" before a
 * mutating call returns. If the write fails the in-memory change is rolled
 * back and a Storage error is returned, so memory and disk never disagree.
 *
 * THREAD SAFETY PATTERN:
 * - get / list / size / query: shared_lock (concurrent readers)
 * - upsert / remove / clear:    unique_lock (exclusive, includes the disk write)
 */

#include "fieldsync/core/result.hpp"
#include "fieldsync/model/types.hpp"
#include "fieldsync/storage/durable_file.hpp"

#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace fieldsync::storage {

class LocalStore {
public:
    explicit LocalStore(std::filesystem::path data_dir);

    LocalStore(const LocalStore&) = delete;
    LocalStore& operator=(const LocalStore&) = delete;

    /**
     * @brief Load records persisted by a previous run
     */
    Result<void> load();

    Result<Record> get(EntityType type, const std::string& id) const;

    /**
     * @brief All records of one type, ordered by id
     */
    std::vector<Record> list(EntityType type) const;

    /**
     * @brief Insert or replace a record; stamps updated_at with the current time
     *
     * @return The record as stored
     */
    Result<Record> upsert(Record record);

    /**
     * @brief Flip the synced flag of an existing record
     *
     * With `version`, the flag is only flipped while the record's updated_at
     * still equals it; an edit saved since then keeps the record unsynced.
     *
     * @return false when the record changed after `version`
     */
    Result<bool> mark_synced(EntityType type, const std::string& id,
                             std::optional<TimePoint> version = std::nullopt);

    Result<void> remove(EntityType type, const std::string& id);

    /**
     * @brief Drop every record (clear offline data)
     */
    Result<void> clear();

    std::size_t size() const;

    /**
     * @brief Serialized size of all record payloads in bytes
     */
    std::size_t data_size_bytes() const;

    /**
     * @brief Directory where downloaded media bodies are kept
     */
    std::filesystem::path media_root() const { return data_dir_ / "media"; }

    template<typename Predicate>
    std::vector<Record> query(Predicate predicate) const {
        std::shared_lock lock(mutex_);
        std::vector<Record> result;
        for (const auto& [key, record] : records_) {
            if (predicate(record)) {
                result.push_back(record);
            }
        }
        return result;
    }

private:
    static std::string make_key(EntityType type, const std::string& id);

    // Caller must hold the unique lock
    Result<void> persist_locked() const;

    std::filesystem::path data_dir_;
    DurableFile file_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Record> records_;
};

} // namespace fieldsync::storage
