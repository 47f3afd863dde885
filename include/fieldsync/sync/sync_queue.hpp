#pragma once

/**
 * @file sync_queue.hpp
 * @brief Durable, deduplicated queue of pending uploads and downloads
 *
 * KEYING:
 * At most one item exists per (entity type, id, direction). Enqueueing an
 * existing key replaces the item in place (same insertion position, fresh
 * attempt budget); an item that is in flight cannot be replaced and the
 * caller gets ErrorKind::Busy.
 *
 * ORDERING:
 * dequeue_batch() returns due items ordered by next_attempt_at, then by
 * insertion order. It is a snapshot: items enqueued afterwards are only seen
 * by the next call.
 *
 * CRASH RECOVERY:
 * load() turns every item persisted as in_flight back into pending. The
 * transfer it stood for is assumed not to have completed; uploads are
 * idempotent on the server side, keyed by record id.
 */

#include "fieldsync/core/result.hpp"
#include "fieldsync/model/types.hpp"
#include "fieldsync/storage/durable_file.hpp"
#include "fieldsync/sync/retry_policy.hpp"

#include <cstdint>
#include <filesystem>
#include <limits>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace fieldsync::sync {

class SyncQueue {
public:
    static constexpr std::size_t kNoLimit = std::numeric_limits<std::size_t>::max();

    explicit SyncQueue(std::filesystem::path data_dir);

    SyncQueue(const SyncQueue&) = delete;
    SyncQueue& operator=(const SyncQueue&) = delete;

    /**
     * @brief Load the persisted queue, recovering in-flight items
     *
     * @return Number of items recovered from in_flight to pending
     */
    Result<std::size_t> load();

    /**
     * @brief Add or replace the item for item.key()
     *
     * The stored item is reset to pending with attempt_count 0 and becomes
     * due at `now` unless item.next_attempt_at is later.
     */
    Result<void> enqueue(QueueItem item, TimePoint now = Clock::now());

    std::vector<QueueItem> dequeue_batch(Direction direction,
                                         std::size_t limit = kNoLimit,
                                         TimePoint now = Clock::now()) const;

    bool has_due(Direction direction, TimePoint now = Clock::now()) const;

    Result<void> mark_in_flight(const QueueKey& key);

    /**
     * @brief Remote side confirmed the transfer; the item is removed
     *
     * When the removal cannot be persisted the item stays, back in pending.
     */
    Result<void> mark_succeeded(const QueueKey& key);

    /**
     * @brief Record a failed attempt
     *
     * Rejected errors dead-letter immediately. Other errors bump
     * attempt_count and either schedule the next attempt using the policy's
     * backoff or dead-letter the item once the policy says it is dead.
     *
     * @return Resulting status (Failed or Dead)
     */
    Result<QueueStatus> mark_failed(const QueueKey& key,
                                    const Error& error,
                                    const RetryPolicy& policy,
                                    TimePoint now = Clock::now());

    /**
     * @brief Put an in-flight item back to pending without charging an attempt
     *
     * Used when a cycle aborts and the queue must stay as it was. The item is
     * pending in memory even if the write fails.
     */
    Result<void> release(const QueueKey& key);

    std::vector<QueueItem> dead_letters() const;
    Result<void> retry_dead_letter(const QueueKey& key, TimePoint now = Clock::now());
    Result<void> discard_dead_letter(const QueueKey& key);

    std::optional<QueueItem> find(const QueueKey& key) const;
    PendingCounts pending_counts() const;
    std::size_t size() const;

    Result<void> clear();

private:
    // Caller must hold the lock
    Result<void> persist_locked() const;

    // Apply `mutate` to the item; roll back when persisting fails
    template<typename Mutate>
    Result<void> update_locked(const QueueKey& key, Mutate mutate);

    storage::DurableFile file_;

    mutable std::mutex mutex_;
    std::unordered_map<QueueKey, QueueItem> items_;
    std::uint64_t next_seq_ = 1;
};

} // namespace fieldsync::sync
