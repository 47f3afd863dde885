#include "fieldsync/sync/sync_queue.hpp"

#include "fieldsync/model/serializer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>

namespace fieldsync::sync {
using json = nlohmann::json;

namespace {

constexpr int kFormatVersion = 1;

bool is_due(const QueueItem& item, Direction direction, TimePoint now) {
    if (item.direction != direction) {
        return false;
    }
    if (item.status != QueueStatus::Pending && item.status != QueueStatus::Failed) {
        return false;
    }
    return item.next_attempt_at <= now;
}

std::string describe_key(const QueueKey& key) {
    return std::string(TypeNames::to_string(key.entity_type)) + "/" + key.id + "/" +
           TypeNames::to_string(key.direction);
}

std::uint64_t salt_for(const QueueKey& key) {
    return static_cast<std::uint64_t>(std::hash<QueueKey>{}(key));
}

} // namespace

template<typename Mutate>
Result<void> SyncQueue::update_locked(const QueueKey& key, Mutate mutate) {
    auto& item = items_.at(key);
    const QueueItem previous = item;
    mutate(item);
    if (auto res = persist_locked(); res.is_error()) {
        item = previous;
        return res;
    }
    return Ok();
}

SyncQueue::SyncQueue(std::filesystem::path data_dir)
    : file_(data_dir / "queue.json") {}

Result<std::size_t> SyncQueue::load() {
    auto document = file_.read();
    if (document.is_error()) {
        return Err<std::size_t>(document.error());
    }

    std::unordered_map<QueueKey, QueueItem> loaded;
    std::uint64_t max_seq = 0;
    std::size_t recovered = 0;

    if (document.value().has_value()) {
        try {
            for (const auto& entry : document.value()->at("items")) {
                QueueItem item = entry.get<QueueItem>();
                if (item.status == QueueStatus::InFlight) {
                    item.status = QueueStatus::Pending;
                    ++recovered;
                }
                max_seq = std::max(max_seq, item.seq);
                loaded[item.key()] = std::move(item);
            }
        } catch (const std::exception& e) {
            return Err<std::size_t>(ErrorKind::Storage, std::string("Failed to decode queue: ") + e.what());
        }
    }

    std::lock_guard lock(mutex_);
    items_ = std::move(loaded);
    next_seq_ = max_seq + 1;

    if (recovered > 0) {
        spdlog::warn("Recovered {} in-flight queue item(s) from an interrupted run", recovered);
        if (auto res = persist_locked(); res.is_error()) {
            return Err<std::size_t>(res.error());
        }
    }
    return Ok(recovered);
}

Result<void> SyncQueue::enqueue(QueueItem item, TimePoint now) {
    if (item.id.empty()) {
        return Err<void>(ErrorKind::InvalidArgument, "Queue item id must not be empty");
    }
    if (item.payload_ref.empty()) {
        item.payload_ref = item.id;
    }

    std::lock_guard lock(mutex_);
    const auto key = item.key();

    std::optional<QueueItem> previous;
    if (auto it = items_.find(key); it != items_.end()) {
        if (it->second.status == QueueStatus::InFlight) {
            return Err<void>(ErrorKind::Busy, "Queue item is in flight: " + describe_key(key));
        }
        previous = it->second;
    }

    item.status = QueueStatus::Pending;
    item.attempt_count = 0;
    item.last_error.clear();
    item.next_attempt_at = std::max(item.next_attempt_at, now);
    item.seq = previous ? previous->seq : next_seq_++;
    items_[key] = item;

    if (auto res = persist_locked(); res.is_error()) {
        if (previous) {
            items_[key] = *previous;
        } else {
            items_.erase(key);
        }
        return res;
    }
    return Ok();
}

std::vector<QueueItem> SyncQueue::dequeue_batch(Direction direction, std::size_t limit, TimePoint now) const {
    std::vector<QueueItem> batch;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [key, item] : items_) {
            if (is_due(item, direction, now)) {
                batch.push_back(item);
            }
        }
    }

    std::sort(batch.begin(), batch.end(), [](const QueueItem& lhs, const QueueItem& rhs) {
        if (lhs.next_attempt_at != rhs.next_attempt_at) {
            return lhs.next_attempt_at < rhs.next_attempt_at;
        }
        return lhs.seq < rhs.seq;
    });

    if (batch.size() > limit) {
        batch.resize(limit);
    }
    return batch;
}

bool SyncQueue::has_due(Direction direction, TimePoint now) const {
    std::lock_guard lock(mutex_);
    return std::any_of(items_.begin(), items_.end(), [&](const auto& entry) {
        return is_due(entry.second, direction, now);
    });
}

Result<void> SyncQueue::mark_in_flight(const QueueKey& key) {
    std::lock_guard lock(mutex_);
    auto it = items_.find(key);
    if (it == items_.end()) {
        return Err<void>(ErrorKind::NotFound, "Queue item not found: " + describe_key(key));
    }
    if (it->second.status != QueueStatus::Pending && it->second.status != QueueStatus::Failed) {
        return Err<void>(ErrorKind::Busy, std::string("Queue item is ") +
                         TypeNames::to_string(it->second.status) + ": " + describe_key(key));
    }
    return update_locked(key, [](QueueItem& item) {
        item.status = QueueStatus::InFlight;
    });
}

Result<void> SyncQueue::mark_succeeded(const QueueKey& key) {
    std::lock_guard lock(mutex_);
    auto it = items_.find(key);
    if (it == items_.end()) {
        return Err<void>(ErrorKind::NotFound, "Queue item not found: " + describe_key(key));
    }

    QueueItem removed = std::move(it->second);
    items_.erase(it);

    if (auto res = persist_locked(); res.is_error()) {
        // Back to pending; a second upload is idempotent on the server
        removed.status = QueueStatus::Pending;
        items_.emplace(key, std::move(removed));
        return res;
    }
    return Ok();
}

Result<QueueStatus> SyncQueue::mark_failed(const QueueKey& key,
                                           const Error& error,
                                           const RetryPolicy& policy,
                                           TimePoint now) {
    std::lock_guard lock(mutex_);
    if (items_.find(key) == items_.end()) {
        return Err<QueueStatus>(ErrorKind::NotFound, "Queue item not found: " + describe_key(key));
    }

    QueueStatus outcome = QueueStatus::Failed;
    auto res = update_locked(key, [&](QueueItem& item) {
        item.attempt_count += 1;
        item.last_error = describe(error);
        if (error.kind == ErrorKind::Rejected || policy.is_dead(item.attempt_count)) {
            item.status = QueueStatus::Dead;
        } else {
            item.status = QueueStatus::Failed;
            item.next_attempt_at = now + policy.next_delay(item.attempt_count, salt_for(key));
        }
        outcome = item.status;
    });
    if (res.is_error()) {
        return Err<QueueStatus>(res.error());
    }
    return Ok(outcome);
}

Result<void> SyncQueue::release(const QueueKey& key) {
    std::lock_guard lock(mutex_);
    auto it = items_.find(key);
    if (it == items_.end()) {
        return Err<void>(ErrorKind::NotFound, "Queue item not found: " + describe_key(key));
    }
    if (it->second.status != QueueStatus::InFlight) {
        return Ok();
    }
    // Pending in memory even when the write fails: load() turns an in-flight
    // entry on disk back into pending, so both views agree.
    it->second.status = QueueStatus::Pending;
    return persist_locked();
}

std::vector<QueueItem> SyncQueue::dead_letters() const {
    std::vector<QueueItem> dead;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [key, item] : items_) {
            if (item.status == QueueStatus::Dead) {
                dead.push_back(item);
            }
        }
    }
    std::sort(dead.begin(), dead.end(), [](const QueueItem& lhs, const QueueItem& rhs) {
        return lhs.seq < rhs.seq;
    });
    return dead;
}

Result<void> SyncQueue::retry_dead_letter(const QueueKey& key, TimePoint now) {
    std::lock_guard lock(mutex_);
    auto it = items_.find(key);
    if (it == items_.end() || it->second.status != QueueStatus::Dead) {
        return Err<void>(ErrorKind::NotFound, "No dead-lettered item: " + describe_key(key));
    }
    return update_locked(key, [now](QueueItem& item) {
        item.status = QueueStatus::Pending;
        item.attempt_count = 0;
        item.next_attempt_at = now;
    });
}

Result<void> SyncQueue::discard_dead_letter(const QueueKey& key) {
    std::lock_guard lock(mutex_);
    auto it = items_.find(key);
    if (it == items_.end() || it->second.status != QueueStatus::Dead) {
        return Err<void>(ErrorKind::NotFound, "No dead-lettered item: " + describe_key(key));
    }

    QueueItem removed = std::move(it->second);
    items_.erase(it);

    if (auto res = persist_locked(); res.is_error()) {
        items_.emplace(key, std::move(removed));
        return res;
    }
    spdlog::info("Discarded dead-lettered item {}", describe_key(key));
    return Ok();
}

std::optional<QueueItem> SyncQueue::find(const QueueKey& key) const {
    std::lock_guard lock(mutex_);
    auto it = items_.find(key);
    if (it == items_.end()) {
        return std::nullopt;
    }
    return it->second;
}

PendingCounts SyncQueue::pending_counts() const {
    std::lock_guard lock(mutex_);
    PendingCounts counts;
    for (const auto& [key, item] : items_) {
        switch (item.status) {
            case QueueStatus::Pending:
            case QueueStatus::InFlight:
                if (item.direction == Direction::Upload) {
                    ++counts.uploads;
                } else {
                    ++counts.downloads;
                }
                break;
            case QueueStatus::Failed:
                ++counts.failed;
                break;
            case QueueStatus::Dead:
                ++counts.dead;
                break;
        }
    }
    return counts;
}

std::size_t SyncQueue::size() const {
    std::lock_guard lock(mutex_);
    return items_.size();
}

Result<void> SyncQueue::clear() {
    std::lock_guard lock(mutex_);
    auto previous = std::move(items_);
    items_.clear();
    if (auto res = persist_locked(); res.is_error()) {
        items_ = std::move(previous);
        return res;
    }
    return Ok();
}

Result<void> SyncQueue::persist_locked() const {
    std::vector<const QueueItem*> ordered;
    ordered.reserve(items_.size());
    for (const auto& [key, item] : items_) {
        ordered.push_back(&item);
    }
    std::sort(ordered.begin(), ordered.end(), [](const QueueItem* lhs, const QueueItem* rhs) {
        return lhs->seq < rhs->seq;
    });

    json items = json::array();
    for (const auto* item : ordered) {
        items.push_back(*item);
    }
    return file_.write(json{{"version", kFormatVersion}, {"items", std::move(items)}});
}

} // namespace fieldsync::sync
