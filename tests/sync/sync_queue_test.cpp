#include "fieldsync/sync/sync_queue.hpp"

#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>

using fieldsync::Clock;
using fieldsync::Direction;
using fieldsync::EntityType;
using fieldsync::Error;
using fieldsync::ErrorKind;
using fieldsync::QueueItem;
using fieldsync::QueueKey;
using fieldsync::QueueStatus;
using fieldsync::RetryConfig;
using fieldsync::sync::RetryPolicy;
using fieldsync::sync::SyncQueue;
using fieldsync::testing::TempDir;
using std::chrono::milliseconds;

namespace {

QueueItem upload(const std::string& id) {
    QueueItem item;
    item.id = id;
    item.entity_type = EntityType::Submission;
    item.direction = Direction::Upload;
    return item;
}

QueueItem download(const std::string& ref) {
    QueueItem item;
    item.id = ref;
    item.entity_type = EntityType::MediaFile;
    item.direction = Direction::Download;
    return item;
}

RetryPolicy policy(std::uint32_t max_retries = 3) {
    return RetryPolicy(RetryConfig{milliseconds(1000), milliseconds(60000), milliseconds(0)}, max_retries);
}

} // namespace

TEST(SyncQueueTest, EnqueueDedupesByKey) {
    TempDir dir;
    SyncQueue queue(dir.path());

    ASSERT_TRUE(queue.enqueue(upload("s1")).is_ok());
    ASSERT_TRUE(queue.enqueue(upload("s2")).is_ok());
    ASSERT_TRUE(queue.enqueue(upload("s1")).is_ok());

    EXPECT_EQ(queue.size(), 2u);

    // Re-enqueue keeps the original position
    auto batch = queue.dequeue_batch(Direction::Upload);
    ASSERT_EQ(batch.size(), 2u);
    EXPECT_EQ(batch[0].id, "s1");
    EXPECT_EQ(batch[1].id, "s2");
    EXPECT_EQ(batch[0].payload_ref, "s1");
}

TEST(SyncQueueTest, SameIdDifferentDirectionIsSeparateItem) {
    TempDir dir;
    SyncQueue queue(dir.path());

    QueueItem up = download("m1");
    up.direction = Direction::Upload;
    ASSERT_TRUE(queue.enqueue(up).is_ok());
    ASSERT_TRUE(queue.enqueue(download("m1")).is_ok());

    EXPECT_EQ(queue.size(), 2u);
    EXPECT_EQ(queue.dequeue_batch(Direction::Upload).size(), 1u);
    EXPECT_EQ(queue.dequeue_batch(Direction::Download).size(), 1u);
    EXPECT_EQ(queue.pending_counts().uploads, 1u);
    EXPECT_EQ(queue.pending_counts().downloads, 1u);
}

TEST(SyncQueueTest, RejectsEmptyId) {
    TempDir dir;
    SyncQueue queue(dir.path());

    auto res = queue.enqueue(upload(""));
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().kind, ErrorKind::InvalidArgument);
}

TEST(SyncQueueTest, InFlightItemCannotBeReplaced) {
    TempDir dir;
    SyncQueue queue(dir.path());
    ASSERT_TRUE(queue.enqueue(upload("s1")).is_ok());
    ASSERT_TRUE(queue.mark_in_flight(upload("s1").key()).is_ok());

    auto res = queue.enqueue(upload("s1"));
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().kind, ErrorKind::Busy);

    // Not due while in flight
    EXPECT_TRUE(queue.dequeue_batch(Direction::Upload).empty());
    EXPECT_EQ(queue.mark_in_flight(upload("s1").key()).error().kind, ErrorKind::Busy);
}

TEST(SyncQueueTest, BatchIsOrderedByDueTimeThenInsertion) {
    TempDir dir;
    SyncQueue queue(dir.path());
    const auto now = Clock::now();

    QueueItem later = upload("later");
    later.next_attempt_at = now + milliseconds(10);
    ASSERT_TRUE(queue.enqueue(later, now).is_ok());
    ASSERT_TRUE(queue.enqueue(upload("first"), now).is_ok());
    ASSERT_TRUE(queue.enqueue(upload("second"), now).is_ok());

    auto due_now = queue.dequeue_batch(Direction::Upload, SyncQueue::kNoLimit, now);
    ASSERT_EQ(due_now.size(), 2u);
    EXPECT_EQ(due_now[0].id, "first");
    EXPECT_EQ(due_now[1].id, "second");

    auto due_later = queue.dequeue_batch(Direction::Upload, SyncQueue::kNoLimit, now + milliseconds(20));
    ASSERT_EQ(due_later.size(), 3u);
    EXPECT_EQ(due_later[2].id, "later");

    auto limited = queue.dequeue_batch(Direction::Upload, 1, now + milliseconds(20));
    ASSERT_EQ(limited.size(), 1u);
    EXPECT_EQ(limited[0].id, "first");
}

TEST(SyncQueueTest, SuccessRemovesItem) {
    TempDir dir;
    SyncQueue queue(dir.path());
    const QueueKey key = upload("s1").key();
    ASSERT_TRUE(queue.enqueue(upload("s1")).is_ok());
    ASSERT_TRUE(queue.mark_in_flight(key).is_ok());
    ASSERT_TRUE(queue.mark_succeeded(key).is_ok());

    EXPECT_FALSE(queue.find(key).has_value());
    EXPECT_EQ(queue.mark_succeeded(key).error().kind, ErrorKind::NotFound);
}

TEST(SyncQueueTest, FailureSchedulesBackoffThenDeadLetters) {
    TempDir dir;
    SyncQueue queue(dir.path());
    const QueueKey key = upload("s1").key();
    const auto now = Clock::now();
    const auto retry = policy(2);
    ASSERT_TRUE(queue.enqueue(upload("s1"), now).is_ok());

    ASSERT_TRUE(queue.mark_in_flight(key).is_ok());
    auto first = queue.mark_failed(key, Error{ErrorKind::Transient, "503"}, retry, now);
    ASSERT_TRUE(first.is_ok());
    EXPECT_EQ(first.value(), QueueStatus::Failed);

    auto item = queue.find(key);
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->attempt_count, 1u);
    EXPECT_GT(item->next_attempt_at, now);
    EXPECT_EQ(item->last_error, "transient: 503");
    EXPECT_FALSE(queue.has_due(Direction::Upload, now));
    EXPECT_TRUE(queue.has_due(Direction::Upload, item->next_attempt_at));
    EXPECT_EQ(queue.pending_counts().failed, 1u);

    ASSERT_TRUE(queue.mark_in_flight(key).is_ok());
    auto second = queue.mark_failed(key, Error{ErrorKind::Timeout, "slow"}, retry, now);
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(second.value(), QueueStatus::Dead);
    EXPECT_EQ(queue.pending_counts().dead, 1u);
    EXPECT_FALSE(queue.has_due(Direction::Upload, now + milliseconds(600000)));
}

TEST(SyncQueueTest, RejectedDeadLettersImmediately) {
    TempDir dir;
    SyncQueue queue(dir.path());
    const QueueKey key = upload("s1").key();
    ASSERT_TRUE(queue.enqueue(upload("s1")).is_ok());
    ASSERT_TRUE(queue.mark_in_flight(key).is_ok());

    auto status = queue.mark_failed(key, Error{ErrorKind::Rejected, "HTTP 422"}, policy(10));
    ASSERT_TRUE(status.is_ok());
    EXPECT_EQ(status.value(), QueueStatus::Dead);
    EXPECT_EQ(queue.find(key)->attempt_count, 1u);
}

TEST(SyncQueueTest, ReleaseKeepsAttemptBudget) {
    TempDir dir;
    SyncQueue queue(dir.path());
    const QueueKey key = upload("s1").key();
    ASSERT_TRUE(queue.enqueue(upload("s1")).is_ok());
    ASSERT_TRUE(queue.mark_in_flight(key).is_ok());

    ASSERT_TRUE(queue.release(key).is_ok());
    auto item = queue.find(key);
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->status, QueueStatus::Pending);
    EXPECT_EQ(item->attempt_count, 0u);
}

TEST(SyncQueueTest, DeadLettersCanBeRetriedOrDiscarded) {
    TempDir dir;
    SyncQueue queue(dir.path());
    for (const char* id : {"a", "b"}) {
        ASSERT_TRUE(queue.enqueue(upload(id)).is_ok());
        ASSERT_TRUE(queue.mark_in_flight(upload(id).key()).is_ok());
        ASSERT_TRUE(queue.mark_failed(upload(id).key(), Error{ErrorKind::Rejected, "bad"}, policy()).is_ok());
    }

    auto dead = queue.dead_letters();
    ASSERT_EQ(dead.size(), 2u);
    EXPECT_EQ(dead[0].id, "a");

    ASSERT_TRUE(queue.retry_dead_letter(upload("a").key()).is_ok());
    auto revived = queue.find(upload("a").key());
    ASSERT_TRUE(revived.has_value());
    EXPECT_EQ(revived->status, QueueStatus::Pending);
    EXPECT_EQ(revived->attempt_count, 0u);

    ASSERT_TRUE(queue.discard_dead_letter(upload("b").key()).is_ok());
    EXPECT_FALSE(queue.find(upload("b").key()).has_value());

    // Only dead items qualify
    EXPECT_EQ(queue.discard_dead_letter(upload("a").key()).error().kind, ErrorKind::NotFound);
}

TEST(SyncQueueTest, LoadRecoversInFlightItems) {
    TempDir dir;
    {
        SyncQueue queue(dir.path());
        ASSERT_TRUE(queue.enqueue(upload("s1")).is_ok());
        ASSERT_TRUE(queue.enqueue(upload("s2")).is_ok());
        ASSERT_TRUE(queue.enqueue(download("ref-1")).is_ok());
        ASSERT_TRUE(queue.mark_in_flight(upload("s2").key()).is_ok());
        // Process dies here
    }

    SyncQueue reopened(dir.path());
    auto recovered = reopened.load();
    ASSERT_TRUE(recovered.is_ok());
    EXPECT_EQ(recovered.value(), 1u);
    EXPECT_EQ(reopened.size(), 3u);

    auto item = reopened.find(upload("s2").key());
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->status, QueueStatus::Pending);

    // Insertion order survives the restart, and new items go after it
    ASSERT_TRUE(reopened.enqueue(upload("s3")).is_ok());
    auto batch = reopened.dequeue_batch(Direction::Upload, SyncQueue::kNoLimit,
                                        Clock::now() + milliseconds(1));
    ASSERT_EQ(batch.size(), 3u);
    EXPECT_EQ(batch[0].id, "s1");
    EXPECT_EQ(batch[1].id, "s2");
    EXPECT_EQ(batch[2].id, "s3");
}

TEST(SyncQueueTest, ClearEmptiesQueue) {
    TempDir dir;
    SyncQueue queue(dir.path());
    ASSERT_TRUE(queue.enqueue(upload("s1")).is_ok());
    ASSERT_TRUE(queue.clear().is_ok());

    EXPECT_EQ(queue.size(), 0u);
    EXPECT_EQ(queue.pending_counts().total_active(), 0u);
}

TEST(SyncQueueTest, UnwritableQueueFileLeavesItemsRetryable) {
    TempDir dir;
    SyncQueue queue(dir.path());
    ASSERT_TRUE(queue.enqueue(upload("s1")).is_ok());
    ASSERT_TRUE(queue.enqueue(upload("s2")).is_ok());
    const QueueKey first = upload("s1").key();
    const QueueKey second = upload("s2").key();
    ASSERT_TRUE(queue.mark_in_flight(first).is_ok());
    ASSERT_TRUE(queue.mark_in_flight(second).is_ok());

    std::filesystem::create_directories(dir.path() / "queue.json.tmp");

    auto succeeded = queue.mark_succeeded(first);
    ASSERT_TRUE(succeeded.is_error());
    EXPECT_EQ(succeeded.error().kind, ErrorKind::Storage);
    ASSERT_TRUE(queue.find(first).has_value());
    EXPECT_EQ(queue.find(first)->status, QueueStatus::Pending);

    auto released = queue.release(second);
    ASSERT_TRUE(released.is_error());
    EXPECT_EQ(released.error().kind, ErrorKind::Storage);
    EXPECT_EQ(queue.find(second)->status, QueueStatus::Pending);

    auto rejected = queue.enqueue(upload("s3"));
    ASSERT_TRUE(rejected.is_error());
    EXPECT_FALSE(queue.find(upload("s3").key()).has_value());
}
