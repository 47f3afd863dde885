#include "fieldsync/sync/sync_session.hpp"

#include <gtest/gtest.h>

using fieldsync::CycleOutcome;
using fieldsync::Error;
using fieldsync::ErrorKind;
using fieldsync::QueueItem;
using fieldsync::SyncPhase;
using fieldsync::SyncTrigger;
using fieldsync::sync::SyncSession;

TEST(SyncSessionTest, StartsInEligibility) {
    SyncSession session{SyncTrigger::Timer};

    EXPECT_EQ(session.trigger(), SyncTrigger::Timer);
    EXPECT_EQ(session.phase(), SyncPhase::Eligibility);
    EXPECT_EQ(session.progress(), 0);
    EXPECT_EQ(session.issue_count(), 0u);
}

TEST(SyncSessionTest, EnforcesPhaseOrder) {
    SyncSession session{SyncTrigger::Manual};

    EXPECT_TRUE(session.advance_to(SyncPhase::Uploading).is_ok());
    EXPECT_TRUE(session.advance_to(SyncPhase::DownloadingMetadata).is_ok());
    EXPECT_TRUE(session.advance_to(SyncPhase::DownloadingMedia).is_ok());
    EXPECT_TRUE(session.advance_to(SyncPhase::Finalizing).is_ok());
    EXPECT_TRUE(session.advance_to(SyncPhase::Done).is_ok());

    auto illegal = session.advance_to(SyncPhase::Uploading);
    EXPECT_TRUE(illegal.is_error());
    EXPECT_EQ(session.outcome(), CycleOutcome::Success);
}

TEST(SyncSessionTest, CannotSkipPhases) {
    SyncSession session{SyncTrigger::Manual};

    EXPECT_TRUE(session.advance_to(SyncPhase::DownloadingMedia).is_error());
    ASSERT_TRUE(session.advance_to(SyncPhase::Uploading).is_ok());
    EXPECT_TRUE(session.advance_to(SyncPhase::DownloadingMedia).is_error());
    EXPECT_TRUE(session.advance_to(SyncPhase::Done).is_error());
}

TEST(SyncSessionTest, InterruptFinalizesWithIssue) {
    SyncSession session{SyncTrigger::Connectivity};
    ASSERT_TRUE(session.advance_to(SyncPhase::Uploading).is_ok());

    ASSERT_TRUE(session.interrupt("connectivity lost").is_ok());
    EXPECT_TRUE(session.interrupted());
    EXPECT_EQ(session.phase(), SyncPhase::Finalizing);

    ASSERT_TRUE(session.advance_to(SyncPhase::Done).is_ok());
    EXPECT_EQ(session.outcome(), CycleOutcome::PartialFailure);
    EXPECT_EQ(session.issues().front(), "connectivity lost");
}

TEST(SyncSessionTest, AbortFromAnyWorkingPhase) {
    SyncSession session{SyncTrigger::Manual};
    ASSERT_TRUE(session.advance_to(SyncPhase::Uploading).is_ok());
    ASSERT_TRUE(session.advance_to(SyncPhase::DownloadingMetadata).is_ok());

    auto aborted = session.abort(Error{ErrorKind::Authentication, "token expired"});
    ASSERT_TRUE(aborted.is_ok());
    EXPECT_EQ(session.phase(), SyncPhase::Aborted);
    EXPECT_EQ(session.aborted_in(), SyncPhase::DownloadingMetadata);
    ASSERT_TRUE(session.fatal_error().has_value());
    EXPECT_EQ(session.fatal_error()->kind, ErrorKind::Authentication);
    EXPECT_EQ(session.outcome(), CycleOutcome::FatalError);

    // Terminal
    EXPECT_TRUE(session.abort(Error{ErrorKind::Storage, "again"}).is_error());
    EXPECT_TRUE(session.advance_to(SyncPhase::Finalizing).is_error());
}

TEST(SyncSessionTest, ProgressIsMonotonicAndClamped) {
    SyncSession session{SyncTrigger::Manual};

    session.set_progress(40);
    session.set_progress(25);
    EXPECT_EQ(session.progress(), 40);

    session.set_progress(150);
    EXPECT_EQ(session.progress(), 100);
}

TEST(SyncSessionTest, FailuresMakePartialFailure) {
    SyncSession session{SyncTrigger::Manual};
    session.record_uploaded();
    session.record_downloaded();
    QueueItem failed;
    failed.id = "submission_1";
    session.record_failure(failed);

    ASSERT_TRUE(session.advance_to(SyncPhase::Finalizing).is_ok());
    ASSERT_TRUE(session.advance_to(SyncPhase::Done).is_ok());

    EXPECT_EQ(session.uploaded_count(), 1u);
    EXPECT_EQ(session.downloaded_count(), 1u);
    EXPECT_EQ(session.issue_count(), 1u);
    EXPECT_EQ(session.outcome(), CycleOutcome::PartialFailure);
}
