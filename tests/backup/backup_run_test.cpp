#include "mbk/backup/backup_run.hpp"

#include <gtest/gtest.h>

using mbk::ErrorCode;
using mbk::backup::BackupRun;
using mbk::backup::BackupStatus;

TEST(BackupRunTest, FollowsPhaseOrder) {
    BackupRun run("BK_1");
    EXPECT_EQ(run.status(), BackupStatus::Queued);

    for (auto next : {BackupStatus::StoppingMySQL, BackupStatus::Compressing, BackupStatus::Encrypting,
                      BackupStatus::Transferring, BackupStatus::Verifying, BackupStatus::StartingMySQL,
                      BackupStatus::Completed}) {
        ASSERT_TRUE(run.transition_to(next, "step").is_ok()) << to_string(next);
    }
    EXPECT_EQ(run.snapshot().overall_progress, 1.0);
}

TEST(BackupRunTest, EncryptionIsOptional) {
    BackupRun run("BK_2");
    ASSERT_TRUE(run.transition_to(BackupStatus::StoppingMySQL, "").is_ok());
    ASSERT_TRUE(run.transition_to(BackupStatus::Compressing, "").is_ok());
    EXPECT_TRUE(run.transition_to(BackupStatus::Transferring, "").is_ok());
}

TEST(BackupRunTest, RejectsSkippedPhases) {
    BackupRun run("BK_3");
    auto skipped = run.transition_to(BackupStatus::Transferring, "");
    ASSERT_TRUE(skipped.is_error());
    EXPECT_EQ(skipped.error().code, ErrorCode::Validation);
    EXPECT_EQ(run.status(), BackupStatus::Queued);

    ASSERT_TRUE(run.transition_to(BackupStatus::StoppingMySQL, "").is_ok());
    EXPECT_TRUE(run.transition_to(BackupStatus::Queued, "").is_error());
    EXPECT_TRUE(run.transition_to(BackupStatus::Verifying, "").is_error());
}

TEST(BackupRunTest, TerminalStatesAreFinal) {
    BackupRun run("BK_4");
    ASSERT_TRUE(run.transition_to(BackupStatus::StoppingMySQL, "").is_ok());
    ASSERT_TRUE(run.transition_to(BackupStatus::Failed, "stop failed").is_ok());

    EXPECT_TRUE(run.transition_to(BackupStatus::Compressing, "").is_error());
    EXPECT_TRUE(run.transition_to(BackupStatus::Cancelled, "").is_error());
    EXPECT_EQ(run.status(), BackupStatus::Failed);
    EXPECT_EQ(run.snapshot().current_operation, "stop failed");
}

TEST(BackupRunTest, CancelReachableFromAnyActivePhase) {
    BackupRun run("BK_5");
    EXPECT_TRUE(run.transition_to(BackupStatus::Cancelled, "").is_ok());
    EXPECT_TRUE(mbk::backup::is_terminal(run.status()));
}

TEST(BackupRunTest, ResumeEntersAtTransfer) {
    BackupRun run("BK_6");
    ASSERT_TRUE(run.resume_at_transfer("Resuming").is_ok());
    EXPECT_EQ(run.status(), BackupStatus::Transferring);
    EXPECT_TRUE(run.transition_to(BackupStatus::Verifying, "").is_ok());
    EXPECT_TRUE(run.resume_at_transfer("again").is_error());
    EXPECT_TRUE(run.transition_to(BackupStatus::Completed, "").is_ok());
}

TEST(BackupRunTest, FullRunCannotSkipMySqlStart) {
    BackupRun run("BK_8");
    for (auto next : {BackupStatus::StoppingMySQL, BackupStatus::Compressing,
                      BackupStatus::Transferring, BackupStatus::Verifying}) {
        ASSERT_TRUE(run.transition_to(next, "").is_ok()) << to_string(next);
    }
    auto skipped = run.transition_to(BackupStatus::Completed, "");
    ASSERT_TRUE(skipped.is_error());
    EXPECT_EQ(skipped.error().code, ErrorCode::Validation);
    EXPECT_EQ(run.status(), BackupStatus::Verifying);
    EXPECT_TRUE(run.transition_to(BackupStatus::StartingMySQL, "").is_ok());
}

TEST(BackupRunTest, ProgressNeverDecreases) {
    BackupRun run("BK_7");
    EXPECT_DOUBLE_EQ(run.report(0.4).overall_progress, 0.4);
    EXPECT_DOUBLE_EQ(run.report(0.2, "older").overall_progress, 0.4);
    EXPECT_EQ(run.snapshot().current_operation, "older");
    EXPECT_DOUBLE_EQ(run.report(7.0).overall_progress, 1.0);

    mbk::transfer::TransferProgress transfer;
    transfer.bytes_transferred = 10;
    transfer.total_bytes = 40;
    transfer.chunks_completed = 1;
    transfer.total_chunks = 4;
    auto snapshot = BackupRun("BK_8").report_transfer(0.5, transfer);
    EXPECT_EQ(snapshot.bytes_transferred, 10u);
    EXPECT_EQ(snapshot.current_operation, "Transferring chunk 1/4");
}

TEST(BackupRunTest, StatusNames) {
    EXPECT_EQ(to_string(BackupStatus::StoppingMySQL), "StoppingMySQL");
    EXPECT_EQ(to_string(BackupStatus::Cancelled), "Cancelled");
    EXPECT_FALSE(mbk::backup::is_terminal(BackupStatus::Verifying));
}
