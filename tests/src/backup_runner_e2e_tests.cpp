/**
 * @file backup_runner_e2e_tests.cpp
 * @brief End-to-end tests of RunBackup: retention, snapshot creation, copy and journal.
 */
#include "BackupUtility/BackupUtility.hpp"
#include "RunJournal/RunJournal.hpp"
#include "helpers/TestHelpers.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

using namespace std::chrono_literals;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Invoke;
using ::testing::MatchesRegex;
using ::testing::Return;
using ::testing::UnorderedElementsAre;

class MockTreeCopier : public TreeCopier
{
  public:
    MOCK_METHOD(CopyReport, CopyFiles, (const fs::path& sourceDirectory, const fs::path& destinationDirectory), (override));
};

class E2ERunBackupTest : public FilesystemTest
{
  protected:
    LogCapture logCapture;
    fs::path sourceDir;
    fs::path backupRoot;

    void SetUp() override
    {
        FilesystemTest::SetUp();
        sourceDir = testRoot / "source";
        backupRoot = testRoot / "backups";

        createFile(sourceDir / "file1.txt", "hello");
        createFile(sourceDir / "dir" / "file2.txt", "world");
        createFile(sourceDir / "dir" / "scratch.tmp", "temporary");
    }

    BackupConfig MakeConfig()
    {
        BackupConfig config;
        config.sourceDir = sourceDir;
        config.destinationRoot = backupRoot;
        config.threadCount = 2;
        config.retryDelay = 1ms;
        config.onLog = logCapture.Sink();
        return config;
    }

    std::vector<std::string> SnapshotNames()
    {
        std::vector<std::string> names;
        for (const auto& name : GetDirectoryEntries(backupRoot))
        {
            if (true == fs::is_directory(backupRoot / name))
            {
                names.push_back(name);
            }
        }
        return names;
    }
};

/* ============================================================================ */
/* FULL RUN */
/* ============================================================================ */

TEST_F(E2ERunBackupTest, RunBackup_CopiesTreeIntoNewSnapshotAndJournalsRun)
{
    // Act
    const BackupRunResult result = RunBackup(MakeConfig());

    // Assert
    EXPECT_TRUE(result.copyReport.Succeeded());
    EXPECT_TRUE(result.journaled);
    EXPECT_EQ(fs::canonical(backupRoot), result.snapshotPath.parent_path());
    EXPECT_THAT(result.startedAt, MatchesRegex("[0-9]{4}-[0-9]{2}-[0-9]{2}_[0-9]{4}_[0-9]{2}"));
    EXPECT_EQ(0u, result.snapshotPath.filename().string().rfind("backup_" + result.startedAt, 0));

    EXPECT_EQ("hello", readFile(result.snapshotPath / "file1.txt"));
    EXPECT_EQ("world", readFile(result.snapshotPath / "dir" / "file2.txt"));
    EXPECT_FALSE(fs::exists(result.snapshotPath / "dir" / "scratch.tmp")) << "Default exclusions skip *.tmp";

    SQLiteConnection connection(backupRoot / "backup.db");
    RunJournal journal(connection);
    const std::vector<RunRecord> runs = journal.GetRuns();
    ASSERT_EQ(1u, runs.size());
    EXPECT_EQ(result.snapshotPath.filename().string(), runs[0].snapshot);
    EXPECT_EQ("Completed", runs[0].status);
    EXPECT_EQ(0, runs[0].failedCount);
}

TEST_F(E2ERunBackupTest, RunBackup_CustomPrefixAndExclusions)
{
    BackupConfig config = MakeConfig();
    config.snapshotPrefix = "docker-backup";
    config.exclusionPatterns = {R"(.*/dir)"};

    const BackupRunResult result = RunBackup(config);

    EXPECT_TRUE(result.copyReport.Succeeded());
    EXPECT_EQ(0u, result.snapshotPath.filename().string().rfind("docker-backup_", 0));
    EXPECT_EQ(std::vector<std::string>{"file1.txt"}, GetDirectoryEntries(result.snapshotPath, DirectoryListingMode::Recursive));
}

TEST_F(E2ERunBackupTest, RunBackup_BackToBackRunsNeverShareASnapshot)
{
    const BackupRunResult first = RunBackup(MakeConfig());
    fs::remove(sourceDir / "file1.txt");
    createFile(sourceDir / "file3.txt", "second run");
    const BackupRunResult second = RunBackup(MakeConfig());

    ASSERT_NE(first.snapshotPath, second.snapshotPath);
    EXPECT_THAT(GetDirectoryEntries(first.snapshotPath, DirectoryListingMode::Recursive),
                UnorderedElementsAre("file1.txt", "dir", "dir/file2.txt"));
    EXPECT_FALSE(fs::exists(first.snapshotPath / "file3.txt"));
    EXPECT_FALSE(fs::exists(second.snapshotPath / "file1.txt"));
    EXPECT_EQ("second run", readFile(second.snapshotPath / "file3.txt"));
    EXPECT_EQ(0u, second.snapshotPath.filename().string().rfind("backup_" + second.startedAt, 0));

    SQLiteConnection connection(backupRoot / "backup.db");
    RunJournal journal(connection);
    const std::vector<RunRecord> runs = journal.GetRuns();
    ASSERT_EQ(2u, runs.size());
    EXPECT_NE(runs[0].snapshot, runs[1].snapshot);
}

/* ============================================================================ */
/* RETENTION */
/* ============================================================================ */

TEST_F(E2ERunBackupTest, RunBackup_RetentionRunsBeforeTheNewSnapshotIsCreated)
{
    // Arrange
    for (int i = 0; i < 4; ++i)
    {
        const fs::path old = backupRoot / ("backup_old" + std::to_string(i));
        createFile(old / "file1.txt", "old");
        fs::last_write_time(old, fs::file_time_type::clock::now() - std::chrono::hours(10 - i));
    }
    BackupConfig config = MakeConfig();
    config.maxBackups = 2;

    // Act
    const BackupRunResult result = RunBackup(config);

    // Assert
    EXPECT_TRUE(result.cleanupResult.anyDeleted);
    EXPECT_FALSE(result.cleanupResult.anyDeletionFailed);
    // Two kept by the limit, plus the snapshot of this run
    EXPECT_THAT(SnapshotNames(), UnorderedElementsAre("backup_old2", "backup_old3", result.snapshotPath.filename().string()));
}

/* ============================================================================ */
/* INJECTED COPIER */
/* ============================================================================ */

TEST_F(E2ERunBackupTest, RunBackup_PassesCanonicalSourceAndSnapshotToCopier)
{
    MockTreeCopier copier;
    fs::path copiedTo;
    EXPECT_CALL(copier, CopyFiles(fs::canonical(sourceDir), _))
        .WillOnce(Invoke(
            [&copiedTo](const fs::path&, const fs::path& destination)
            {
                copiedTo = destination;
                return CopyReport();
            }));

    const BackupRunResult result = RunBackup(MakeConfig(), copier);

    EXPECT_EQ(result.snapshotPath, copiedTo);
    EXPECT_TRUE(fs::is_directory(copiedTo));
    EXPECT_TRUE(result.copyReport.Succeeded());
}

TEST_F(E2ERunBackupTest, RunBackup_TimedOutCopyIsJournaledWithFailures)
{
    CopyReport timedOut;
    timedOut.status = CopyStatus::DrainTimedOut;
    timedOut.failedFiles = {sourceDir / "dir" / "file2.txt"};

    MockTreeCopier copier;
    EXPECT_CALL(copier, CopyFiles(_, _)).WillOnce(Return(timedOut));

    const BackupRunResult result = RunBackup(MakeConfig(), copier);

    EXPECT_FALSE(result.copyReport.Succeeded());
    ASSERT_TRUE(result.journaled);

    SQLiteConnection connection(backupRoot / "backup.db");
    RunJournal journal(connection);
    const std::vector<RunRecord> runs = journal.GetRuns();
    ASSERT_EQ(1u, runs.size());
    EXPECT_EQ("DrainTimedOut", runs[0].status);
    EXPECT_EQ(1, runs[0].failedCount);
    EXPECT_THAT(journal.GetFailedFiles(runs[0].snapshot), ElementsAre((sourceDir / "dir" / "file2.txt").string()));
}

TEST_F(E2ERunBackupTest, RunBackup_UnwritableJournalDoesNotFailBackup)
{
    BackupConfig config = MakeConfig();
    // A directory where the database file should be
    fs::create_directories(testRoot / "journal.db");
    config.databaseFile = testRoot / "journal.db";

    MockTreeCopier copier;
    EXPECT_CALL(copier, CopyFiles(_, _)).WillOnce(Return(CopyReport()));

    const BackupRunResult result = RunBackup(config, copier);

    EXPECT_TRUE(result.copyReport.Succeeded());
    EXPECT_FALSE(result.journaled);
    EXPECT_GE(logCapture.CountContaining(LogLevel::Warning, "journal"), 1u);
}

/* ============================================================================ */
/* ERROR HANDLING */
/* ============================================================================ */

TEST_F(E2ERunBackupTest, RunBackup_WithNonExistentSource_ThrowsConfigurationError)
{
    BackupConfig config = MakeConfig();
    config.sourceDir = testRoot / "non_existent_dir";

    EXPECT_THROW(RunBackup(config), ConfigurationError);
    EXPECT_TRUE(SnapshotNames().empty());
}

TEST_F(E2ERunBackupTest, RunBackup_FailedFileIsReportedAndJournaled)
{
    MockTreeCopier copier;
    EXPECT_CALL(copier, CopyFiles(_, _))
        .WillOnce(Invoke(
            [](const fs::path& source, const fs::path&)
            {
                CopyReport report;
                report.failedFiles = {source / "file1.txt"};
                return report;
            }));

    const BackupRunResult result = RunBackup(MakeConfig(), copier);

    EXPECT_EQ(CopyStatus::Completed, result.copyReport.status);
    ASSERT_EQ(1u, result.copyReport.failedFiles.size());
    EXPECT_EQ("file1.txt", result.copyReport.failedFiles[0].filename().string());
    EXPECT_TRUE(result.journaled);
}
