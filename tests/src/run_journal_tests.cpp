/**
 * @file run_journal_tests.cpp
 * @brief Tests for the SQLite run journal.
 */
#include "RunJournal/RunJournal.hpp"
#include "helpers/TestHelpers.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

using ::testing::ElementsAre;

class RunJournalTest : public FilesystemTest
{
  protected:
    fs::path databaseFile;

    void SetUp() override
    {
        FilesystemTest::SetUp();
        databaseFile = testRoot / "backup.db";
    }
};

TEST_F(RunJournalTest, RecordRun_StoresRunAndFailedFiles)
{
    // Arrange
    SQLiteConnection connection(databaseFile);
    RunJournal journal(connection);
    ASSERT_TRUE(journal.InitializeSchema());

    // Act
    const bool recorded =
        journal.RecordRun({"backup_2026-01-02_0304_05", "2026-01-02_0304_05", 1234, "Completed", 2}, {"/src/a.txt", "/src/b.txt"});

    // Assert
    ASSERT_TRUE(recorded);
    const std::vector<RunRecord> runs = journal.GetRuns();
    ASSERT_EQ(1u, runs.size());
    EXPECT_EQ("backup_2026-01-02_0304_05", runs[0].snapshot);
    EXPECT_EQ("2026-01-02_0304_05", runs[0].startedAt);
    EXPECT_EQ(1234, runs[0].durationMs);
    EXPECT_EQ("Completed", runs[0].status);
    EXPECT_EQ(2, runs[0].failedCount);
    EXPECT_THAT(journal.GetFailedFiles("backup_2026-01-02_0304_05"), ElementsAre("/src/a.txt", "/src/b.txt"));
}

TEST_F(RunJournalTest, GetRuns_ReturnsNewestFirst)
{
    SQLiteConnection connection(databaseFile);
    RunJournal journal(connection);
    ASSERT_TRUE(journal.InitializeSchema());

    ASSERT_TRUE(journal.RecordRun({"backup_first", "t1", 10, "Completed", 0}, {}));
    ASSERT_TRUE(journal.RecordRun({"backup_second", "t2", 20, "DrainTimedOut", 1}, {"/src/slow.bin"}));

    const std::vector<RunRecord> runs = journal.GetRuns();
    ASSERT_EQ(2u, runs.size());
    EXPECT_EQ("backup_second", runs[0].snapshot);
    EXPECT_EQ("backup_first", runs[1].snapshot);
    EXPECT_TRUE(journal.GetFailedFiles("backup_first").empty());
}

TEST_F(RunJournalTest, InitializeSchema_IsIdempotentAndDataSurvivesReopen)
{
    {
        SQLiteConnection connection(databaseFile);
        RunJournal journal(connection);
        ASSERT_TRUE(journal.InitializeSchema());
        ASSERT_TRUE(journal.RecordRun({"backup_kept", "t", 1, "Completed", 0}, {}));
    }

    SQLiteConnection connection(databaseFile);
    RunJournal journal(connection);
    ASSERT_TRUE(journal.InitializeSchema());

    const std::vector<RunRecord> runs = journal.GetRuns();
    ASSERT_EQ(1u, runs.size());
    EXPECT_EQ("backup_kept", runs[0].snapshot);
}

TEST_F(RunJournalTest, RecordRun_WithoutSchema_ReturnsFalse)
{
    SQLiteConnection connection(databaseFile);
    RunJournal journal(connection);

    EXPECT_FALSE(journal.RecordRun({"backup_x", "t", 1, "Completed", 0}, {}));
}

TEST_F(RunJournalTest, SQLiteTransaction_WithoutCommit_RollsBack)
{
    SQLiteConnection connection(databaseFile);
    RunJournal journal(connection);
    ASSERT_TRUE(journal.InitializeSchema());

    {
        SQLiteTransaction transaction(connection);
        connection.Execute("INSERT INTO runs(snapshot, started_at, duration_ms, status, failed_count) "
                           "VALUES('backup_rolled_back', 't', 0, 'Completed', 0);");
    }

    EXPECT_TRUE(journal.GetRuns().empty());
}

TEST_F(RunJournalTest, SQLiteConnection_InvalidStatement_Throws)
{
    SQLiteConnection connection(databaseFile);

    EXPECT_THROW(connection.Execute("NOT VALID SQL;"), std::runtime_error);
    EXPECT_THROW(connection.Prepare("SELECT * FROM missing_table;"), std::runtime_error);
}

TEST_F(RunJournalTest, SQLiteStatement_BindsRowsAndRejectsQueryAsWrite)
{
    SQLiteConnection connection(databaseFile);
    connection.Execute("CREATE TABLE paths(id INTEGER, path TEXT);");

    auto insert = connection.Prepare("INSERT INTO paths(id, path) VALUES(?1, ?2);");
    for (std::int64_t id = 1; id <= 2; ++id)
    {
        insert.BindInt64(1, id);
        insert.BindText(2, "dir/file" + std::to_string(id) + ".txt");
        insert.Execute();
        insert.Reset();
    }

    auto select = connection.Prepare("SELECT id, path FROM paths ORDER BY id;");
    std::vector<std::string> paths;
    while (true == select.FetchRow())
    {
        paths.push_back(std::to_string(select.ColumnInt64(0)) + ":" + select.ColumnText(1));
    }
    EXPECT_THAT(paths, ElementsAre("1:dir/file1.txt", "2:dir/file2.txt"));

    auto query = connection.Prepare("SELECT path FROM paths;");
    EXPECT_THROW(query.Execute(), std::runtime_error);
}

TEST_F(RunJournalTest, SQLiteStatement_ConstraintViolation_Throws)
{
    SQLiteConnection connection(databaseFile);
    connection.Execute("CREATE TABLE snapshots(name TEXT PRIMARY KEY);");

    auto insert = connection.Prepare("INSERT INTO snapshots(name) VALUES(?1);");
    insert.BindText(1, "backup_2024-03-07_0905_03");
    insert.Execute();
    insert.Reset();
    insert.BindText(1, "backup_2024-03-07_0905_03");

    EXPECT_THROW(insert.Execute(), std::runtime_error);
}
