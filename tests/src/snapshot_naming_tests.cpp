/**
 * @file snapshot_naming_tests.cpp
 * @brief Unit tests for timestamps, snapshot directory creation and duration text.
 */
#include "SnapshotDirectoryProvider/SnapshotDirectoryProvider.hpp"
#include "TimestampProvider/DurationFormatter.hpp"
#include "TimestampProvider/TimestampProvider.hpp"
#include "helpers/TestHelpers.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <ctime>
#include <string>

using namespace std::chrono_literals;
using ::testing::MatchesRegex;

TEST(TimestampProviderTest, Format_UsesFilesystemSafeLayout)
{
    std::tm timeStruct{};
    timeStruct.tm_year = 2024 - 1900;
    timeStruct.tm_mon = 2;
    timeStruct.tm_mday = 7;
    timeStruct.tm_hour = 9;
    timeStruct.tm_min = 5;
    timeStruct.tm_sec = 3;
    timeStruct.tm_isdst = -1;
    const std::time_t time = std::mktime(&timeStruct);

    TimestampProvider provider;
    EXPECT_EQ("2024-03-07_0905_03", provider.Format(time));
}

TEST(TimestampProviderTest, NowFilesystemSafe_HasNoSeparatorsOrColons)
{
    TimestampProvider provider;
    EXPECT_THAT(provider.NowFilesystemSafe(), MatchesRegex("[0-9]{4}-[0-9]{2}-[0-9]{2}_[0-9]{4}_[0-9]{2}"));
}

class SnapshotDirectoryProviderTest : public FilesystemTest
{
};

TEST_F(SnapshotDirectoryProviderTest, GetOrCreate_CreatesPrefixedTimestampDirectoryOnce)
{
    TimestampProvider timestampProvider;
    SnapshotDirectoryProvider provider(testRoot, "nightly", timestampProvider);

    const fs::path first = provider.GetOrCreate();
    const fs::path second = provider.GetOrCreate();

    EXPECT_EQ(first, second);
    EXPECT_EQ(testRoot, first.parent_path());
    EXPECT_TRUE(fs::is_directory(first));
    EXPECT_THAT(first.filename().string(), MatchesRegex("nightly_[0-9]{4}-[0-9]{2}-[0-9]{2}_[0-9]{4}_[0-9]{2}"));
    EXPECT_EQ(1u, GetDirectoryEntries(testRoot).size());
}

TEST_F(SnapshotDirectoryProviderTest, GetOrCreate_ExistingNameGetsNumericSuffix)
{
    TimestampProvider timestampProvider;
    const std::string timestamp = timestampProvider.NowFilesystemSafe();
    // Occupy the current and the next second so the collision holds across a clock tick
    for (const std::string& taken : {timestamp, timestampProvider.Format(std::time(nullptr) + 1)})
    {
        createFile(testRoot / ("nightly_" + taken) / "earlier.txt", "earlier run");
    }
    SnapshotDirectoryProvider provider(testRoot, "nightly", timestampProvider);

    const fs::path snapshot = provider.GetOrCreate();

    EXPECT_THAT(snapshot.filename().string(), MatchesRegex("nightly_" + provider.Timestamp() + "_1"));
    EXPECT_TRUE(GetDirectoryEntries(snapshot).empty());
}

TEST_F(SnapshotDirectoryProviderTest, Timestamp_MatchesSnapshotName)
{
    TimestampProvider timestampProvider;
    SnapshotDirectoryProvider provider(testRoot, "nightly", timestampProvider);
    EXPECT_TRUE(provider.Timestamp().empty());

    const fs::path snapshot = provider.GetOrCreate();

    EXPECT_EQ("nightly_" + provider.Timestamp(), snapshot.filename().string());
}

TEST_F(SnapshotDirectoryProviderTest, GetOrCreate_CreatesMissingDestinationRoot)
{
    TimestampProvider timestampProvider;
    SnapshotDirectoryProvider provider(testRoot / "a" / "b", DefaultSnapshotPrefix, timestampProvider);

    const fs::path snapshot = provider.GetOrCreate();

    EXPECT_TRUE(fs::is_directory(snapshot));
    EXPECT_EQ(0u, snapshot.filename().string().rfind("backup_", 0));
}

TEST(DurationFormatterTest, FormatDuration_MinutesAndSeconds)
{
    EXPECT_EQ("1 minute, 5 seconds", FormatDuration(65s));
    EXPECT_EQ("2 minutes, 1 second", FormatDuration(121s));
    EXPECT_EQ("3 minutes", FormatDuration(180s));
}

TEST(DurationFormatterTest, FormatDuration_MillisecondsOnlyBelowOneSecond)
{
    EXPECT_EQ("250 milliseconds", FormatDuration(250ms));
    EXPECT_EQ("1 millisecond", FormatDuration(1ms));
    EXPECT_EQ("1 second", FormatDuration(1500ms));
}

TEST(DurationFormatterTest, FormatDuration_Zero)
{
    EXPECT_EQ("0 seconds", FormatDuration(0ms));
}
