#pragma once

#include "Logger/Logger.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief Normalize path separators to forward slashes for cross-platform testing.
 *
 * @param[in] paths Vector of path strings to normalize
 * @return Vector of normalized path strings
 */
inline std::vector<std::string> NormalizePaths(const std::vector<std::string>& paths)
{
    std::vector<std::string> normalizedPaths;
    for (const auto& path : paths)
    {
        std::string normalizedPath = path;
        std::replace(normalizedPath.begin(), normalizedPath.end(), '\\', '/');
        normalizedPaths.push_back(normalizedPath);
    }
    return normalizedPaths;
}

enum class DirectoryListingMode
{
    Recursive,
    NonRecursive
};

/**
 * @brief Get directory contents as a sorted vector of strings.
 *
 * @param[in] directoryPath Path to the directory to traverse
 * @param[in] mode Specifies the traversal mode (Recursive or NonRecursive).
 * @return Sorted vector of normalized paths (relative if recursive, filenames if not)
 */
inline std::vector<std::string> GetDirectoryEntries(const fs::path& directoryPath,
                                                    DirectoryListingMode mode = DirectoryListingMode::NonRecursive)
{
    std::vector<std::string> contents;
    if ((fs::exists(directoryPath)) && (fs::is_directory(directoryPath)))
    {
        if (mode == DirectoryListingMode::Recursive)
        {
            for (const auto& entry : fs::recursive_directory_iterator(directoryPath))
            {
                contents.push_back(fs::relative(entry.path(), directoryPath).string());
            }
        }
        else
        {
            for (const auto& entry : fs::directory_iterator(directoryPath))
            {
                contents.push_back(entry.path().filename().string());
            }
        }
    }
    std::sort(contents.begin(), contents.end());
    return NormalizePaths(contents);
}

/**
 * @brief Thread-safe collector of log messages for assertions.
 */
class LogCapture
{
  public:
    std::function<void(const LogMessage&)> Sink()
    {
        return [this](const LogMessage& message)
        {
            std::lock_guard lock(_mutex);
            _messages.push_back(message);
        };
    }

    std::vector<LogMessage> Messages() const
    {
        std::lock_guard lock(_mutex);
        return _messages;
    }

    std::size_t CountContaining(LogLevel level, const std::string& text) const
    {
        std::lock_guard lock(_mutex);
        return static_cast<std::size_t>(std::count_if(_messages.begin(), _messages.end(), [&](const LogMessage& message)
                                                      { return (level == message.level) && (std::string::npos != message.text.find(text)); }));
    }

  private:
    mutable std::mutex _mutex;
    std::vector<LogMessage> _messages;
};

/**
 * @brief Fixture owning a scratch directory named after the running test.
 */
class FilesystemTest : public ::testing::Test
{
  protected:
    fs::path testRoot;

    void SetUp() override
    {
        const auto* testInfo = ::testing::UnitTest::GetInstance()->current_test_info();
        testRoot = fs::temp_directory_path() / (std::string("snapshot_backup_") + testInfo->test_suite_name() + "_" + testInfo->name());

        fs::remove_all(testRoot);
        fs::create_directories(testRoot);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(testRoot, ec);
    }

    void createFile(const fs::path& path, const std::string& content)
    {
        fs::create_directories(path.parent_path());
        std::ofstream ofs(path, std::ios::binary);
        ASSERT_TRUE(ofs.good()) << "Failed to create file: " << path;
        ofs << content;
    }

    std::string readFile(const fs::path& path)
    {
        std::ifstream ifs(path, std::ios::binary);
        EXPECT_TRUE(ifs.good()) << "Failed to open file: " << path;
        std::stringstream buffer;
        buffer << ifs.rdbuf();
        return buffer.str();
    }
};
