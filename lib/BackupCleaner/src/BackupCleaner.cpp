#include "BackupCleaner/BackupCleaner.hpp"

#include <algorithm>
#include <functional>
#include <system_error>
#include <utility>

BackupCleaner::BackupCleaner(Logger& logger) : _logger(logger)
{
}

CleanupResult BackupCleaner::Cleanup(const fs::path& backupRoot, std::size_t maxBackups)
{
    _logger.Info("Starting cleanup of old backups in " + backupRoot.string() + ", keeping " + std::to_string(maxBackups));

    CleanupResult result{false, false};
    const std::vector<fs::path> snapshots = ListSnapshots(backupRoot);
    _logger.Debug("Found " + std::to_string(snapshots.size()) + " backup directories");

    if (snapshots.size() <= maxBackups)
    {
        _logger.Info("No backups need to be deleted. Current count (" + std::to_string(snapshots.size()) + ") is within limit (" +
                     std::to_string(maxBackups) + ")");
        return result;
    }

    const std::size_t backupsToDelete = snapshots.size() - maxBackups;
    _logger.Info("Deleting " + std::to_string(backupsToDelete) + " old backups...");

    for (std::size_t i = 0; i < backupsToDelete; ++i)
    {
        const CleanupResult snapshotResult = DeleteSnapshot(snapshots[i]);
        result.anyDeleted = result.anyDeleted || snapshotResult.anyDeleted;
        result.anyDeletionFailed = result.anyDeletionFailed || snapshotResult.anyDeletionFailed;
    }

    _logger.Info("Backup cleanup completed");
    return result;
}

std::vector<fs::path> BackupCleaner::ListSnapshots(const fs::path& backupRoot)
{
    std::vector<std::pair<fs::file_time_type, fs::path>> snapshots;

    std::error_code errorCode;
    fs::directory_iterator iterator(backupRoot, errorCode);
    if (0 != errorCode.value())
    {
        _logger.Error("Error while listing backups in " + backupRoot.string() + ": " + errorCode.message());
        return {};
    }

    for (; (0 == errorCode.value()) && (fs::directory_iterator() != iterator); iterator.increment(errorCode))
    {
        const fs::directory_entry& entry = *iterator;
        std::error_code entryError;
        if ((true == entry.is_symlink(entryError)) || (false == entry.is_directory(entryError)))
        {
            continue;
        }

        fs::file_time_type lastWriteTime = entry.last_write_time(entryError);
        if (0 != entryError.value())
        {
            _logger.Error("Failed to get last modified time for " + entry.path().string() + ": " + entryError.message());
            lastWriteTime = fs::file_time_type::max();
        }
        snapshots.emplace_back(lastWriteTime, entry.path());
    }
    if (0 != errorCode.value())
    {
        _logger.Error("Error while listing backups in " + backupRoot.string() + ": " + errorCode.message());
    }

    std::sort(snapshots.begin(), snapshots.end(),
              [](const auto& left, const auto& right)
              {
                  if (left.first != right.first)
                  {
                      return left.first < right.first;
                  }
                  return left.second.filename() < right.second.filename();
              });

    std::vector<fs::path> sortedPaths;
    sortedPaths.reserve(snapshots.size());
    for (auto& snapshot : snapshots)
    {
        sortedPaths.push_back(std::move(snapshot.second));
    }
    return sortedPaths;
}

/**
 * @brief Remove a snapshot tree bottom-up, children before their parents.
 */
CleanupResult BackupCleaner::DeleteSnapshot(const fs::path& snapshotDirectory)
{
    _logger.Info("Attempting to delete backup directory: " + snapshotDirectory.string());
    CleanupResult result{false, false};

    std::vector<fs::path> paths{snapshotDirectory};
    std::error_code errorCode;
    fs::recursive_directory_iterator iterator(snapshotDirectory, errorCode);
    for (; (0 == errorCode.value()) && (fs::recursive_directory_iterator() != iterator); iterator.increment(errorCode))
    {
        paths.push_back(iterator->path());
    }
    if (0 != errorCode.value())
    {
        _logger.Error("Error walking backup " + snapshotDirectory.string() + ": " + errorCode.message());
        result.anyDeletionFailed = true;
    }

    std::sort(paths.begin(), paths.end(), std::greater<fs::path>());

    for (const auto& path : paths)
    {
        std::error_code removeError;
        const bool removed = fs::remove(path, removeError);
        if (0 != removeError.value())
        {
            _logger.Error("Failed to delete " + path.string() + ": " + removeError.message());
            result.anyDeletionFailed = true;
            continue;
        }
        if (true == removed)
        {
            _logger.Debug("Deleted: " + path.string());
            result.anyDeleted = true;
        }
    }

    if (false == result.anyDeletionFailed)
    {
        _logger.Info("Deleted old backup: " + snapshotDirectory.string());
    }
    return result;
}
