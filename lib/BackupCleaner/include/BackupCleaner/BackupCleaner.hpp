#pragma once

#include "Logger/Logger.hpp"

#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief Outcome of a retention cleanup.
 */
struct CleanupResult
{
    bool anyDeleted;        /**< At least one path of an expired snapshot was removed */
    bool anyDeletionFailed; /**< At least one path of an expired snapshot could not be removed */
};

/**
 * @brief Application component keeping only the most recently modified snapshots.
 */
class BackupCleaner
{
  public:
    /**
     * @brief Construct a cleaner.
     *
     * @param[in] logger Logger for deletions and failures
     */
    explicit BackupCleaner(Logger& logger);

    /**
     * @brief Delete the oldest snapshot directories beyond the retention limit.
     *
     * Snapshots are the immediate subdirectories of the backup root ordered by last write
     * time, oldest first, with the directory name as tie-break. Failures on single paths
     * are recorded and do not stop the cleanup.
     *
     * @param[in] backupRoot Directory holding the snapshots
     * @param[in] maxBackups Number of snapshots to keep
     * @return Whether anything was deleted and whether any deletion failed
     */
    CleanupResult Cleanup(const fs::path& backupRoot, std::size_t maxBackups);

    /**
     * @brief List snapshot directories, oldest first.
     *
     * @param[in] backupRoot Directory holding the snapshots
     * @return Sorted snapshot directories, empty if the root cannot be listed
     */
    std::vector<fs::path> ListSnapshots(const fs::path& backupRoot);

  private:
    CleanupResult DeleteSnapshot(const fs::path& snapshotDirectory);

    Logger& _logger;
};
