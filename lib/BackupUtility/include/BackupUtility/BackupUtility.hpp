#pragma once

#include "BackupCleaner/BackupCleaner.hpp"
#include "CopyEngine/TreeCopier.hpp"
#include "FileCopier/CopyRunContext.hpp"
#include "Logger/Logger.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief Raised when the backup configuration is missing, malformed or points at unusable directories.
 */
class ConfigurationError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Configuration parameters for backup operations.
 */
struct BackupConfig
{
    fs::path sourceDir;         /**< Source directory to back up */
    fs::path destinationRoot;   /**< Directory holding the snapshots */
    fs::path databaseFile;      /**< SQLite run journal, defaults to <destinationRoot>/backup.db */

    std::string snapshotPrefix; /**< Name prefix of snapshot directories */

    unsigned int threadCount;               /**< Worker threads copying files */
    unsigned int maxRetries;                /**< Copy attempts per file */
    std::chrono::milliseconds retryDelay;   /**< Base backoff delay between attempts */
    std::vector<std::string> exclusionPatterns; /**< Full-path regular expressions of skipped entries */
    std::size_t maxBackups;                 /**< Snapshots kept by the retention policy */
    std::chrono::milliseconds drainTimeout; /**< Upper bound for waiting on outstanding copies */

    bool verbose;               /**< Enable debug log output */

    std::function<void(const BackupProgress&)> onProgress;  /**< Optional callback for progress notifications */
    std::function<void(const LogMessage&)> onLog;           /**< Optional log sink */

    /**
     * @brief Initialize configuration with default values.
     */
    BackupConfig();
};

/**
 * @brief Result of a complete backup run.
 */
struct BackupRunResult
{
    fs::path snapshotPath;              /**< Snapshot directory written by this run */
    std::string startedAt;              /**< Start timestamp, yyyy-MM-dd_HHmm_ss */
    std::chrono::milliseconds duration; /**< Wall-clock duration of the copy */
    CopyReport copyReport;              /**< Copy status and failed files */
    CleanupResult cleanupResult;        /**< Outcome of the retention cleanup */
    bool journaled;                     /**< Run was stored in the run journal */

    BackupRunResult()
        : duration(0)
        , cleanupResult{false, false}
        , journaled(false)
    {
    }
};

/**
 * @brief Execute a backup run based on provided configuration.
 *
 * Validates the configuration, removes snapshots beyond the retention limit, creates
 * a new timestamped snapshot, mirrors the source tree into it with the concurrent copy
 * engine and records the run in the journal.
 *
 * @param[in] configuration Configuration parameters for the backup operation
 * @return Report of the run; failed files are reported, never thrown
 * @throws ConfigurationError if the configuration is invalid
 * @throws fs::filesystem_error if the snapshot or one of its directories cannot be created
 */
BackupRunResult RunBackup(const BackupConfig& configuration);

/**
 * @brief Execute a backup run with a caller-provided tree copier.
 *
 * @param[in] configuration Configuration parameters for the backup operation
 * @param[in] treeCopier Copier mirroring the source tree into the snapshot
 * @return Report of the run
 * @throws ConfigurationError if the configuration is invalid
 * @throws fs::filesystem_error if the snapshot cannot be created
 */
BackupRunResult RunBackup(const BackupConfig& configuration, TreeCopier& treeCopier);
