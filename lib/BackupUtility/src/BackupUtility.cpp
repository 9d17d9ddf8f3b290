#include "BackupUtility/BackupUtility.hpp"

#include "BackupUtility/ConfigLoader.hpp"
#include "CopyEngine/ConcurrentCopyEngine.hpp"
#include "RunJournal/RunJournal.hpp"
#include "SnapshotDirectoryProvider/SnapshotDirectoryProvider.hpp"
#include "TimestampProvider/DurationFormatter.hpp"
#include "TimestampProvider/TimestampProvider.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

namespace
{
constexpr unsigned int DefaultMaxRetries = 3;
constexpr std::chrono::milliseconds DefaultRetryDelay{1000};
constexpr std::size_t DefaultMaxBackups = 5;

LogLevel MinimumLogLevel(const BackupConfig& config)
{
    return (true == config.verbose) ? LogLevel::Debug : LogLevel::Info;
}

CopyEngineSettings MakeEngineSettings(const BackupConfig& config)
{
    CopyEngineSettings settings;
    settings.threadCount = config.threadCount;
    settings.retryPolicy = RetryPolicy(config.maxRetries, config.retryDelay);
    settings.exclusionPatterns = config.exclusionPatterns;
    settings.drainTimeout = config.drainTimeout;
    return settings;
}

void LogCleanupResult(Logger& logger, const CleanupResult& cleanupResult)
{
    if (false == cleanupResult.anyDeleted)
    {
        logger.Info("No backups were deleted");
    }
    if (true == cleanupResult.anyDeletionFailed)
    {
        logger.Warning("Some old backups could not be deleted. Check logs for details");
    }
    else if (true == cleanupResult.anyDeleted)
    {
        logger.Info("Old backups deleted successfully");
    }
}

/**
 * @brief Store the run in the journal. Journal failures never fail the backup.
 *
 * @return true if the run was recorded
 */
bool RecordRun(Logger& logger, const fs::path& databaseFile, const BackupRunResult& result)
{
    try
    {
        SQLiteConnection connection(databaseFile);
        RunJournal journal(connection);
        if (false == journal.InitializeSchema())
        {
            logger.Warning("Failed to initialize run journal " + databaseFile.string());
            return false;
        }

        const RunRecord record{result.snapshotPath.filename().string(), result.startedAt, result.duration.count(),
                               CopyStatusToString(result.copyReport.status),
                               static_cast<std::int64_t>(result.copyReport.failedFiles.size())};
        if (false == journal.RecordRun(record, result.copyReport.failedFiles))
        {
            logger.Warning("Failed to record run in journal " + databaseFile.string());
            return false;
        }
        return true;
    }
    catch (const std::runtime_error& error)
    {
        logger.Warning(std::string("Run journal unavailable: ") + error.what());
        return false;
    }
}

BackupRunResult ExecuteBackup(const BackupConfig& config, TreeCopier& treeCopier, Logger& logger)
{
    BackupRunResult result;

    logger.Info("Cleaning up old backups...");
    BackupCleaner cleaner(logger);
    result.cleanupResult = cleaner.Cleanup(config.destinationRoot, config.maxBackups);
    LogCleanupResult(logger, result.cleanupResult);

    logger.Info("Preparing backup...");
    TimestampProvider timestampProvider;
    SnapshotDirectoryProvider snapshotDirectory(config.destinationRoot, config.snapshotPrefix, timestampProvider);
    result.snapshotPath = snapshotDirectory.GetOrCreate();
    result.startedAt = snapshotDirectory.Timestamp();
    logger.Debug("Backup directory: " + result.snapshotPath.string());

    logger.Info("Starting backup from " + config.sourceDir.string() + " to " + result.snapshotPath.string());
    const auto start = std::chrono::steady_clock::now();
    result.copyReport = treeCopier.CopyFiles(config.sourceDir, result.snapshotPath);
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    logger.Info("Backup execution completed in " + FormatDuration(result.duration));

    result.journaled = RecordRun(logger, config.databaseFile, result);
    return result;
}
}

BackupConfig::BackupConfig()
    : snapshotPrefix(DefaultSnapshotPrefix)
    , threadCount(std::max(1u, std::thread::hardware_concurrency()))
    , maxRetries(DefaultMaxRetries)
    , retryDelay(DefaultRetryDelay)
    , exclusionPatterns(DefaultExclusionPatterns())
    , maxBackups(DefaultMaxBackups)
    , drainTimeout(DefaultDrainTimeout)
    , verbose(false)
    , onProgress(nullptr)
    , onLog(nullptr)
{
}

BackupRunResult RunBackup(const BackupConfig& configuration)
{
    Logger logger(configuration.onLog, MinimumLogLevel(configuration));
    const BackupConfig config = ValidateConfiguration(configuration);

    ConcurrentCopyEngine engine(MakeEngineSettings(config), logger, config.onProgress);
    return ExecuteBackup(config, engine, logger);
}

BackupRunResult RunBackup(const BackupConfig& configuration, TreeCopier& treeCopier)
{
    Logger logger(configuration.onLog, MinimumLogLevel(configuration));
    const BackupConfig config = ValidateConfiguration(configuration);

    return ExecuteBackup(config, treeCopier, logger);
}
