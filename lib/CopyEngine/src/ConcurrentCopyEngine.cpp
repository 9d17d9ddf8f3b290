#include "CopyEngine/ConcurrentCopyEngine.hpp"

#include "CopyTaskQueue/CopyTaskQueue.hpp"
#include "DirectoryProcessor/DirectoryProcessor.hpp"
#include "FileCopier/FileCopier.hpp"

#include <exception>

ConcurrentCopyEngine::ConcurrentCopyEngine(const CopyEngineSettings& settings, Logger& logger,
                                           const std::function<void(const BackupProgress&)>& onProgress)
    : _settings(settings), _logger(logger), _onProgress(onProgress), _checksumVerifier(logger),
      _retryHandler(settings.retryPolicy, logger), _exclusionFilter(settings.exclusionPatterns, logger)
{
    _logger.Info("Initializing copy engine with " + std::to_string(_settings.threadCount) + " worker threads, max attempts: " +
                 std::to_string(_retryHandler.Policy().maxAttempts) + ", retry delay: " +
                 std::to_string(_retryHandler.Policy().baseDelay.count()) + " ms");
}

CopyReport ConcurrentCopyEngine::CopyFiles(const fs::path& sourceDirectory, const fs::path& destinationDirectory)
{
    CopyRunContext runContext;
    CopyTaskQueue taskQueue(_settings.threadCount);
    FileCopier fileCopier(taskQueue, _retryHandler, _checksumVerifier, runContext, _logger,
                          [this](const BackupProgress& progress) { ReportProgress(progress); });
    DirectoryProcessor directoryProcessor(fileCopier, _exclusionFilter, _logger);

    taskQueue.Start([&fileCopier](const CopyTask& task) { fileCopier.CopyFileWithRetry(task); });

    _logger.Info("Copying " + sourceDirectory.string() + " to " + destinationDirectory.string());
    try
    {
        directoryProcessor.ProcessDirectory(sourceDirectory, destinationDirectory);
    }
    catch (const std::exception& exception)
    {
        _logger.Error(std::string("Backup aborted: ") + exception.what());
        runContext.cancellation.Cancel();
        taskQueue.Cancel();
        throw;
    }

    _logger.Debug("All " + std::to_string(runContext.submittedCount.load()) + " files submitted, waiting for tasks to complete...");

    CopyReport report;
    if (false == taskQueue.AwaitTermination(_settings.drainTimeout))
    {
        _logger.Warning("Timeout! Not all files were copied within " + std::to_string(_settings.drainTimeout.count()) +
                        " ms, cancelling outstanding copies");
        report.status = CopyStatus::DrainTimedOut;
        runContext.cancellation.Cancel();
        for (const auto& task : taskQueue.Cancel())
        {
            runContext.failures.Add(task.sourcePath);
        }
    }

    report.failedFiles = runContext.failures.Snapshot();
    LogReport(report);
    return report;
}

void ConcurrentCopyEngine::ReportProgress(const BackupProgress& progress)
{
    if (nullptr == _onProgress)
    {
        return;
    }
    std::lock_guard lock(_progressMutex);
    _onProgress(progress);
}

void ConcurrentCopyEngine::LogReport(const CopyReport& report)
{
    if (true == report.failedFiles.empty())
    {
        if (CopyStatus::Completed == report.status)
        {
            _logger.Info("All files copied successfully!");
        }
        return;
    }

    _logger.Warning("Backup completed with " + std::to_string(report.failedFiles.size()) + " failed file(s):");
    for (const auto& failedFile : report.failedFiles)
    {
        _logger.Warning("- " + failedFile.string());
    }
}
