#include "FileCopier/FileCopier.hpp"

#include <exception>
#include <system_error>

FileCopier::FileCopier(CopyTaskQueue& taskQueue, const RetryHandler& retryHandler, const ChecksumVerifier& checksumVerifier,
                       CopyRunContext& runContext, Logger& logger, const std::function<void(const BackupProgress&)>& onProgress)
    : _taskQueue(taskQueue), _retryHandler(retryHandler), _checksumVerifier(checksumVerifier), _runContext(runContext),
      _logger(logger), _onProgress(onProgress)
{
}

void FileCopier::SubmitFileForCopy(const fs::path& sourceFile, const fs::path& destinationFile)
{
    _logger.Debug("Submitting file for copy: " + sourceFile.string() + " -> " + destinationFile.string());

    ++_runContext.submittedCount;
    if (false == _taskQueue.Enqueue({sourceFile, destinationFile}))
    {
        --_runContext.submittedCount;
        _logger.Error("Copy queue is closed, not copying " + sourceFile.string());
        _runContext.failures.Add(sourceFile);
    }
}

void FileCopier::CopyFileWithRetry(const CopyTask& task)
{
    bool copied = false;
    try
    {
        copied = _retryHandler.ExecuteWithRetry([&]() { return CopyAndVerify(task); }, "copying file " + task.sourcePath.string(),
                                                _runContext.cancellation);
    }
    catch (const std::exception& exception)
    {
        _logger.Error("Unexpected error while copying " + task.sourcePath.string() + ": " + exception.what());
    }

    if (false == copied)
    {
        _runContext.failures.Add(task.sourcePath);
        ReportProgress("failed", task.sourcePath);
        return;
    }

    ReportProgress("copied", task.sourcePath);
}

/**
 * @brief One attempt: copy over any existing destination, then compare digests.
 */
AttemptOutcome FileCopier::CopyAndVerify(const CopyTask& task) const
{
    std::error_code errorCode;
    const bool sourceIsDirectory = fs::is_directory(task.sourcePath, errorCode);

    errorCode.clear();
    if (true == sourceIsDirectory)
    {
        fs::create_directories(task.destinationPath, errorCode);
    }
    else
    {
        fs::copy_file(task.sourcePath, task.destinationPath, fs::copy_options::overwrite_existing, errorCode);
    }

    if (0 != errorCode.value())
    {
        _logger.Error("Failed to copy file " + task.sourcePath.string() + ": " + errorCode.message());
        return AttemptOutcome::RetryableFailure;
    }
    _logger.Debug("File copied: " + task.sourcePath.string() + " -> " + task.destinationPath.string());

    if (true == sourceIsDirectory)
    {
        _logger.Debug("Skipping checksum verification for directory: " + task.sourcePath.string());
        return AttemptOutcome::Success;
    }

    if (false == _checksumVerifier.Verify(task.sourcePath, task.destinationPath))
    {
        _logger.Warning("Checksum verification failed for " + task.sourcePath.string());
        return AttemptOutcome::RetryableFailure;
    }

    return AttemptOutcome::Success;
}

void FileCopier::ReportProgress(const char* stage, const fs::path& file)
{
    const std::size_t processed = ++_runContext.processedCount;
    if (nullptr == _onProgress)
    {
        return;
    }

    try
    {
        _onProgress({stage, processed, _runContext.submittedCount.load(), file});
    }
    catch (const std::exception& exception)
    {
        _logger.Error("Progress callback failed for " + file.string() + ": " + exception.what());
    }
}
