#pragma once

#include "ChecksumVerifier/ChecksumVerifier.hpp"
#include "CopyTaskQueue/CopyTaskQueue.hpp"
#include "FileCopier/CopyRunContext.hpp"
#include "Logger/Logger.hpp"
#include "RetryHandler/RetryHandler.hpp"

#include <filesystem>
#include <functional>

namespace fs = std::filesystem;

/**
 * @brief Application component copying single files with verification and retry.
 */
class FileCopier
{
  public:
    /**
     * @brief Construct a copier bound to one run.
     *
     * @param[in] taskQueue Worker pool receiving submitted tasks
     * @param[in] retryHandler Retry policy executor
     * @param[in] checksumVerifier Integrity check for copied files
     * @param[in/out] runContext Per-run failure set and cancellation signal
     * @param[in] logger Logger
     * @param[in] onProgress Thread-safe progress callback, may be empty
     */
    FileCopier(CopyTaskQueue& taskQueue, const RetryHandler& retryHandler, const ChecksumVerifier& checksumVerifier,
               CopyRunContext& runContext, Logger& logger, const std::function<void(const BackupProgress&)>& onProgress);

    /**
     * @brief Queue a file for asynchronous copying. Returns without waiting for the copy.
     *
     * @param[in] sourceFile File to copy
     * @param[in] destinationFile Target path inside the snapshot
     */
    void SubmitFileForCopy(const fs::path& sourceFile, const fs::path& destinationFile);

    /**
     * @brief Copy and verify a file, retrying on failure.
     *
     * Runs on a worker thread. If every attempt fails the source path is added to the
     * run's failure set.
     *
     * @param[in] task Source and destination of the copy
     */
    void CopyFileWithRetry(const CopyTask& task);

  private:
    AttemptOutcome CopyAndVerify(const CopyTask& task) const;
    void ReportProgress(const char* stage, const fs::path& file);

    CopyTaskQueue& _taskQueue;
    const RetryHandler& _retryHandler;
    const ChecksumVerifier& _checksumVerifier;
    CopyRunContext& _runContext;
    Logger& _logger;
    std::function<void(const BackupProgress&)> _onProgress;
};
