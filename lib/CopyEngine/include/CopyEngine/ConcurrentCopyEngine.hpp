#pragma once

#include "ChecksumVerifier/ChecksumVerifier.hpp"
#include "CopyEngine/TreeCopier.hpp"
#include "DirectoryProcessor/ExclusionFilter.hpp"
#include "FileCopier/CopyRunContext.hpp"
#include "Logger/Logger.hpp"
#include "RetryHandler/RetryHandler.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Default upper bound for waiting on outstanding copies.
 */
constexpr std::chrono::seconds DefaultDrainTimeout{60};

/**
 * @brief Configuration of the concurrent copy engine.
 */
struct CopyEngineSettings
{
    unsigned int threadCount;                   /**< Worker threads per run */
    RetryPolicy retryPolicy;                    /**< Per-file retry limits */
    std::vector<std::string> exclusionPatterns; /**< Full-path regular expressions of skipped entries */
    std::chrono::milliseconds drainTimeout;     /**< Upper bound for waiting on outstanding copies */

    /**
     * @brief Initialize settings with default values.
     */
    CopyEngineSettings()
        : threadCount(std::max(1u, std::thread::hardware_concurrency()))
        , drainTimeout(DefaultDrainTimeout)
    {
    }
};

/**
 * @brief Application component copying a source tree with a pool of worker threads.
 *
 * Every call to CopyFiles uses its own worker pool and failure set, so runs never share state.
 */
class ConcurrentCopyEngine : public TreeCopier
{
  public:
    /**
     * @brief Construct the engine.
     *
     * @param[in] settings Pool size, retry policy, exclusions and drain timeout
     * @param[in] logger Logger shared with all components
     * @param[in] onProgress Optional progress callback, invoked serialized
     */
    ConcurrentCopyEngine(const CopyEngineSettings& settings, Logger& logger,
                         const std::function<void(const BackupProgress&)>& onProgress = nullptr);

    /**
     * @brief Mirror the source tree into the destination and wait for the copies.
     *
     * Traversal runs on the calling thread; files are copied on the pool. If the drain
     * timeout expires, outstanding tasks are cancelled, reported as failed, and the status
     * is DrainTimedOut.
     *
     * @param[in] sourceDirectory Root of the tree to copy
     * @param[in] destinationDirectory Snapshot directory receiving the mirror
     * @return Report of the run
     * @throws fs::filesystem_error if a directory cannot be created or read
     */
    CopyReport CopyFiles(const fs::path& sourceDirectory, const fs::path& destinationDirectory) override;

  private:
    void ReportProgress(const BackupProgress& progress);
    void LogReport(const CopyReport& report);

    CopyEngineSettings _settings;
    Logger& _logger;
    std::function<void(const BackupProgress&)> _onProgress;
    std::mutex _progressMutex;
    ChecksumVerifier _checksumVerifier;
    RetryHandler _retryHandler;
    ExclusionFilter _exclusionFilter;
};
