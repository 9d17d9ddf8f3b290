#pragma once

#include "FileCopier/FailureSet.hpp"
#include "RetryHandler/CancellationToken.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>

namespace fs = std::filesystem;

/**
 * @brief Progress information for backup operations.
 */
struct BackupProgress
{
    const char* stage;          /**< Current stage of backup operation */
    std::size_t processed;      /**< Number of items processed so far */
    std::size_t total;          /**< Total number of items to process, 0 if unknown */
    fs::path file;              /**< Currently processing file path */
};

/**
 * @brief State shared by the producer and every worker of a single copy run.
 *
 * Created by the engine for each run and passed by reference; never shared between runs.
 */
struct CopyRunContext
{
    FailureSet failures;                        /**< Files that exhausted their retries */
    CancellationToken cancellation;             /**< Aborts waiting retries when the run is cancelled */
    std::atomic<std::size_t> submittedCount{0}; /**< Tasks handed to the pool */
    std::atomic<std::size_t> processedCount{0}; /**< Tasks finished, successfully or not */
};
