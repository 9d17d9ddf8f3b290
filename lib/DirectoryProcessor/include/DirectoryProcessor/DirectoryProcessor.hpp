#pragma once

#include "DirectoryProcessor/ExclusionFilter.hpp"
#include "FileCopier/FileCopier.hpp"
#include "Logger/Logger.hpp"

#include <filesystem>

namespace fs = std::filesystem;

/**
 * @brief Application component walking the source tree and mirroring its directories.
 *
 * Traversal runs on the calling thread; files are handed to the FileCopier and copied
 * asynchronously.
 */
class DirectoryProcessor
{
  public:
    /**
     * @brief Construct a directory processor.
     *
     * @param[in] fileCopier Receiver of every non-excluded file
     * @param[in] exclusionFilter Rules for skipped paths
     * @param[in] logger Logger
     */
    DirectoryProcessor(FileCopier& fileCopier, const ExclusionFilter& exclusionFilter, Logger& logger);

    /**
     * @brief Mirror a source directory into a destination directory.
     *
     * Creates the destination if needed, recurses into subdirectories and submits files.
     * Excluded entries are skipped and never descended into. Returns once every task is
     * submitted, not once the copies complete.
     *
     * @param[in] sourceDirectory Directory to read
     * @param[in] destinationDirectory Mirror of the source directory
     * @throws fs::filesystem_error if a destination directory cannot be created or a source directory cannot be read
     */
    void ProcessDirectory(const fs::path& sourceDirectory, const fs::path& destinationDirectory);

  private:
    FileCopier& _fileCopier;
    const ExclusionFilter& _exclusionFilter;
    Logger& _logger;
};
