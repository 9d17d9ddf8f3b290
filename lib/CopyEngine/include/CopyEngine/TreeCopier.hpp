#pragma once

#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief Terminal state of a copy run.
 */
enum class CopyStatus
{
    Completed,    /**< Every submitted task finished before the drain timeout */
    DrainTimedOut /**< The drain timeout expired; unfinished tasks were cancelled and reported as failed */
};

/**
 * @brief Convert a CopyStatus value to its string representation.
 *
 * @param[in] status The status to convert
 * @return String representation of the status
 */
inline const char* CopyStatusToString(CopyStatus status)
{
    switch (status)
    {
    case CopyStatus::Completed:
        return "Completed";
    case CopyStatus::DrainTimedOut:
        return "DrainTimedOut";
    }
    return "Unknown";
}

/**
 * @brief Outcome of copying one source tree into a snapshot.
 */
struct CopyReport
{
    CopyStatus status;                 /**< How the run ended */
    std::vector<fs::path> failedFiles; /**< Source files that were not backed up */

    CopyReport()
        : status(CopyStatus::Completed)
    {
    }

    /**
     * @brief Check whether every file was copied and verified.
     *
     * @return true if the run completed without failed files
     */
    bool Succeeded() const
    {
        return (CopyStatus::Completed == status) && (true == failedFiles.empty());
    }
};

/**
 * @brief Capability to mirror a directory tree into a destination directory.
 */
class TreeCopier
{
  public:
    virtual ~TreeCopier() = default;

    /**
     * @brief Copy a source tree into a destination directory.
     *
     * @param[in] sourceDirectory Root of the tree to copy
     * @param[in] destinationDirectory Directory receiving the mirror
     * @return Report of the run
     */
    virtual CopyReport CopyFiles(const fs::path& sourceDirectory, const fs::path& destinationDirectory) = 0;
};
