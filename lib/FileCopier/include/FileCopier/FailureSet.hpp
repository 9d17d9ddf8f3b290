#pragma once

#include <filesystem>
#include <mutex>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief Source paths that could not be backed up during one run.
 *
 * Appends are guarded by a mutex and may come from any worker thread.
 */
class FailureSet
{
  public:
    /**
     * @brief Record a permanently failed source path.
     *
     * @param[in] sourcePath Source file that was not copied
     */
    void Add(const fs::path& sourcePath);

    /**
     * @brief Copy of the recorded paths in insertion order.
     *
     * @return Failed source paths
     */
    std::vector<fs::path> Snapshot() const;

    bool IsEmpty() const;
    std::size_t Size() const;

  private:
    mutable std::mutex _mutex;
    std::vector<fs::path> _failedPaths;
};
