#pragma once

#include "TimestampProvider/TimestampProvider.hpp"

#include <filesystem>
#include <mutex>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief Default name prefix of snapshot directories.
 */
constexpr const char* DefaultSnapshotPrefix = "backup";

/**
 * @brief Infrastructure component that creates the snapshot directory of a run once.
 */
class SnapshotDirectoryProvider
{
  public:
    /**
     * @brief Construct a snapshot directory provider.
     *
     * @param[in] destinationRoot Directory holding all snapshots
     * @param[in] snapshotPrefix Name prefix of the snapshot directory
     * @param[in] timestampProvider Timestamp provider
     */
    SnapshotDirectoryProvider(const fs::path& destinationRoot, const std::string& snapshotPrefix,
                              const TimestampProvider& timestampProvider);

    /**
     * @brief Get or create the snapshot directory <prefix>_yyyy-MM-dd_HHmm_ss.
     *
     * The name is fixed on the first call; later calls return the same path. An existing
     * directory is never reused: when the name is taken a numeric suffix is appended.
     *
     * @return Snapshot directory path
     * @throws fs::filesystem_error if the directory cannot be created
     */
    fs::path GetOrCreate();

    /**
     * @brief Timestamp embedded in the snapshot name, empty before GetOrCreate().
     */
    const std::string& Timestamp() const;

  private:
    fs::path _destinationRoot;
    std::string _snapshotPrefix;
    const TimestampProvider& _timestampProvider;
    std::once_flag _snapshotFlag;
    std::string _timestamp;
    fs::path _snapshotPath;
};
