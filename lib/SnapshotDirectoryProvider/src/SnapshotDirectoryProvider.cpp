#include "SnapshotDirectoryProvider/SnapshotDirectoryProvider.hpp"

#include <system_error>

namespace
{
constexpr unsigned int MaxNameCollisions = 1000;
}

SnapshotDirectoryProvider::SnapshotDirectoryProvider(const fs::path& destinationRoot, const std::string& snapshotPrefix,
                                                     const TimestampProvider& timestampProvider)
    : _destinationRoot(destinationRoot), _snapshotPrefix(snapshotPrefix), _timestampProvider(timestampProvider)
{
}

fs::path SnapshotDirectoryProvider::GetOrCreate()
{
    std::call_once(_snapshotFlag, [&]() {
        fs::create_directories(_destinationRoot);

        const std::string timestamp = _timestampProvider.NowFilesystemSafe();
        const std::string baseName = _snapshotPrefix + "_" + timestamp;

        // create_directory reports an existing leaf as false; a run started within the same second gets a suffix
        fs::path snapshotPath = _destinationRoot / baseName;
        for (unsigned int suffix = 1; false == fs::create_directory(snapshotPath); ++suffix)
        {
            if (MaxNameCollisions < suffix)
            {
                throw fs::filesystem_error("Snapshot directory name is already taken", snapshotPath,
                                           std::make_error_code(std::errc::file_exists));
            }
            snapshotPath = _destinationRoot / (baseName + "_" + std::to_string(suffix));
        }

        _timestamp = timestamp;
        _snapshotPath = snapshotPath;
    });
    return _snapshotPath;
}

const std::string& SnapshotDirectoryProvider::Timestamp() const
{
    return _timestamp;
}
