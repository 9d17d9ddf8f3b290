#include "DirectoryProcessor/DirectoryProcessor.hpp"

#include <system_error>

DirectoryProcessor::DirectoryProcessor(FileCopier& fileCopier, const ExclusionFilter& exclusionFilter, Logger& logger)
    : _fileCopier(fileCopier), _exclusionFilter(exclusionFilter), _logger(logger)
{
}

void DirectoryProcessor::ProcessDirectory(const fs::path& sourceDirectory, const fs::path& destinationDirectory)
{
    if (true == fs::create_directories(destinationDirectory))
    {
        _logger.Debug("Created directory: " + destinationDirectory.string());
    }

    for (const auto& entry : fs::directory_iterator(sourceDirectory))
    {
        const fs::path& entryPath = entry.path();
        if (true == _exclusionFilter.Matches(entryPath))
        {
            _logger.Info("Excluding: " + entryPath.string());
            continue;
        }

        const fs::path destinationPath = destinationDirectory / entryPath.filename();

        std::error_code errorCode;
        const bool isDirectory = entry.is_directory(errorCode);
        if ((0 == errorCode.value()) && (true == isDirectory))
        {
            ProcessDirectory(entryPath, destinationPath);
        }
        else
        {
            _fileCopier.SubmitFileForCopy(entryPath, destinationPath);
        }
    }
}
