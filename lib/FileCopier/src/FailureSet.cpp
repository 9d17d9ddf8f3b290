#include "FileCopier/FailureSet.hpp"

void FailureSet::Add(const fs::path& sourcePath)
{
    std::lock_guard lock(_mutex);
    _failedPaths.push_back(sourcePath);
}

std::vector<fs::path> FailureSet::Snapshot() const
{
    std::lock_guard lock(_mutex);
    return _failedPaths;
}

bool FailureSet::IsEmpty() const
{
    std::lock_guard lock(_mutex);
    return _failedPaths.empty();
}

std::size_t FailureSet::Size() const
{
    std::lock_guard lock(_mutex);
    return _failedPaths.size();
}
