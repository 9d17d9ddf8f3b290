#include "TimestampProvider/TimestampProvider.hpp"

namespace
{
constexpr std::size_t TimestampBufferSize = 32;
constexpr const char* SnapshotTimestampFormat = "%Y-%m-%d_%H%M_%S";
}

std::string TimestampProvider::NowFilesystemSafe() const
{
    return Format(std::time(nullptr));
}

std::string TimestampProvider::Format(std::time_t time) const
{
    std::tm timeStruct{};

#ifdef _WIN32
    _localtime64_s(&timeStruct, &time);
#else
    localtime_r(&time, &timeStruct);
#endif

    char buffer[TimestampBufferSize];
    std::strftime(buffer, sizeof(buffer), SnapshotTimestampFormat, &timeStruct);
    return buffer;
}
