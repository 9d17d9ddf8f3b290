#include "TimestampProvider/DurationFormatter.hpp"

#include <sstream>

namespace
{
void AppendUnit(std::ostringstream& outputStream, long long value, const char* singular, const char* plural)
{
    if (0 < outputStream.tellp())
    {
        outputStream << ", ";
    }
    outputStream << value << ' ' << ((1 == value) ? singular : plural);
}
}

std::string FormatDuration(std::chrono::milliseconds duration)
{
    const long long totalSeconds = std::chrono::duration_cast<std::chrono::seconds>(duration).count();
    const long long minutes = totalSeconds / 60;
    const long long seconds = totalSeconds % 60;
    const long long milliseconds = duration.count() % 1000;

    std::ostringstream outputStream;
    if (0 < minutes)
    {
        AppendUnit(outputStream, minutes, "minute", "minutes");
    }
    if (0 < seconds)
    {
        AppendUnit(outputStream, seconds, "second", "seconds");
    }
    if ((0 < milliseconds) && (0 == minutes) && (0 == seconds))
    {
        AppendUnit(outputStream, milliseconds, "millisecond", "milliseconds");
    }

    const std::string result = outputStream.str();
    return (true == result.empty()) ? "0 seconds" : result;
}
