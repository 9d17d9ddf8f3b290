#include "Logger/Logger.hpp"

#include <exception>
#include <iostream>

Logger::Logger(const std::function<void(const LogMessage&)>& sink, LogLevel minimumLevel) : _sink(sink), _minimumLevel(minimumLevel)
{
}

void Logger::Debug(const std::string& text)
{
    Log(LogLevel::Debug, text);
}

void Logger::Info(const std::string& text)
{
    Log(LogLevel::Info, text);
}

void Logger::Warning(const std::string& text)
{
    Log(LogLevel::Warning, text);
}

void Logger::Error(const std::string& text)
{
    Log(LogLevel::Error, text);
}

void Logger::Log(LogLevel level, const std::string& text)
{
    if ((nullptr == _sink) || (false == IsEnabled(level)))
    {
        return;
    }

    std::lock_guard lock(_sinkMutex);
    try
    {
        _sink({level, text});
    }
    catch (const std::exception& exception)
    {
        // Log calls come from worker threads; a failing sink must not unwind them
        std::cerr << "Log sink failed: " << exception.what() << " [" << LogLevelToString(level) << "] " << text << '\n';
    }
}

bool Logger::IsEnabled(LogLevel level) const
{
    return static_cast<int>(level) >= static_cast<int>(_minimumLevel);
}
