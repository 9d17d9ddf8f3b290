#pragma once

#include <functional>
#include <mutex>
#include <string>

/**
 * @brief Severity of a log message.
 */
enum class LogLevel
{
    Debug,   /**< Diagnostic detail, shown in verbose mode only */
    Info,    /**< Normal progress of a backup run */
    Warning, /**< Recoverable problem, the run continues */
    Error    /**< Operation failed */
};

/**
 * @brief Convert a LogLevel value to its display string.
 *
 * @param[in] level The level to convert
 * @return Upper-case level name
 */
inline const char* LogLevelToString(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "UNKNOWN";
}

/**
 * @brief A single log record handed to the log sink.
 */
struct LogMessage
{
    LogLevel level;   /**< Severity of the message */
    std::string text; /**< Formatted message text */
};

/**
 * @brief Infrastructure component dispatching log messages to a sink callback.
 *
 * Sink calls are serialized, so one logger may be shared by the producer and all workers.
 */
class Logger
{
  public:
    /**
     * @brief Construct a logger.
     *
     * @param[in] sink Callback receiving every message at or above the minimum level, may be empty
     * @param[in] minimumLevel Messages below this level are dropped
     */
    explicit Logger(const std::function<void(const LogMessage&)>& sink = nullptr, LogLevel minimumLevel = LogLevel::Info);

    void Debug(const std::string& text);
    void Info(const std::string& text);
    void Warning(const std::string& text);
    void Error(const std::string& text);

    /**
     * @brief Emit a message at the given level.
     *
     * @param[in] level Message severity
     * @param[in] text Message text
     */
    void Log(LogLevel level, const std::string& text);

    /**
     * @brief Check whether messages of the given level reach the sink.
     *
     * @param[in] level Level to test
     * @return true if enabled
     */
    bool IsEnabled(LogLevel level) const;

  private:
    std::function<void(const LogMessage&)> _sink;
    LogLevel _minimumLevel;
    std::mutex _sinkMutex;
};
