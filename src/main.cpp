// file main.cpp:

#include "BackupUtility/BackupUtility.hpp"
#include "BackupUtility/ConfigLoader.hpp"
#include "RunJournal/RunJournal.hpp"
#include "TimestampProvider/DurationFormatter.hpp"
#include "cxxopts.hpp"

#include <filesystem>
#include <iostream>
#include <optional>

namespace fs = std::filesystem;

namespace
{

constexpr int ExitSuccess = 0;
constexpr int ExitFatal = 1;
constexpr int ExitIncomplete = 2;

/**
 * @brief Parses command-line arguments using cxxopts.
 *
 * @param[in] argc Argument count.
 * @param[in] argv Argument values.
 * @return std::optional<cxxopts::ParseResult> if parsing is successful and help is not requested,
 *         otherwise returns an empty optional.
 */
std::optional<cxxopts::ParseResult> ParseCommandLineOptions(int argc, char* argv[])
{
    cxxopts::Options options("snapshot-backup", "Timestamped directory snapshot backups");

    // clang-format off
    options.add_options()
        ("c,config",      "Configuration file (YAML or JSON)", cxxopts::value<std::string>())
        ("s,source",      "Source directory", cxxopts::value<std::string>())
        ("d,destination", "Destination root holding the snapshots", cxxopts::value<std::string>())
        ("p,prefix",      "Snapshot directory name prefix", cxxopts::value<std::string>())
        ("t,threads",     "Worker thread count", cxxopts::value<unsigned int>())
        ("r,retries",     "Copy attempts per file", cxxopts::value<unsigned int>())
        ("retry-delay-ms", "Base retry delay in milliseconds", cxxopts::value<unsigned int>())
        ("k,keep",        "Number of snapshots to keep", cxxopts::value<std::size_t>())
        ("x,exclude",     "Full-path exclusion regex, repeatable", cxxopts::value<std::vector<std::string>>())
        ("drain-timeout", "Seconds to wait for outstanding copies", cxxopts::value<unsigned int>())
        ("history",       "Print the run journal and exit")
        ("v,verbose",     "Verbose output")
        ("h,help",        "Print help");
    // clang-format on

    auto parseResult = options.parse(argc, argv);

    if (0 < parseResult.count("help"))
    {
        std::cout << options.help() << '\n';
        return std::nullopt;
    }

    if ((0 == parseResult.count("config")) && ((0 == parseResult.count("destination")) ||
                                               ((0 == parseResult.count("source")) && (0 == parseResult.count("history")))))
    {
        std::cout << options.help() << '\n';
        return std::nullopt;
    }

    return parseResult;
}

void PrintLogMessage(const LogMessage& message)
{
    std::ostream& stream = (LogLevel::Warning <= message.level) ? std::cerr : std::cout;
    stream << "[" << LogLevelToString(message.level) << "] " << message.text << '\n';
}

/**
 * @brief Builds the BackupConfig from the optional configuration file and command-line overrides.
 *
 * @param[in] parseResult The parsed command-line options.
 * @return Backup configuration, not yet validated.
 * @throws ConfigurationError if the configuration file cannot be loaded.
 */
BackupConfig SetupBackupConfiguration(const cxxopts::ParseResult& parseResult)
{
    BackupConfig config;
    if (0 < parseResult.count("config"))
    {
        config = LoadConfigFile(fs::path(parseResult["config"].as<std::string>()));
    }

    if (0 < parseResult.count("source"))
    {
        config.sourceDir = fs::path(parseResult["source"].as<std::string>());
    }
    if (0 < parseResult.count("destination"))
    {
        config.destinationRoot = fs::path(parseResult["destination"].as<std::string>());
    }
    if (0 < parseResult.count("prefix"))
    {
        config.snapshotPrefix = parseResult["prefix"].as<std::string>();
    }
    if (0 < parseResult.count("threads"))
    {
        config.threadCount = parseResult["threads"].as<unsigned int>();
    }
    if (0 < parseResult.count("retries"))
    {
        config.maxRetries = parseResult["retries"].as<unsigned int>();
    }
    if (0 < parseResult.count("retry-delay-ms"))
    {
        config.retryDelay = std::chrono::milliseconds(parseResult["retry-delay-ms"].as<unsigned int>());
    }
    if (0 < parseResult.count("keep"))
    {
        config.maxBackups = parseResult["keep"].as<std::size_t>();
    }
    if (0 < parseResult.count("exclude"))
    {
        config.exclusionPatterns = parseResult["exclude"].as<std::vector<std::string>>();
    }
    if (0 < parseResult.count("drain-timeout"))
    {
        config.drainTimeout = std::chrono::seconds(parseResult["drain-timeout"].as<unsigned int>());
    }

    config.verbose = (0 < parseResult.count("verbose"));
    config.onLog = PrintLogMessage;

    if (true == config.verbose)
    {
        config.onProgress = [](const BackupProgress& progress)
        { std::cout << "[" << progress.stage << "] " << progress.processed << "/" << progress.total << " : " << progress.file.string() << '\n'; };
    }

    return config;
}

/**
 * @brief Prints the stored runs of the journal in the destination root.
 *
 * @param[in] config Configuration naming the destination root or journal file.
 * @return Process exit code.
 */
int PrintHistory(const BackupConfig& config)
{
    const fs::path databaseFile = config.databaseFile.empty() ? config.destinationRoot / "backup.db" : config.databaseFile;
    if (false == fs::exists(databaseFile))
    {
        std::cout << "No backup runs recorded in " << databaseFile.string() << '\n';
        return ExitSuccess;
    }

    SQLiteConnection connection(databaseFile);
    RunJournal journal(connection);
    for (const auto& run : journal.GetRuns())
    {
        std::cout << run.snapshot << "  started " << run.startedAt << "  took " << FormatDuration(std::chrono::milliseconds(run.durationMs))
                  << "  " << run.status << "  failed: " << run.failedCount << '\n';
        for (const auto& failedFile : journal.GetFailedFiles(run.snapshot))
        {
            std::cout << "    - " << failedFile << '\n';
        }
    }
    return ExitSuccess;
}

int ReportResult(const BackupRunResult& result)
{
    std::cout << "Backup completed in " << FormatDuration(result.duration) << ".\n";
    std::cout << "Backup stored at: " << result.snapshotPath.string() << '\n';

    if (CopyStatus::DrainTimedOut == result.copyReport.status)
    {
        std::cerr << "Backup incomplete: copies were still running when the drain timeout expired\n";
    }

    if (true == result.copyReport.failedFiles.empty())
    {
        if (CopyStatus::Completed == result.copyReport.status)
        {
            std::cout << "All files copied successfully!\n";
            return ExitSuccess;
        }
        return ExitIncomplete;
    }

    std::cerr << result.copyReport.failedFiles.size() << " file(s) could not be backed up:\n";
    for (const auto& failedFile : result.copyReport.failedFiles)
    {
        std::cerr << "- " << failedFile.string() << '\n';
    }
    return ExitIncomplete;
}

} // namespace

int main(int argc, char* argv[])
{
    try
    {
        std::optional<cxxopts::ParseResult> parseResult = ParseCommandLineOptions(argc, argv);

        if (false == parseResult.has_value())
        {
            return ExitSuccess; // Help was shown or required arguments are missing.
        }

        const BackupConfig backupConfiguration = SetupBackupConfiguration(parseResult.value());

        if (0 < parseResult.value().count("history"))
        {
            return PrintHistory(backupConfiguration);
        }

        return ReportResult(RunBackup(backupConfiguration));
    }
    catch (const cxxopts::exceptions::exception& error)
    {
        std::cerr << "Invalid arguments: " << error.what() << '\n';
    }
    catch (const ConfigurationError& error)
    {
        std::cerr << "Configuration error: " << error.what() << '\n';
    }
    catch (const fs::filesystem_error& error)
    {
        std::cerr << "Backup failed: " << error.what() << '\n';
    }
    catch (const std::runtime_error& error)
    {
        std::cerr << "Backup failed: " << error.what() << '\n';
    }

    return ExitFatal;
}
