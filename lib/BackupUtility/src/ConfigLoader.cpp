#include "BackupUtility/ConfigLoader.hpp"

#include <algorithm>
#include <limits>
#include <system_error>

#include <yaml-cpp/yaml.h>

namespace
{
constexpr const char* DefaultDatabaseFileName = "backup.db";

constexpr long long MaxUnsigned = std::numeric_limits<unsigned int>::max();
// Retry delays are doubled up to 30 times and drain timeouts are converted to milliseconds
constexpr long long MaxRetryDelayMs = std::numeric_limits<long long>::max() >> 31;
constexpr long long MaxDrainTimeoutSeconds = std::numeric_limits<long long>::max() / 1000;

/**
 * @brief Read an integer setting bounded by [0, maximum].
 *
 * @param[in] node Mapping holding the setting
 * @param[in] key Setting name
 * @param[in] fallback Value used when the key is absent
 * @param[in] maximum Largest accepted value
 * @return Setting value
 * @throws ConfigurationError if the value is negative or above maximum
 */
long long ReadBounded(const YAML::Node& node, const char* key, long long fallback, long long maximum)
{
    const YAML::Node value = node[key];
    if (false == value.IsDefined() || true == value.IsNull())
    {
        return fallback;
    }

    const long long number = value.as<long long>();
    if (0 > number)
    {
        throw ConfigurationError(std::string("Configuration value '") + key + "' must not be negative");
    }
    if (maximum < number)
    {
        throw ConfigurationError(std::string("Configuration value '") + key + "' must not exceed " + std::to_string(maximum));
    }
    return number;
}

/**
 * @brief Check whether a path equals or lies below another, both canonical.
 */
bool IsWithin(const fs::path& path, const fs::path& directory)
{
    const auto mismatch = std::mismatch(directory.begin(), directory.end(), path.begin(), path.end());
    return directory.end() == mismatch.first;
}

fs::path ReadPath(const YAML::Node& node, const char* key, const fs::path& fallback)
{
    const YAML::Node value = node[key];
    if (false == value.IsDefined() || true == value.IsNull())
    {
        return fallback;
    }
    return fs::path(value.as<std::string>());
}
}

std::vector<std::string> DefaultExclusionPatterns()
{
    return {R"(.*/\.cache)", R"(.*/__pycache__)", R"(.*/node_modules)", R"(.*\.tmp)",
            R"(.*\.swp)",    R"(.*~)",            R"(.*/\.DS_Store)",   R"(.*/Thumbs\.db)"};
}

BackupConfig LoadConfigFile(const fs::path& configPath, const BackupConfig& baseConfiguration)
{
    BackupConfig config = baseConfiguration;

    try
    {
        const YAML::Node root = YAML::LoadFile(configPath.string());
        if (false == root.IsMap())
        {
            throw ConfigurationError("Configuration file " + configPath.string() + " does not contain a mapping");
        }

        config.sourceDir = ReadPath(root, "sourceDir", config.sourceDir);
        config.destinationRoot = ReadPath(root, "destinationDir", config.destinationRoot);
        config.databaseFile = ReadPath(root, "databaseFile", config.databaseFile);

        if (true == root["snapshotPrefix"].IsDefined())
        {
            config.snapshotPrefix = root["snapshotPrefix"].as<std::string>();
        }

        config.threadCount = static_cast<unsigned int>(ReadBounded(root, "threadPoolSize", config.threadCount, MaxUnsigned));
        config.maxRetries = static_cast<unsigned int>(ReadBounded(root, "maxRetries", config.maxRetries, MaxUnsigned));
        config.retryDelay = std::chrono::milliseconds(ReadBounded(root, "retryDelayMs", config.retryDelay.count(), MaxRetryDelayMs));
        config.maxBackups = static_cast<std::size_t>(ReadBounded(root, "maxBackupsToKeep", static_cast<long long>(config.maxBackups),
                                                                 std::numeric_limits<long long>::max()));

        const long long drainSeconds = ReadBounded(root, "drainTimeoutSeconds",
                                                   std::chrono::duration_cast<std::chrono::seconds>(config.drainTimeout).count(),
                                                   MaxDrainTimeoutSeconds);
        config.drainTimeout = std::chrono::seconds(drainSeconds);

        const YAML::Node patterns = root["exclusionPatterns"];
        if (true == patterns.IsDefined())
        {
            config.exclusionPatterns = patterns.as<std::vector<std::string>>();
        }
    }
    catch (const YAML::Exception& exception)
    {
        throw ConfigurationError("Failed to load configuration " + configPath.string() + ": " + exception.what());
    }

    return config;
}

BackupConfig ValidateConfiguration(const BackupConfig& configuration)
{
    BackupConfig config = configuration;

    if (true == config.sourceDir.empty())
    {
        throw ConfigurationError("Source directory is not set");
    }
    if (true == config.destinationRoot.empty())
    {
        throw ConfigurationError("Destination directory is not set");
    }
    if (0 == config.threadCount)
    {
        throw ConfigurationError("Thread pool size must be at least 1");
    }
    if (true == config.snapshotPrefix.empty())
    {
        throw ConfigurationError("Snapshot prefix must not be empty");
    }

    std::error_code errorCode;
    config.sourceDir = fs::canonical(config.sourceDir, errorCode);
    if ((0 != errorCode.value()) || (false == fs::is_directory(config.sourceDir, errorCode)))
    {
        throw ConfigurationError("Source directory does not exist or is not a directory: " + configuration.sourceDir.string());
    }

    errorCode.clear();
    const bool destinationExists = fs::exists(config.destinationRoot, errorCode);
    if (0 != errorCode.value())
    {
        throw ConfigurationError("Cannot access destination directory " + config.destinationRoot.string() + ": " + errorCode.message());
    }

    if (false == destinationExists)
    {
        fs::create_directories(config.destinationRoot, errorCode);
        if (0 != errorCode.value())
        {
            throw ConfigurationError("Failed to create destination directory " + config.destinationRoot.string() + ": " +
                                     errorCode.message());
        }
    }
    else if (false == fs::is_directory(config.destinationRoot, errorCode))
    {
        throw ConfigurationError("Destination path exists but is not a directory: " + config.destinationRoot.string());
    }

    config.destinationRoot = fs::canonical(config.destinationRoot, errorCode);
    if (0 != errorCode.value())
    {
        throw ConfigurationError("Cannot resolve destination directory " + configuration.destinationRoot.string());
    }

    if (true == IsWithin(config.destinationRoot, config.sourceDir))
    {
        throw ConfigurationError("Destination directory must not be inside the source directory: " + config.destinationRoot.string());
    }
    // Retention treats every directory of the destination root as a snapshot and would delete the source
    if (true == IsWithin(config.sourceDir, config.destinationRoot))
    {
        throw ConfigurationError("Source directory must not be inside the destination directory: " + config.sourceDir.string());
    }

    if (true == config.databaseFile.empty())
    {
        config.databaseFile = config.destinationRoot / DefaultDatabaseFileName;
    }

    return config;
}
