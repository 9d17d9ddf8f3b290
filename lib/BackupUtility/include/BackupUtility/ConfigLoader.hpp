#pragma once

#include "BackupUtility/BackupUtility.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief Exclusion patterns used when the configuration names none.
 *
 * @return Regular expressions matching common temporary and cache entries
 */
std::vector<std::string> DefaultExclusionPatterns();

/**
 * @brief Load backup settings from a YAML or JSON file.
 *
 * Keys that are absent keep the value from the base configuration; unknown keys are ignored.
 *
 * @param[in] configPath Path to the configuration file
 * @param[in] baseConfiguration Values used for absent keys
 * @return Configuration with the file's settings applied
 * @throws ConfigurationError if the file cannot be read or a value has the wrong type
 */
BackupConfig LoadConfigFile(const fs::path& configPath, const BackupConfig& baseConfiguration = BackupConfig());

/**
 * @brief Check a configuration before any copying starts.
 *
 * Canonicalizes the source directory, creates the destination root when missing and
 * fills the journal path default.
 *
 * @param[in] configuration Configuration to validate
 * @return Validated configuration
 * @throws ConfigurationError if a directory is invalid or a setting is out of range
 */
BackupConfig ValidateConfiguration(const BackupConfig& configuration);
