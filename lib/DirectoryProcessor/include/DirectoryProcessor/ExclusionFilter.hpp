#pragma once

#include "Logger/Logger.hpp"

#include <filesystem>
#include <regex>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief Set of compiled exclusion rules matched against full path strings.
 */
class ExclusionFilter
{
  public:
    /**
     * @brief Compile the exclusion patterns.
     *
     * Patterns that fail to compile are dropped with a warning.
     *
     * @param[in] patterns ECMAScript regular expressions
     * @param[in] logger Logger for rejected patterns
     */
    ExclusionFilter(const std::vector<std::string>& patterns, Logger& logger);

    /**
     * @brief Test a path against every rule.
     *
     * The whole path string must match a rule; a rule matching only part of it does not exclude.
     *
     * @param[in] path Path to test
     * @return true if any rule matches the full path
     */
    bool Matches(const fs::path& path) const;

    std::size_t RuleCount() const;

  private:
    std::vector<std::regex> _rules;
};
