#include "DirectoryProcessor/ExclusionFilter.hpp"

ExclusionFilter::ExclusionFilter(const std::vector<std::string>& patterns, Logger& logger)
{
    _rules.reserve(patterns.size());
    for (const auto& pattern : patterns)
    {
        try
        {
            _rules.emplace_back(pattern, std::regex::ECMAScript);
            logger.Debug("Added exclusion pattern: " + pattern);
        }
        catch (const std::regex_error& error)
        {
            logger.Warning("Invalid exclusion pattern '" + pattern + "': " + error.what());
        }
    }
}

bool ExclusionFilter::Matches(const fs::path& path) const
{
    const std::string pathText = path.string();
    for (const auto& rule : _rules)
    {
        if (true == std::regex_match(pathText, rule))
        {
            return true;
        }
    }
    return false;
}

std::size_t ExclusionFilter::RuleCount() const
{
    return _rules.size();
}
