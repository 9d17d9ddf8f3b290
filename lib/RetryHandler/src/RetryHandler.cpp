#include "RetryHandler/RetryHandler.hpp"

#include <algorithm>
#include <exception>

namespace
{
constexpr unsigned int MaxBackoffShift = 30;
}

RetryHandler::RetryHandler(const RetryPolicy& policy, Logger& logger) : _policy(policy), _logger(logger)
{
    if (0 == _policy.maxAttempts)
    {
        _policy.maxAttempts = 1;
    }
}

bool RetryHandler::ExecuteWithRetry(const std::function<AttemptOutcome()>& operation, const std::string& description,
                                    const CancellationToken& cancellation) const
{
    for (unsigned int attempt = 1; attempt <= _policy.maxAttempts; ++attempt)
    {
        if (AttemptOutcome::Success == RunAttempt(operation, description))
        {
            return true;
        }

        _logger.Warning("Attempt " + std::to_string(attempt) + "/" + std::to_string(_policy.maxAttempts) + " failed for " + description);

        if (_policy.maxAttempts == attempt)
        {
            break;
        }

        const std::chrono::milliseconds delay = ComputeBackoffDelay(attempt);
        _logger.Debug("Retrying " + description + " in " + std::to_string(delay.count()) + " ms");
        if ((true == cancellation.IsCancelled()) || (true == cancellation.WaitFor(delay)))
        {
            _logger.Error("Retry cancelled for " + description);
            return false;
        }
    }

    _logger.Error("Failed to complete " + description + " after " + std::to_string(_policy.maxAttempts) + " attempts");
    return false;
}

std::chrono::milliseconds RetryHandler::ComputeBackoffDelay(unsigned int attempt) const
{
    const unsigned int shift = std::min(std::max(attempt, 1u) - 1, MaxBackoffShift);
    return _policy.baseDelay * (1LL << shift);
}

const RetryPolicy& RetryHandler::Policy() const
{
    return _policy;
}

AttemptOutcome RetryHandler::RunAttempt(const std::function<AttemptOutcome()>& operation, const std::string& description) const
{
    try
    {
        return operation();
    }
    catch (const std::exception& exception)
    {
        _logger.Error(description + " raised: " + exception.what());
        return AttemptOutcome::RetryableFailure;
    }
}
