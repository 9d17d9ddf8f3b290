#pragma once

#include "Logger/Logger.hpp"
#include "RetryHandler/CancellationToken.hpp"

#include <chrono>
#include <functional>
#include <string>

/**
 * @brief Result of a single attempt of a retried operation.
 */
enum class AttemptOutcome
{
    Success,         /**< Operation completed, no further attempts */
    RetryableFailure /**< Operation failed and may be attempted again */
};

/**
 * @brief Retry limits shared read-only by all copy tasks of a run.
 */
struct RetryPolicy
{
    unsigned int maxAttempts;             /**< Total number of attempts, including the first */
    std::chrono::milliseconds baseDelay;  /**< Wait after the first failed attempt */

    /**
     * @brief Initialize the policy with default values.
     */
    RetryPolicy()
        : maxAttempts(3)
        , baseDelay(1000)
    {
    }

    RetryPolicy(unsigned int attempts, std::chrono::milliseconds delay)
        : maxAttempts(attempts)
        , baseDelay(delay)
    {
    }
};

/**
 * @brief Application component executing an operation with bounded exponential backoff.
 */
class RetryHandler
{
  public:
    /**
     * @brief Construct a retry handler.
     *
     * @param[in] policy Attempt limit and base delay
     * @param[in] logger Logger for attempt failures
     */
    RetryHandler(const RetryPolicy& policy, Logger& logger);

    /**
     * @brief Run an operation until it succeeds or the attempts are exhausted.
     *
     * After failed attempt n the calling thread waits baseDelay * 2^(n-1) on the
     * cancellation token; no wait follows the final attempt. A std::exception thrown
     * by the operation counts as a retryable failure. Cancellation before or during
     * a wait stops the retries immediately and leaves the token cancelled.
     *
     * @param[in] operation Attempt to execute
     * @param[in] description Operation description for log messages
     * @param[in] cancellation Run cancellation signal
     * @return true if an attempt succeeded, false if all attempts failed or the wait was cancelled
     */
    bool ExecuteWithRetry(const std::function<AttemptOutcome()>& operation, const std::string& description,
                          const CancellationToken& cancellation) const;

    /**
     * @brief Wait applied after the given failed attempt.
     *
     * @param[in] attempt 1-based number of the failed attempt
     * @return Backoff delay
     */
    std::chrono::milliseconds ComputeBackoffDelay(unsigned int attempt) const;

    const RetryPolicy& Policy() const;

  private:
    AttemptOutcome RunAttempt(const std::function<AttemptOutcome()>& operation, const std::string& description) const;

    RetryPolicy _policy;
    Logger& _logger;
};
