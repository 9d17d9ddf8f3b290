#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

/**
 * @brief Cancellation signal shared between a backup run and its workers.
 *
 * Once cancelled the token stays cancelled. Waits on the token wake up early on cancellation.
 */
class CancellationToken
{
  public:
    CancellationToken();

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /**
     * @brief Cancel the token and wake all waiters.
     */
    void Cancel();

    /**
     * @brief Check whether the token has been cancelled.
     *
     * @return true if cancelled
     */
    bool IsCancelled() const;

    /**
     * @brief Block the calling thread for the given duration or until cancelled.
     *
     * @param[in] duration Time to wait
     * @return true if the wait ended because of cancellation, false if the full duration elapsed
     */
    bool WaitFor(std::chrono::milliseconds duration) const;

  private:
    mutable std::mutex _mutex;
    mutable std::condition_variable _cancelledCv;
    bool _cancelled;
};
