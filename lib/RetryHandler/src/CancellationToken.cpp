#include "RetryHandler/CancellationToken.hpp"

CancellationToken::CancellationToken() : _cancelled(false)
{
}

void CancellationToken::Cancel()
{
    {
        std::lock_guard lock(_mutex);
        _cancelled = true;
    }
    _cancelledCv.notify_all();
}

bool CancellationToken::IsCancelled() const
{
    std::lock_guard lock(_mutex);
    return _cancelled;
}

bool CancellationToken::WaitFor(std::chrono::milliseconds duration) const
{
    std::unique_lock lock(_mutex);
    return _cancelledCv.wait_for(lock, duration, [this]() { return _cancelled; });
}
