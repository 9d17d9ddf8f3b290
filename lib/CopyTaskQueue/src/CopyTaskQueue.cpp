#include "CopyTaskQueue/CopyTaskQueue.hpp"

#include <utility>

CopyTaskQueue::CopyTaskQueue(unsigned int threadCount)
    : _threadCount((0 == threadCount) ? 1 : threadCount), _activeTasks(0), _shutdown(false)
{
}

CopyTaskQueue::~CopyTaskQueue()
{
    Shutdown();
    JoinWorkers();
}

void CopyTaskQueue::Start(const std::function<void(const CopyTask&)>& workItem)
{
    std::lock_guard lock(_queueMutex);
    if (false == _workers.empty())
    {
        return;
    }

    _workItem = workItem;
    _workers.reserve(_threadCount);
    for (unsigned int i = 0; i < _threadCount; ++i)
    {
        _workers.emplace_back([this]() { WorkerLoop(); });
    }
}

bool CopyTaskQueue::Enqueue(const CopyTask& task)
{
    {
        std::lock_guard lock(_queueMutex);
        if (true == _shutdown)
        {
            return false;
        }
        _taskQueue.push(task);
    }
    _queueCv.notify_one();
    return true;
}

void CopyTaskQueue::Shutdown()
{
    {
        std::lock_guard lock(_queueMutex);
        _shutdown = true;
    }
    _queueCv.notify_all();
}

bool CopyTaskQueue::AwaitTermination(std::chrono::milliseconds timeout)
{
    Shutdown();

    bool drained = false;
    {
        std::unique_lock lock(_queueMutex);
        drained = _drainedCv.wait_for(lock, timeout, [this]() { return (true == _taskQueue.empty()) && (0 == _activeTasks); });
    }

    if (true == drained)
    {
        JoinWorkers();
    }
    return drained;
}

std::vector<CopyTask> CopyTaskQueue::Cancel()
{
    std::vector<CopyTask> discardedTasks;
    {
        std::lock_guard lock(_queueMutex);
        _shutdown = true;
        while (false == _taskQueue.empty())
        {
            discardedTasks.push_back(std::move(_taskQueue.front()));
            _taskQueue.pop();
        }
    }
    _queueCv.notify_all();

    JoinWorkers();
    return discardedTasks;
}

unsigned int CopyTaskQueue::ThreadCount() const
{
    return _threadCount;
}

/**
 * @brief Worker thread loop for processing queued tasks.
 */
void CopyTaskQueue::WorkerLoop()
{
    while (true)
    {
        CopyTask task;
        {
            std::unique_lock lock(_queueMutex);
            _queueCv.wait(lock, [this]() { return (true == _shutdown) || (false == _taskQueue.empty()); });
            if (true == _taskQueue.empty())
            {
                return;
            }
            task = std::move(_taskQueue.front());
            _taskQueue.pop();
            ++_activeTasks;
        }

        _workItem(task);

        {
            std::lock_guard lock(_queueMutex);
            --_activeTasks;
            if ((true == _taskQueue.empty()) && (0 == _activeTasks))
            {
                _drainedCv.notify_all();
            }
        }
    }
}

void CopyTaskQueue::JoinWorkers()
{
    for (auto& worker : _workers)
    {
        if (true == worker.joinable())
        {
            worker.join();
        }
    }
}
