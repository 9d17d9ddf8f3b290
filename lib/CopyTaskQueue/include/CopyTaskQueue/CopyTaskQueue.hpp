#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief A single file to mirror into the snapshot.
 */
struct CopyTask
{
    fs::path sourcePath;      /**< File in the source tree */
    fs::path destinationPath; /**< Same relative position under the snapshot root */
};

/**
 * @brief Infrastructure component running copy tasks on a fixed-size pool of worker threads.
 *
 * Producers never block: the queue is unbounded. Each instance serves a single run;
 * once shut down it accepts no further tasks.
 */
class CopyTaskQueue
{
  public:
    /**
     * @brief Construct a worker pool without starting it.
     *
     * @param[in] threadCount Number of worker threads, 0 is treated as 1
     */
    explicit CopyTaskQueue(unsigned int threadCount);
    /**
     * @brief Stop accepting tasks, drain the queue and join the workers.
     */
    ~CopyTaskQueue();

    CopyTaskQueue(const CopyTaskQueue&) = delete;
    CopyTaskQueue& operator=(const CopyTaskQueue&) = delete;

    /**
     * @brief Start the worker threads.
     *
     * @param[in] workItem Callback executed by a worker for every dequeued task
     */
    void Start(const std::function<void(const CopyTask&)>& workItem);

    /**
     * @brief Enqueue a task for processing.
     *
     * @param[in] task Task to enqueue
     * @return true if accepted, false if the queue has been shut down
     */
    bool Enqueue(const CopyTask& task);

    /**
     * @brief Close the queue to further submissions. Queued tasks still run.
     */
    void Shutdown();

    /**
     * @brief Shut down and wait until queued and running tasks have finished.
     *
     * @param[in] timeout Upper bound for the wait
     * @return true if the queue drained and the workers were joined, false on timeout
     */
    bool AwaitTermination(std::chrono::milliseconds timeout);

    /**
     * @brief Discard queued tasks and join the workers once running tasks return.
     *
     * @return Tasks that were queued but never started
     */
    std::vector<CopyTask> Cancel();

    unsigned int ThreadCount() const;

  private:
    void WorkerLoop();
    void JoinWorkers();

    unsigned int _threadCount;
    std::function<void(const CopyTask&)> _workItem;
    std::mutex _queueMutex;
    std::condition_variable _queueCv;
    std::condition_variable _drainedCv;
    std::queue<CopyTask> _taskQueue;
    std::vector<std::thread> _workers;
    std::size_t _activeTasks;
    bool _shutdown;
};
