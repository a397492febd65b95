#pragma once

#include "TransferTask.hpp"
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

struct WorkItem
{
    JobId Job;
    TaskId Id;
    std::string DestinationKey;
    unsigned int JobLimit = 0;  // 0 = no per-job cap
    std::unique_ptr<TaskWork> Work;
};

// Fixed set of worker threads bounded globally and per destination.
// Jobs are served first-in-first-out unless promoted; within a job, items are admitted in
// submission order, skipping those whose destination has no free slot.
class WorkerPool
{
public:
    using Executor = std::function<void(WorkItem&)>;

    WorkerPool(unsigned int GlobalMax, unsigned int PerDestinationMax, Executor Run = {});
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void Submit(WorkItem Item);

    // Removes the job's queued items. In-flight items are unaffected.
    std::vector<WorkItem> Withdraw(const JobId& Job);

    // Moves the job's queue ahead of all others. False if nothing of the job is queued.
    bool Promote(const JobId& Job);

    void WaitUntilIdle();

    // Stops admitting work, waits for in-flight items, and returns whatever was still queued.
    std::vector<WorkItem> Shutdown();

    size_t QueuedCount();
    unsigned int RunningCount();
    unsigned int PeakRunning();
    unsigned int PeakRunningFor(const std::string& DestinationKey);

private:
    struct JobQueue
    {
        JobId Job;
        std::deque<WorkItem> Items;
    };

    unsigned int GlobalMax;
    unsigned int PerDestinationMax;
    Executor Run;

    std::deque<JobQueue> Queues;
    std::unordered_map<std::string, unsigned int> RunningPerDestination;
    std::unordered_map<std::string, unsigned int> PeakPerDestination;
    std::unordered_map<JobId, unsigned int> RunningPerJob;
    unsigned int Running = 0;
    unsigned int Peak = 0;
    bool Stopping = false;

    std::mutex PoolMutex;
    std::condition_variable Work_CV;
    std::condition_variable Idle_CV;
    std::vector<std::thread> Workers;

    bool TakeNext(WorkItem& Out);
    void Finish(const WorkItem& Item);
    void WorkerThread();
};
