#pragma once

#include "TransferTypes.hpp"
#include "TransferTask.hpp"
#include "SourceDigestRegistry.hpp"
#include "WorkerPool.hpp"
#include "EventBus.hpp"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

class TransferIO;
class ProgressLedger;
class PostProcessor;

struct SchedulerSettings
{
    unsigned int MaxConcurrency = 2;
    unsigned int PerDestinationConcurrency = 1;
    size_t ChunkSize = 4 * 1024 * 1024;
};

struct JobSnapshot
{
    JobId Id;
    JobType Type = JobType::Copy;
    JobStatus Status = JobStatus::Queued;
    bool ChecksumMismatch = false;
    size_t Pending = 0;
    size_t Active = 0;
    size_t Completed = 0;
    size_t Skipped = 0;
    size_t Failed = 0;
    size_t Cancelled = 0;
    uint64_t TotalBytes = 0;
    uint64_t TransferredBytes = 0;
    std::vector<Task> Tasks;
};

// Expands job specs into tasks, drives them through the worker pool and owns every task
// between executions. All job and task state lives behind one mutex; callers only see copies.
class JobScheduler : public TaskObserver
{
public:
    JobScheduler(TransferIO& IO, ProgressLedger& Ledger, EventBus& Bus, SchedulerSettings Settings, PostProcessor* Post = nullptr);
    ~JobScheduler() override;

    JobScheduler(const JobScheduler&) = delete;
    JobScheduler& operator=(const JobScheduler&) = delete;

    // Throws std::invalid_argument for a duplicate id or a job without destinations.
    JobId Submit(const JobSpec& Spec);

    bool Pause(const JobId& Id);
    bool Resume(const JobId& Id);
    bool Cancel(const JobId& Id);
    // Re-queues Failed tasks as Pending; their ledger entries make them resume. Returns the count.
    size_t RetryFailed(const JobId& Id);
    bool Promote(const JobId& Id);

    std::optional<JobSnapshot> Snapshot(const JobId& Id);

    // Blocks until every task of the job is terminal. Throws std::out_of_range for unknown jobs.
    JobStatus WaitForJob(const JobId& Id);
    std::optional<JobStatus> WaitForJob(const JobId& Id, std::chrono::milliseconds Timeout);
    void WaitForIdle();

    // Stops admitting work and waits for in-flight tasks. Queued tasks stay Pending.
    void Shutdown();

    SourceDigestRegistry& Digests() { return DigestRegistry; }
    WorkerPool& Pool() { return Workers; }

    static TaskId MakeTaskId(const JobId& Job, const std::string& SourcePath, const std::string& DestinationPath);

    void OnTaskStateChanged(const Task& Snapshot, TaskStatus OldStatus) override;
    void OnTaskProgress(const Task& Snapshot) override;

private:
    struct TaskRecord
    {
        Task State;
        CancelToken Cancel;
        bool Scheduled = false;  // queued in the pool or executing
    };

    struct JobRecord
    {
        JobSpec Spec;
        JobStatus Status = JobStatus::Queued;
        bool ChecksumMismatch = false;
        bool CancelRequested = false;
        bool Finished = false;
        std::vector<TaskId> Order;
        std::unordered_map<TaskId, TaskRecord> Tasks;
    };

    using EventList = std::vector<TransferEvent>;

    TransferIO& IO;
    ProgressLedger& Ledger;
    EventBus& Bus;
    SchedulerSettings Settings;
    PostProcessor* Post;

    std::mutex SchedulerMutex;
    std::condition_variable JobDone_CV;
    std::unordered_map<JobId, JobRecord> Jobs;
    bool ShuttingDown = false;

    SourceDigestRegistry DigestRegistry;
    WorkerPool Workers;

    JobRecord& FindJob(const JobId& Id);
    void SeedKnownDigests(const JobRecord& Job);
    void Enqueue(JobRecord& Job, TaskRecord& Record);
    void SetJobStatus(JobRecord& Job, JobStatus Status, EventList& Events);
    void WithdrawQueued(JobRecord& Job);
    void CheckFinished(JobRecord& Job, EventList& Events);
    void PublishAll(const EventList& Events);

    static TaskStateChangedEvent MakeStateEvent(const Task& State, TaskStatus Old);
};
