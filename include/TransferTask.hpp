#pragma once

#include "TransferTypes.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <variant>

class TransferIO;
class ProgressLedger;
class SourceDigestRegistry;

using CancelToken = std::shared_ptr<std::atomic<bool>>;

// Receives snapshots of a task as it executes. Called on the worker thread.
class TaskObserver
{
public:
    virtual ~TaskObserver() = default;

    virtual void OnTaskStateChanged(const Task& Snapshot, TaskStatus OldStatus) = 0;
    virtual void OnTaskProgress(const Task& Snapshot) = 0;
};

struct TaskContext
{
    TransferIO& IO;
    ProgressLedger& Ledger;
    SourceDigestRegistry& Digests;
    size_t ChunkSize;
    TaskObserver* Observer = nullptr;
};

// Bookkeeping shared by every task kind: status transitions, cancellation and error capture.
class TaskCore
{
public:
    TaskCore(Task State, TaskContext Context, CancelToken Cancel);

    Task Current;
    TaskContext Context;
    CancelToken Cancel;

    bool CancelRequested() const;
    void ThrowIfCancelled(const std::string& Where) const;
    void SetStatus(TaskStatus Status);
    void ReportProgress();

    // Digest of the source bytes, hashed at most once per source across all tasks of the job.
    std::string ResolveSourceDigest();

    // Runs Body and turns anything it throws into a terminal state.
    void RunGuarded(const std::function<void()>& Body);

private:
    void Abort(TransferErrorKind Kind, const std::string& Detail);
};

// Copies one source file to one destination, resuming from the ledger, then verifies it.
// Pending -> Copying -> Verifying -> Completed | Failed, Pending -> Skipped, or Cancelled.
class TransferTask
{
public:
    TransferTask(Task State, TaskContext Context, CancelToken Cancel);

    void Execute();
    void RequestCancel();
    const Task& State() const { return Core.Current; }

private:
    TaskCore Core;

    bool TrySkip();
    void CopyPhase();
    void VerifyPhase();
};

// Checks an existing destination file against the source digest without copying.
class VerifyTask
{
public:
    VerifyTask(Task State, TaskContext Context, CancelToken Cancel);

    void Execute();
    void RequestCancel();
    const Task& State() const { return Core.Current; }

private:
    TaskCore Core;
};

using TaskWork = std::variant<TransferTask, VerifyTask>;

TaskWork MakeTaskWork(Task State, TaskContext Context, CancelToken Cancel);
void ExecuteTask(TaskWork& Work);
void CancelTask(TaskWork& Work);
const Task& TaskState(const TaskWork& Work);
