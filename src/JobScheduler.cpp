#include "JobScheduler.hpp"
#include "ChecksumEngine.hpp"
#include "Logger.hpp"
#include "PostProcessor.hpp"
#include "ProgressLedger.hpp"
#include "TransferIO.hpp"
#include <xxhash.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <set>
#include <stdexcept>

namespace FS = std::filesystem;

JobScheduler::JobScheduler(TransferIO& IO, ProgressLedger& Ledger, EventBus& Bus, SchedulerSettings Settings, PostProcessor* Post)
    : IO(IO), Ledger(Ledger), Bus(Bus), Settings(Settings), Post(Post),
      Workers(Settings.MaxConcurrency, Settings.PerDestinationConcurrency)
{
    if (this->Settings.ChunkSize == 0)
    {
        this->Settings.ChunkSize = 4 * 1024 * 1024;
    }
}

JobScheduler::~JobScheduler()
{
    Shutdown();
}

TaskId JobScheduler::MakeTaskId(const JobId& Job, const std::string& SourcePath, const std::string& DestinationPath)
{
    std::string Key = SourcePath;
    Key.push_back('\0');
    Key += DestinationPath;

    XXH64_canonical_t Canonical;
    XXH64_canonicalFromHash(&Canonical, XXH64(Key.data(), Key.size(), 0));
    return Job + "-" + ChecksumEngine::ToHex(Canonical.digest, sizeof(Canonical.digest));
}

JobScheduler::JobRecord& JobScheduler::FindJob(const JobId& Id)
{
    auto it = Jobs.find(Id);
    if (it == Jobs.end())
    {
        throw std::out_of_range("Unknown job " + Id);
    }
    return it->second;
}

TaskStateChangedEvent JobScheduler::MakeStateEvent(const Task& State, TaskStatus Old)
{
    TaskStateChangedEvent Event;
    Event.Task = State.Id;
    Event.Job = State.Job;
    Event.Old = Old;
    Event.New = State.Status;
    Event.ErrorKind = State.ErrorKind;
    if (State.Status == TaskStatus::Failed || State.Status == TaskStatus::Cancelled)
    {
        Event.Error = State.ErrorDetail;
    }
    Event.SourcePath = State.Source.SourcePath;
    Event.DestinationPath = State.DestinationPath;
    Event.Checksum = State.Checksum;
    return Event;
}

JobId JobScheduler::Submit(const JobSpec& Spec)
{
    if (Spec.Id.empty())
    {
        throw std::invalid_argument("Job id must not be empty");
    }
    if (Spec.Destinations.empty())
    {
        throw std::invalid_argument("Job " + Spec.Id + " has no destinations");
    }

    EventList Events;
    {
        std::lock_guard<std::mutex> Lock(SchedulerMutex);
        if (ShuttingDown)
        {
            throw std::runtime_error("Scheduler is shutting down");
        }
        if (Jobs.count(Spec.Id) != 0)
        {
            throw std::invalid_argument("Job " + Spec.Id + " already submitted");
        }

        JobRecord& Job = Jobs[Spec.Id];
        Job.Spec = Spec;

        SeedKnownDigests(Job);

        for (const auto& File : Spec.Files)
        {
            for (const auto& Root : Spec.Destinations)
            {
                std::string Relative = File.RelativePath.empty() ? FS::path(File.SourcePath).filename().string() : File.RelativePath;

                Task State;
                State.Job = Spec.Id;
                State.Kind = Spec.Options.Type;
                State.Source = File;
                State.DestinationRoot = Root;
                State.DestinationPath = (FS::path(Root) / Relative).lexically_normal().string();
                State.Algorithm = Spec.Options.Algorithm;
                State.SkipExisting = Spec.Options.Type == JobType::Copy ? Spec.Options.SkipExisting : SkipPolicy::Off;
                State.Id = MakeTaskId(Spec.Id, File.SourcePath, State.DestinationPath);

                if (Job.Tasks.count(State.Id) != 0)
                {
                    Log.Warn("[JobScheduler] " + Spec.Id + ": duplicate entry " + File.SourcePath + " -> " + State.DestinationPath + " ignored");
                    continue;
                }

                Job.Order.push_back(State.Id);
                TaskRecord& Record = Job.Tasks[State.Id];
                Record.State = std::move(State);
            }
        }

        Log.Info("[JobScheduler] Submitted " + Spec.Id + " (" + ToString(Spec.Options.Type) + ", " + ToString(Spec.Options.Algorithm) + "): " +
                 std::to_string(Spec.Files.size()) + " file(s) x " + std::to_string(Spec.Destinations.size()) + " destination(s) = " +
                 std::to_string(Job.Order.size()) + " task(s)");

        for (const auto& Id : Job.Order)
        {
            Enqueue(Job, Job.Tasks[Id]);
        }
        CheckFinished(Job, Events);
        PublishAll(Events);
    }
    return Spec.Id;
}

void JobScheduler::SeedKnownDigests(const JobRecord& Job)
{
    for (const auto& File : Job.Spec.Files)
    {
        if (File.Checksum && !File.Checksum->empty())
        {
            std::string Known = *File.Checksum;
            std::transform(Known.begin(), Known.end(), Known.begin(), [](unsigned char Ch) { return static_cast<char>(std::tolower(Ch)); });
            DigestRegistry.Seed(Job.Spec.Id, File.SourcePath, Job.Spec.Options.Algorithm, Known);
        }
    }
}

void JobScheduler::Enqueue(JobRecord& Job, TaskRecord& Record)
{
    Record.Cancel = std::make_shared<std::atomic<bool>>(false);
    Record.Scheduled = true;

    TaskContext Context{ IO, Ledger, DigestRegistry, Settings.ChunkSize, this };

    WorkItem Item;
    Item.Job = Job.Spec.Id;
    Item.Id = Record.State.Id;
    Item.DestinationKey = Record.State.DestinationRoot;
    Item.JobLimit = Job.Spec.Options.MaxConcurrency;
    Item.Work = std::make_unique<TaskWork>(MakeTaskWork(Record.State, Context, Record.Cancel));
    Workers.Submit(std::move(Item));
}

void JobScheduler::SetJobStatus(JobRecord& Job, JobStatus Status, EventList& Events)
{
    if (Job.Status == Status)
    {
        return;
    }
    Events.push_back(JobStateChangedEvent{ Job.Spec.Id, Job.Status, Status });
    Log.Info("[JobScheduler] " + Job.Spec.Id + ": " + ToString(Job.Status) + " -> " + ToString(Status));
    Job.Status = Status;
}

void JobScheduler::WithdrawQueued(JobRecord& Job)
{
    for (const auto& Item : Workers.Withdraw(Job.Spec.Id))
    {
        auto it = Job.Tasks.find(Item.Id);
        if (it != Job.Tasks.end())
        {
            it->second.Scheduled = false;
        }
    }
}

void JobScheduler::CheckFinished(JobRecord& Job, EventList& Events)
{
    if (Job.Finished)
    {
        return;
    }

    std::vector<TaskStatus> States;
    States.reserve(Job.Tasks.size());
    for (const auto& Id : Job.Order)
    {
        TaskStatus Status = Job.Tasks[Id].State.Status;
        if (!IsTerminal(Status))
        {
            return;
        }
        States.push_back(Status);
    }

    Job.Finished = true;
    DigestRegistry.ForgetJob(Job.Spec.Id);
    JobStatus Final = ComputeJobStatus(States);
    SetJobStatus(Job, Final, Events);

    JobFinishedEvent Done;
    Done.Job = Job.Spec.Id;
    Done.Status = Final;
    Done.ChecksumMismatch = Job.ChecksumMismatch;
    for (TaskStatus Status : States)
    {
        switch (Status)
        {
        case TaskStatus::Completed: ++Done.Completed; break;
        case TaskStatus::Skipped:   ++Done.Skipped; break;
        case TaskStatus::Failed:    ++Done.Failed; break;
        default:                    ++Done.Cancelled; break;
        }
    }
    Events.push_back(Done);

    if (Final == JobStatus::Completed && Job.Spec.Options.EjectOnComplete)
    {
        std::set<std::string> Roots;
        for (const auto& File : Job.Spec.Files)
        {
            Roots.insert(File.SourceRoot.empty() ? FS::path(File.SourcePath).parent_path().string() : File.SourceRoot);
        }
        for (const auto& Root : Roots)
        {
            Log.Info("[JobScheduler] " + Job.Spec.Id + ": requesting eject of " + Root);
            Events.push_back(EjectRequestedEvent{ Job.Spec.Id, Root });
        }
    }
    else if (Job.Spec.Options.EjectOnComplete)
    {
        Log.Warn("[JobScheduler] " + Job.Spec.Id + " finished " + ToString(Final) + ", source media will not be ejected");
    }

    JobDone_CV.notify_all();
}

// Called with SchedulerMutex held so subscribers see events in state order.
void JobScheduler::PublishAll(const EventList& Events)
{
    for (const auto& Event : Events)
    {
        Bus.Publish(Event);
    }
}

bool JobScheduler::Pause(const JobId& Id)
{
    EventList Events;
    {
        std::lock_guard<std::mutex> Lock(SchedulerMutex);
        auto it = Jobs.find(Id);
        if (it == Jobs.end() || (it->second.Status != JobStatus::Queued && it->second.Status != JobStatus::Running))
        {
            return false;
        }
        WithdrawQueued(it->second);
        SetJobStatus(it->second, JobStatus::Paused, Events);
        PublishAll(Events);
    }
    return true;
}

bool JobScheduler::Resume(const JobId& Id)
{
    EventList Events;
    {
        std::lock_guard<std::mutex> Lock(SchedulerMutex);
        auto it = Jobs.find(Id);
        if (it == Jobs.end() || it->second.Status != JobStatus::Paused || it->second.CancelRequested || ShuttingDown)
        {
            return false;
        }
        JobRecord& Job = it->second;
        SetJobStatus(Job, JobStatus::Running, Events);

        size_t Requeued = 0;
        for (const auto& TaskKey : Job.Order)
        {
            TaskRecord& Record = Job.Tasks[TaskKey];
            if (Record.State.Status == TaskStatus::Pending && !Record.Scheduled)
            {
                Enqueue(Job, Record);
                ++Requeued;
            }
        }
        Log.Info("[JobScheduler] " + Id + ": resumed with " + std::to_string(Requeued) + " task(s) re-admitted");
        CheckFinished(Job, Events);
        PublishAll(Events);
    }
    return true;
}

bool JobScheduler::Cancel(const JobId& Id)
{
    EventList Events;
    {
        std::lock_guard<std::mutex> Lock(SchedulerMutex);
        auto it = Jobs.find(Id);
        if (it == Jobs.end() || it->second.Finished)
        {
            return false;
        }
        JobRecord& Job = it->second;
        Job.CancelRequested = true;
        WithdrawQueued(Job);

        for (const auto& TaskKey : Job.Order)
        {
            TaskRecord& Record = Job.Tasks[TaskKey];
            if (IsTerminal(Record.State.Status))
            {
                continue;
            }
            if (Record.Scheduled)
            {
                Record.Cancel->store(true);
                continue;
            }

            TaskStatus Old = Record.State.Status;
            Record.State.Status = TaskStatus::Cancelled;
            Record.State.ErrorKind = TransferErrorKind::Cancelled;
            Record.State.ErrorDetail = "Cancelled before start";
            Events.push_back(MakeStateEvent(Record.State, Old));
        }

        Log.Info("[JobScheduler] " + Id + ": cancel requested");
        CheckFinished(Job, Events);
        PublishAll(Events);
    }
    return true;
}

size_t JobScheduler::RetryFailed(const JobId& Id)
{
    EventList Events;
    size_t Retried = 0;
    {
        std::lock_guard<std::mutex> Lock(SchedulerMutex);
        auto it = Jobs.find(Id);
        if (it == Jobs.end() || it->second.CancelRequested || ShuttingDown)
        {
            return 0;
        }
        JobRecord& Job = it->second;
        bool WasFinished = Job.Finished;

        for (const auto& TaskKey : Job.Order)
        {
            TaskRecord& Record = Job.Tasks[TaskKey];
            if (Record.State.Status != TaskStatus::Failed)
            {
                continue;
            }
            if (Retried == 0 && WasFinished)
            {
                SeedKnownDigests(Job);
            }
            // The source may have been fixed or swapped since the failed attempt.
            DigestRegistry.Forget(Id, Record.State.Source.SourcePath, Record.State.Algorithm);
            Record.State.Status = TaskStatus::Pending;
            Record.State.ErrorKind = TransferErrorKind::None;
            Record.State.ErrorDetail.clear();
            Record.State.Checksum.clear();
            Events.push_back(MakeStateEvent(Record.State, TaskStatus::Failed));
            ++Retried;
        }

        if (Retried == 0)
        {
            return 0;
        }

        Job.ChecksumMismatch = false;
        for (const auto& Item : Job.Tasks)
        {
            if (Item.second.State.Status == TaskStatus::Failed && Item.second.State.ErrorKind == TransferErrorKind::ChecksumMismatch)
            {
                Job.ChecksumMismatch = true;
            }
        }

        // Finished jobs reopen; the one transition allowed to go backwards besides Paused -> Running.
        Job.Finished = false;
        if (Job.Status != JobStatus::Paused)
        {
            SetJobStatus(Job, JobStatus::Running, Events);
            for (const auto& TaskKey : Job.Order)
            {
                TaskRecord& Record = Job.Tasks[TaskKey];
                if (Record.State.Status == TaskStatus::Pending && !Record.Scheduled)
                {
                    Enqueue(Job, Record);
                }
            }
        }
        Log.Info("[JobScheduler] " + Id + ": retrying " + std::to_string(Retried) + " failed task(s)");
        PublishAll(Events);
    }
    return Retried;
}

bool JobScheduler::Promote(const JobId& Id)
{
    {
        std::lock_guard<std::mutex> Lock(SchedulerMutex);
        if (Jobs.count(Id) == 0)
        {
            return false;
        }
    }
    bool Promoted = Workers.Promote(Id);
    if (Promoted)
    {
        Log.Info("[JobScheduler] " + Id + " promoted to the front of the queue");
    }
    return Promoted;
}

std::optional<JobSnapshot> JobScheduler::Snapshot(const JobId& Id)
{
    std::lock_guard<std::mutex> Lock(SchedulerMutex);
    auto it = Jobs.find(Id);
    if (it == Jobs.end())
    {
        return std::nullopt;
    }
    const JobRecord& Job = it->second;

    JobSnapshot Snap;
    Snap.Id = Id;
    Snap.Type = Job.Spec.Options.Type;
    Snap.Status = Job.Status;
    Snap.ChecksumMismatch = Job.ChecksumMismatch;

    for (const auto& TaskKey : Job.Order)
    {
        const Task& State = Job.Tasks.at(TaskKey).State;
        switch (State.Status)
        {
        case TaskStatus::Pending:   ++Snap.Pending; break;
        case TaskStatus::Copying:
        case TaskStatus::Verifying: ++Snap.Active; break;
        case TaskStatus::Completed: ++Snap.Completed; break;
        case TaskStatus::Skipped:   ++Snap.Skipped; break;
        case TaskStatus::Failed:    ++Snap.Failed; break;
        case TaskStatus::Cancelled: ++Snap.Cancelled; break;
        }
        Snap.TotalBytes += State.Source.Size;
        Snap.TransferredBytes += State.BytesTransferred;
        Snap.Tasks.push_back(State);
    }
    return Snap;
}

JobStatus JobScheduler::WaitForJob(const JobId& Id)
{
    std::unique_lock<std::mutex> Lock(SchedulerMutex);
    JobRecord& Job = FindJob(Id);
    JobDone_CV.wait(Lock, [&Job]() { return Job.Finished; });
    return Job.Status;
}

std::optional<JobStatus> JobScheduler::WaitForJob(const JobId& Id, std::chrono::milliseconds Timeout)
{
    std::unique_lock<std::mutex> Lock(SchedulerMutex);
    JobRecord& Job = FindJob(Id);
    if (!JobDone_CV.wait_for(Lock, Timeout, [&Job]() { return Job.Finished; }))
    {
        return std::nullopt;
    }
    return Job.Status;
}

void JobScheduler::WaitForIdle()
{
    Workers.WaitUntilIdle();
}

void JobScheduler::Shutdown()
{
    {
        std::lock_guard<std::mutex> Lock(SchedulerMutex);
        if (ShuttingDown)
        {
            return;
        }
        ShuttingDown = true;
    }

    std::vector<WorkItem> Remaining = Workers.Shutdown();

    std::lock_guard<std::mutex> Lock(SchedulerMutex);
    for (const auto& Item : Remaining)
    {
        auto JobIt = Jobs.find(Item.Job);
        if (JobIt == Jobs.end())
        {
            continue;
        }
        auto TaskIt = JobIt->second.Tasks.find(Item.Id);
        if (TaskIt != JobIt->second.Tasks.end())
        {
            TaskIt->second.Scheduled = false;
        }
    }
    if (!Remaining.empty())
    {
        Log.Info("[JobScheduler] Shut down with " + std::to_string(Remaining.size()) + " task(s) left Pending");
    }
}

void JobScheduler::OnTaskStateChanged(const Task& Snapshot, TaskStatus OldStatus)
{
    EventList Events;
    std::optional<PostProcessRequest> Offer;
    {
        std::lock_guard<std::mutex> Lock(SchedulerMutex);
        auto JobIt = Jobs.find(Snapshot.Job);
        if (JobIt == Jobs.end())
        {
            return;
        }
        JobRecord& Job = JobIt->second;
        auto TaskIt = Job.Tasks.find(Snapshot.Id);
        if (TaskIt == Job.Tasks.end())
        {
            return;
        }
        TaskRecord& Record = TaskIt->second;
        Record.State = Snapshot;
        Events.push_back(MakeStateEvent(Snapshot, OldStatus));

        if (OldStatus == TaskStatus::Pending && Job.Status == JobStatus::Queued)
        {
            SetJobStatus(Job, JobStatus::Running, Events);
        }

        if (IsTerminal(Snapshot.Status))
        {
            Record.Scheduled = false;

            if (Snapshot.Status == TaskStatus::Completed && Post != nullptr && Job.Spec.Options.PostProcess && Snapshot.Kind == JobType::Copy)
            {
                Offer = PostProcessRequest{ Snapshot.Job, Snapshot.Id, Snapshot.DestinationPath, Snapshot.Checksum };
            }

            if (Snapshot.Status == TaskStatus::Failed && Snapshot.ErrorKind == TransferErrorKind::ChecksumMismatch)
            {
                Job.ChecksumMismatch = true;
            }

            if (Snapshot.Status == TaskStatus::Failed && Snapshot.ErrorKind == TransferErrorKind::EngineFault &&
                (Job.Status == JobStatus::Running || Job.Status == JobStatus::Queued))
            {
                Log.Error("[JobScheduler] " + Job.Spec.Id + ": engine fault in " + Snapshot.Id + ", pausing admission of remaining tasks");
                WithdrawQueued(Job);
                SetJobStatus(Job, JobStatus::Paused, Events);
            }

            CheckFinished(Job, Events);
        }
        PublishAll(Events);
    }
    if (Offer)
    {
        Post->Offer(*Offer);
    }
}

void JobScheduler::OnTaskProgress(const Task& Snapshot)
{
    {
        std::lock_guard<std::mutex> Lock(SchedulerMutex);
        auto JobIt = Jobs.find(Snapshot.Job);
        if (JobIt == Jobs.end())
        {
            return;
        }
        auto TaskIt = JobIt->second.Tasks.find(Snapshot.Id);
        if (TaskIt == JobIt->second.Tasks.end())
        {
            return;
        }
        TaskIt->second.State.BytesTransferred = Snapshot.BytesTransferred;
        TaskIt->second.State.ResumedFrom = Snapshot.ResumedFrom;
        Bus.Publish(TaskProgressEvent{ Snapshot.Id, Snapshot.Job, Snapshot.BytesTransferred, Snapshot.Source.Size });
    }
}
