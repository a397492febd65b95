#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <unordered_map>

#include "ControlFlow.hpp"
#include "Logger.hpp"
#include "ConfigGlobal.hpp"
#include "ThreadPool.hpp"
#include "FailureDetect.hpp"
#include "EventBus.hpp"
#include "EventListeners.hpp"
#include "PostProcessor.hpp"
#include "ProgressLedger.hpp"
#include "TransferIO.hpp"

namespace
{
    std::atomic<bool> InterruptRequested{ false };

    void OnInterrupt(int)
    {
        InterruptRequested.store(true);
    }
}

int ControlFlow::Run()
{
    std::cout << "Starting Offloader \n";

    // Parsed before the log opens so LogDir from the config applies.
    bool ConfigOk = Parser.Parse(ConfigGlobal::ConfigFile);
    Log.Init(ConfigGlobal::LogDir);

    if (!ConfigOk)
    {
        for (const auto& Error : Parser.GetErrors())
        {
            std::cerr << "Config Error: " << Error << "\n";
            Log.Error(Error);
        }
        std::cerr << "Check Errors and Fix Them, Exiting Offload\n";
        Log.Error("Check Errors and Fix Them, Exiting Offload");
        return 1;
    }
    Log.Info("Config Parsed Successfully.");
    std::cout << "Config Parsed Successfully.\n";

    for (const auto& Info : Parser.GetInfos())
    {
        std::cout << "Config Info: " << Info << "\n";
        Log.Info(Info);
    }

    std::unique_ptr<ProgressLedger> Ledger;
    try
    {
        Ledger = std::make_unique<ProgressLedger>(ConfigGlobal::LedgerDir);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Cannot open progress ledger: " << e.what() << "\n";
        Log.Error(std::string("Cannot open progress ledger: ") + e.what());
        return 1;
    }

    FailureDetect::Initialize(ConfigGlobal::LedgerDir);
    if (FailureDetect::WasLastFailure())
    {
        std::cout << "Previous offload did not complete successfully.\n";
        std::cout << "Partially copied files will resume from the last confirmed offset when the same sources and destinations are used.\n";
        Log.Warn("Previous offload incomplete, resumable ledger entries may exist");
    }
    else if (FailureDetect::WasLastSuccess())
    {
        std::cout << "Last Offload Status - Success.\n";
        Log.Info("Last offload completed successfully.");
    }
    FailureDetect::MarkFailure();

    size_t Removed = Ledger->Recover();
    size_t Surviving = Ledger->List().size();
    Log.Info("[ProgressLedger] Recovery removed " + std::to_string(Removed) + " stale record(s), " +
             std::to_string(Surviving) + " resumable entr" + (Surviving == 1 ? "y" : "ies") + " kept");

    LogRequest();

    Log.Info("Scanning Sources...");
    std::cout << "Scanning Sources...\n";
    std::vector<FileDescriptor> Files = ScanSources();
    Log.Info("Scanning Sources Complete, " + std::to_string(Files.size()) + " file(s)");
    std::cout << "Scanning Source Complete, " << Files.size() << " file(s)\n";

    JobSpec Spec = BuildJob(std::move(Files));
    uint64_t TotalBytes = 0;
    for (const auto& File : Spec.Files)
    {
        TotalBytes += File.Size * Spec.Destinations.size();
    }

    LogEventListener LogListener;
    ConsoleProgressListener Console(std::cout, Spec.Id, TotalBytes);
    EventBus Bus(ConfigGlobal::EventQueueCapacity);
    Bus.Subscribe("Log", LogListener);
    Bus.Subscribe("Console", [&Console](const TransferEvent& Event) { Console(Event); });

    if (!ConfigGlobal::EjectCommand.empty())
    {
        std::string EjectTemplate = ConfigGlobal::EjectCommand;
        Bus.Subscribe("Eject", [EjectTemplate](const TransferEvent& Event)
        {
            const auto* Eject = std::get_if<EjectRequestedEvent>(&Event);
            if (Eject == nullptr)
            {
                return;
            }
            std::string Command = ShellCommand::Expand(EjectTemplate, { { "source", Eject->SourceRootId } });
            int Status = ShellCommand::Run(Command);
            if (Status != 0)
            {
                Log.Error("[Eject] '" + Command + "' exited with " + std::to_string(Status));
            }
            else
            {
                Log.Info("[Eject] Ejected " + Eject->SourceRootId);
            }
        });
    }

    std::unique_ptr<ExternalCommandPostProcessor> Post;
    if (!ConfigGlobal::PostProcessCommand.empty() && Spec.Options.PostProcess)
    {
        Post = std::make_unique<ExternalCommandPostProcessor>(ConfigGlobal::PostProcessCommand);
    }

    SchedulerSettings Settings;
    Settings.MaxConcurrency = ConfigGlobal::MaxConcurrency;
    Settings.PerDestinationConcurrency = ConfigGlobal::PerDestinationConcurrency;
    Settings.ChunkSize = ConfigGlobal::ChunkSizeBytes;

    PosixTransferIO IO;
    JobStatus Final = JobStatus::Failed;
    std::optional<JobSnapshot> Snap;
    {
        JobScheduler Scheduler(IO, *Ledger, Bus, Settings, Post.get());

        Log.Info("Initiating " + ToString(Spec.Options.Type) + "...");
        std::cout << "Initiating " << ToString(Spec.Options.Type) << "...\n";

        try
        {
            Scheduler.Submit(Spec);
        }
        catch (const std::exception& e)
        {
            std::cerr << "Cannot start job: " << e.what() << "\n";
            Log.Error(std::string("Cannot start job: ") + e.what());
            return 1;
        }

        PruneLedger(*Ledger, Scheduler.Snapshot(Spec.Id));

        InterruptRequested.store(false);
        auto PreviousHandler = std::signal(SIGINT, OnInterrupt);
        bool CancelSent = false;
        while (true)
        {
            auto Status = Scheduler.WaitForJob(Spec.Id, std::chrono::milliseconds(200));
            if (Status)
            {
                Final = *Status;
                break;
            }
            if (InterruptRequested.load() && !CancelSent)
            {
                std::cout << "\nInterrupted, cancelling after the current chunk...\n";
                Log.Warn("Interrupt received, cancelling " + Spec.Id);
                Scheduler.Cancel(Spec.Id);
                CancelSent = true;
            }
            if (auto Current = Scheduler.Snapshot(Spec.Id); Current && Current->Status == JobStatus::Paused && !CancelSent)
            {
                std::cerr << "\nJob paused after an engine fault, check the log. Cancelling.\n";
                Scheduler.Cancel(Spec.Id);
                CancelSent = true;
            }
        }
        std::signal(SIGINT, PreviousHandler);

        Snap = Scheduler.Snapshot(Spec.Id);
        Scheduler.Shutdown();
    }

    if (Post)
    {
        Post->Drain();
        if (Post->FailureCount() > 0)
        {
            Log.Warn("[PostProcess] " + std::to_string(Post->FailureCount()) + " command(s) failed");
        }
    }
    Bus.Flush();
    Bus.Shutdown();

    if (Snap)
    {
        PrintSummary(*Snap);
    }

    if (Final == JobStatus::Completed)
    {
        FailureDetect::MarkSuccess();
    }

    Log.CleanupOldLogs(ConfigGlobal::MaxLogFiles);
    std::cout << "Logs Saved to : " << Log.CurrentLogFilePath << "\n";
    std::cout << "Offload " << ToString(Final) << " \n";
    return Final == JobStatus::Completed ? 0 : 1;
}

void ControlFlow::PruneLedger(ProgressLedger& Ledger, const std::optional<JobSnapshot>& Submitted)
{
    std::set<TaskId> Claimed;
    if (Submitted)
    {
        for (const auto& State : Submitted->Tasks)
        {
            Claimed.insert(State.Id);
        }
    }

    int64_t Now = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    int64_t Cutoff = Now - static_cast<int64_t>(ConfigGlobal::LedgerRetentionDays) * 24 * 60 * 60;
    try
    {
        size_t Pruned = Ledger.Prune(Claimed, Cutoff);
        if (Pruned > 0)
        {
            Log.Info("Pruned " + std::to_string(Pruned) + " ledger record(s) older than " + std::to_string(ConfigGlobal::LedgerRetentionDays) + " day(s)");
        }
    }
    catch (const TransferError& e)
    {
        Log.Warn(std::string("Ledger pruning failed: ") + e.what());
    }
}

void ControlFlow::LogRequest()
{
    const OffloadRequest& Request = Parser.GetRequest();
    Log.Info("Job: " + Request.Id + " (" + ToString(Request.Options.Type) + ", " + ToString(Request.Options.Algorithm) +
             ", skip " + ToString(Request.Options.SkipExisting) + ")");

    Log.Info("Sources:");
    for (const auto& Source : Parser.GetSources())
    {
        Log.Info("  " + Source);
    }

    Log.Info("Destinations:");
    for (const auto& Destination : Parser.GetDestinations())
    {
        Log.Info("  " + Destination);
    }

    const auto& Excludes = Parser.GetExcludes();
    if (!Excludes.empty())
    {
        Log.Info("Excludes:");
        for (const auto& Exclude : Excludes)
        {
            Log.Info("  " + Exclude);
        }
    }
}

std::vector<FileDescriptor> ControlFlow::ScanSources()
{
    const OffloadRequest& Request = Parser.GetRequest();

    ThreadPool Pool(std::max<size_t>(1, std::min<size_t>(Request.Sources.size(), 4)));
    std::unordered_map<std::string, std::vector<FileDescriptor>> PerSourceResults;
    std::mutex ResultMutex;

    for (const auto& Source : Request.Sources)
    {
        Pool.Submit([Source, &Request, &PerSourceResults, &ResultMutex]()
        {
            FileScanner LocalScanner;
            LocalScanner.SetExcludes(Request.Excludes);
            LocalScanner.SetLayout(Request.Layout);
            LocalScanner.Scan(Source);
            std::lock_guard<std::mutex> Lock(ResultMutex);
            PerSourceResults[Source] = LocalScanner.GetFiles();
        });
    }
    Pool.Join();

    // Keep the configured source order.
    std::vector<FileDescriptor> Files;
    for (const auto& Source : Request.Sources)
    {
        for (auto& File : PerSourceResults[Source])
        {
            Log.Info("Scanned: " + File.RelativePath + " | " + FormatBytes(File.Size) + " | mtime: " + std::to_string(File.MTime));
            Files.push_back(std::move(File));
        }
    }
    return Files;
}

JobSpec ControlFlow::BuildJob(std::vector<FileDescriptor> Files) const
{
    const OffloadRequest& Request = Parser.GetRequest();

    JobSpec Spec;
    Spec.Id = Request.Id;
    Spec.Files = std::move(Files);
    Spec.Destinations = Request.Destinations;
    Spec.Options = Request.Options;
    return Spec;
}

void ControlFlow::PrintSummary(const JobSnapshot& Snap) const
{
    std::cout << "\nSummary for " << Snap.Id << ": " << ToString(Snap.Status) << "\n";
    std::cout << "  Completed: " << Snap.Completed << "  Skipped: " << Snap.Skipped
              << "  Failed: " << Snap.Failed << "  Cancelled: " << Snap.Cancelled << "\n";
    std::cout << "  Transferred: " << FormatBytes(Snap.TransferredBytes) << " / " << FormatBytes(Snap.TotalBytes) << "\n";

    for (const auto& State : Snap.Tasks)
    {
        if (State.Status == TaskStatus::Failed)
        {
            std::cout << "  FAILED " << State.Source.SourcePath << " -> " << State.DestinationPath
                      << " (" << ToString(State.ErrorKind) << ": " << State.ErrorDetail << ")\n";
        }
    }

    if (Snap.ChecksumMismatch)
    {
        std::cout << "  CHECKSUM MISMATCH detected. Do not erase the source media.\n";
        Log.Error("Checksum mismatch in " + Snap.Id + ", source media must be kept");
    }
}
