#include "JobScheduler.hpp"
#include "ChecksumEngine.hpp"
#include "PostProcessor.hpp"
#include "ProgressLedger.hpp"
#include "TestSupport.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <thread>

using namespace TestSupport;

namespace
{
    constexpr size_t CHUNK = 64 * 1024;

    class FaultyLedger : public ProgressLedger
    {
    public:
        using ProgressLedger::ProgressLedger;

        void Record(const TaskId& Id, ChecksumAlgorithm Algorithm, uint64_t Offset, const std::vector<uint8_t>& State) override
        {
            if (Broken.load())
            {
                throw TransferError(TransferErrorKind::EngineFault, "[ProgressLedger] Failed to write ledger: Read-only file system", EROFS);
            }
            ProgressLedger::Record(Id, Algorithm, Offset, State);
        }

        std::atomic<bool> Broken{ false };
    };

    class RecordingPostProcessor : public PostProcessor
    {
    public:
        void Offer(const PostProcessRequest& Request) override
        {
            std::lock_guard<std::mutex> Lock(Mutex);
            Offers.push_back(Request);
        }

        std::vector<PostProcessRequest> Taken()
        {
            std::lock_guard<std::mutex> Lock(Mutex);
            return Offers;
        }

    private:
        std::mutex Mutex;
        std::vector<PostProcessRequest> Offers;
    };

    class JobSchedulerTest : public ::testing::Test
    {
    protected:
        TempDir Dir;
        ScriptedIO IO;
        FaultyLedger Ledger{ Dir / "ledger" };
        EventRecorder Recorder;
        EventBus Bus;
        std::map<std::string, std::vector<uint8_t>> Contents;

        void SetUp() override
        {
            Bus.Subscribe("Recorder", [this](const TransferEvent& E) { Recorder(E); });
        }

        std::unique_ptr<JobScheduler> MakeScheduler(unsigned int Global = 2, unsigned int PerDestination = 1, PostProcessor* Post = nullptr)
        {
            SchedulerSettings Settings;
            Settings.MaxConcurrency = Global;
            Settings.PerDestinationConcurrency = PerDestination;
            Settings.ChunkSize = CHUNK;
            return std::make_unique<JobScheduler>(IO, Ledger, Bus, Settings, Post);
        }

        FileDescriptor AddSource(const std::string& Name, size_t Size, const std::string& Card = "card")
        {
            FileDescriptor File;
            File.SourceRoot = Dir / Card;
            File.SourcePath = Dir / (Card + "/" + Name);
            File.RelativePath = Card + "/" + Name;
            File.Size = Size;
            File.MTime = 1700000000;
            Contents[File.SourcePath] = MakeBytes(Size, static_cast<uint32_t>(Contents.size() + 1));
            WriteFile(File.SourcePath, Contents[File.SourcePath]);
            return File;
        }

        JobSpec MakeJob(const std::string& Id, std::vector<FileDescriptor> Files, std::vector<std::string> Destinations)
        {
            JobSpec Spec;
            Spec.Id = Id;
            Spec.Files = std::move(Files);
            Spec.Destinations = std::move(Destinations);
            return Spec;
        }

        std::string Destination(const std::string& Name) const { return Dir / Name; }

        void ExpectCopied(const FileDescriptor& File, const std::string& Root)
        {
            EXPECT_EQ(ReadFile((FS::path(Root) / File.RelativePath).string()), Contents[File.SourcePath]) << File.SourcePath << " -> " << Root;
        }

        static const Task* FindTask(const JobSnapshot& Snap, const std::string& DestinationRoot)
        {
            for (const auto& State : Snap.Tasks)
            {
                if (State.DestinationRoot == DestinationRoot)
                {
                    return &State;
                }
            }
            return nullptr;
        }
    };
}

TEST_F(JobSchedulerTest, CopiesEveryFileToEveryDestinationHashingSourcesOnce)
{
    auto Scheduler = MakeScheduler(2, 1);
    std::vector<FileDescriptor> Files = { AddSource("A001.mov", 5 * CHUNK + 17), AddSource("A002.mov", 3 * CHUNK), AddSource("A003.wav", 1000) };
    JobSpec Spec = MakeJob("offload", Files, { Destination("shuttle1"), Destination("shuttle2") });

    EXPECT_EQ(Scheduler->Submit(Spec), "offload");
    EXPECT_EQ(Scheduler->WaitForJob("offload"), JobStatus::Completed);

    for (const auto& File : Files)
    {
        ExpectCopied(File, Destination("shuttle1"));
        ExpectCopied(File, Destination("shuttle2"));
        EXPECT_EQ(Scheduler->Digests().HashPasses(File.SourcePath, ChecksumAlgorithm::XXH64), 1u) << File.SourcePath;
    }
    EXPECT_EQ(Scheduler->Digests().TotalHashPasses(), 3u);
    EXPECT_LE(Scheduler->Pool().PeakRunningFor(Destination("shuttle1")), 1u);
    EXPECT_LE(Scheduler->Pool().PeakRunning(), 2u);

    auto Snap = Scheduler->Snapshot("offload");
    ASSERT_TRUE(Snap.has_value());
    EXPECT_EQ(Snap->Completed, 6u);
    EXPECT_EQ(Snap->TotalBytes, Snap->TransferredBytes);
    EXPECT_TRUE(Ledger.List().empty());

    Bus.Flush();
    auto Finished = Recorder.All<JobFinishedEvent>();
    ASSERT_EQ(Finished.size(), 1u);
    EXPECT_EQ(Finished[0].Status, JobStatus::Completed);
    EXPECT_EQ(Finished[0].Completed, 6u);
    EXPECT_FALSE(Finished[0].ChecksumMismatch);
    EXPECT_TRUE(Recorder.All<EjectRequestedEvent>().empty());

    auto JobChanges = Recorder.All<JobStateChangedEvent>();
    ASSERT_GE(JobChanges.size(), 2u);
    EXPECT_EQ(JobChanges.front().New, JobStatus::Running);
    EXPECT_EQ(JobChanges.back().New, JobStatus::Completed);
}

TEST_F(JobSchedulerTest, EmptyJobCompletesImmediately)
{
    auto Scheduler = MakeScheduler();
    Scheduler->Submit(MakeJob("empty", {}, { Destination("shuttle1") }));
    EXPECT_EQ(Scheduler->WaitForJob("empty"), JobStatus::Completed);
}

TEST_F(JobSchedulerTest, RejectsBadSubmissions)
{
    auto Scheduler = MakeScheduler();
    auto File = AddSource("A001.mov", 100);

    EXPECT_THROW(Scheduler->Submit(MakeJob("nodest", { File }, {})), std::invalid_argument);
    Scheduler->Submit(MakeJob("dup", { File }, { Destination("shuttle1") }));
    EXPECT_THROW(Scheduler->Submit(MakeJob("dup", { File }, { Destination("shuttle2") })), std::invalid_argument);
    EXPECT_THROW(Scheduler->WaitForJob("unknown"), std::out_of_range);
    EXPECT_FALSE(Scheduler->Snapshot("unknown").has_value());
    EXPECT_FALSE(Scheduler->Promote("unknown"));
    Scheduler->WaitForJob("dup");
}

TEST_F(JobSchedulerTest, TaskIdsAreStablePerPair)
{
    EXPECT_EQ(JobScheduler::MakeTaskId("job", "/a", "/b"), JobScheduler::MakeTaskId("job", "/a", "/b"));
    EXPECT_NE(JobScheduler::MakeTaskId("job", "/a", "/b"), JobScheduler::MakeTaskId("job", "/a", "/c"));
    EXPECT_NE(JobScheduler::MakeTaskId("job", "/ab", "/c"), JobScheduler::MakeTaskId("job", "/a", "b/c"));
    EXPECT_EQ(JobScheduler::MakeTaskId("job", "/a", "/b").rfind("job-", 0), 0u);
}

TEST_F(JobSchedulerTest, DiskFullThenRetryResumesFromLedger)
{
    auto Scheduler = MakeScheduler(2, 1);
    auto File = AddSource("A001.mov", 10 * CHUNK);
    JobSpec Spec = MakeJob("offload", { File }, { Destination("shuttle1"), Destination("shuttle2") });
    Spec.Options.EjectOnComplete = true;

    IO.FailWritesPast(Destination("shuttle2"), 6 * CHUNK);

    Scheduler->Submit(Spec);
    EXPECT_EQ(Scheduler->WaitForJob("offload"), JobStatus::PartiallyFailed);

    auto Snap = Scheduler->Snapshot("offload");
    ASSERT_TRUE(Snap.has_value());
    const Task* Failed = FindTask(*Snap, Destination("shuttle2"));
    ASSERT_NE(Failed, nullptr);
    EXPECT_EQ(Failed->Status, TaskStatus::Failed);
    EXPECT_EQ(Failed->ErrorKind, TransferErrorKind::DestinationUnavailable);
    EXPECT_EQ(FindTask(*Snap, Destination("shuttle1"))->Status, TaskStatus::Completed);

    auto Entry = Ledger.Read(Failed->Id);
    ASSERT_TRUE(Entry.has_value());
    EXPECT_EQ(Entry->Offset, 6 * CHUNK);

    Bus.Flush();
    EXPECT_TRUE(Recorder.All<EjectRequestedEvent>().empty());

    IO.StopFailing();
    IO.ClearWrites();
    EXPECT_EQ(Scheduler->RetryFailed("offload"), 1u);
    EXPECT_EQ(Scheduler->WaitForJob("offload"), JobStatus::Completed);

    ExpectCopied(File, Destination("shuttle2"));
    for (const auto& W : IO.Writes())
    {
        EXPECT_GE(W.Offset, 6 * CHUNK) << W.Path;
    }
    auto Retried = Scheduler->Snapshot("offload");
    EXPECT_EQ(FindTask(*Retried, Destination("shuttle2"))->ResumedFrom, 6 * CHUNK);
    EXPECT_FALSE(Ledger.Read(Failed->Id).has_value());

    Bus.Flush();
    auto Ejects = Recorder.All<EjectRequestedEvent>();
    ASSERT_EQ(Ejects.size(), 1u);
    EXPECT_EQ(Ejects[0].SourceRootId, Dir / "card");
    EXPECT_EQ(Recorder.All<JobFinishedEvent>().size(), 2u);
}

TEST_F(JobSchedulerTest, EjectRequestedPerSourceRootOnlyWhenCompleted)
{
    auto Scheduler = MakeScheduler();
    JobSpec Spec = MakeJob("offload", { AddSource("A.mov", 100, "cardA"), AddSource("B.mov", 100, "cardA"), AddSource("C.mov", 100, "cardB") },
                           { Destination("shuttle1") });
    Spec.Options.EjectOnComplete = true;

    Scheduler->Submit(Spec);
    EXPECT_EQ(Scheduler->WaitForJob("offload"), JobStatus::Completed);
    Bus.Flush();

    auto Ejects = Recorder.All<EjectRequestedEvent>();
    ASSERT_EQ(Ejects.size(), 2u);
    std::vector<std::string> Roots = { Ejects[0].SourceRootId, Ejects[1].SourceRootId };
    std::sort(Roots.begin(), Roots.end());
    EXPECT_EQ(Roots, (std::vector<std::string>{ Dir / "cardA", Dir / "cardB" }));
}

TEST_F(JobSchedulerTest, AllTasksFailingFailsTheJob)
{
    auto Scheduler = MakeScheduler();
    auto File = AddSource("A001.mov", 1000);
    FS::remove(File.SourcePath);

    JobSpec Spec = MakeJob("offload", { File }, { Destination("shuttle1"), Destination("shuttle2") });
    Spec.Options.EjectOnComplete = true;
    Scheduler->Submit(Spec);
    EXPECT_EQ(Scheduler->WaitForJob("offload"), JobStatus::Failed);

    auto Snap = Scheduler->Snapshot("offload");
    for (const auto& State : Snap->Tasks)
    {
        EXPECT_EQ(State.ErrorKind, TransferErrorKind::SourceUnavailable);
    }
    Bus.Flush();
    EXPECT_TRUE(Recorder.All<EjectRequestedEvent>().empty());
}

TEST_F(JobSchedulerTest, ChecksumMismatchIsFlaggedOnTheJob)
{
    auto Scheduler = MakeScheduler();
    auto File = AddSource("A001.mov", 2 * CHUNK);
    File.Checksum = "0000000000000000";

    Scheduler->Submit(MakeJob("offload", { File }, { Destination("shuttle1") }));
    EXPECT_EQ(Scheduler->WaitForJob("offload"), JobStatus::Failed);
    EXPECT_TRUE(Scheduler->Snapshot("offload")->ChecksumMismatch);

    Bus.Flush();
    auto Finished = Recorder.All<JobFinishedEvent>();
    ASSERT_EQ(Finished.size(), 1u);
    EXPECT_TRUE(Finished[0].ChecksumMismatch);
}

TEST_F(JobSchedulerTest, PauseLetsInFlightFinishAndResumeReadmits)
{
    auto Scheduler = MakeScheduler(1, 1);
    std::vector<FileDescriptor> Files;
    for (int i = 0; i < 4; ++i)
    {
        Files.push_back(AddSource("A00" + std::to_string(i) + ".mov", 2 * CHUNK));
    }

    IO.HoldWrites();
    Scheduler->Submit(MakeJob("offload", Files, { Destination("shuttle1") }));
    ASSERT_TRUE(IO.WaitForHeldWrites(1));

    EXPECT_TRUE(Scheduler->Pause("offload"));
    EXPECT_FALSE(Scheduler->Pause("offload"));
    EXPECT_EQ(Scheduler->Snapshot("offload")->Status, JobStatus::Paused);

    IO.ReleaseWrites();
    Scheduler->WaitForIdle();

    auto Paused = Scheduler->Snapshot("offload");
    EXPECT_EQ(Paused->Status, JobStatus::Paused);
    EXPECT_EQ(Paused->Completed, 1u);
    EXPECT_EQ(Paused->Pending, 3u);
    EXPECT_FALSE(Scheduler->WaitForJob("offload", std::chrono::milliseconds(50)).has_value());

    EXPECT_TRUE(Scheduler->Resume("offload"));
    EXPECT_EQ(Scheduler->WaitForJob("offload"), JobStatus::Completed);
    for (const auto& File : Files)
    {
        ExpectCopied(File, Destination("shuttle1"));
    }
}

TEST_F(JobSchedulerTest, CancelStopsInFlightAndQueuedTasks)
{
    auto Scheduler = MakeScheduler(1, 1);
    std::vector<FileDescriptor> Files;
    for (int i = 0; i < 3; ++i)
    {
        Files.push_back(AddSource("A00" + std::to_string(i) + ".mov", 4 * CHUNK));
    }

    IO.HoldWrites();
    Scheduler->Submit(MakeJob("offload", Files, { Destination("shuttle1") }));
    ASSERT_TRUE(IO.WaitForHeldWrites(1));

    EXPECT_TRUE(Scheduler->Cancel("offload"));
    IO.ReleaseWrites();
    EXPECT_EQ(Scheduler->WaitForJob("offload"), JobStatus::Cancelled);

    auto Snap = Scheduler->Snapshot("offload");
    EXPECT_EQ(Snap->Cancelled, 3u);

    // The interrupted task keeps its last confirmed chunk for a later run.
    auto Entries = Ledger.List();
    ASSERT_EQ(Entries.size(), 1u);
    EXPECT_EQ(Entries[0].Offset, CHUNK);

    EXPECT_FALSE(Scheduler->Resume("offload"));
    EXPECT_EQ(Scheduler->RetryFailed("offload"), 0u);
    EXPECT_FALSE(Scheduler->Cancel("offload"));
}

TEST_F(JobSchedulerTest, LedgerFaultPausesTheJob)
{
    auto Scheduler = MakeScheduler(1, 1);
    std::vector<FileDescriptor> Files = { AddSource("A.mov", 2 * CHUNK), AddSource("B.mov", 2 * CHUNK), AddSource("C.mov", 2 * CHUNK) };

    Ledger.Broken = true;
    Scheduler->Submit(MakeJob("offload", Files, { Destination("shuttle1") }));

    for (int i = 0; i < 200; ++i)
    {
        auto Snap = Scheduler->Snapshot("offload");
        if (Snap->Status == JobStatus::Paused)
        {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    Scheduler->WaitForIdle();

    auto Snap = Scheduler->Snapshot("offload");
    EXPECT_EQ(Snap->Status, JobStatus::Paused);
    EXPECT_EQ(Snap->Failed, 1u);
    EXPECT_EQ(Snap->Pending, 2u);
    EXPECT_EQ(Snap->Tasks[0].ErrorKind, TransferErrorKind::EngineFault);

    Ledger.Broken = false;
    EXPECT_EQ(Scheduler->RetryFailed("offload"), 1u);
    EXPECT_EQ(Scheduler->Snapshot("offload")->Status, JobStatus::Paused);
    EXPECT_TRUE(Scheduler->Resume("offload"));
    EXPECT_EQ(Scheduler->WaitForJob("offload"), JobStatus::Completed);
}

TEST_F(JobSchedulerTest, SkipsExistingAndCountsSkipped)
{
    auto Scheduler = MakeScheduler();
    auto File = AddSource("A001.mov", 3 * CHUNK);
    WriteFile((FS::path(Destination("shuttle1")) / File.RelativePath).string(), Contents[File.SourcePath]);

    JobSpec Spec = MakeJob("offload", { File }, { Destination("shuttle1"), Destination("shuttle2") });
    Spec.Options.SkipExisting = SkipPolicy::SizeAndChecksum;
    Scheduler->Submit(Spec);
    EXPECT_EQ(Scheduler->WaitForJob("offload"), JobStatus::Completed);

    auto Snap = Scheduler->Snapshot("offload");
    EXPECT_EQ(Snap->Skipped, 1u);
    EXPECT_EQ(Snap->Completed, 1u);
    ExpectCopied(File, Destination("shuttle2"));
    EXPECT_EQ(Scheduler->Digests().HashPasses(File.SourcePath, ChecksumAlgorithm::XXH64), 1u);
}

TEST_F(JobSchedulerTest, SourceRewrittenBetweenJobsIsHashedAgain)
{
    auto Scheduler = MakeScheduler();
    auto File = AddSource("A001.mov", 300000);

    JobSpec Day1 = MakeJob("day1", { File }, { Destination("shuttle1") });
    Day1.Options.SkipExisting = SkipPolicy::SizeAndChecksum;
    Scheduler->Submit(Day1);
    ASSERT_EQ(Scheduler->WaitForJob("day1"), JobStatus::Completed);
    EXPECT_EQ(Scheduler->Digests().TrackedJobs(), 0u);

    // Next card mounted at the same path, same size, different bytes.
    std::vector<uint8_t> NextCard(File.Size, 'B');
    WriteFile(File.SourcePath, NextCard);
    Contents[File.SourcePath] = NextCard;

    JobSpec Day2 = MakeJob("day2", { File }, { Destination("shuttle1"), Destination("shuttle2") });
    Day2.Options.SkipExisting = SkipPolicy::SizeAndChecksum;
    Scheduler->Submit(Day2);
    EXPECT_EQ(Scheduler->WaitForJob("day2"), JobStatus::Completed);

    auto Snap = Scheduler->Snapshot("day2");
    EXPECT_EQ(Snap->Skipped, 0u);
    EXPECT_EQ(Snap->Completed, 2u);
    EXPECT_FALSE(Snap->ChecksumMismatch);
    ExpectCopied(File, Destination("shuttle1"));
    ExpectCopied(File, Destination("shuttle2"));
    EXPECT_EQ(Scheduler->Digests().HashPasses(File.SourcePath, ChecksumAlgorithm::XXH64), 2u);
}

TEST_F(JobSchedulerTest, RetryHashesTheSourceAgain)
{
    auto Scheduler = MakeScheduler();
    auto File = AddSource("A001.mov", 3 * CHUNK);
    IO.FailWritesPast(Destination("shuttle2"), 0);

    Scheduler->Submit(MakeJob("offload", { File }, { Destination("shuttle1"), Destination("shuttle2") }));
    ASSERT_EQ(Scheduler->WaitForJob("offload"), JobStatus::PartiallyFailed);
    const unsigned int Before = Scheduler->Digests().HashPasses(File.SourcePath, ChecksumAlgorithm::XXH64);
    EXPECT_GE(Before, 1u);

    // Card swapped for a reshoot of the same length before the retry.
    std::vector<uint8_t> Reshoot(File.Size, 'C');
    WriteFile(File.SourcePath, Reshoot);
    Contents[File.SourcePath] = Reshoot;

    IO.StopFailing();
    EXPECT_EQ(Scheduler->RetryFailed("offload"), 1u);
    EXPECT_EQ(Scheduler->WaitForJob("offload"), JobStatus::Completed);

    ExpectCopied(File, Destination("shuttle2"));
    auto Snap = Scheduler->Snapshot("offload");
    EXPECT_FALSE(Snap->ChecksumMismatch);
    EXPECT_EQ(Scheduler->Digests().HashPasses(File.SourcePath, ChecksumAlgorithm::XXH64), Before + 1);
    EXPECT_EQ(Scheduler->Digests().TrackedJobs(), 0u);
}

TEST_F(JobSchedulerTest, VerifyJobReportsMismatches)
{
    auto Scheduler = MakeScheduler();
    auto File = AddSource("A001.mov", 2 * CHUNK);
    WriteFile((FS::path(Destination("shuttle1")) / File.RelativePath).string(), Contents[File.SourcePath]);
    auto Corrupt = Contents[File.SourcePath];
    Corrupt[0] ^= 0x10;
    WriteFile((FS::path(Destination("shuttle2")) / File.RelativePath).string(), Corrupt);

    JobSpec Spec = MakeJob("verify", { File }, { Destination("shuttle1"), Destination("shuttle2") });
    Spec.Options.Type = JobType::Verify;
    Spec.Options.Algorithm = ChecksumAlgorithm::MD5;
    Scheduler->Submit(Spec);
    EXPECT_EQ(Scheduler->WaitForJob("verify"), JobStatus::PartiallyFailed);

    auto Snap = Scheduler->Snapshot("verify");
    EXPECT_TRUE(Snap->ChecksumMismatch);
    EXPECT_EQ(FindTask(*Snap, Destination("shuttle1"))->Status, TaskStatus::Completed);
    EXPECT_EQ(FindTask(*Snap, Destination("shuttle2"))->ErrorKind, TransferErrorKind::ChecksumMismatch);
    EXPECT_TRUE(IO.Writes().empty());
    EXPECT_EQ(ReadFile((FS::path(Destination("shuttle2")) / File.RelativePath).string()), Corrupt);
}

TEST_F(JobSchedulerTest, CompletedCopiesAreOfferedForPostProcessing)
{
    RecordingPostProcessor Post;
    auto Scheduler = MakeScheduler(2, 1, &Post);

    JobSpec Spec = MakeJob("offload", { AddSource("A.mov", 100), AddSource("B.mov", 200) }, { Destination("shuttle1") });
    Scheduler->Submit(Spec);
    EXPECT_EQ(Scheduler->WaitForJob("offload"), JobStatus::Completed);

    auto Offers = Post.Taken();
    ASSERT_EQ(Offers.size(), 2u);
    for (const auto& Offer : Offers)
    {
        EXPECT_EQ(Offer.Job, "offload");
        EXPECT_TRUE(FS::exists(Offer.Path));
        EXPECT_EQ(Offer.Checksum.size(), 16u);
    }

    JobSpec Quiet = MakeJob("quiet", { AddSource("C.mov", 100) }, { Destination("shuttle2") });
    Quiet.Options.PostProcess = false;
    Scheduler->Submit(Quiet);
    Scheduler->WaitForJob("quiet");
    EXPECT_EQ(Post.Taken().size(), 2u);
}

TEST_F(JobSchedulerTest, PerJobConcurrencyCap)
{
    auto Scheduler = MakeScheduler(4, 4);
    std::vector<FileDescriptor> Files;
    for (int i = 0; i < 4; ++i)
    {
        Files.push_back(AddSource("A00" + std::to_string(i) + ".mov", 2 * CHUNK));
    }
    JobSpec Spec = MakeJob("offload", Files, { Destination("shuttle1"), Destination("shuttle2") });
    Spec.Options.MaxConcurrency = 1;

    Scheduler->Submit(Spec);
    EXPECT_EQ(Scheduler->WaitForJob("offload"), JobStatus::Completed);
    EXPECT_EQ(Scheduler->Pool().PeakRunning(), 1u);
}
