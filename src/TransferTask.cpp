#include "TransferTask.hpp"
#include "ChecksumEngine.hpp"
#include "Logger.hpp"
#include "ProgressLedger.hpp"
#include "SourceDigestRegistry.hpp"
#include "TransferIO.hpp"
#include <algorithm>
#include <filesystem>
#include <vector>

TaskCore::TaskCore(Task State, TaskContext Context, CancelToken Cancel)
    : Current(std::move(State)), Context(Context), Cancel(std::move(Cancel))
{
    if (!this->Cancel)
    {
        this->Cancel = std::make_shared<std::atomic<bool>>(false);
    }
}

bool TaskCore::CancelRequested() const
{
    return Cancel->load();
}

void TaskCore::ThrowIfCancelled(const std::string& Where) const
{
    if (CancelRequested())
    {
        throw TransferError(TransferErrorKind::Cancelled, "Cancelled " + Where);
    }
}

void TaskCore::SetStatus(TaskStatus Status)
{
    TaskStatus Old = Current.Status;
    if (Old == Status)
    {
        return;
    }
    Current.Status = Status;
    if (Context.Observer != nullptr)
    {
        Context.Observer->OnTaskStateChanged(Current, Old);
    }
}

void TaskCore::ReportProgress()
{
    if (Context.Observer != nullptr)
    {
        Context.Observer->OnTaskProgress(Current);
    }
}

std::string TaskCore::ResolveSourceDigest()
{
    const std::string& SourcePath = Current.Source.SourcePath;
    ChecksumAlgorithm Algorithm = Current.Algorithm;

    return Context.Digests.Resolve(Current.Job, SourcePath, Algorithm, [this, &SourcePath, Algorithm]()
    {
        Log.Info("[TransferTask] Hashing source " + SourcePath + " with " + ToString(Algorithm));
        auto Reader = Context.IO.OpenRead(SourcePath, IoSide::Source);
        return ChecksumEngine::HashFile(*Reader, Algorithm, Context.ChunkSize, Cancel.get());
    }, Cancel.get());
}

void TaskCore::RunGuarded(const std::function<void()>& Body)
{
    try
    {
        Body();
    }
    catch (const TransferError& e)
    {
        Abort(e.Kind(), e.what());
    }
    catch (const std::filesystem::filesystem_error& e)
    {
        Abort(TransferErrorKind::EngineFault, e.what());
    }
    catch (const std::exception& e)
    {
        Abort(TransferErrorKind::EngineFault, e.what());
    }
}

void TaskCore::Abort(TransferErrorKind Kind, const std::string& Detail)
{
    Current.ErrorKind = Kind;
    Current.ErrorDetail = Detail;

    if (Kind == TransferErrorKind::Cancelled)
    {
        Log.Info("[TransferTask] " + Current.Id + " cancelled at " + std::to_string(Current.BytesTransferred) + " bytes");
        SetStatus(TaskStatus::Cancelled);
        return;
    }

    Log.Error("[TransferTask] " + Current.Id + " failed (" + ToString(Kind) + "): " + Detail);
    SetStatus(TaskStatus::Failed);
}

TransferTask::TransferTask(Task State, TaskContext Context, CancelToken Cancel)
    : Core(std::move(State), Context, std::move(Cancel))
{
}

void TransferTask::RequestCancel()
{
    Core.Cancel->store(true);
}

void TransferTask::Execute()
{
    Core.RunGuarded([this]()
    {
        Core.ThrowIfCancelled("before start");

        if (Core.Current.Status == TaskStatus::Pending && Core.Current.SkipExisting != SkipPolicy::Off && TrySkip())
        {
            return;
        }

        CopyPhase();
        VerifyPhase();
    });
}

bool TransferTask::TrySkip()
{
    Task& Current = Core.Current;
    auto DestinationSize = Core.Context.IO.FileSize(Current.DestinationPath);
    if (!DestinationSize || *DestinationSize != Current.Source.Size)
    {
        return false;
    }

    if (Current.SkipExisting == SkipPolicy::SizeAndChecksum)
    {
        std::string Expected = Core.ResolveSourceDigest();
        auto Reader = Core.Context.IO.OpenRead(Current.DestinationPath, IoSide::Destination);
        std::string Existing = ChecksumEngine::HashFile(*Reader, Current.Algorithm, Core.Context.ChunkSize, Core.Cancel.get());
        if (Existing != Expected)
        {
            Log.Info("[TransferTask] " + Current.DestinationPath + " exists with matching size but different checksum, copying");
            return false;
        }
        Current.Checksum = Existing;
    }

    Core.Context.Ledger.Clear(Current.Id);
    Current.BytesTransferred = Current.Source.Size;
    Log.Info("[TransferTask] Skipping existing " + Current.DestinationPath + " (" + ToString(Current.SkipExisting) + ")");
    Core.SetStatus(TaskStatus::Skipped);
    return true;
}

void TransferTask::CopyPhase()
{
    Task& Current = Core.Current;
    const TaskContext& Context = Core.Context;
    const std::string& SourcePath = Current.Source.SourcePath;

    Core.SetStatus(TaskStatus::Copying);

    auto Source = Context.IO.OpenRead(SourcePath, IoSide::Source);
    const uint64_t Size = Source->Size();
    if (Size != Current.Source.Size)
    {
        throw TransferError(TransferErrorKind::SourceUnavailable, "Source " + SourcePath + " is " + std::to_string(Size) +
                            " bytes, expected " + std::to_string(Current.Source.Size));
    }

    auto Destination = Context.IO.OpenWrite(Current.DestinationPath);

    uint64_t Offset = 0;
    auto Entry = Context.Ledger.Read(Current.Id);
    if (Entry)
    {
        const uint64_t DestinationSize = Destination->Size();
        if (Entry->Algorithm == Current.Algorithm && Entry->Offset <= Size && Entry->Offset <= DestinationSize)
        {
            Offset = Entry->Offset;
        }
        else
        {
            Log.Warn("[TransferTask] Ledger record for " + Current.Id + " does not match the destination, starting from 0");
            Context.Ledger.Clear(Current.Id);
            Entry.reset();
        }
    }

    // Anything past the last confirmed chunk may be torn.
    Destination->Truncate(Offset);

    DigestClaim Claim(Context.Digests, Current.Job, SourcePath, Current.Algorithm, Context.Digests.TryClaim(Current.Job, SourcePath, Current.Algorithm));
    std::unique_ptr<Hasher> SourceHash;
    if (Claim.IsOwner())
    {
        if (Offset > 0 && Entry && !Entry->HasherState.empty())
        {
            SourceHash = ChecksumEngine::Restore(Current.Algorithm, Entry->HasherState);
        }
        if (!SourceHash)
        {
            SourceHash = ChecksumEngine::Open(Current.Algorithm);
            if (Offset > 0)
            {
                Log.Info("[TransferTask] Re-hashing first " + std::to_string(Offset) + " bytes of " + SourcePath);
                ChecksumEngine::HashPrefix(*Source, *SourceHash, Offset, Context.ChunkSize, Core.Cancel.get());
            }
        }
    }

    Current.ResumedFrom = Offset;
    Current.BytesTransferred = Offset;
    if (Offset > 0)
    {
        Log.Info("[TransferTask] Resuming " + Current.Id + " at byte " + std::to_string(Offset));
        Core.ReportProgress();
    }

    std::vector<uint8_t> Buffer(Context.ChunkSize);
    while (Offset < Size)
    {
        Core.ThrowIfCancelled("at byte " + std::to_string(Offset));

        const size_t Wanted = static_cast<size_t>(std::min<uint64_t>(Context.ChunkSize, Size - Offset));
        const size_t Got = Source->ReadAt(Offset, Buffer.data(), Wanted);
        if (Got != Wanted)
        {
            throw TransferError(TransferErrorKind::SourceUnavailable, "Source " + SourcePath + " ended at byte " + std::to_string(Offset + Got));
        }

        Destination->WriteAt(Offset, Buffer.data(), Got);
        Destination->Sync();

        if (SourceHash)
        {
            SourceHash->Update(Buffer.data(), Got);
        }
        Offset += Got;

        Context.Ledger.Record(Current.Id, Current.Algorithm, Offset,
                              SourceHash ? SourceHash->PartialState() : std::vector<uint8_t>());

        Current.BytesTransferred = Offset;
        Core.ReportProgress();
    }

    if (SourceHash && !Claim.Publish(SourceHash->Finalize()))
    {
        Context.Ledger.Clear(Current.Id);
        throw TransferError(TransferErrorKind::ChecksumMismatch, "Source " + SourcePath + " does not match its known checksum");
    }
}

void TransferTask::VerifyPhase()
{
    Task& Current = Core.Current;
    const TaskContext& Context = Core.Context;

    Core.SetStatus(TaskStatus::Verifying);

    std::string Expected = Core.ResolveSourceDigest();

    auto Reader = Context.IO.OpenRead(Current.DestinationPath, IoSide::Destination);
    if (Reader->Size() != Current.Source.Size)
    {
        throw TransferError(TransferErrorKind::DestinationUnavailable, "Destination " + Current.DestinationPath + " is " +
                            std::to_string(Reader->Size()) + " bytes after copy, expected " + std::to_string(Current.Source.Size));
    }

    Current.Checksum = ChecksumEngine::HashFile(*Reader, Current.Algorithm, Context.ChunkSize, Core.Cancel.get());
    Reader.reset();

    if (Current.Checksum != Expected)
    {
        // A mismatching file is never resumed; the next attempt starts from byte 0.
        Context.Ledger.Clear(Current.Id);
        throw TransferError(TransferErrorKind::ChecksumMismatch, "Destination " + Current.DestinationPath + " hashed to " +
                            Current.Checksum + ", source is " + Expected);
    }

    if (!Context.IO.SetModificationTime(Current.DestinationPath, Current.Source.MTime))
    {
        Log.Warn("[TransferTask] Could not set modification time on " + Current.DestinationPath);
    }

    Context.Ledger.Clear(Current.Id);
    Core.SetStatus(TaskStatus::Completed);
}

VerifyTask::VerifyTask(Task State, TaskContext Context, CancelToken Cancel)
    : Core(std::move(State), Context, std::move(Cancel))
{
}

void VerifyTask::RequestCancel()
{
    Core.Cancel->store(true);
}

void VerifyTask::Execute()
{
    Core.RunGuarded([this]()
    {
        Task& Current = Core.Current;
        Core.ThrowIfCancelled("before start");
        Core.SetStatus(TaskStatus::Verifying);

        auto DestinationSize = Core.Context.IO.FileSize(Current.DestinationPath);
        if (!DestinationSize)
        {
            throw TransferError(TransferErrorKind::DestinationUnavailable, "Destination " + Current.DestinationPath + " is missing");
        }
        if (*DestinationSize < Current.Source.Size)
        {
            throw TransferError(TransferErrorKind::DestinationUnavailable, "Destination " + Current.DestinationPath + " is short (" +
                                std::to_string(*DestinationSize) + " of " + std::to_string(Current.Source.Size) + " bytes)");
        }

        std::string Expected = Core.ResolveSourceDigest();

        auto Reader = Core.Context.IO.OpenRead(Current.DestinationPath, IoSide::Destination);
        Current.Checksum = ChecksumEngine::HashFile(*Reader, Current.Algorithm, Core.Context.ChunkSize, Core.Cancel.get());
        Current.BytesTransferred = *DestinationSize;
        Core.ReportProgress();

        if (Current.Checksum != Expected)
        {
            throw TransferError(TransferErrorKind::ChecksumMismatch, "Destination " + Current.DestinationPath + " hashed to " +
                                Current.Checksum + ", source is " + Expected);
        }

        Core.SetStatus(TaskStatus::Completed);
    });
}

TaskWork MakeTaskWork(Task State, TaskContext Context, CancelToken Cancel)
{
    if (State.Kind == JobType::Verify)
    {
        return TaskWork(std::in_place_type<VerifyTask>, std::move(State), Context, std::move(Cancel));
    }
    return TaskWork(std::in_place_type<TransferTask>, std::move(State), Context, std::move(Cancel));
}

void ExecuteTask(TaskWork& Work)
{
    std::visit([](auto& Kind) { Kind.Execute(); }, Work);
}

void CancelTask(TaskWork& Work)
{
    std::visit([](auto& Kind) { Kind.RequestCancel(); }, Work);
}

const Task& TaskState(const TaskWork& Work)
{
    return std::visit([](const auto& Kind) -> const Task& { return Kind.State(); }, Work);
}
