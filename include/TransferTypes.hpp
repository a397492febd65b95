#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using JobId = std::string;
using TaskId = std::string;

enum class ChecksumAlgorithm : uint8_t
{
    XXH64 = 1,
    BLAKE3 = 2,
    MD5 = 3
};

enum class SkipPolicy
{
    Off,
    SizeOnly,
    SizeAndChecksum
};

enum class JobType
{
    Copy,
    Verify
};

enum class TaskStatus
{
    Pending,
    Copying,
    Verifying,
    Completed,
    Failed,
    Skipped,
    Cancelled
};

enum class JobStatus
{
    Queued,
    Running,
    Paused,
    Completed,
    PartiallyFailed,
    Failed,
    Cancelled
};

enum class TransferErrorKind
{
    None,
    SourceUnavailable,
    DestinationUnavailable,
    ChecksumMismatch,
    Cancelled,
    EngineFault
};

// One enumerated source file. RelativePath is where the file lands under every destination root.
struct FileDescriptor
{
    std::string SourcePath;
    std::string RelativePath;
    std::string SourceRoot;
    uint64_t Size = 0;
    int64_t MTime = 0;
    std::optional<std::string> Checksum;
};

struct JobOptions
{
    JobType Type = JobType::Copy;
    ChecksumAlgorithm Algorithm = ChecksumAlgorithm::XXH64;
    SkipPolicy SkipExisting = SkipPolicy::Off;
    unsigned int MaxConcurrency = 0; // 0 = bounded only by the engine
    bool EjectOnComplete = false;
    bool PostProcess = true;
};

struct JobSpec
{
    JobId Id;
    std::vector<FileDescriptor> Files;
    std::vector<std::string> Destinations;
    JobOptions Options;
};

struct Task
{
    TaskId Id;
    JobId Job;
    JobType Kind = JobType::Copy;
    FileDescriptor Source;
    std::string DestinationRoot;
    std::string DestinationPath;
    ChecksumAlgorithm Algorithm = ChecksumAlgorithm::XXH64;
    SkipPolicy SkipExisting = SkipPolicy::Off;
    TaskStatus Status = TaskStatus::Pending;
    uint64_t BytesTransferred = 0;
    uint64_t ResumedFrom = 0;
    std::string Checksum;
    TransferErrorKind ErrorKind = TransferErrorKind::None;
    std::string ErrorDetail;
};

class TransferError : public std::runtime_error
{
public:
    TransferError(TransferErrorKind Kind, const std::string& Message, int ErrorCode = 0);

    TransferErrorKind Kind() const noexcept { return ErrorKind; }
    int ErrorCode() const noexcept { return Code; }

private:
    TransferErrorKind ErrorKind;
    int Code;
};

bool IsTerminal(TaskStatus Status);
bool IsTerminal(JobStatus Status);

// Completed iff every task Completed or Skipped, Failed iff every non-skipped task Failed,
// PartiallyFailed otherwise when something failed. Any Cancelled task makes the job Cancelled.
JobStatus ComputeJobStatus(const std::vector<TaskStatus>& TaskStates);

std::string ToString(ChecksumAlgorithm Algorithm);
std::string ToString(SkipPolicy Policy);
std::string ToString(JobType Type);
std::string ToString(TaskStatus Status);
std::string ToString(JobStatus Status);
std::string ToString(TransferErrorKind Kind);

std::optional<ChecksumAlgorithm> ToChecksumAlgorithm(const std::string& Name);
std::optional<SkipPolicy> ToSkipPolicy(const std::string& Name);
std::optional<JobType> ToJobType(const std::string& Name);
