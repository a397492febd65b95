#include "TransferTypes.hpp"

#include <unordered_map>

TransferError::TransferError(TransferErrorKind Kind, const std::string& Message, int ErrorCode)
    : std::runtime_error(Message), ErrorKind(Kind), Code(ErrorCode)
{
}

bool IsTerminal(TaskStatus Status)
{
    switch (Status)
    {
    case TaskStatus::Completed:
    case TaskStatus::Failed:
    case TaskStatus::Skipped:
    case TaskStatus::Cancelled:
        return true;
    default:
        return false;
    }
}

bool IsTerminal(JobStatus Status)
{
    switch (Status)
    {
    case JobStatus::Completed:
    case JobStatus::PartiallyFailed:
    case JobStatus::Failed:
    case JobStatus::Cancelled:
        return true;
    default:
        return false;
    }
}

JobStatus ComputeJobStatus(const std::vector<TaskStatus>& TaskStates)
{
    size_t Completed = 0;
    size_t Failed = 0;

    for (TaskStatus Status : TaskStates)
    {
        switch (Status)
        {
        case TaskStatus::Completed: ++Completed; break;
        case TaskStatus::Skipped:   break;
        case TaskStatus::Failed:    ++Failed; break;
        case TaskStatus::Cancelled: return JobStatus::Cancelled;
        default:                    return JobStatus::Running;
        }
    }

    if (Failed == 0)
    {
        return JobStatus::Completed;
    }
    if (Completed == 0)
    {
        return JobStatus::Failed;
    }
    return JobStatus::PartiallyFailed;
}

std::string ToString(ChecksumAlgorithm Algorithm)
{
    switch (Algorithm)
    {
    case ChecksumAlgorithm::XXH64:  return "XXH64";
    case ChecksumAlgorithm::BLAKE3: return "BLAKE3";
    case ChecksumAlgorithm::MD5:    return "MD5";
    default:                        return "UNKNOWN";
    }
}

std::string ToString(SkipPolicy Policy)
{
    switch (Policy)
    {
    case SkipPolicy::Off:             return "NO";
    case SkipPolicy::SizeOnly:        return "SIZE";
    case SkipPolicy::SizeAndChecksum: return "CHECKSUM";
    default:                          return "UNKNOWN";
    }
}

std::string ToString(JobType Type)
{
    return Type == JobType::Copy ? "Copy" : "Verify";
}

std::string ToString(TaskStatus Status)
{
    switch (Status)
    {
    case TaskStatus::Pending:   return "Pending";
    case TaskStatus::Copying:   return "Copying";
    case TaskStatus::Verifying: return "Verifying";
    case TaskStatus::Completed: return "Completed";
    case TaskStatus::Failed:    return "Failed";
    case TaskStatus::Skipped:   return "Skipped";
    case TaskStatus::Cancelled: return "Cancelled";
    default:                    return "UNKNOWN";
    }
}

std::string ToString(JobStatus Status)
{
    switch (Status)
    {
    case JobStatus::Queued:          return "Queued";
    case JobStatus::Running:         return "Running";
    case JobStatus::Paused:          return "Paused";
    case JobStatus::Completed:       return "Completed";
    case JobStatus::PartiallyFailed: return "PartiallyFailed";
    case JobStatus::Failed:          return "Failed";
    case JobStatus::Cancelled:       return "Cancelled";
    default:                         return "UNKNOWN";
    }
}

std::string ToString(TransferErrorKind Kind)
{
    switch (Kind)
    {
    case TransferErrorKind::None:                   return "None";
    case TransferErrorKind::SourceUnavailable:      return "SourceUnavailable";
    case TransferErrorKind::DestinationUnavailable: return "DestinationUnavailable";
    case TransferErrorKind::ChecksumMismatch:       return "ChecksumMismatch";
    case TransferErrorKind::Cancelled:              return "Cancelled";
    case TransferErrorKind::EngineFault:            return "EngineFault";
    default:                                        return "UNKNOWN";
    }
}

std::optional<ChecksumAlgorithm> ToChecksumAlgorithm(const std::string& Name)
{
    static const std::unordered_map<std::string, ChecksumAlgorithm> AlgorithmMap = {
        { "XXH64",  ChecksumAlgorithm::XXH64 },
        { "BLAKE3", ChecksumAlgorithm::BLAKE3 },
        { "MD5",    ChecksumAlgorithm::MD5 }
    };

    auto it = AlgorithmMap.find(Name);
    if (it == AlgorithmMap.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::optional<SkipPolicy> ToSkipPolicy(const std::string& Name)
{
    static const std::unordered_map<std::string, SkipPolicy> PolicyMap = {
        { "NO",       SkipPolicy::Off },
        { "SIZE",     SkipPolicy::SizeOnly },
        { "CHECKSUM", SkipPolicy::SizeAndChecksum }
    };

    auto it = PolicyMap.find(Name);
    if (it == PolicyMap.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::optional<JobType> ToJobType(const std::string& Name)
{
    if (Name == "Copy")
    {
        return JobType::Copy;
    }
    if (Name == "Verify")
    {
        return JobType::Verify;
    }
    return std::nullopt;
}
