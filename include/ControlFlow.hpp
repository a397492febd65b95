#pragma once

#include "FileScanner.hpp"
#include "ConfigParser.hpp"
#include "ConfigGlobal.hpp"
#include "JobScheduler.hpp"
#include <optional>

class ProgressLedger;

class ControlFlow
{
public:
    ControlFlow() = default;

    // Exit code: 0 only when the job finished Completed.
    int Run();

private:
    ConfigParser Parser;

    void LogRequest();
    static void PruneLedger(ProgressLedger& Ledger, const std::optional<JobSnapshot>& Submitted);
    std::vector<FileDescriptor> ScanSources();
    JobSpec BuildJob(std::vector<FileDescriptor> Files) const;
    void PrintSummary(const JobSnapshot& Snap) const;
};
