#pragma once

#include "TransferTypes.hpp"
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

struct LedgerEntry
{
    TaskId Id;
    ChecksumAlgorithm Algorithm = ChecksumAlgorithm::XXH64;
    uint64_t Offset = 0;                // bytes confirmed durable at the destination
    std::vector<uint8_t> HasherState;   // empty when the algorithm cannot resume
    int64_t UpdatedAt = 0;
};

// Durable per-task resume records, one file per task id under a directory.
// A record becomes visible only once fully written and fsynced, so a crash leaves either the
// previous record or the new one. Storage failures throw TransferError(EngineFault).
class ProgressLedger
{
public:
    explicit ProgressLedger(const std::string& Directory);
    virtual ~ProgressLedger() = default;

    virtual void Record(const TaskId& Id, ChecksumAlgorithm Algorithm, uint64_t Offset, const std::vector<uint8_t>& HasherState);
    virtual std::optional<LedgerEntry> Read(const TaskId& Id);
    virtual void Clear(const TaskId& Id);

    std::vector<LedgerEntry> List();

    // Removes temp files left by an interrupted Record and records that fail validation.
    // Returns the number of files removed.
    size_t Recover();

    // Removes records whose task is not in Claimed and that were last updated before Cutoff
    // (UNIX seconds). Returns the number of records removed.
    size_t Prune(const std::set<TaskId>& Claimed, int64_t Cutoff);

    const std::string& Directory() const { return LedgerDirectory; }

private:
    std::string LedgerDirectory;

    std::string EntryPath(const TaskId& Id) const;
    std::optional<LedgerEntry> LoadFile(const std::string& Path) const;
    void SyncDirectory() const;
};
