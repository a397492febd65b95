#pragma once

#include "TransferTypes.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

// Source checksums shared by every destination task of a source file within one job.
// Each (job, source, algorithm) is hashed at most once: either streamed by the first copying task
// that claims it, or by a dedicated pass when a task needs the digest and nobody streams it.
// A later job reading the same path hashes it again, since the media may have changed.
class SourceDigestRegistry
{
public:
    // A checksum known before the transfer, e.g. supplied by the file enumeration.
    void Seed(const JobId& Job, const std::string& SourcePath, ChecksumAlgorithm Algorithm, const std::string& Digest);

    // True when the caller becomes the streaming owner and must Publish or Release.
    bool TryClaim(const JobId& Job, const std::string& SourcePath, ChecksumAlgorithm Algorithm);

    // Returns false when a seeded digest exists and differs; the computed digest is then dropped.
    bool Publish(const JobId& Job, const std::string& SourcePath, ChecksumAlgorithm Algorithm, const std::string& Digest);

    void Release(const JobId& Job, const std::string& SourcePath, ChecksumAlgorithm Algorithm);

    // The digest to verify against. Waits for an active owner, or runs DedicatedPass itself when
    // there is none. Throws TransferError(Cancelled) if Cancel is raised while waiting.
    std::string Resolve(const JobId& Job, const std::string& SourcePath, ChecksumAlgorithm Algorithm,
                        const std::function<std::string()>& DedicatedPass,
                        const std::atomic<bool>* Cancel = nullptr);

    // Drops a computed digest so the next task hashes the source again. Seeded digests stay.
    void Forget(const JobId& Job, const std::string& SourcePath, ChecksumAlgorithm Algorithm);

    // Drops everything recorded for the job.
    void ForgetJob(const JobId& Job);

    size_t TrackedJobs();

    // Hashing passes run over the source, across all jobs.
    unsigned int HashPasses(const std::string& SourcePath, ChecksumAlgorithm Algorithm);
    unsigned int TotalHashPasses();

private:
    struct Entry
    {
        std::optional<std::string> Expected;
        std::optional<std::string> Computed;
        bool OwnerActive = false;
    };

    std::mutex RegistryMutex;
    std::condition_variable Changed;
    std::unordered_map<JobId, std::unordered_map<std::string, Entry>> Entries;
    std::unordered_map<std::string, unsigned int> Passes;

    void CountPass(const std::string& K);

    static std::string Key(const std::string& SourcePath, ChecksumAlgorithm Algorithm);
};

// Releases an unpublished claim when the owner leaves early.
class DigestClaim
{
public:
    DigestClaim(SourceDigestRegistry& Registry, const JobId& Job, const std::string& SourcePath, ChecksumAlgorithm Algorithm, bool Owned)
        : Registry(Registry), Job(Job), SourcePath(SourcePath), Algorithm(Algorithm), Owned(Owned)
    {
    }

    ~DigestClaim()
    {
        if (Owned)
        {
            Registry.Release(Job, SourcePath, Algorithm);
        }
    }

    DigestClaim(const DigestClaim&) = delete;
    DigestClaim& operator=(const DigestClaim&) = delete;

    bool IsOwner() const { return Owned; }
    bool Publish(const std::string& Digest)
    {
        Owned = false;
        return Registry.Publish(Job, SourcePath, Algorithm, Digest);
    }

private:
    SourceDigestRegistry& Registry;
    JobId Job;
    std::string SourcePath;
    ChecksumAlgorithm Algorithm;
    bool Owned;
};
