#include "SourceDigestRegistry.hpp"
#include "Logger.hpp"
#include <chrono>

std::string SourceDigestRegistry::Key(const std::string& SourcePath, ChecksumAlgorithm Algorithm)
{
    return ToString(Algorithm) + ":" + SourcePath;
}

void SourceDigestRegistry::CountPass(const std::string& K)
{
    ++Passes[K];
}

void SourceDigestRegistry::Seed(const JobId& Job, const std::string& SourcePath, ChecksumAlgorithm Algorithm, const std::string& Digest)
{
    std::lock_guard<std::mutex> Lock(RegistryMutex);
    Entries[Job][Key(SourcePath, Algorithm)].Expected = Digest;
}

bool SourceDigestRegistry::TryClaim(const JobId& Job, const std::string& SourcePath, ChecksumAlgorithm Algorithm)
{
    std::lock_guard<std::mutex> Lock(RegistryMutex);
    const std::string K = Key(SourcePath, Algorithm);
    Entry& E = Entries[Job][K];
    if (E.Computed || E.OwnerActive)
    {
        return false;
    }
    E.OwnerActive = true;
    CountPass(K);
    return true;
}

bool SourceDigestRegistry::Publish(const JobId& Job, const std::string& SourcePath, ChecksumAlgorithm Algorithm, const std::string& Digest)
{
    bool Matches = true;
    {
        std::lock_guard<std::mutex> Lock(RegistryMutex);
        Entry& E = Entries[Job][Key(SourcePath, Algorithm)];
        E.OwnerActive = false;

        if (E.Expected && *E.Expected != Digest)
        {
            Matches = false;
            Log.Error("[SourceDigestRegistry] Source " + SourcePath + " hashed to " + Digest + " but known checksum is " + *E.Expected);
        }
        else
        {
            E.Computed = Digest;
        }
    }
    Changed.notify_all();
    return Matches;
}

void SourceDigestRegistry::Release(const JobId& Job, const std::string& SourcePath, ChecksumAlgorithm Algorithm)
{
    {
        std::lock_guard<std::mutex> Lock(RegistryMutex);
        auto JobIt = Entries.find(Job);
        if (JobIt != Entries.end())
        {
            auto it = JobIt->second.find(Key(SourcePath, Algorithm));
            if (it != JobIt->second.end())
            {
                it->second.OwnerActive = false;
            }
        }
    }
    Changed.notify_all();
}

std::string SourceDigestRegistry::Resolve(const JobId& Job, const std::string& SourcePath, ChecksumAlgorithm Algorithm,
                                          const std::function<std::string()>& DedicatedPass,
                                          const std::atomic<bool>* Cancel)
{
    const std::string K = Key(SourcePath, Algorithm);
    {
        std::unique_lock<std::mutex> Lock(RegistryMutex);
        while (true)
        {
            Entry& E = Entries[Job][K];
            if (E.Expected)
            {
                return *E.Expected;
            }
            if (E.Computed)
            {
                return *E.Computed;
            }
            if (!E.OwnerActive)
            {
                E.OwnerActive = true;
                CountPass(K);
                break;
            }
            if (Cancel != nullptr && Cancel->load())
            {
                throw TransferError(TransferErrorKind::Cancelled, "Cancelled while waiting for source checksum");
            }
            Changed.wait_for(Lock, std::chrono::milliseconds(100));
        }
    }

    DigestClaim Claim(*this, Job, SourcePath, Algorithm, true);
    std::string Digest = DedicatedPass();
    Claim.Publish(Digest);
    return Digest;
}

void SourceDigestRegistry::Forget(const JobId& Job, const std::string& SourcePath, ChecksumAlgorithm Algorithm)
{
    std::lock_guard<std::mutex> Lock(RegistryMutex);
    auto JobIt = Entries.find(Job);
    if (JobIt == Entries.end())
    {
        return;
    }
    auto it = JobIt->second.find(Key(SourcePath, Algorithm));
    if (it != JobIt->second.end() && !it->second.OwnerActive)
    {
        it->second.Computed.reset();
    }
}

void SourceDigestRegistry::ForgetJob(const JobId& Job)
{
    std::lock_guard<std::mutex> Lock(RegistryMutex);
    Entries.erase(Job);
}

size_t SourceDigestRegistry::TrackedJobs()
{
    std::lock_guard<std::mutex> Lock(RegistryMutex);
    return Entries.size();
}

unsigned int SourceDigestRegistry::HashPasses(const std::string& SourcePath, ChecksumAlgorithm Algorithm)
{
    std::lock_guard<std::mutex> Lock(RegistryMutex);
    auto it = Passes.find(Key(SourcePath, Algorithm));
    return it == Passes.end() ? 0 : it->second;
}

unsigned int SourceDigestRegistry::TotalHashPasses()
{
    std::lock_guard<std::mutex> Lock(RegistryMutex);
    unsigned int Total = 0;
    for (const auto& Item : Passes)
    {
        Total += Item.second;
    }
    return Total;
}
