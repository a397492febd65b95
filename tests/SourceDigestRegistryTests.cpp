#include "SourceDigestRegistry.hpp"
#include <gtest/gtest.h>
#include <thread>

namespace
{
    const std::string Clip = "/media/card/A001.mov";

    std::function<std::string()> CountingPass(int& Runs, const std::string& Digest)
    {
        return [&Runs, Digest]()
        {
            ++Runs;
            return Digest;
        };
    }
}

TEST(SourceDigestRegistry, DedicatedPassRunsOncePerJob)
{
    SourceDigestRegistry Registry;
    int Runs = 0;

    EXPECT_EQ(Registry.Resolve("day1", Clip, ChecksumAlgorithm::XXH64, CountingPass(Runs, "aaaa")), "aaaa");
    EXPECT_EQ(Registry.Resolve("day1", Clip, ChecksumAlgorithm::XXH64, CountingPass(Runs, "ignored")), "aaaa");
    EXPECT_EQ(Runs, 1);

    EXPECT_EQ(Registry.Resolve("day2", Clip, ChecksumAlgorithm::XXH64, CountingPass(Runs, "bbbb")), "bbbb");
    EXPECT_EQ(Runs, 2);
    EXPECT_EQ(Registry.HashPasses(Clip, ChecksumAlgorithm::XXH64), 2u);
    EXPECT_EQ(Registry.HashPasses(Clip, ChecksumAlgorithm::MD5), 0u);
}

TEST(SourceDigestRegistry, StreamingOwnerServesWaiters)
{
    SourceDigestRegistry Registry;
    ASSERT_TRUE(Registry.TryClaim("job", Clip, ChecksumAlgorithm::BLAKE3));
    EXPECT_FALSE(Registry.TryClaim("job", Clip, ChecksumAlgorithm::BLAKE3));

    std::thread Owner([&Registry]()
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        Registry.Publish("job", Clip, ChecksumAlgorithm::BLAKE3, "cafe");
    });

    int Runs = 0;
    EXPECT_EQ(Registry.Resolve("job", Clip, ChecksumAlgorithm::BLAKE3, CountingPass(Runs, "other")), "cafe");
    Owner.join();
    EXPECT_EQ(Runs, 0);
    EXPECT_EQ(Registry.TotalHashPasses(), 1u);
}

TEST(SourceDigestRegistry, ReleasedClaimLetsTheNextTaskHash)
{
    SourceDigestRegistry Registry;
    {
        DigestClaim Claim(Registry, "job", Clip, ChecksumAlgorithm::XXH64, Registry.TryClaim("job", Clip, ChecksumAlgorithm::XXH64));
        EXPECT_TRUE(Claim.IsOwner());
    }
    EXPECT_TRUE(Registry.TryClaim("job", Clip, ChecksumAlgorithm::XXH64));
    EXPECT_EQ(Registry.HashPasses(Clip, ChecksumAlgorithm::XXH64), 2u);
}

TEST(SourceDigestRegistry, ForgetDropsComputedButKeepsSeeded)
{
    SourceDigestRegistry Registry;
    int Runs = 0;
    Registry.Resolve("job", Clip, ChecksumAlgorithm::XXH64, CountingPass(Runs, "aaaa"));
    Registry.Forget("job", Clip, ChecksumAlgorithm::XXH64);
    EXPECT_EQ(Registry.Resolve("job", Clip, ChecksumAlgorithm::XXH64, CountingPass(Runs, "bbbb")), "bbbb");
    EXPECT_EQ(Runs, 2);

    Registry.Seed("job", "/media/card/A002.mov", ChecksumAlgorithm::MD5, "0123");
    Registry.Forget("job", "/media/card/A002.mov", ChecksumAlgorithm::MD5);
    EXPECT_EQ(Registry.Resolve("job", "/media/card/A002.mov", ChecksumAlgorithm::MD5, CountingPass(Runs, "ffff")), "0123");
    EXPECT_EQ(Runs, 2);
}

TEST(SourceDigestRegistry, PublishAgainstSeedReportsMismatch)
{
    SourceDigestRegistry Registry;
    Registry.Seed("job", Clip, ChecksumAlgorithm::MD5, "0123");
    ASSERT_TRUE(Registry.TryClaim("job", Clip, ChecksumAlgorithm::MD5));
    EXPECT_FALSE(Registry.Publish("job", Clip, ChecksumAlgorithm::MD5, "4567"));

    ASSERT_TRUE(Registry.TryClaim("job", Clip, ChecksumAlgorithm::MD5));
    EXPECT_TRUE(Registry.Publish("job", Clip, ChecksumAlgorithm::MD5, "0123"));
}

TEST(SourceDigestRegistry, ForgetJobDropsOnlyThatJob)
{
    SourceDigestRegistry Registry;
    int Runs = 0;
    Registry.Resolve("day1", Clip, ChecksumAlgorithm::XXH64, CountingPass(Runs, "aaaa"));
    Registry.Resolve("day2", Clip, ChecksumAlgorithm::XXH64, CountingPass(Runs, "bbbb"));
    EXPECT_EQ(Registry.TrackedJobs(), 2u);

    Registry.ForgetJob("day1");
    Registry.Release("day1", Clip, ChecksumAlgorithm::XXH64);
    EXPECT_EQ(Registry.TrackedJobs(), 1u);
    EXPECT_EQ(Registry.Resolve("day2", Clip, ChecksumAlgorithm::XXH64, CountingPass(Runs, "cccc")), "bbbb");
    EXPECT_EQ(Runs, 2);
    EXPECT_EQ(Registry.HashPasses(Clip, ChecksumAlgorithm::XXH64), 2u);
}

TEST(SourceDigestRegistry, CancelStopsWaitingForOwner)
{
    SourceDigestRegistry Registry;
    ASSERT_TRUE(Registry.TryClaim("job", Clip, ChecksumAlgorithm::XXH64));
    std::atomic<bool> Cancel{ true };
    int Runs = 0;
    try
    {
        Registry.Resolve("job", Clip, ChecksumAlgorithm::XXH64, CountingPass(Runs, "aaaa"), &Cancel);
        FAIL() << "Resolve returned while the owner was active";
    }
    catch (const TransferError& Error)
    {
        EXPECT_EQ(Error.Kind(), TransferErrorKind::Cancelled);
    }
    EXPECT_EQ(Runs, 0);
}
