#include "WorkerPool.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace
{
    WorkItem Item(const std::string& Job, const std::string& Id, const std::string& Destination, unsigned int JobLimit = 0)
    {
        WorkItem W;
        W.Job = Job;
        W.Id = Id;
        W.DestinationKey = Destination;
        W.JobLimit = JobLimit;
        return W;
    }

    // Executor that parks every item until opened, recording start order.
    class Latch
    {
    public:
        void Run(WorkItem& W)
        {
            std::unique_lock<std::mutex> Lock(Mutex);
            Started.push_back(W.Id);
            CV.notify_all();
            CV.wait(Lock, [this]() { return Open; });
        }

        void Release()
        {
            {
                std::lock_guard<std::mutex> Lock(Mutex);
                Open = true;
            }
            CV.notify_all();
        }

        bool WaitForStarted(size_t Count)
        {
            std::unique_lock<std::mutex> Lock(Mutex);
            return CV.wait_for(Lock, std::chrono::seconds(10), [this, Count]() { return Started.size() >= Count; });
        }

        std::vector<std::string> Order()
        {
            std::lock_guard<std::mutex> Lock(Mutex);
            return Started;
        }

    private:
        std::mutex Mutex;
        std::condition_variable CV;
        bool Open = false;
        std::vector<std::string> Started;
    };
}

TEST(WorkerPool, RespectsGlobalAndPerDestinationLimits)
{
    WorkerPool Pool(4, 1, [](WorkItem&) { std::this_thread::sleep_for(std::chrono::milliseconds(15)); });

    for (int i = 0; i < 12; ++i)
    {
        Pool.Submit(Item("job", "t" + std::to_string(i), "dest" + std::to_string(i % 3)));
    }
    Pool.WaitUntilIdle();

    EXPECT_LE(Pool.PeakRunning(), 3u);
    EXPECT_EQ(Pool.PeakRunningFor("dest0"), 1u);
    EXPECT_EQ(Pool.PeakRunningFor("dest1"), 1u);
    EXPECT_EQ(Pool.PeakRunningFor("dest2"), 1u);
    EXPECT_EQ(Pool.QueuedCount(), 0u);
}

TEST(WorkerPool, GlobalLimitBindsAcrossDestinations)
{
    std::atomic<int> Executed{ 0 };
    WorkerPool Pool(2, 8, [&Executed](WorkItem&)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        ++Executed;
    });

    for (int i = 0; i < 10; ++i)
    {
        Pool.Submit(Item("job", "t" + std::to_string(i), "dest" + std::to_string(i)));
    }
    Pool.WaitUntilIdle();

    EXPECT_EQ(Executed.load(), 10);
    EXPECT_LE(Pool.PeakRunning(), 2u);
}

TEST(WorkerPool, PerJobLimit)
{
    Latch Gate;
    WorkerPool Pool(4, 4, [&Gate](WorkItem& W) { Gate.Run(W); });

    for (int i = 0; i < 4; ++i)
    {
        Pool.Submit(Item("job", "t" + std::to_string(i), "dest" + std::to_string(i), 1));
    }
    ASSERT_TRUE(Gate.WaitForStarted(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(Pool.RunningCount(), 1u);

    Gate.Release();
    Pool.WaitUntilIdle();
    EXPECT_EQ(Pool.PeakRunning(), 1u);
}

TEST(WorkerPool, PromotedJobRunsNext)
{
    Latch Gate;
    WorkerPool Pool(1, 1, [&Gate](WorkItem& W) { Gate.Run(W); });

    Pool.Submit(Item("A", "a0", "d"));
    ASSERT_TRUE(Gate.WaitForStarted(1));

    Pool.Submit(Item("A", "a1", "d"));
    Pool.Submit(Item("A", "a2", "d"));
    Pool.Submit(Item("B", "b0", "d"));
    Pool.Submit(Item("B", "b1", "d"));

    EXPECT_TRUE(Pool.Promote("B"));
    EXPECT_FALSE(Pool.Promote("C"));

    Gate.Release();
    Pool.WaitUntilIdle();

    EXPECT_EQ(Gate.Order(), (std::vector<std::string>{ "a0", "b0", "b1", "a1", "a2" }));
}

TEST(WorkerPool, WithdrawLeavesInFlightAlone)
{
    Latch Gate;
    WorkerPool Pool(1, 1, [&Gate](WorkItem& W) { Gate.Run(W); });

    Pool.Submit(Item("A", "a0", "d"));
    ASSERT_TRUE(Gate.WaitForStarted(1));
    Pool.Submit(Item("A", "a1", "d"));
    Pool.Submit(Item("A", "a2", "d"));

    auto Withdrawn = Pool.Withdraw("A");
    ASSERT_EQ(Withdrawn.size(), 2u);
    EXPECT_EQ(Withdrawn[0].Id, "a1");
    EXPECT_EQ(Withdrawn[1].Id, "a2");
    EXPECT_EQ(Pool.RunningCount(), 1u);

    Gate.Release();
    Pool.WaitUntilIdle();
    EXPECT_EQ(Gate.Order(), (std::vector<std::string>{ "a0" }));
}

TEST(WorkerPool, ShutdownDrainsInFlightAndReturnsQueued)
{
    Latch Gate;
    WorkerPool Pool(1, 1, [&Gate](WorkItem& W) { Gate.Run(W); });

    Pool.Submit(Item("A", "a0", "d"));
    ASSERT_TRUE(Gate.WaitForStarted(1));
    Pool.Submit(Item("A", "a1", "d"));

    std::thread Releaser([&Gate]()
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        Gate.Release();
    });
    auto Remaining = Pool.Shutdown();
    Releaser.join();

    ASSERT_EQ(Remaining.size(), 1u);
    EXPECT_EQ(Remaining[0].Id, "a1");
    EXPECT_EQ(Gate.Order(), (std::vector<std::string>{ "a0" }));

    Pool.Submit(Item("A", "late", "d"));
    EXPECT_EQ(Pool.QueuedCount(), 0u);
}

TEST(WorkerPool, ThrowingExecutorDoesNotKillWorker)
{
    std::atomic<int> Executed{ 0 };
    WorkerPool Pool(1, 1, [&Executed](WorkItem& W)
    {
        ++Executed;
        if (W.Id == "boom")
        {
            throw std::runtime_error("boom");
        }
    });

    Pool.Submit(Item("A", "boom", "d"));
    Pool.Submit(Item("A", "after", "d"));
    Pool.WaitUntilIdle();
    EXPECT_EQ(Executed.load(), 2);
}
