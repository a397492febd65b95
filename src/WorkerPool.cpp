#include "WorkerPool.hpp"
#include "Logger.hpp"
#include <algorithm>

WorkerPool::WorkerPool(unsigned int GlobalMax, unsigned int PerDestinationMax, Executor Run)
    : GlobalMax(std::max(1u, GlobalMax)), PerDestinationMax(std::max(1u, PerDestinationMax)), Run(std::move(Run))
{
    if (!this->Run)
    {
        this->Run = [](WorkItem& Item)
        {
            if (Item.Work)
            {
                ExecuteTask(*Item.Work);
            }
        };
    }

    for (unsigned int i = 0; i < this->GlobalMax; ++i)
    {
        Workers.emplace_back(&WorkerPool::WorkerThread, this);
    }
    Log.Info("[WorkerPool] Started " + std::to_string(this->GlobalMax) + " workers, " +
             std::to_string(this->PerDestinationMax) + " per destination");
}

WorkerPool::~WorkerPool()
{
    Shutdown();
}

void WorkerPool::Submit(WorkItem Item)
{
    {
        std::lock_guard<std::mutex> Lock(PoolMutex);
        if (Stopping)
        {
            Log.Warn("[WorkerPool] Rejected " + Item.Id + " after shutdown");
            return;
        }

        auto it = std::find_if(Queues.begin(), Queues.end(), [&Item](const JobQueue& Q) { return Q.Job == Item.Job; });
        if (it == Queues.end())
        {
            Queues.push_back(JobQueue{ Item.Job, {} });
            it = std::prev(Queues.end());
        }
        it->Items.push_back(std::move(Item));
    }
    Work_CV.notify_one();
}

std::vector<WorkItem> WorkerPool::Withdraw(const JobId& Job)
{
    std::vector<WorkItem> Withdrawn;
    std::lock_guard<std::mutex> Lock(PoolMutex);

    auto it = std::find_if(Queues.begin(), Queues.end(), [&Job](const JobQueue& Q) { return Q.Job == Job; });
    if (it != Queues.end())
    {
        for (auto& Item : it->Items)
        {
            Withdrawn.push_back(std::move(Item));
        }
        Queues.erase(it);
    }
    Idle_CV.notify_all();
    return Withdrawn;
}

bool WorkerPool::Promote(const JobId& Job)
{
    {
        std::lock_guard<std::mutex> Lock(PoolMutex);
        auto it = std::find_if(Queues.begin(), Queues.end(), [&Job](const JobQueue& Q) { return Q.Job == Job; });
        if (it == Queues.end())
        {
            return false;
        }
        if (it != Queues.begin())
        {
            JobQueue Promoted = std::move(*it);
            Queues.erase(it);
            Queues.push_front(std::move(Promoted));
        }
    }
    Work_CV.notify_all();
    return true;
}

bool WorkerPool::TakeNext(WorkItem& Out)
{
    if (Running >= GlobalMax)
    {
        return false;
    }

    for (auto QueueIt = Queues.begin(); QueueIt != Queues.end(); ++QueueIt)
    {
        auto& Items = QueueIt->Items;
        if (Items.empty())
        {
            continue;
        }

        const unsigned int JobLimit = Items.front().JobLimit;
        if (JobLimit != 0 && RunningPerJob[QueueIt->Job] >= JobLimit)
        {
            continue;
        }

        for (auto ItemIt = Items.begin(); ItemIt != Items.end(); ++ItemIt)
        {
            if (RunningPerDestination[ItemIt->DestinationKey] >= PerDestinationMax)
            {
                continue;
            }

            Out = std::move(*ItemIt);
            Items.erase(ItemIt);
            if (Items.empty())
            {
                Queues.erase(QueueIt);
            }

            ++Running;
            ++RunningPerJob[Out.Job];
            unsigned int& DestinationRunning = ++RunningPerDestination[Out.DestinationKey];
            Peak = std::max(Peak, Running);
            unsigned int& DestinationPeak = PeakPerDestination[Out.DestinationKey];
            DestinationPeak = std::max(DestinationPeak, DestinationRunning);
            return true;
        }
    }
    return false;
}

void WorkerPool::Finish(const WorkItem& Item)
{
    {
        std::lock_guard<std::mutex> Lock(PoolMutex);
        --Running;
        if (--RunningPerJob[Item.Job] == 0)
        {
            RunningPerJob.erase(Item.Job);
        }
        --RunningPerDestination[Item.DestinationKey];
    }
    Work_CV.notify_all();
    Idle_CV.notify_all();
}

void WorkerPool::WorkerThread()
{
    while (true)
    {
        WorkItem Item;
        {
            std::unique_lock<std::mutex> Lock(PoolMutex);
            while (true)
            {
                if (Stopping)
                {
                    return;
                }
                if (TakeNext(Item))
                {
                    break;
                }
                Work_CV.wait(Lock);
            }
        }

        try
        {
            Run(Item);
        }
        catch (const std::exception& e)
        {
            Log.Error("[WorkerPool] Work item " + Item.Id + " threw: " + e.what());
        }
        Finish(Item);
    }
}

void WorkerPool::WaitUntilIdle()
{
    std::unique_lock<std::mutex> Lock(PoolMutex);
    Idle_CV.wait(Lock, [this]() { return Running == 0 && Queues.empty(); });
}

std::vector<WorkItem> WorkerPool::Shutdown()
{
    std::vector<WorkItem> Remaining;
    {
        std::lock_guard<std::mutex> Lock(PoolMutex);
        if (Stopping)
        {
            return Remaining;
        }
        Stopping = true;
        for (auto& Q : Queues)
        {
            for (auto& Item : Q.Items)
            {
                Remaining.push_back(std::move(Item));
            }
        }
        Queues.clear();
    }
    Work_CV.notify_all();

    for (std::thread& Worker : Workers)
    {
        if (Worker.joinable())
        {
            Worker.join();
        }
    }
    Idle_CV.notify_all();
    Log.Info("[WorkerPool] Shut down, " + std::to_string(Remaining.size()) + " queued item(s) not started");
    return Remaining;
}

size_t WorkerPool::QueuedCount()
{
    std::lock_guard<std::mutex> Lock(PoolMutex);
    size_t Count = 0;
    for (const auto& Q : Queues)
    {
        Count += Q.Items.size();
    }
    return Count;
}

unsigned int WorkerPool::RunningCount()
{
    std::lock_guard<std::mutex> Lock(PoolMutex);
    return Running;
}

unsigned int WorkerPool::PeakRunning()
{
    std::lock_guard<std::mutex> Lock(PoolMutex);
    return Peak;
}

unsigned int WorkerPool::PeakRunningFor(const std::string& DestinationKey)
{
    std::lock_guard<std::mutex> Lock(PoolMutex);
    auto it = PeakPerDestination.find(DestinationKey);
    return it == PeakPerDestination.end() ? 0 : it->second;
}
