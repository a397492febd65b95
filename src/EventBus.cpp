#include "EventBus.hpp"
#include "Logger.hpp"
#include <vector>

EventBus::EventBus(size_t DefaultCapacity) : DefaultCapacity(DefaultCapacity == 0 ? 1 : DefaultCapacity)
{
}

EventBus::~EventBus()
{
    Shutdown();
}

SubscriptionId EventBus::Subscribe(const std::string& Name, EventHandler Handler, size_t Capacity)
{
    auto Sub = std::make_shared<Subscriber>();
    Sub->Name = Name;
    Sub->Handler = std::move(Handler);
    Sub->Capacity = Capacity == 0 ? DefaultCapacity : Capacity;

    std::lock_guard<std::mutex> Lock(BusMutex);
    Sub->Id = NextId++;
    Sub->Thread = std::thread(&EventBus::DeliveryLoop, std::ref(*Sub));
    Subscribers.emplace(Sub->Id, Sub);

    Log.Info("[EventBus] Subscribed " + Name + " (queue " + std::to_string(Sub->Capacity) + ")");
    return Sub->Id;
}

void EventBus::Unsubscribe(SubscriptionId Id)
{
    std::shared_ptr<Subscriber> Sub;
    {
        std::lock_guard<std::mutex> Lock(BusMutex);
        auto it = Subscribers.find(Id);
        if (it == Subscribers.end())
        {
            return;
        }
        Sub = it->second;
        Subscribers.erase(it);
    }
    Stop(*Sub);
}

void EventBus::Publish(const TransferEvent& Event)
{
    std::lock_guard<std::mutex> Lock(BusMutex);
    for (auto& [Id, Sub] : Subscribers)
    {
        {
            std::lock_guard<std::mutex> QueueLock(Sub->QueueMutex);
            if (Sub->Queue.size() >= Sub->Capacity)
            {
                Sub->Queue.pop_front();
                ++Sub->Dropped;
            }
            Sub->Queue.push_back(Event);
        }
        Sub->Queue_CV.notify_all();
    }
}

void EventBus::Flush()
{
    std::vector<std::shared_ptr<Subscriber>> Current;
    {
        std::lock_guard<std::mutex> Lock(BusMutex);
        for (auto& [Id, Sub] : Subscribers)
        {
            Current.push_back(Sub);
        }
    }

    for (auto& Sub : Current)
    {
        std::unique_lock<std::mutex> QueueLock(Sub->QueueMutex);
        Sub->Queue_CV.wait(QueueLock, [&Sub]() { return (Sub->Queue.empty() && !Sub->Busy) || Sub->Stopping; });
    }
}

void EventBus::Shutdown()
{
    std::map<SubscriptionId, std::shared_ptr<Subscriber>> Current;
    {
        std::lock_guard<std::mutex> Lock(BusMutex);
        Current.swap(Subscribers);
    }
    for (auto& [Id, Sub] : Current)
    {
        Stop(*Sub);
    }
}

uint64_t EventBus::DroppedCount(SubscriptionId Id)
{
    std::lock_guard<std::mutex> Lock(BusMutex);
    auto it = Subscribers.find(Id);
    if (it == Subscribers.end())
    {
        return 0;
    }
    std::lock_guard<std::mutex> QueueLock(it->second->QueueMutex);
    return it->second->Dropped;
}

uint64_t EventBus::DeliveredCount(SubscriptionId Id)
{
    std::lock_guard<std::mutex> Lock(BusMutex);
    auto it = Subscribers.find(Id);
    if (it == Subscribers.end())
    {
        return 0;
    }
    std::lock_guard<std::mutex> QueueLock(it->second->QueueMutex);
    return it->second->Delivered;
}

void EventBus::Stop(Subscriber& Sub)
{
    {
        std::lock_guard<std::mutex> QueueLock(Sub.QueueMutex);
        Sub.Stopping = true;
    }
    Sub.Queue_CV.notify_all();
    if (Sub.Thread.joinable())
    {
        Sub.Thread.join();
    }
    if (Sub.Dropped > 0)
    {
        Log.Warn("[EventBus] " + Sub.Name + " dropped " + std::to_string(Sub.Dropped) + " event(s)");
    }
}

void EventBus::DeliveryLoop(Subscriber& Sub)
{
    while (true)
    {
        TransferEvent Event;
        {
            std::unique_lock<std::mutex> QueueLock(Sub.QueueMutex);
            Sub.Busy = false;
            Sub.Queue_CV.notify_all();
            Sub.Queue_CV.wait(QueueLock, [&Sub]() { return Sub.Stopping || !Sub.Queue.empty(); });
            if (Sub.Queue.empty())
            {
                return;
            }
            Event = std::move(Sub.Queue.front());
            Sub.Queue.pop_front();
            Sub.Busy = true;
        }

        try
        {
            Sub.Handler(Event);
        }
        catch (const std::exception& e)
        {
            Log.Error("[EventBus] Subscriber " + Sub.Name + " failed on " + EventName(Event) + ": " + e.what());
        }

        std::lock_guard<std::mutex> QueueLock(Sub.QueueMutex);
        ++Sub.Delivered;
    }
}

const char* EventName(const TransferEvent& Event)
{
    switch (Event.index())
    {
    case 0: return "TaskProgress";
    case 1: return "TaskStateChanged";
    case 2: return "JobStateChanged";
    case 3: return "JobFinished";
    case 4: return "EjectRequested";
    default: return "Unknown";
    }
}
