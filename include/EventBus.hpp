#pragma once

#include "TransferTypes.hpp"
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>

struct TaskProgressEvent
{
    TaskId Task;
    JobId Job;
    uint64_t BytesTransferred = 0;
    uint64_t TotalBytes = 0;
};

struct TaskStateChangedEvent
{
    TaskId Task;
    JobId Job;
    TaskStatus Old = TaskStatus::Pending;
    TaskStatus New = TaskStatus::Pending;
    TransferErrorKind ErrorKind = TransferErrorKind::None;
    std::optional<std::string> Error;
    std::string SourcePath;
    std::string DestinationPath;
    std::string Checksum;
};

struct JobStateChangedEvent
{
    JobId Job;
    JobStatus Old = JobStatus::Queued;
    JobStatus New = JobStatus::Queued;
};

struct JobFinishedEvent
{
    JobId Job;
    JobStatus Status = JobStatus::Completed;
    bool ChecksumMismatch = false;
    size_t Completed = 0;
    size_t Skipped = 0;
    size_t Failed = 0;
    size_t Cancelled = 0;
};

struct EjectRequestedEvent
{
    JobId Job;
    std::string SourceRootId;
};

using TransferEvent = std::variant<TaskProgressEvent, TaskStateChangedEvent, JobStateChangedEvent, JobFinishedEvent, EjectRequestedEvent>;
using EventHandler = std::function<void(const TransferEvent&)>;
using SubscriptionId = uint64_t;

// Fan-out of engine events to independent subscribers. Each subscriber gets its own bounded
// queue and delivery thread; a full queue drops its oldest event, so Publish never waits on a
// consumer. Handlers must not call Flush or Unsubscribe on their own bus.
class EventBus
{
public:
    explicit EventBus(size_t DefaultCapacity = 1024);
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    // Capacity 0 uses the bus default.
    SubscriptionId Subscribe(const std::string& Name, EventHandler Handler, size_t Capacity = 0);

    // Delivers what is already queued for the subscriber, then stops its thread.
    void Unsubscribe(SubscriptionId Id);

    void Publish(const TransferEvent& Event);

    // Blocks until every subscriber has handled everything published so far.
    void Flush();

    void Shutdown();

    uint64_t DroppedCount(SubscriptionId Id);
    uint64_t DeliveredCount(SubscriptionId Id);

private:
    struct Subscriber
    {
        SubscriptionId Id = 0;
        std::string Name;
        EventHandler Handler;
        size_t Capacity = 0;

        std::deque<TransferEvent> Queue;
        std::mutex QueueMutex;
        std::condition_variable Queue_CV;
        bool Stopping = false;
        bool Busy = false;
        uint64_t Dropped = 0;
        uint64_t Delivered = 0;

        std::thread Thread;
    };

    size_t DefaultCapacity;
    SubscriptionId NextId = 1;
    std::map<SubscriptionId, std::shared_ptr<Subscriber>> Subscribers;
    std::mutex BusMutex;

    static void DeliveryLoop(Subscriber& Sub);
    static void Stop(Subscriber& Sub);
};

const char* EventName(const TransferEvent& Event);
