#pragma once

#include "EventBus.hpp"
#include <chrono>
#include <mutex>
#include <ostream>
#include <string>
#include <unordered_map>

// "512.00 ", "1.50 KB", "2.00 GB" (1024 based, two decimals)
std::string FormatBytes(uint64_t ByteCount);

// One line of human readable text for an event.
std::string DescribeEvent(const TransferEvent& Event);

// Writes every event except per-chunk progress to the process log.
class LogEventListener
{
public:
    void operator()(const TransferEvent& Event) const;
};

// Aggregates progress for one job and prints percent, throughput and ETA.
class ConsoleProgressListener
{
public:
    ConsoleProgressListener(std::ostream& Out, JobId Job, uint64_t TotalBytes,
                            std::chrono::milliseconds Interval = std::chrono::milliseconds(500));

    void operator()(const TransferEvent& Event);

    uint64_t TransferredBytes();

private:
    std::ostream& Out;
    JobId Job;
    uint64_t TotalBytes;
    std::chrono::milliseconds Interval;
    std::chrono::steady_clock::time_point Started;
    std::chrono::steady_clock::time_point LastPrint;
    std::unordered_map<TaskId, uint64_t> TaskBytes;
    uint64_t Transferred = 0;
    std::mutex ListenerMutex;

    void Print(bool Force);
};
