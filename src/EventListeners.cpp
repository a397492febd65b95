#include "EventListeners.hpp"
#include "Logger.hpp"
#include "TimeUtils.hpp"
#include <iomanip>
#include <sstream>

namespace
{
    template<class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
    template<class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;
}

std::string FormatBytes(uint64_t ByteCount)
{
    static const char* Labels[] = { "B", "KB", "MB", "GB", "TB" };
    double Value = static_cast<double>(ByteCount);
    size_t Power = 0;
    while (Value >= 1024.0 && Power < 4)
    {
        Value /= 1024.0;
        ++Power;
    }

    std::ostringstream Stream;
    Stream << std::fixed << std::setprecision(2) << Value << " " << Labels[Power];
    return Stream.str();
}

std::string DescribeEvent(const TransferEvent& Event)
{
    return std::visit(Overloaded{
        [](const TaskProgressEvent& E)
        {
            return "[Progress] " + E.Task + " " + FormatBytes(E.BytesTransferred) + " / " + FormatBytes(E.TotalBytes);
        },
        [](const TaskStateChangedEvent& E)
        {
            std::string Text = "[Task] " + E.Task + " " + ToString(E.Old) + " -> " + ToString(E.New);
            if (E.New == TaskStatus::Completed && !E.Checksum.empty())
            {
                Text += " " + E.DestinationPath + " (" + E.Checksum + ")";
            }
            if (E.Error)
            {
                Text += " (" + ToString(E.ErrorKind) + ": " + *E.Error + ")";
            }
            return Text;
        },
        [](const JobStateChangedEvent& E)
        {
            return "[Job] " + E.Job + " " + ToString(E.Old) + " -> " + ToString(E.New);
        },
        [](const JobFinishedEvent& E)
        {
            std::string Text = "[Job] " + E.Job + " finished " + ToString(E.Status) + ": " +
                std::to_string(E.Completed) + " completed, " + std::to_string(E.Skipped) + " skipped, " +
                std::to_string(E.Failed) + " failed, " + std::to_string(E.Cancelled) + " cancelled";
            if (E.ChecksumMismatch)
            {
                Text += " [CHECKSUM MISMATCH, do not erase source media]";
            }
            return Text;
        },
        [](const EjectRequestedEvent& E)
        {
            return "[Eject] " + E.Job + " requests eject of " + E.SourceRootId;
        }
    }, Event);
}

void LogEventListener::operator()(const TransferEvent& Event) const
{
    if (std::holds_alternative<TaskProgressEvent>(Event))
    {
        return;
    }

    std::string Text = DescribeEvent(Event);

    if (const auto* Changed = std::get_if<TaskStateChangedEvent>(&Event))
    {
        if (Changed->New == TaskStatus::Failed)
        {
            Log.Error(Text);
            return;
        }
    }
    else if (const auto* Finished = std::get_if<JobFinishedEvent>(&Event))
    {
        if (Finished->ChecksumMismatch || Finished->Status == JobStatus::Failed)
        {
            Log.Error(Text);
            return;
        }
        if (Finished->Status != JobStatus::Completed)
        {
            Log.Warn(Text);
            return;
        }
    }
    Log.Info(Text);
}

ConsoleProgressListener::ConsoleProgressListener(std::ostream& Out, JobId Job, uint64_t TotalBytes, std::chrono::milliseconds Interval)
    : Out(Out), Job(std::move(Job)), TotalBytes(TotalBytes), Interval(Interval),
      Started(std::chrono::steady_clock::now()), LastPrint()
{
}

void ConsoleProgressListener::operator()(const TransferEvent& Event)
{
    std::lock_guard<std::mutex> Lock(ListenerMutex);

    if (const auto* Progress = std::get_if<TaskProgressEvent>(&Event))
    {
        if (Progress->Job != Job)
        {
            return;
        }
        uint64_t& Known = TaskBytes[Progress->Task];
        if (Known == 0 && Transferred == 0)
        {
            Started = std::chrono::steady_clock::now();
        }
        if (Progress->BytesTransferred >= Known)
        {
            Transferred += Progress->BytesTransferred - Known;
        }
        else
        {
            Transferred -= Known - Progress->BytesTransferred;
        }
        Known = Progress->BytesTransferred;
        Print(false);
    }
    else if (const auto* Finished = std::get_if<JobFinishedEvent>(&Event))
    {
        if (Finished->Job == Job)
        {
            Print(true);
            Out << "\n" << DescribeEvent(Event) << "\n";
            Out.flush();
        }
    }
    else if (const auto* Changed = std::get_if<TaskStateChangedEvent>(&Event))
    {
        if (Changed->Job == Job && Changed->New == TaskStatus::Failed)
        {
            Out << "\n" << DescribeEvent(Event) << "\n";
        }
    }
}

uint64_t ConsoleProgressListener::TransferredBytes()
{
    std::lock_guard<std::mutex> Lock(ListenerMutex);
    return Transferred;
}

void ConsoleProgressListener::Print(bool Force)
{
    auto Now = std::chrono::steady_clock::now();
    if (!Force && Now - LastPrint < Interval)
    {
        return;
    }
    LastPrint = Now;

    double Elapsed = std::chrono::duration<double>(Now - Started).count();
    double Speed = Elapsed > 0.0 ? static_cast<double>(Transferred) / Elapsed : 0.0;
    double Percent = TotalBytes == 0 ? 100.0 : 100.0 * static_cast<double>(Transferred) / static_cast<double>(TotalBytes);
    double Eta = Speed > 0.0 && TotalBytes >= Transferred ? static_cast<double>(TotalBytes - Transferred) / Speed : -1.0;

    Out << "\r[" << Job << "] " << std::fixed << std::setprecision(1) << Percent << "% "
        << FormatBytes(Transferred) << " / " << FormatBytes(TotalBytes) << "  "
        << FormatBytes(static_cast<uint64_t>(Speed)) << "/s  ETA " << FormatEta(Eta) << "   ";
    Out.flush();
}
