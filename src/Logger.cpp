#include "Logger.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <iostream>
#include <vector>
#include <algorithm>

Logger Log;
namespace FS = std::filesystem;

void Logger::Init(const std::string& LogDir)
{
    std::error_code ec;
    FS::create_directories(LogDir, ec);
    if (ec)
    {
        std::cerr << "Logger: Failed to create log directory: " << LogDir << " (" << ec.message() << ")\n";
        return;
    }

    LogDirectory = LogDir;
    CurrentLogFilePath = (FS::path(LogDir) / ("Offload_Log" + GetTimestampForFilename() + ".txt")).string();

    OpenLogFile(CurrentLogFilePath);

    Info("Offload Started at " + GetTimestamp());
}

Logger::~Logger()
{
    Close();
}

void Logger::Close()
{
    if (!IsOpen())
    {
        return;
    }
    Info("Offload Finished at " + GetTimestamp());

    std::lock_guard<std::mutex> Lock(LogWriteMutex);
    LogFile.close();
}

bool Logger::IsOpen()
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);
    return LogFile.is_open();
}

void Logger::OpenLogFile(const std::string& FilePath)
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);
    LogFile.open(FilePath, std::ios::out | std::ios::app);

    if (!LogFile.is_open())
    {
        std::cerr << "Logger: Failed to open log file: " << FilePath << "\n";
    }
}

void Logger::CleanupOldLogs(unsigned short int MaxLogFiles)
{
    if (LogDirectory.empty())
    {
        return;
    }

    std::vector<FS::directory_entry> Logs;
    std::error_code ec;

    for (const auto& Entry : FS::directory_iterator(LogDirectory, ec))
    {
        if (Entry.is_regular_file() && Entry.path().filename().string().find("Offload_Log") == 0)
        {
            Logs.push_back(Entry);
        }
    }

    if (Logs.size() <= MaxLogFiles)
    {
        return;
    }

    std::sort(Logs.begin(), Logs.end(), [](const FS::directory_entry& A, const FS::directory_entry& B)
    {
        return A.path().filename().string() < B.path().filename().string();
    });

    while (Logs.size() > MaxLogFiles)
    {
        if (Logs.front().path().string() != CurrentLogFilePath)
        {
            std::error_code RemoveError;
            if (!FS::remove(Logs.front(), RemoveError) && RemoveError)
            {
                Warn("[Logger] Could not remove old log " + Logs.front().path().string() + ": " + RemoveError.message());
            }
        }
        Logs.erase(Logs.begin());
    }
}

void Logger::Log(LogLevel Level, const std::string& Message)
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);

    if (!LogFile.is_open())
    {
        return;
    }

    LogFile << "[" << GetTimestamp() << "]" << " [" << LevelToString(Level) << "] " << Message << "\n";
    LogFile.flush();
}

void Logger::Info(const std::string& Message)
{
    Log(LogLevel::INFO, Message);
}

void Logger::Warn(const std::string& Message)
{
    Log(LogLevel::WARN, Message);
}

void Logger::Error(const std::string& Message)
{
    Log(LogLevel::ERROR, Message);
}

std::string Logger::GetTimestampForFilename()
{
    auto Now = std::chrono::system_clock::now();
    std::time_t Time = std::chrono::system_clock::to_time_t(Now);
    std::tm Local{};

#ifdef _WIN32
    localtime_s(&Local, &Time);
#else
    localtime_r(&Time, &Local);
#endif

    std::ostringstream Stream;
    Stream << std::put_time(&Local, "%Y%m%d_%H%M%S");
    return Stream.str();
}

std::string Logger::GetTimestamp() const
{
    auto Now = std::chrono::system_clock::now();
    std::time_t Time = std::chrono::system_clock::to_time_t(Now);
    std::tm Local{};

#ifdef _WIN32
    localtime_s(&Local, &Time);
#else
    localtime_r(&Time, &Local);
#endif

    std::ostringstream Stream;
    Stream << std::put_time(&Local, "%Y-%m-%d %H:%M:%S");
    return Stream.str();
}

std::string Logger::LevelToString(LogLevel Level) const
{
    switch (Level)
    {
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    default:              return "UNKNOWN";
    }
}
