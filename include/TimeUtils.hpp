#pragma once

#include <filesystem>
#include <chrono>
#include <ctime>
#include <string>

//UNIX seconds of a filesystem timestamp
inline int64_t ToUnixSeconds(std::filesystem::file_time_type FTime)
{
    using namespace std::chrono;
    return duration_cast<seconds>(file_clock::to_sys(FTime).time_since_epoch()).count();
}

// strftime over the local time of Now
inline std::string FormatLocalTime(const char* Format, std::time_t Now = std::time(nullptr))
{
    std::tm Local{};
    localtime_r(&Now, &Local);
    char Buffer[64] = { 0 };
    size_t Length = std::strftime(Buffer, sizeof(Buffer), Format, &Local);
    return std::string(Buffer, Length);
}

// "1h 2m", "3m 4s", "5s", "Done" for zero and "N/A" for negative
inline std::string FormatEta(double Seconds)
{
    if (Seconds < 0)
    {
        return "N/A";
    }
    long long Total = static_cast<long long>(Seconds);
    if (Total == 0)
    {
        return "Done";
    }
    long long Hours = Total / 3600;
    long long Minutes = (Total % 3600) / 60;
    long long Secs = Total % 60;

    if (Hours > 0)
    {
        return std::to_string(Hours) + "h " + std::to_string(Minutes) + "m";
    }
    if (Minutes > 0)
    {
        return std::to_string(Minutes) + "m " + std::to_string(Secs) + "s";
    }
    return std::to_string(Secs) + "s";
}
