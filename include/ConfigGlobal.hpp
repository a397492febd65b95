#pragma once

#include <string>
#include <filesystem>

namespace ConfigGlobal
{
    extern std::string ConfigFile;
    extern std::string LogDir;
    extern std::string LedgerDir;
    extern std::string PostProcessCommand;
    extern std::string EjectCommand;

    extern unsigned short int MaxLogFiles;
    extern unsigned short int LedgerRetentionDays;
    extern unsigned short int MaxConcurrency;
    extern unsigned short int PerDestinationConcurrency;
    extern size_t ChunkSizeBytes;
    extern size_t EventQueueCapacity;

    extern std::filesystem::path FailureFile;
    extern std::filesystem::path SuccessFile;

    void InitializeDefaults();
}
