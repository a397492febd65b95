#include "ConfigGlobal.hpp"

namespace ConfigGlobal
{
    std::string ConfigFile;
    std::string LogDir;
    std::string LedgerDir;
    std::string PostProcessCommand;
    std::string EjectCommand;

    unsigned short int MaxLogFiles;
    unsigned short int LedgerRetentionDays;
    unsigned short int MaxConcurrency;
    unsigned short int PerDestinationConcurrency;
    size_t ChunkSizeBytes;
    size_t EventQueueCapacity;

    std::filesystem::path FailureFile;
    std::filesystem::path SuccessFile;

    void InitializeDefaults()
    {
        ConfigFile = "Offload.txt"; //Relative to the working directory unless given on the command line
        LogDir = "Offload_Logs";
        LedgerDir = "Offload_Ledger";
        PostProcessCommand = "";
        EjectCommand = "";
        MaxLogFiles = 10;
        LedgerRetentionDays = 30; //Unclaimed ledger records older than this are pruned, 0 prunes them all
        MaxConcurrency = 2;
        PerDestinationConcurrency = 1;
        ChunkSizeBytes = 4 * 1024 * 1024;
        EventQueueCapacity = 1024;
        FailureFile.clear(); //Set by FailureDetect once the ledger directory is known
        SuccessFile.clear();
    }
}
