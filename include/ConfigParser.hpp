#pragma once

#include "TransferTypes.hpp"
#include "FileScanner.hpp"
#include <string>
#include <vector>

// Everything one config file asks the driver to do.
struct OffloadRequest
{
    JobId Id;
    std::vector<std::string> Sources;
    std::vector<std::string> Destinations;
    std::vector<std::string> Excludes;
    JobOptions Options;
    DestinationLayout Layout;
};

class ConfigParser
{
public:
    ConfigParser() = default;
    bool Parse(const std::string& FilePath);

    const std::vector<std::string>& GetErrors() const;
    const std::vector<std::string>& GetInfos() const;
    const std::vector<std::string>& GetExcludes() const;
    const std::vector<std::string>& GetSources() const;
    const std::vector<std::string>& GetDestinations() const;
    const OffloadRequest& GetRequest() const;
    void Reset();

    static bool IsAbsolutePath(const std::string& Path);
    static bool IsParentDirectory(const std::string& Parent, const std::string& Child);

    // "Offload_<hex>" derived from the sorted source and destination paths.
    static std::string DefaultJobId(std::vector<std::string> Sources, std::vector<std::string> Destinations);

private:
    void AddError(const std::string& Message);
    void AddInfo(const std::string& Message);

    bool ParseYesNo(const std::string& Value, int LineNumber, bool& Out);
    bool ParseNumber(const std::string& Key, const std::string& Value, int LineNumber, unsigned long Min, unsigned long Max, unsigned long& Out);

    void AddSource(const std::string& Value, int LineNumber);
    void AddDestination(const std::string& Value, int LineNumber);
    void ValidateRequest();

    OffloadRequest Request;
    std::vector<std::string> Errors;
    std::vector<std::string> Infos;
};
