#include <iostream>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>

#include "ConfigParser.hpp"
#include "ChecksumEngine.hpp"
#include "ConfigGlobal.hpp"

namespace FS = std::filesystem;

const std::vector<std::string>& ConfigParser::GetSources() const
{
    return Request.Sources;
}

const std::vector<std::string>& ConfigParser::GetDestinations() const
{
    return Request.Destinations;
}

const std::vector<std::string>& ConfigParser::GetExcludes() const
{
    return Request.Excludes;
}

const std::vector<std::string>& ConfigParser::GetErrors() const
{
    return Errors;
}

const std::vector<std::string>& ConfigParser::GetInfos() const
{
    return Infos;
}

const OffloadRequest& ConfigParser::GetRequest() const
{
    return Request;
}

void ConfigParser::Reset()
{
    Request = OffloadRequest();
    Errors.clear();
    Infos.clear();

    ConfigGlobal::InitializeDefaults();
}

void ConfigParser::AddError(const std::string& Message)
{
    Errors.push_back(Message);
}

void ConfigParser::AddInfo(const std::string& Message)
{
    Infos.push_back(Message);
}

bool ConfigParser::IsAbsolutePath(const std::string& Path)
{
    return !Path.empty() && Path[0] == '/';
}

bool ConfigParser::IsParentDirectory(const std::string& Parent, const std::string& Child)
{
    std::error_code ec;
    auto ParentAbs = FS::absolute(FS::path(Parent), ec).lexically_normal();
    if (ec)
    {
        return false;
    }
    auto ChildAbs = FS::absolute(FS::path(Child), ec).lexically_normal();
    if (ec)
    {
        return false;
    }

    auto ParentIt = ParentAbs.begin();
    auto ChildIt = ChildAbs.begin();

    for (; ParentIt != ParentAbs.end() && ChildIt != ChildAbs.end(); ++ParentIt, ++ChildIt)
    {
        // "/a/b/" normalises with an empty trailing element
        if (ParentIt->empty())
        {
            return true;
        }
        if (*ParentIt != *ChildIt)
            return false;
    }
    return ParentIt == ParentAbs.end() || ParentIt->empty();
}

// Same sources and destinations give the same id, so a rerun after a crash finds its ledger records.
std::string ConfigParser::DefaultJobId(std::vector<std::string> Sources, std::vector<std::string> Destinations)
{
    for (auto& Source : Sources)
    {
        Source = FS::path(Source).lexically_normal().string();
    }
    for (auto& Destination : Destinations)
    {
        Destination = FS::path(Destination).lexically_normal().string();
    }
    std::sort(Sources.begin(), Sources.end());
    std::sort(Destinations.begin(), Destinations.end());

    std::string Key;
    for (const auto& Source : Sources)
    {
        Key += "S:" + Source;
        Key.push_back('\0');
    }
    for (const auto& Destination : Destinations)
    {
        Key += "D:" + Destination;
        Key.push_back('\0');
    }
    return "Offload_" + ChecksumEngine::HashBytes(ChecksumAlgorithm::XXH64, Key.data(), Key.size());
}

bool ConfigParser::ParseYesNo(const std::string& Value, int LineNumber, bool& Out)
{
    if (Value == "YES")
    {
        Out = true;
        return true;
    }
    if (Value == "NO")
    {
        Out = false;
        return true;
    }
    AddError("Line " + std::to_string(LineNumber) + ": Invalid Input. Use 'YES' or 'NO'.");
    return false;
}

bool ConfigParser::ParseNumber(const std::string& Key, const std::string& Value, int LineNumber, unsigned long Min, unsigned long Max, unsigned long& Out)
{
    bool AllDigits = !Value.empty() && std::all_of(Value.begin(), Value.end(), [](char Ch) { return std::isdigit(static_cast<unsigned char>(Ch)); });
    if (!AllDigits)
    {
        AddError("Line " + std::to_string(LineNumber) + ": Invalid number for " + Key + ".");
        return false;
    }

    unsigned long ValueNum = 0;
    try
    {
        ValueNum = std::stoul(Value);
    }
    catch (const std::out_of_range&)
    {
        AddError("Line " + std::to_string(LineNumber) + ": " + Key + " is out of range.");
        return false;
    }

    if (ValueNum < Min || ValueNum > Max)
    {
        AddError("Line " + std::to_string(LineNumber) + ": " + Key + " must be between " + std::to_string(Min) + " and " + std::to_string(Max) + ".");
        return false;
    }
    Out = ValueNum;
    AddInfo(Key + " set to " + std::to_string(ValueNum));
    return true;
}

void ConfigParser::AddSource(const std::string& Value, int LineNumber)
{
    if (!IsAbsolutePath(Value))
    {
        AddError("Line " + std::to_string(LineNumber) + ": Source path is not absolute.");
        return;
    }
    FS::path SourcePath(Value);
    std::error_code ec;
    if (!FS::exists(SourcePath, ec))
    {
        AddError("Line " + std::to_string(LineNumber) + ": Source path does not exist. " + ec.message());
        return;
    }
    if (!FS::is_directory(SourcePath, ec) && !FS::is_regular_file(SourcePath, ec))
    {
        AddError("Line " + std::to_string(LineNumber) + ": Source path is neither a file nor a directory.");
        return;
    }

    if (std::find(Request.Sources.begin(), Request.Sources.end(), Value) != Request.Sources.end())
    {
        AddInfo("Line " + std::to_string(LineNumber) + ": Duplicate source path '" + Value + "'. Ignored.");
        return;
    }

    for (const auto& ExistingSource : Request.Sources)
    {
        if (IsParentDirectory(ExistingSource, Value))
        {
            AddInfo("Line " + std::to_string(LineNumber) + ": Skipping source '" + Value + "' because parent directory '" + ExistingSource + "' is already added.");
            return;
        }
        if (IsParentDirectory(Value, ExistingSource)) //Skip because possibility of duplicate files and double reads
        {
            AddInfo("Line " + std::to_string(LineNumber) + ": Skipping parent directory '" + Value + "' because '" + ExistingSource + "' is already added.");
            return;
        }
    }
    Request.Sources.push_back(Value);
}

void ConfigParser::AddDestination(const std::string& Value, int LineNumber)
{
    if (!IsAbsolutePath(Value))
    {
        AddError("Line " + std::to_string(LineNumber) + ": Destination path is not absolute.");
        return;
    }
    std::error_code ec;
    FS::path DestPath(Value);
    if (!FS::exists(DestPath, ec))
    {
        AddError("Line " + std::to_string(LineNumber) + ": Destination path does not exist.");
        return;
    }
    if (!FS::is_directory(DestPath, ec))
    {
        AddError("Line " + std::to_string(LineNumber) + ": Destination path is not a directory.");
        return;
    }
    if (std::find(Request.Destinations.begin(), Request.Destinations.end(), Value) != Request.Destinations.end())
    {
        AddInfo("Line " + std::to_string(LineNumber) + ": Duplicate destination path '" + Value + "'. Ignored.");
        return;
    }
    Request.Destinations.push_back(Value);
}

bool ConfigParser::Parse(const std::string& FilePath)
{
    if (!std::filesystem::exists(FilePath))
    {
        AddError("Config file does not exist: " + FilePath);
        return false;
    }

    std::ifstream File(FilePath);
    if (!File.is_open())
    {
        AddError("Failed to open config file: " + FilePath);
        return false;
    }

    auto IsSpace = [](char Ch) { return std::isspace(static_cast<unsigned char>(Ch)) != 0; };
    auto Trim = [&IsSpace](std::string& Text)
    {
        Text.erase(Text.begin(), std::find_if_not(Text.begin(), Text.end(), IsSpace));
        Text.erase(std::find_if_not(Text.rbegin(), Text.rend(), IsSpace).base(), Text.end());
    };

    std::string Line;
    int LineNumber = 0;

    while (std::getline(File, Line))
    {
        LineNumber++;
        Trim(Line);

        if (Line.empty() || Line[0] == '#')
        {
            continue;
        }

        size_t EqualPos = Line.find('=');
        if (EqualPos == std::string::npos)
        {
            AddError("Invalid format on line " + std::to_string(LineNumber) + ": No '=' found.");
            continue;
        }

        std::string Key = Line.substr(0, EqualPos);
        std::string Value = Line.substr(EqualPos + 1);
        Key.erase(std::remove_if(Key.begin(), Key.end(), IsSpace), Key.end());
        Trim(Value);

        unsigned long Number = 0;

        if (Key == "JobID")
        {
            bool Valid = !Value.empty() && std::all_of(Value.begin(), Value.end(), [](char Ch)
            {
                return std::isalnum(static_cast<unsigned char>(Ch)) || Ch == '_' || Ch == '-' || Ch == '.';
            });
            if (!Valid)
            {
                AddError("Line " + std::to_string(LineNumber) + ": JobID may only contain letters, digits, '_', '-' and '.'.");
                continue;
            }
            if (!Request.Id.empty())
            {
                AddInfo("Line " + std::to_string(LineNumber) + ": JobID given twice, using '" + Value + "'.");
            }
            Request.Id = Value;
        }

        else if (Key == "Source")
        {
            AddSource(Value, LineNumber);
        }

        else if (Key == "Destination")
        {
            AddDestination(Value, LineNumber);
        }

        else if (Key == "Exclude")
        {
            if (!IsAbsolutePath(Value))
            {
                AddError("Line " + std::to_string(LineNumber) + ": Exclude path is not absolute.");
                continue;
            }
            if (std::find(Request.Excludes.begin(), Request.Excludes.end(), Value) != Request.Excludes.end())
            {
                AddInfo("Line " + std::to_string(LineNumber) + ": Duplicate exclude path '" + Value + "'. Ignored.");
                continue;
            }
            Request.Excludes.push_back(Value);
        }

        else if (Key == "JobType")
        {
            auto Type = ToJobType(Value);
            if (!Type)
            {
                AddError("Line " + std::to_string(LineNumber) + ": Invalid JobType. Use 'Copy' or 'Verify'.");
                continue;
            }
            Request.Options.Type = *Type;
            AddInfo("JobType set to '" + Value + "'.");
        }

        else if (Key == "Checksum")
        {
            auto Algorithm = ToChecksumAlgorithm(Value);
            if (!Algorithm)
            {
                AddError("Line " + std::to_string(LineNumber) + ": Invalid Checksum. Use 'XXH64' or 'BLAKE3' or 'MD5'.");
                continue;
            }
            Request.Options.Algorithm = *Algorithm;
            AddInfo("Checksum set to '" + Value + "'.");
        }

        else if (Key == "SkipExisting")
        {
            auto Policy = ToSkipPolicy(Value);
            if (!Policy)
            {
                AddError("Line " + std::to_string(LineNumber) + ": Invalid SkipExisting. Use 'NO' or 'SIZE' or 'CHECKSUM'.");
                continue;
            }
            Request.Options.SkipExisting = *Policy;
            if (*Policy == SkipPolicy::SizeOnly)
            {
                AddInfo("IMPORTANT - ! Existing files of equal size are skipped WITHOUT checksum verification !");
            }
            else
            {
                AddInfo("SkipExisting set to '" + Value + "'.");
            }
        }

        else if (Key == "MaxConcurrency")
        {
            if (ParseNumber(Key, Value, LineNumber, 1, 256, Number))
            {
                ConfigGlobal::MaxConcurrency = static_cast<unsigned short int>(Number);
                Request.Options.MaxConcurrency = static_cast<unsigned int>(Number);
            }
        }

        else if (Key == "PerDestinationConcurrency")
        {
            if (ParseNumber(Key, Value, LineNumber, 1, 256, Number))
            {
                ConfigGlobal::PerDestinationConcurrency = static_cast<unsigned short int>(Number);
            }
        }

        else if (Key == "EjectOnComplete")
        {
            ParseYesNo(Value, LineNumber, Request.Options.EjectOnComplete);
        }

        else if (Key == "PostProcess")
        {
            ParseYesNo(Value, LineNumber, Request.Options.PostProcess);
        }

        else if (Key == "CreateSourceFolder")
        {
            ParseYesNo(Value, LineNumber, Request.Layout.CreateSourceFolder);
        }

        else if (Key == "DestinationTemplate")
        {
            if (IsAbsolutePath(Value) || Value.find("..") != std::string::npos)
            {
                AddError("Line " + std::to_string(LineNumber) + ": DestinationTemplate must be a relative path without '..'.");
                continue;
            }
            Request.Layout.Template = Value;
            AddInfo("DestinationTemplate set to '" + Value + "'.");
        }

        else if (Key == "ProjectName")
        {
            Request.Layout.ProjectName = Value;
        }

        else if (Key == "CameraID")
        {
            Request.Layout.CameraID = Value;
        }

        else if (Key == "CardNumber")
        {
            if (ParseNumber(Key, Value, LineNumber, 1, 999, Number))
            {
                Request.Layout.CardNumber = static_cast<unsigned int>(Number);
            }
        }

        else if (Key == "ChunkSizeMB")
        {
            if (ParseNumber(Key, Value, LineNumber, 1, 1024, Number))
            {
                ConfigGlobal::ChunkSizeBytes = static_cast<size_t>(Number) * 1024 * 1024;
            }
        }

        else if (Key == "MaxLogFiles")
        {
            if (ParseNumber(Key, Value, LineNumber, 1, 65535, Number))
            {
                ConfigGlobal::MaxLogFiles = static_cast<unsigned short int>(Number);
            }
        }

        else if (Key == "LedgerRetentionDays")
        {
            if (ParseNumber(Key, Value, LineNumber, 0, 3650, Number))
            {
                ConfigGlobal::LedgerRetentionDays = static_cast<unsigned short int>(Number);
            }
        }

        else if (Key == "EventQueueCapacity")
        {
            if (ParseNumber(Key, Value, LineNumber, 1, 1000000, Number))
            {
                ConfigGlobal::EventQueueCapacity = static_cast<size_t>(Number);
            }
        }

        else if (Key == "LedgerDir" || Key == "LogDir")
        {
            if (Value.empty())
            {
                AddError("Line " + std::to_string(LineNumber) + ": " + Key + " must not be empty.");
                continue;
            }
            (Key == "LedgerDir" ? ConfigGlobal::LedgerDir : ConfigGlobal::LogDir) = Value;
            AddInfo(Key + " set to '" + Value + "'.");
        }

        else if (Key == "PostProcessCommand")
        {
            ConfigGlobal::PostProcessCommand = Value;
            AddInfo("PostProcessCommand set to '" + Value + "'.");
        }

        else if (Key == "EjectCommand")
        {
            ConfigGlobal::EjectCommand = Value;
            AddInfo("EjectCommand set to '" + Value + "'.");
        }

        else
        {
            AddError("Line " + std::to_string(LineNumber) + ": Unknown key '" + Key + "'.");
            continue;
        }
    }

    ValidateRequest();
    return Errors.empty();  // Return false only if fatal errors present
}

void ConfigParser::ValidateRequest()
{
    if (Request.Sources.empty())
    {
        AddError("No source paths provided.");
    }

    if (Request.Destinations.empty())
    {
        AddError("No destination path provided.");
    }

    if (Request.Id.empty() && !Request.Sources.empty() && !Request.Destinations.empty())
    {
        Request.Id = DefaultJobId(Request.Sources, Request.Destinations);
        AddInfo("No JobID given, using '" + Request.Id + "'.");
    }

    for (const auto& Destination : Request.Destinations)
    {
        FS::path DestAbs = FS::path(Destination).lexically_normal();

        for (const auto& Source : Request.Sources)
        {
            FS::path SourceAbs = FS::path(Source).lexically_normal();

            if (SourceAbs == DestAbs)
            {
                AddError("Source path '" + Source + "' is the same as the destination path.");
            }
            else if (IsParentDirectory(SourceAbs.string(), DestAbs.string()))
            {
                AddError("Destination '" + DestAbs.string() + "' is inside source directory '" + SourceAbs.string() + "'. This is not allowed.");
            }
        }
    }

    if (Request.Options.Type == JobType::Verify && Request.Options.SkipExisting != SkipPolicy::Off)
    {
        AddInfo("SkipExisting has no effect on Verify jobs.");
    }
}
