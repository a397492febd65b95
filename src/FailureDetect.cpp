#include "FailureDetect.hpp"
#include "ConfigGlobal.hpp"
#include "Logger.hpp"

#include <filesystem>
#include <fstream>

namespace FailureDetect
{
    void Initialize(const std::string& MarkerDir)
    {
        ConfigGlobal::FailureFile = std::filesystem::path(MarkerDir) / ".Failure";
        ConfigGlobal::SuccessFile = std::filesystem::path(MarkerDir) / ".Success";

        std::error_code ec;
        std::filesystem::create_directories(MarkerDir, ec);
        if (ec)
        {
            Log.Error("[FailureDetect] Failed to create marker directory " + MarkerDir + ": " + ec.message());
        }
    }

    bool MarkFailure()
    {
        std::error_code ec;
        std::filesystem::remove(ConfigGlobal::SuccessFile, ec);
        if (ec)
        {
            Log.Warn("[FailureDetect] Could not remove " + ConfigGlobal::SuccessFile.string() + ": " + ec.message());
        }

        std::ofstream ofs(ConfigGlobal::FailureFile, std::ios::trunc);
        return ofs.good();
    }

    bool MarkSuccess()
    {
        std::error_code ec;
        std::filesystem::remove(ConfigGlobal::FailureFile, ec);
        if (ec)
        {
            Log.Warn("[FailureDetect] Could not remove " + ConfigGlobal::FailureFile.string() + ": " + ec.message());
        }

        std::ofstream ofs(ConfigGlobal::SuccessFile, std::ios::trunc);
        return ofs.good();
    }

    bool WasLastSuccess()
    {
        std::error_code ec;
        return std::filesystem::exists(ConfigGlobal::SuccessFile, ec);
    }

    bool WasLastFailure()
    {
        std::error_code ec;
        return std::filesystem::exists(ConfigGlobal::FailureFile, ec);
    }
}
