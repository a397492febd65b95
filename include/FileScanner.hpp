#pragma once

#include "TransferTypes.hpp"
#include <string>
#include <vector>
#include <filesystem>
#include <ctime>

// Folder created under every destination root for a source.
// A non-empty Template wins over CreateSourceFolder.
struct DestinationLayout
{
    bool CreateSourceFolder = true;
    std::string Template;
    std::string ProjectName = "Project";
    std::string CameraID = "CAM";
    unsigned int CardNumber = 1;
};

// Tokens: {date_yyyy-mm-dd} {date_yyyymmdd} {date_yy-mm-dd} {project_name} {camera_id} {card_num} {source_name}
std::string ResolvePathTemplate(const std::string& Template, const DestinationLayout& Layout, const std::string& SourceName, std::time_t Now = std::time(nullptr));

class FileScanner
{
public:
    FileScanner() = default;

    void Clear();

    void Scan(const std::string& RootPath);
    void SetExcludes(const std::vector<std::string>& ExcludePaths);
    void SetLayout(const DestinationLayout& NewLayout);

    // Sorted by relative path within each scanned root.
    const std::vector<FileDescriptor>& GetFiles() const;

private:
    std::vector<FileDescriptor> Files;
    std::vector<std::string> Excludes;
    DestinationLayout Layout;

    void ScanDirectoryIterative(const std::filesystem::path& Root, const std::filesystem::path& Prefix);
    void AddFile(const std::filesystem::path& Root, const std::filesystem::path& File, const std::filesystem::path& RelativePath, uintmax_t Size, std::filesystem::file_time_type MTime);
    std::filesystem::path LayoutPrefix(const std::filesystem::path& Root) const;

    bool IsExcluded(const std::filesystem::path& Path) const;
};
