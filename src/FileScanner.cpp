#include <iostream>
#include <filesystem>
#include <stack>
#include <algorithm>
#include <cstdio>

#include "FileScanner.hpp"
#include "TimeUtils.hpp"
#include "Logger.hpp"

namespace FS = std::filesystem;

namespace
{
    void ReplaceAll(std::string& Text, const std::string& Token, const std::string& Value)
    {
        size_t Pos = 0;
        while ((Pos = Text.find(Token, Pos)) != std::string::npos)
        {
            Text.replace(Pos, Token.size(), Value);
            Pos += Value.size();
        }
    }
}

std::string ResolvePathTemplate(const std::string& Template, const DestinationLayout& Layout, const std::string& SourceName, std::time_t Now)
{
    char Card[16] = { 0 };
    std::snprintf(Card, sizeof(Card), "%03u", Layout.CardNumber);

    std::string Path = Template;
    ReplaceAll(Path, "{date_yyyy-mm-dd}", FormatLocalTime("%Y-%m-%d", Now));
    ReplaceAll(Path, "{date_yyyymmdd}", FormatLocalTime("%Y%m%d", Now));
    ReplaceAll(Path, "{date_yy-mm-dd}", FormatLocalTime("%y-%m-%d", Now));
    ReplaceAll(Path, "{project_name}", Layout.ProjectName);
    ReplaceAll(Path, "{camera_id}", Layout.CameraID);
    ReplaceAll(Path, "{card_num}", Card);
    ReplaceAll(Path, "{source_name}", SourceName);
    return Path;
}

const std::vector<FileDescriptor>& FileScanner::GetFiles() const
{
    return Files;
}

void FileScanner::Clear()
{
    Files.clear();
}

void FileScanner::SetExcludes(const std::vector<std::string>& ExcludePaths)
{
    Excludes = ExcludePaths;
}

void FileScanner::SetLayout(const DestinationLayout& NewLayout)
{
    Layout = NewLayout;
}

bool FileScanner::IsExcluded(const FS::path& Path) const
{
    std::error_code ec;
    const std::string Abs = FS::absolute(Path, ec).lexically_normal().string();
    for (const auto& Exclude : Excludes)
    {
        if (Abs == FS::path(Exclude).lexically_normal().string())
        {
            return true;
        }
    }
    return false;
}

FS::path FileScanner::LayoutPrefix(const FS::path& Root) const
{
    std::string SourceName = Root.filename().string();
    if (!Layout.Template.empty())
    {
        return FS::path(ResolvePathTemplate(Layout.Template, Layout, SourceName));
    }
    if (Layout.CreateSourceFolder)
    {
        return FS::path(SourceName);
    }
    return FS::path();
}

void FileScanner::AddFile(const FS::path& Root, const FS::path& File, const FS::path& RelativePath, uintmax_t Size, FS::file_time_type MTime)
{
    FileDescriptor Descriptor;
    Descriptor.SourcePath = File.string();
    Descriptor.RelativePath = RelativePath.generic_string();
    Descriptor.SourceRoot = Root.string();
    Descriptor.Size = Size;
    Descriptor.MTime = ToUnixSeconds(MTime);
    Files.push_back(std::move(Descriptor));
}

void FileScanner::Scan(const std::string& RootPath)
{
    FS::path Root = FS::path(RootPath).lexically_normal();
    if (!Root.has_filename())
    {
        Root = Root.parent_path();
    }

    try
    {
        if (!FS::exists(Root))
        {
            std::cerr << "Scan Error: Path does not exist: " << Root.string() << "\n";
            Log.Error("[FileScanner] Path does not exist: " + Root.string());
            return;
        }
        if (IsExcluded(Root))
        {
            Log.Warn("[FileScanner] Skipping excluded root path: " + Root.string());
            return;
        }
        if (FS::is_regular_file(Root)) // Single file case
        {
            FS::path Prefix = Layout.Template.empty() ? FS::path() : LayoutPrefix(Root.parent_path());
            AddFile(Root, Root, Prefix / Root.filename(), FS::file_size(Root), FS::last_write_time(Root));
            return;
        }
        if (!FS::is_directory(Root))
        {
            std::cerr << "Scan Error: Path is neither a directory nor a file: " << Root.string() << "\n";
            Log.Error("[FileScanner] Path is neither a directory nor a file: " + Root.string());
            return;
        }

        size_t FirstNew = Files.size();
        ScanDirectoryIterative(Root, LayoutPrefix(Root));
        std::sort(Files.begin() + static_cast<std::ptrdiff_t>(FirstNew), Files.end(), [](const FileDescriptor& A, const FileDescriptor& B)
        {
            return A.RelativePath < B.RelativePath;
        });
        Log.Info("[FileScanner] " + Root.string() + ": " + std::to_string(Files.size() - FirstNew) + " file(s)");
    }
    catch (const FS::filesystem_error& e)
    {
        std::cerr << "Filesystem error during scan: " << e.what() << "\n";
        Log.Error(std::string("[FileScanner] Filesystem error during scan: ") + e.what() + " Path: " + e.path1().string());
    }
}

void FileScanner::ScanDirectoryIterative(const FS::path& Root, const FS::path& Prefix)
{
    std::stack<FS::path> DirStack;
    DirStack.push(Root);
    while (!DirStack.empty())
    {
        FS::path Current = DirStack.top();
        DirStack.pop();

        if (IsExcluded(Current))
        {
            Log.Info(std::string("[FileScanner] Skipping Excluded Directory: ") + Current.string());
            continue;
        }
        try
        {
            for (const auto& Entry : FS::directory_iterator(Current))
            {
                try
                {
                    const FS::path& AbsPath = Entry.path();
                    // Skip symbolic links to avoid loops or unsupported files.
                    if (FS::is_symlink(Entry.symlink_status()))
                    {
                        Log.Info(std::string("[FileScanner] Skipping SymLink: ") + AbsPath.string());
                        continue;
                    }
                    if (IsExcluded(AbsPath))
                    {
                        Log.Info(std::string("[FileScanner] Skipping Excluded Path: ") + AbsPath.string());
                        continue;
                    }
                    if (Entry.is_directory())
                    {
                        DirStack.push(AbsPath);
                    }
                    else if (Entry.is_regular_file())
                    {
                        AddFile(Root, AbsPath, Prefix / AbsPath.lexically_relative(Root), Entry.file_size(), Entry.last_write_time());
                    }
                }
                catch (const FS::filesystem_error& e)
                {
                    Log.Error(std::string("[FileScanner] Filesystem error accessing entry: ") + e.what() + std::string(" Path: ") + Entry.path().string());
                }
            }
        }
        catch (const FS::filesystem_error& e)
        {
            Log.Error(std::string("[FileScanner] Filesystem error iterating directory: ") + e.what() + std::string(" Path: ") + Current.string());
        }
    }
}
