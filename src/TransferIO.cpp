#include "TransferIO.hpp"
#include <filesystem>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

namespace FS = std::filesystem;

void ThrowIoError(const std::string& What, const std::string& Path, int ErrorNumber, IoSide Side)
{
    TransferErrorKind Kind = Side == IoSide::Source ? TransferErrorKind::SourceUnavailable : TransferErrorKind::DestinationUnavailable;
    throw TransferError(Kind, What + " " + Path + ": " + std::strerror(ErrorNumber), ErrorNumber);
}

namespace
{
    class PosixFile
    {
    public:
        PosixFile(int Descriptor, std::string FilePath, IoSide FileSide)
            : Fd(Descriptor), Path(std::move(FilePath)), Side(FileSide)
        {
        }

        ~PosixFile()
        {
            if (Fd >= 0)
            {
                close(Fd);
            }
        }

        PosixFile(const PosixFile&) = delete;
        PosixFile& operator=(const PosixFile&) = delete;

        uint64_t Size()
        {
            struct stat StatBuf;
            if (fstat(Fd, &StatBuf) != 0)
            {
                ThrowIoError("Failed to stat", Path, errno, Side);
            }
            return static_cast<uint64_t>(StatBuf.st_size);
        }

        int Fd;
        std::string Path;
        IoSide Side;
    };

    class PosixReader : public FileReader
    {
    public:
        PosixReader(int Fd, const std::string& Path, IoSide Side) : File(Fd, Path, Side) {}

        uint64_t Size() override
        {
            return File.Size();
        }

        size_t ReadAt(uint64_t Offset, uint8_t* Buffer, size_t Length) override
        {
            size_t Total = 0;
            while (Total < Length)
            {
                ssize_t Got = pread(File.Fd, Buffer + Total, Length - Total, static_cast<off_t>(Offset + Total));
                if (Got < 0)
                {
                    if (errno == EINTR)
                    {
                        continue;
                    }
                    ThrowIoError("Failed to read", File.Path, errno, File.Side);
                }
                if (Got == 0)
                {
                    break;
                }
                Total += static_cast<size_t>(Got);
            }
            return Total;
        }

    private:
        PosixFile File;
    };

    class PosixWriter : public FileWriter
    {
    public:
        PosixWriter(int Fd, const std::string& Path) : File(Fd, Path, IoSide::Destination) {}

        uint64_t Size() override
        {
            return File.Size();
        }

        void WriteAt(uint64_t Offset, const uint8_t* Buffer, size_t Length) override
        {
            size_t Total = 0;
            while (Total < Length)
            {
                ssize_t Put = pwrite(File.Fd, Buffer + Total, Length - Total, static_cast<off_t>(Offset + Total));
                if (Put < 0)
                {
                    if (errno == EINTR)
                    {
                        continue;
                    }
                    ThrowIoError("Failed to write", File.Path, errno, IoSide::Destination);
                }
                Total += static_cast<size_t>(Put);
            }
        }

        void Truncate(uint64_t Length) override
        {
            if (ftruncate(File.Fd, static_cast<off_t>(Length)) != 0)
            {
                ThrowIoError("Failed to truncate", File.Path, errno, IoSide::Destination);
            }
        }

        void Sync() override
        {
            if (fdatasync(File.Fd) != 0)
            {
                ThrowIoError("Failed to sync", File.Path, errno, IoSide::Destination);
            }
        }

    private:
        PosixFile File;
    };
}

std::unique_ptr<FileReader> PosixTransferIO::OpenRead(const std::string& Path, IoSide Side)
{
    int Fd = open(Path.c_str(), O_RDONLY | O_CLOEXEC);
    if (Fd < 0)
    {
        ThrowIoError("Failed to open", Path, errno, Side);
    }
    return std::make_unique<PosixReader>(Fd, Path, Side);
}

std::unique_ptr<FileWriter> PosixTransferIO::OpenWrite(const std::string& Path)
{
    FS::path Parent = FS::path(Path).parent_path();
    if (!Parent.empty())
    {
        std::error_code ec;
        FS::create_directories(Parent, ec);
        if (ec)
        {
            throw TransferError(TransferErrorKind::DestinationUnavailable, "Failed to create directory " + Parent.string() + ": " + ec.message(), ec.value());
        }
    }

    int Fd = open(Path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (Fd < 0)
    {
        ThrowIoError("Failed to open", Path, errno, IoSide::Destination);
    }
    return std::make_unique<PosixWriter>(Fd, Path);
}

std::optional<uint64_t> PosixTransferIO::FileSize(const std::string& Path)
{
    struct stat StatBuf;
    if (stat(Path.c_str(), &StatBuf) != 0 || !S_ISREG(StatBuf.st_mode))
    {
        return std::nullopt;
    }
    return static_cast<uint64_t>(StatBuf.st_size);
}

bool PosixTransferIO::SetModificationTime(const std::string& Path, int64_t MTime)
{
    struct timespec Times[2];
    Times[0].tv_sec = 0;
    Times[0].tv_nsec = UTIME_OMIT;
    Times[1].tv_sec = static_cast<time_t>(MTime);
    Times[1].tv_nsec = 0;
    return utimensat(AT_FDCWD, Path.c_str(), Times, 0) == 0;
}
