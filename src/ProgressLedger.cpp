#include "ProgressLedger.hpp"
#include "ChecksumEngine.hpp"
#include "Logger.hpp"
#include <xxhash.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

namespace FS = std::filesystem;

namespace
{
    constexpr uint32_t LEDGER_MAGIC = 0x474C464F; // "OFLG"
    constexpr uint16_t LEDGER_VERSION = 1;
    constexpr uint32_t MAX_ID_LENGTH = 4096;
    constexpr uint32_t MAX_STATE_LENGTH = 1 << 20;
    const char* LEDGER_EXTENSION = ".ledger";
    const char* TEMP_EXTENSION = ".tmp";

    template<typename T>
    void AppendBinary(std::vector<uint8_t>& Buffer, const T& Value)
    {
        const uint8_t* Raw = reinterpret_cast<const uint8_t*>(&Value);
        Buffer.insert(Buffer.end(), Raw, Raw + sizeof(T));
    }

    template<typename T>
    bool ReadBinary(const std::vector<uint8_t>& Buffer, size_t& Position, T& Value)
    {
        if (Position + sizeof(T) > Buffer.size())
        {
            return false;
        }
        std::memcpy(&Value, Buffer.data() + Position, sizeof(T));
        Position += sizeof(T);
        return true;
    }

    [[noreturn]] void Fail(const std::string& What, const std::string& Path, int ErrorNumber)
    {
        std::string Message = "[ProgressLedger] " + What + " " + Path + ": " + std::strerror(ErrorNumber);
        Log.Error(Message);
        throw TransferError(TransferErrorKind::EngineFault, Message, ErrorNumber);
    }

    int64_t NowSeconds()
    {
        return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    }
}

ProgressLedger::ProgressLedger(const std::string& Directory) : LedgerDirectory(Directory)
{
    std::error_code ec;
    FS::create_directories(LedgerDirectory, ec);
    if (ec)
    {
        Fail("Failed to create ledger directory", LedgerDirectory, ec.value());
    }
}

std::string ProgressLedger::EntryPath(const TaskId& Id) const
{
    XXH64_canonical_t Canonical;
    XXH64_canonicalFromHash(&Canonical, XXH64(Id.data(), Id.size(), 0));
    std::string Name = ChecksumEngine::ToHex(Canonical.digest, sizeof(Canonical.digest)) + LEDGER_EXTENSION;
    return (FS::path(LedgerDirectory) / Name).string();
}

void ProgressLedger::Record(const TaskId& Id, ChecksumAlgorithm Algorithm, uint64_t Offset, const std::vector<uint8_t>& HasherState)
{
    std::vector<uint8_t> Buffer;
    AppendBinary(Buffer, LEDGER_MAGIC);
    AppendBinary(Buffer, LEDGER_VERSION);
    AppendBinary(Buffer, static_cast<uint8_t>(Algorithm));
    AppendBinary(Buffer, static_cast<uint32_t>(Id.size()));
    Buffer.insert(Buffer.end(), Id.begin(), Id.end());
    AppendBinary(Buffer, Offset);
    AppendBinary(Buffer, NowSeconds());
    AppendBinary(Buffer, static_cast<uint32_t>(HasherState.size()));
    Buffer.insert(Buffer.end(), HasherState.begin(), HasherState.end());
    AppendBinary(Buffer, static_cast<uint64_t>(XXH64(Buffer.data(), Buffer.size(), 0)));

    std::string FinalPath = EntryPath(Id);
    std::string TempPath = FinalPath + TEMP_EXTENSION;

    int Fd = open(TempPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (Fd < 0)
    {
        Fail("Failed to open", TempPath, errno);
    }

    size_t Written = 0;
    while (Written < Buffer.size())
    {
        ssize_t Put = write(Fd, Buffer.data() + Written, Buffer.size() - Written);
        if (Put < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            int Error = errno;
            close(Fd);
            unlink(TempPath.c_str());
            Fail("Failed to write", TempPath, Error);
        }
        Written += static_cast<size_t>(Put);
    }

    if (fsync(Fd) != 0)
    {
        int Error = errno;
        close(Fd);
        unlink(TempPath.c_str());
        Fail("Failed to sync", TempPath, Error);
    }
    close(Fd);

    if (rename(TempPath.c_str(), FinalPath.c_str()) != 0)
    {
        int Error = errno;
        unlink(TempPath.c_str());
        Fail("Failed to commit", FinalPath, Error);
    }

    SyncDirectory();
}

void ProgressLedger::SyncDirectory() const
{
    int DirFd = open(LedgerDirectory.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (DirFd < 0)
    {
        Fail("Failed to open ledger directory", LedgerDirectory, errno);
    }
    if (fsync(DirFd) != 0)
    {
        int Error = errno;
        close(DirFd);
        Fail("Failed to sync ledger directory", LedgerDirectory, Error);
    }
    close(DirFd);
}

std::optional<LedgerEntry> ProgressLedger::LoadFile(const std::string& Path) const
{
    std::ifstream File(Path, std::ios::binary);
    if (!File)
    {
        return std::nullopt;
    }
    std::vector<uint8_t> Buffer((std::istreambuf_iterator<char>(File)), std::istreambuf_iterator<char>());

    if (Buffer.size() < sizeof(uint64_t))
    {
        return std::nullopt;
    }

    size_t BodyLength = Buffer.size() - sizeof(uint64_t);
    uint64_t StoredHash = 0;
    std::memcpy(&StoredHash, Buffer.data() + BodyLength, sizeof(StoredHash));
    if (StoredHash != XXH64(Buffer.data(), BodyLength, 0))
    {
        return std::nullopt;
    }
    Buffer.resize(BodyLength);

    size_t Position = 0;
    uint32_t Magic = 0;
    uint16_t Version = 0;
    uint8_t Algorithm = 0;
    uint32_t IdLength = 0;

    if (!ReadBinary(Buffer, Position, Magic) || Magic != LEDGER_MAGIC) return std::nullopt;
    if (!ReadBinary(Buffer, Position, Version) || Version != LEDGER_VERSION) return std::nullopt;
    if (!ReadBinary(Buffer, Position, Algorithm)) return std::nullopt;
    if (!ReadBinary(Buffer, Position, IdLength) || IdLength == 0 || IdLength > MAX_ID_LENGTH) return std::nullopt;
    if (Position + IdLength > Buffer.size()) return std::nullopt;

    LedgerEntry Entry;
    Entry.Algorithm = static_cast<ChecksumAlgorithm>(Algorithm);
    Entry.Id.assign(reinterpret_cast<const char*>(Buffer.data() + Position), IdLength);
    Position += IdLength;

    uint32_t StateLength = 0;
    if (!ReadBinary(Buffer, Position, Entry.Offset)) return std::nullopt;
    if (!ReadBinary(Buffer, Position, Entry.UpdatedAt)) return std::nullopt;
    if (!ReadBinary(Buffer, Position, StateLength) || StateLength > MAX_STATE_LENGTH) return std::nullopt;
    if (Position + StateLength != Buffer.size()) return std::nullopt;

    Entry.HasherState.assign(Buffer.begin() + static_cast<std::ptrdiff_t>(Position), Buffer.end());
    return Entry;
}

std::optional<LedgerEntry> ProgressLedger::Read(const TaskId& Id)
{
    std::string Path = EntryPath(Id);
    std::error_code ec;
    if (!FS::exists(Path, ec))
    {
        return std::nullopt;
    }

    auto Entry = LoadFile(Path);
    if (!Entry || Entry->Id != Id)
    {
        Log.Warn("[ProgressLedger] Ignoring unreadable ledger record for task " + Id);
        return std::nullopt;
    }
    return Entry;
}

void ProgressLedger::Clear(const TaskId& Id)
{
    std::string Path = EntryPath(Id);
    if (unlink(Path.c_str()) != 0)
    {
        if (errno == ENOENT)
        {
            return;
        }
        Fail("Failed to remove", Path, errno);
    }
    SyncDirectory();
}

std::vector<LedgerEntry> ProgressLedger::List()
{
    std::vector<LedgerEntry> Entries;
    std::error_code ec;

    for (const auto& Item : FS::directory_iterator(LedgerDirectory, ec))
    {
        if (!Item.is_regular_file() || Item.path().extension() != LEDGER_EXTENSION)
        {
            continue;
        }
        if (auto Entry = LoadFile(Item.path().string()))
        {
            Entries.push_back(std::move(*Entry));
        }
    }
    if (ec)
    {
        Fail("Failed to list", LedgerDirectory, ec.value());
    }
    return Entries;
}

size_t ProgressLedger::Recover()
{
    std::vector<FS::path> Doomed;
    std::error_code ec;

    for (const auto& Item : FS::directory_iterator(LedgerDirectory, ec))
    {
        if (!Item.is_regular_file())
        {
            continue;
        }

        const FS::path& Path = Item.path();
        if (Path.extension() == TEMP_EXTENSION)
        {
            Log.Info("[ProgressLedger] Removing interrupted write " + Path.string());
            Doomed.push_back(Path);
        }
        else if (Path.extension() == LEDGER_EXTENSION && !LoadFile(Path.string()))
        {
            Log.Warn("[ProgressLedger] Discarding corrupt ledger record " + Path.string());
            Doomed.push_back(Path);
        }
    }
    if (ec)
    {
        Fail("Failed to scan", LedgerDirectory, ec.value());
    }

    size_t Removed = 0;
    for (const auto& Path : Doomed)
    {
        std::error_code RemoveError;
        if (FS::remove(Path, RemoveError))
        {
            ++Removed;
        }
        else if (RemoveError)
        {
            Log.Error("[ProgressLedger] Failed to remove " + Path.string() + ": " + RemoveError.message());
        }
    }

    Log.Info("[ProgressLedger] Recovery removed " + std::to_string(Removed) + " file(s), " + std::to_string(List().size()) + " resumable record(s) remain");
    return Removed;
}

size_t ProgressLedger::Prune(const std::set<TaskId>& Claimed, int64_t Cutoff)
{
    size_t Removed = 0;
    for (const auto& Entry : List())
    {
        if (Claimed.count(Entry.Id) != 0 || Entry.UpdatedAt >= Cutoff)
        {
            continue;
        }
        Log.Info("[ProgressLedger] Pruning unclaimed record for " + Entry.Id + " (offset " + std::to_string(Entry.Offset) + ")");
        Clear(Entry.Id);
        ++Removed;
    }
    return Removed;
}
