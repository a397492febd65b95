#pragma once

#include "TransferTypes.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

enum class IoSide
{
    Source,
    Destination
};

class FileReader
{
public:
    virtual ~FileReader() = default;

    virtual uint64_t Size() = 0;
    // Returns the bytes read; 0 only at end of file.
    virtual size_t ReadAt(uint64_t Offset, uint8_t* Buffer, size_t Length) = 0;
};

class FileWriter
{
public:
    virtual ~FileWriter() = default;

    virtual uint64_t Size() = 0;
    virtual void WriteAt(uint64_t Offset, const uint8_t* Buffer, size_t Length) = 0;
    virtual void Truncate(uint64_t Length) = 0;
    // Durable once this returns.
    virtual void Sync() = 0;
};

// Every file operation the engine performs goes through here so tests can inject faults.
// Failures throw TransferError with the kind matching the side of the transfer.
class TransferIO
{
public:
    virtual ~TransferIO() = default;

    virtual std::unique_ptr<FileReader> OpenRead(const std::string& Path, IoSide Side) = 0;
    // Creates missing parent directories. Never truncates an existing file.
    virtual std::unique_ptr<FileWriter> OpenWrite(const std::string& Path) = 0;
    virtual std::optional<uint64_t> FileSize(const std::string& Path) = 0;
    virtual bool SetModificationTime(const std::string& Path, int64_t MTime) = 0;
};

class PosixTransferIO : public TransferIO
{
public:
    std::unique_ptr<FileReader> OpenRead(const std::string& Path, IoSide Side) override;
    std::unique_ptr<FileWriter> OpenWrite(const std::string& Path) override;
    std::optional<uint64_t> FileSize(const std::string& Path) override;
    bool SetModificationTime(const std::string& Path, int64_t MTime) override;
};

// Source-side failures are SourceUnavailable, everything on the write side DestinationUnavailable.
[[noreturn]] void ThrowIoError(const std::string& What, const std::string& Path, int ErrorNumber, IoSide Side);
