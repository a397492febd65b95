#pragma once

#include "TransferTypes.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

class FileReader;

// Incremental digest over a byte stream. PartialState/Restore let a copy resume
// hashing at an offset without re-reading bytes already hashed.
class Hasher
{
public:
    virtual ~Hasher() = default;

    virtual ChecksumAlgorithm Algorithm() const = 0;
    virtual void Update(const uint8_t* Data, size_t Length) = 0;
    virtual std::string Finalize() = 0;

    virtual bool SupportsResume() const = 0;
    // Empty when the algorithm cannot export its state.
    virtual std::vector<uint8_t> PartialState() const = 0;
};

namespace ChecksumEngine
{
    std::unique_ptr<Hasher> Open(ChecksumAlgorithm Algorithm);

    // nullptr when the blob is empty, truncated or belongs to a different algorithm.
    std::unique_ptr<Hasher> Restore(ChecksumAlgorithm Algorithm, const std::vector<uint8_t>& State);

    // Hashes Reader from offset 0 to its size. Throws TransferError(Cancelled) when Cancel is raised.
    std::string HashFile(FileReader& Reader, ChecksumAlgorithm Algorithm, size_t ChunkSize, const std::atomic<bool>* Cancel = nullptr);

    // Feeds Reader's bytes [0, Length) into an existing hasher.
    void HashPrefix(FileReader& Reader, Hasher& Target, uint64_t Length, size_t ChunkSize, const std::atomic<bool>* Cancel = nullptr);

    std::string HashBytes(ChecksumAlgorithm Algorithm, const void* Data, size_t Length);

    std::string ToHex(const uint8_t* Data, size_t Length);
}
