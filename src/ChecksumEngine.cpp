#include "ChecksumEngine.hpp"
#include "TransferIO.hpp"

#define XXH_STATIC_LINKING_ONLY
#include <xxhash.h>
#include <blake3.h>
#include <openssl/evp.h>

#include <algorithm>
#include <cstring>
#include <string>

namespace
{
    constexpr uint8_t STATE_VERSION = 2;

    // The raw state layout belongs to the library build that wrote it.
    std::string LibraryVersion(ChecksumAlgorithm Algorithm)
    {
        switch (Algorithm)
        {
        case ChecksumAlgorithm::XXH64:  return "xxhash-" + std::to_string(XXH_versionNumber());
        case ChecksumAlgorithm::BLAKE3: return std::string("blake3-") + blake3_version();
        default:                        return std::string();
        }
    }

    // State blob: [algorithm][version][library version length][library version][raw state bytes]
    template<typename T>
    std::vector<uint8_t> PackState(ChecksumAlgorithm Algorithm, const T& State)
    {
        const std::string Library = LibraryVersion(Algorithm);
        std::vector<uint8_t> Blob;
        Blob.reserve(3 + Library.size() + sizeof(T));
        Blob.push_back(static_cast<uint8_t>(Algorithm));
        Blob.push_back(STATE_VERSION);
        Blob.push_back(static_cast<uint8_t>(Library.size()));
        Blob.insert(Blob.end(), Library.begin(), Library.end());
        const uint8_t* Raw = reinterpret_cast<const uint8_t*>(&State);
        Blob.insert(Blob.end(), Raw, Raw + sizeof(T));
        return Blob;
    }

    template<typename T>
    bool UnpackState(ChecksumAlgorithm Algorithm, const std::vector<uint8_t>& Blob, T& State)
    {
        const std::string Library = LibraryVersion(Algorithm);
        const size_t Header = 3 + Library.size();
        if (Blob.size() != Header + sizeof(T) || Blob[0] != static_cast<uint8_t>(Algorithm) || Blob[1] != STATE_VERSION ||
            Blob[2] != Library.size() || !std::equal(Library.begin(), Library.end(), Blob.begin() + 3))
        {
            return false;
        }
        std::memcpy(&State, Blob.data() + Header, sizeof(T));
        return true;
    }

    class XXH64Hasher : public Hasher
    {
    public:
        XXH64Hasher()
        {
            XXH64_reset(&State, 0);
        }

        explicit XXH64Hasher(const XXH64_state_t& Saved) : State(Saved) {}

        ChecksumAlgorithm Algorithm() const override { return ChecksumAlgorithm::XXH64; }

        void Update(const uint8_t* Data, size_t Length) override
        {
            XXH64_update(&State, Data, Length);
        }

        std::string Finalize() override
        {
            XXH64_canonical_t Canonical;
            XXH64_canonicalFromHash(&Canonical, XXH64_digest(&State));
            return ChecksumEngine::ToHex(Canonical.digest, sizeof(Canonical.digest));
        }

        bool SupportsResume() const override { return true; }

        std::vector<uint8_t> PartialState() const override
        {
            return PackState(ChecksumAlgorithm::XXH64, State);
        }

    private:
        XXH64_state_t State;
    };

    class Blake3Hasher : public Hasher
    {
    public:
        Blake3Hasher()
        {
            blake3_hasher_init(&State);
        }

        explicit Blake3Hasher(const blake3_hasher& Saved) : State(Saved) {}

        ChecksumAlgorithm Algorithm() const override { return ChecksumAlgorithm::BLAKE3; }

        void Update(const uint8_t* Data, size_t Length) override
        {
            blake3_hasher_update(&State, Data, Length);
        }

        std::string Finalize() override
        {
            uint8_t Out[BLAKE3_OUT_LEN] = { 0 };
            blake3_hasher_finalize(&State, Out, sizeof(Out));
            return ChecksumEngine::ToHex(Out, sizeof(Out));
        }

        bool SupportsResume() const override { return true; }

        std::vector<uint8_t> PartialState() const override
        {
            return PackState(ChecksumAlgorithm::BLAKE3, State);
        }

    private:
        blake3_hasher State;
    };

    // EVP contexts are opaque, so MD5 copies re-hash the prefix on resume.
    class MD5Hasher : public Hasher
    {
    public:
        MD5Hasher() : Context(EVP_MD_CTX_new())
        {
            if (Context == nullptr || EVP_DigestInit_ex(Context, EVP_md5(), nullptr) != 1)
            {
                EVP_MD_CTX_free(Context);
                throw TransferError(TransferErrorKind::EngineFault, "OpenSSL MD5 initialisation failed");
            }
        }

        ~MD5Hasher() override
        {
            EVP_MD_CTX_free(Context);
        }

        MD5Hasher(const MD5Hasher&) = delete;
        MD5Hasher& operator=(const MD5Hasher&) = delete;

        ChecksumAlgorithm Algorithm() const override { return ChecksumAlgorithm::MD5; }

        void Update(const uint8_t* Data, size_t Length) override
        {
            if (EVP_DigestUpdate(Context, Data, Length) != 1)
            {
                throw TransferError(TransferErrorKind::EngineFault, "OpenSSL MD5 update failed");
            }
        }

        std::string Finalize() override
        {
            unsigned char Out[EVP_MAX_MD_SIZE];
            unsigned int OutLength = 0;
            if (EVP_DigestFinal_ex(Context, Out, &OutLength) != 1)
            {
                throw TransferError(TransferErrorKind::EngineFault, "OpenSSL MD5 finalise failed");
            }
            return ChecksumEngine::ToHex(Out, OutLength);
        }

        bool SupportsResume() const override { return false; }

        std::vector<uint8_t> PartialState() const override { return {}; }

    private:
        EVP_MD_CTX* Context;
    };
}

namespace ChecksumEngine
{
    std::unique_ptr<Hasher> Open(ChecksumAlgorithm Algorithm)
    {
        switch (Algorithm)
        {
        case ChecksumAlgorithm::XXH64:  return std::make_unique<XXH64Hasher>();
        case ChecksumAlgorithm::BLAKE3: return std::make_unique<Blake3Hasher>();
        case ChecksumAlgorithm::MD5:    return std::make_unique<MD5Hasher>();
        }
        throw TransferError(TransferErrorKind::EngineFault, "Unknown checksum algorithm");
    }

    std::unique_ptr<Hasher> Restore(ChecksumAlgorithm Algorithm, const std::vector<uint8_t>& State)
    {
        switch (Algorithm)
        {
        case ChecksumAlgorithm::XXH64:
        {
            XXH64_state_t Saved;
            if (!UnpackState(Algorithm, State, Saved))
            {
                return nullptr;
            }
            return std::make_unique<XXH64Hasher>(Saved);
        }
        case ChecksumAlgorithm::BLAKE3:
        {
            blake3_hasher Saved;
            if (!UnpackState(Algorithm, State, Saved))
            {
                return nullptr;
            }
            return std::make_unique<Blake3Hasher>(Saved);
        }
        default:
            return nullptr;
        }
    }

    void HashPrefix(FileReader& Reader, Hasher& Target, uint64_t Length, size_t ChunkSize, const std::atomic<bool>* Cancel)
    {
        std::vector<uint8_t> Buffer(ChunkSize);
        uint64_t Offset = 0;

        while (Offset < Length)
        {
            if (Cancel != nullptr && Cancel->load())
            {
                throw TransferError(TransferErrorKind::Cancelled, "Hashing cancelled");
            }

            size_t Wanted = static_cast<size_t>(std::min<uint64_t>(ChunkSize, Length - Offset));
            size_t Got = Reader.ReadAt(Offset, Buffer.data(), Wanted);
            if (Got == 0)
            {
                throw TransferError(TransferErrorKind::SourceUnavailable, "Unexpected end of file while hashing at offset " + std::to_string(Offset));
            }
            Target.Update(Buffer.data(), Got);
            Offset += Got;
        }
    }

    std::string HashFile(FileReader& Reader, ChecksumAlgorithm Algorithm, size_t ChunkSize, const std::atomic<bool>* Cancel)
    {
        auto H = Open(Algorithm);
        HashPrefix(Reader, *H, Reader.Size(), ChunkSize, Cancel);
        return H->Finalize();
    }

    std::string HashBytes(ChecksumAlgorithm Algorithm, const void* Data, size_t Length)
    {
        auto H = Open(Algorithm);
        H->Update(static_cast<const uint8_t*>(Data), Length);
        return H->Finalize();
    }

    std::string ToHex(const uint8_t* Data, size_t Length)
    {
        static const char Digits[] = "0123456789abcdef";
        std::string Out;
        Out.reserve(Length * 2);
        for (size_t i = 0; i < Length; ++i)
        {
            Out += Digits[Data[i] >> 4];
            Out += Digits[Data[i] & 0x0F];
        }
        return Out;
    }
}
