#include "FileHasher.hpp"
#include "Logger.hpp"

#include <blake3.h>
#include <fstream>
#include <vector>

constexpr size_t HASH_BUFFER_SIZE = 64 * 1024;

std::optional<ContentHash> FileHasher::HashFile(const std::filesystem::path& FilePath)
{
    std::ifstream file(FilePath, std::ios::binary);
    if (!file)
    {
        Log.Error("[FileHasher] Failed to open file for hashing: " + FilePath.string());
        return std::nullopt;
    }

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);

    std::vector<char> buffer(HASH_BUFFER_SIZE);
    while (file)
    {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize readCount = file.gcount();
        if (readCount > 0)
        {
            blake3_hasher_update(&hasher, buffer.data(), static_cast<size_t>(readCount));
        }
    }
    if (file.bad())
    {
        Log.Error("[FileHasher] Read error while hashing: " + FilePath.string());
        return std::nullopt;
    }

    ContentHash outHash{};
    blake3_hasher_finalize(&hasher, outHash.data(), outHash.size());
    return outHash;
}

bool FileHasher::SameContent(const std::filesystem::path& First, const std::filesystem::path& Second)
{
    std::optional<ContentHash> FirstHash = HashFile(First);
    std::optional<ContentHash> SecondHash = HashFile(Second);
    if (!FirstHash || !SecondHash)
    {
        return false;
    }
    if (*FirstHash != *SecondHash)
    {
        Log.Warn("[FileHasher] Content mismatch: " + First.string() + " (" + ToHex(*FirstHash) + ") vs " + Second.string() + " (" + ToHex(*SecondHash) + ")");
        return false;
    }
    return true;
}

std::string FileHasher::ToHex(const ContentHash& Hash)
{
    static const char Digits[] = "0123456789abcdef";
    std::string Hex;
    Hex.reserve(Hash.size() * 2);
    for (uint8_t byte : Hash)
    {
        Hex += Digits[byte >> 4];
        Hex += Digits[byte & 0x0F];
    }
    return Hex;
}
