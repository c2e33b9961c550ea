#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

using ContentHash = std::array<uint8_t, 32>;

// BLAKE3 over file contents, used to verify byte copies
class FileHasher
{
public:
    static std::optional<ContentHash> HashFile(const std::filesystem::path& FilePath);

    // True only when both files could be read and their digests match
    static bool SameContent(const std::filesystem::path& First, const std::filesystem::path& Second);

    static std::string ToHex(const ContentHash& Hash);
};
