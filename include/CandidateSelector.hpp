#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

struct CandidateFile
{
    std::filesystem::path Path;
    uint64_t Size = 0;
};

// Picks the main media file of a finished payload
class CandidateSelector
{
public:
    CandidateSelector() = default;

    static bool IsMediaFile(const std::filesystem::path& Path);

    // Media files under Root (or Root itself), in lexicographic path order
    std::vector<CandidateFile> Scan(const std::filesystem::path& Root) const;

    // Largest candidate, first in scan order on ties. Throws ImportError
    // NotFound when Root is missing, NoMediaFound when nothing qualifies.
    CandidateFile Select(const std::filesystem::path& Root) const;

private:
    void ScanDirectoryIterative(const std::filesystem::path& Root, std::vector<CandidateFile>& Files) const;
};
