#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <stack>
#include <string>

#include "CandidateSelector.hpp"
#include "ImportError.hpp"
#include "Logger.hpp"

namespace FS = std::filesystem;

namespace
{
    const std::array<const char*, 9> MediaExtensions = { ".mkv", ".mp4", ".avi", ".mov", ".wmv", ".flv", ".webm", ".m4v", ".ts" };
}

bool CandidateSelector::IsMediaFile(const FS::path& Path)
{
    std::string Extension = Path.extension().string();
    std::transform(Extension.begin(), Extension.end(), Extension.begin(), [](unsigned char Ch) { return static_cast<char>(std::tolower(Ch)); });
    return std::find(MediaExtensions.begin(), MediaExtensions.end(), Extension) != MediaExtensions.end();
}

std::vector<CandidateFile> CandidateSelector::Scan(const FS::path& Root) const
{
    std::vector<CandidateFile> Files;
    std::error_code ec;

    if (FS::is_regular_file(Root, ec))
    {
        if (IsMediaFile(Root))
        {
            uintmax_t Size = FS::file_size(Root, ec);
            if (ec)
            {
                Log.Error("[CandidateSelector] Cannot read size of " + Root.string() + ": " + ec.message());
                return Files;
            }
            Files.push_back({ Root, static_cast<uint64_t>(Size) });
        }
        return Files;
    }
    if (FS::is_directory(Root, ec))
    {
        ScanDirectoryIterative(Root, Files);
    }
    return Files;
}

void CandidateSelector::ScanDirectoryIterative(const FS::path& Root, std::vector<CandidateFile>& Files) const
{
    std::stack<FS::path> DirStack;
    DirStack.push(Root);
    while (!DirStack.empty())
    {
        FS::path Current = DirStack.top();
        DirStack.pop();

        std::vector<FS::directory_entry> Entries;
        try
        {
            for (const auto& Entry : FS::directory_iterator(Current))
            {
                Entries.push_back(Entry);
            }
        }
        catch (const FS::filesystem_error& e)
        {
            Log.Error(std::string("[CandidateSelector] Filesystem error iterating directory: ") + e.what() + " Path: " + Current.string());
            continue;
        }

        std::sort(Entries.begin(), Entries.end(), [](const FS::directory_entry& A, const FS::directory_entry& B)
        {
            return A.path() < B.path();
        });

        std::vector<FS::path> SubDirs;
        for (const auto& Entry : Entries)
        {
            try
            {
                // Symlinks could loop or point outside the payload
                if (FS::is_symlink(Entry.symlink_status()))
                {
                    Log.Info("[CandidateSelector] Skipping SymLink: " + Entry.path().string());
                    continue;
                }
                if (Entry.is_directory())
                {
                    SubDirs.push_back(Entry.path());
                }
                else if (Entry.is_regular_file() && IsMediaFile(Entry.path()))
                {
                    Files.push_back({ Entry.path(), static_cast<uint64_t>(Entry.file_size()) });
                }
            }
            catch (const FS::filesystem_error& e)
            {
                Log.Error(std::string("[CandidateSelector] Filesystem error accessing entry: ") + e.what() + " Path: " + Entry.path().string());
            }
        }

        // Reverse push keeps the depth-first walk in lexicographic order
        for (auto it = SubDirs.rbegin(); it != SubDirs.rend(); ++it)
        {
            DirStack.push(*it);
        }
    }
}

CandidateFile CandidateSelector::Select(const FS::path& Root) const
{
    std::error_code ec;
    if (Root.empty() || !FS::exists(Root, ec))
    {
        throw ImportError(ImportErrorCode::NotFound, "Download path not found: " + Root.string());
    }

    std::vector<CandidateFile> Candidates = Scan(Root);
    if (Candidates.empty())
    {
        throw ImportError(ImportErrorCode::NoMediaFound, "No media files found in: " + Root.string());
    }

    const CandidateFile* Best = &Candidates.front();
    for (const auto& Candidate : Candidates)
    {
        if (Candidate.Size > Best->Size)
        {
            Best = &Candidate;
        }
    }

    Log.Info("[CandidateSelector] Selected " + Best->Path.string() + " (" + std::to_string(Best->Size) + " bytes) out of " +
             std::to_string(Candidates.size()) + " candidate(s)");
    return *Best;
}
