#include "RootSelector.hpp"
#include "ImportError.hpp"
#include "Logger.hpp"
#include "TimeUtils.hpp"

#include <algorithm>
#include <filesystem>

namespace FS = std::filesystem;

void RootSelector::Refresh(std::vector<RootLocation>& Roots)
{
    for (RootLocation& Root : Roots)
    {
        std::error_code ec;
        Root.LastChecked = NowUnix();

        if (!FS::is_directory(Root.Path, ec))
        {
            Root.Reachable = false;
            Root.FreeSpaceBytes = 0;
            Log.Warn("[RootSelector] Root folder unreachable: " + Root.Path);
            continue;
        }

        FS::space_info Space = FS::space(Root.Path, ec);
        if (ec)
        {
            Root.Reachable = false;
            Root.FreeSpaceBytes = 0;
            Log.Warn("[RootSelector] Could not query free space for " + Root.Path + ": " + ec.message());
            continue;
        }

        Root.Reachable = true;
        Root.FreeSpaceBytes = Space.available;
    }
}

RootLocation RootSelector::Select(const std::vector<RootLocation>& Roots, uint64_t PayloadBytes, uint64_t MinimumFreeBytes)
{
    std::vector<RootLocation> Reachable;
    for (const RootLocation& Root : Roots)
    {
        if (Root.Reachable)
        {
            Reachable.push_back(Root);
        }
    }

    if (Reachable.empty())
    {
        throw ImportError(ImportErrorCode::StorageUnavailable, "No reachable root folder configured");
    }

    std::stable_sort(Reachable.begin(), Reachable.end(), [](const RootLocation& A, const RootLocation& B)
    {
        return A.FreeSpaceBytes > B.FreeSpaceBytes;
    });

    for (const RootLocation& Root : Reachable)
    {
        if (HasRoomFor(Root.FreeSpaceBytes, PayloadBytes, MinimumFreeBytes))
        {
            Log.Info("[RootSelector] Selected root " + Root.Path + " (" + std::to_string(Root.FreeSpaceBytes) + " bytes free)");
            return Root;
        }
    }

    Log.Warn("[RootSelector] No root has room for " + std::to_string(PayloadBytes) + " bytes, falling back to " + Reachable.front().Path);
    return Reachable.front();
}
