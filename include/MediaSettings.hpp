#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

enum class TransferMode
{
    Move,
    Copy,
    Hardlink
};

inline std::optional<TransferMode> ToTransferMode(const std::string& ModeStr)
{
    static const std::unordered_map<std::string, TransferMode> ModeMap = {
        { "Move",     TransferMode::Move },
        { "Copy",     TransferMode::Copy },
        { "Hardlink", TransferMode::Hardlink }
    };

    auto it = ModeMap.find(ModeStr);
    if (it == ModeMap.end())
    {
        return std::nullopt;
    }
    return it->second;
}

inline std::string TransferModeName(TransferMode Mode)
{
    switch (Mode)
    {
    case TransferMode::Move:     return "Move";
    case TransferMode::Copy:     return "Copy";
    case TransferMode::Hardlink: return "Hardlink";
    }
    return "Move";
}

struct PermissionPolicy
{
    bool Enabled = false;
    std::string FileMode = "644"; // octal, chmod style
    std::string OwnerUser;
    std::string OwnerGroup;
};

struct RootLocation
{
    std::string Path;
    bool Reachable = false;
    uint64_t FreeSpaceBytes = 0;
    int64_t LastChecked = 0;
};

struct MediaManagementSettings
{
    std::vector<RootLocation> RootFolders;
    std::string FolderFormat = "{Item Title}";
    std::string FileFormat = "{Item Title} - {Air Date} - {Quality Full}";
    TransferMode Mode = TransferMode::Move;
    PermissionPolicy Permissions;
    uint64_t MinimumFreeSpaceBytes = 100ULL * 1024 * 1024;
    bool SkipFreeSpaceCheck = false;
    bool RemoveCompletedDownloads = true;
    bool RenameFiles = true;
    bool CreateItemFolder = true;
    bool VerifyTransfers = false;
};

enum class AgentKind
{
    QBittorrent,
    Transmission,
    Sabnzbd
};

inline std::optional<AgentKind> ToAgentKind(const std::string& KindStr)
{
    static const std::unordered_map<std::string, AgentKind> KindMap = {
        { "qBittorrent",  AgentKind::QBittorrent },
        { "Transmission", AgentKind::Transmission },
        { "SABnzbd",      AgentKind::Sabnzbd }
    };

    auto it = KindMap.find(KindStr);
    if (it == KindMap.end())
    {
        return std::nullopt;
    }
    return it->second;
}

struct FetchAgentConfig
{
    std::string Name;
    AgentKind Kind = AgentKind::QBittorrent;
    std::string Host = "localhost";
    unsigned short int Port = 8080;
    bool UseSsl = false;
    std::string Username;
    std::string Password; // for SABnzbd this is the API key
    std::string Category = "importflow";
    std::string UrlBase;
    long TimeoutSeconds = 30;

    std::string BaseUrl() const
    {
        std::string Url = (UseSsl ? "https://" : "http://") + Host + ":" + std::to_string(Port);
        if (!UrlBase.empty())
        {
            if (UrlBase.front() != '/')
            {
                Url += '/';
            }
            Url += UrlBase;
            if (Url.back() == '/')
            {
                Url.pop_back();
            }
        }
        return Url;
    }
};
