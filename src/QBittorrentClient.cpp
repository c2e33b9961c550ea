#include "QBittorrentClient.hpp"
#include "Logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <unordered_map>

using json = nlohmann::json;

QBittorrentClient::QBittorrentClient(FetchAgentConfig Config, std::shared_ptr<HttpTransport> Transport)
    : FetchAgentClient(std::move(Config), std::move(Transport))
{
}

CanonicalStatus QBittorrentClient::MapState(const std::string& VendorState)
{
    static const std::unordered_map<std::string, CanonicalStatus> StateMap = {
        { "downloading",        CanonicalStatus::Downloading },
        { "forceddl",           CanonicalStatus::Downloading },
        { "stalleddl",          CanonicalStatus::Downloading },
        { "uploading",          CanonicalStatus::Completed },
        { "stalledup",          CanonicalStatus::Completed },
        { "forcedup",           CanonicalStatus::Completed },
        { "queuedup",           CanonicalStatus::Completed },
        { "checkingup",         CanonicalStatus::Completed },
        { "pausedup",           CanonicalStatus::Completed },
        { "stoppedup",          CanonicalStatus::Completed },
        { "pauseddl",           CanonicalStatus::Paused },
        { "stoppeddl",          CanonicalStatus::Paused },
        { "queueddl",           CanonicalStatus::Queued },
        { "allocating",         CanonicalStatus::Queued },
        { "metadl",             CanonicalStatus::Queued },
        { "checkingdl",         CanonicalStatus::Queued },
        { "checkingresumedata", CanonicalStatus::Queued },
        { "error",              CanonicalStatus::Failed },
        { "missingfiles",       CanonicalStatus::Failed }
    };

    std::string Lower = VendorState;
    std::transform(Lower.begin(), Lower.end(), Lower.begin(), [](unsigned char Ch) { return static_cast<char>(std::tolower(Ch)); });

    auto it = StateMap.find(Lower);
    return (it != StateMap.end()) ? it->second : CanonicalStatus::Downloading; // unknown states are still in flight
}

std::optional<std::string> QBittorrentClient::HashFromMagnet(const std::string& SourceUri)
{
    const std::string Marker = "xt=urn:btih:";
    size_t Pos = SourceUri.find(Marker);
    if (!SourceUri.starts_with("magnet:") || Pos == std::string::npos)
    {
        return std::nullopt;
    }

    std::string Hash = SourceUri.substr(Pos + Marker.size());
    Hash = Hash.substr(0, Hash.find('&'));
    if (Hash.size() != 40 || !std::all_of(Hash.begin(), Hash.end(), [](unsigned char Ch) { return std::isxdigit(Ch); }))
    {
        return std::nullopt; // base32 hashes are resolved through the torrent list
    }
    std::transform(Hash.begin(), Hash.end(), Hash.begin(), [](unsigned char Ch) { return static_cast<char>(std::tolower(Ch)); });
    return Hash;
}

std::optional<std::string> QBittorrentClient::Login()
{
    HttpRequest Request = MakeRequest("POST", "/api/v2/auth/login");
    Request.Headers.emplace_back("Content-Type", "application/x-www-form-urlencoded");
    Request.Headers.emplace_back("Referer", AgentConfig.BaseUrl());
    Request.Body = FormEncode({ { "username", AgentConfig.Username.empty() ? "admin" : AgentConfig.Username },
                                { "password", AgentConfig.Password } });

    std::optional<HttpResponse> Response = SendUnauthenticated(Request);
    if (!Response)
    {
        return std::nullopt;
    }
    if (!Response->IsSuccess() || Response->Body.find("Fails") != std::string::npos)
    {
        Log.Warn(Tag() + " Login rejected (HTTP " + std::to_string(Response->Status) + "): " + Response->Body);
        return std::nullopt;
    }

    for (const auto& [Name, Value] : Response->Headers)
    {
        if (Name != "set-cookie")
        {
            continue;
        }
        size_t Start = Value.find("SID=");
        if (Start == std::string::npos)
        {
            continue;
        }
        size_t End = Value.find(';', Start);
        Log.Info(Tag() + " Login successful");
        return Value.substr(Start, End == std::string::npos ? std::string::npos : End - Start);
    }

    Log.Warn(Tag() + " Login response carried no SID cookie");
    return std::nullopt;
}

void QBittorrentClient::ApplySession(HttpRequest& Request, const std::string& Token) const
{
    Request.Headers.emplace_back("Cookie", Token);
    Request.Headers.emplace_back("Referer", AgentConfig.BaseUrl());
}

bool QBittorrentClient::IsAuthFailure(const HttpResponse& Response) const
{
    return Response.Status == 403;
}

bool QBittorrentClient::TestConnection()
{
    std::optional<HttpResponse> Response = SendAuthenticated(MakeRequest("GET", "/api/v2/app/version"));
    if (!Response || !Response->IsSuccess())
    {
        Log.Error(Tag() + " Connection test failed");
        return false;
    }
    Log.Info(Tag() + " Connected successfully. Version: " + Response->Body);
    return true;
}

std::optional<std::string> QBittorrentClient::Enqueue(const std::string& SourceUri, const std::string& Category)
{
    HttpRequest Request = MakeRequest("POST", "/api/v2/torrents/add");
    Request.Headers.emplace_back("Content-Type", "application/x-www-form-urlencoded");
    Request.Body = FormEncode({ { "urls", SourceUri }, { "category", Category }, { "paused", "false" } });

    std::optional<HttpResponse> Response = SendAuthenticated(Request);
    if (!Response)
    {
        return std::nullopt;
    }
    if (!Response->IsSuccess() || Response->Body.find("Fails") != std::string::npos)
    {
        Log.Error(Tag() + " Failed to add torrent (HTTP " + std::to_string(Response->Status) + "): " + Response->Body);
        return std::nullopt;
    }

    Log.Info(Tag() + " Torrent added: " + SourceUri);

    if (auto Hash = HashFromMagnet(SourceUri))
    {
        return Hash;
    }
    return NewestHashInCategory(Category);
}

std::optional<std::string> QBittorrentClient::NewestHashInCategory(const std::string& Category)
{
    std::optional<HttpResponse> Response = SendAuthenticated(
        MakeRequest("GET", "/api/v2/torrents/info?category=" + UrlEncode(Category) + "&sort=added_on&reverse=true&limit=1"));
    if (!Response || !Response->IsSuccess())
    {
        return std::nullopt;
    }

    json Torrents = json::parse(Response->Body, nullptr, false);
    if (Torrents.is_discarded() || !Torrents.is_array() || Torrents.empty())
    {
        Log.Warn(Tag() + " Added torrent not visible in category '" + Category + "' yet");
        return std::nullopt;
    }
    std::string Hash = Torrents.front().value("hash", std::string());
    if (Hash.empty())
    {
        return std::nullopt;
    }
    return Hash;
}

std::optional<AgentStatus> QBittorrentClient::Status(const std::string& Handle)
{
    std::optional<HttpResponse> Response = SendAuthenticated(MakeRequest("GET", "/api/v2/torrents/info?hashes=" + UrlEncode(Handle)));
    if (!Response)
    {
        return std::nullopt;
    }
    if (!Response->IsSuccess())
    {
        Log.Warn(Tag() + " Status query failed (HTTP " + std::to_string(Response->Status) + ")");
        return std::nullopt;
    }

    json Torrents = json::parse(Response->Body, nullptr, false);
    if (Torrents.is_discarded() || !Torrents.is_array())
    {
        Log.Warn(Tag() + " Malformed torrent list");
        return std::nullopt;
    }
    if (Torrents.empty())
    {
        Log.Warn(Tag() + " Torrent " + Handle + " not found");
        return std::nullopt;
    }

    const json& Torrent = Torrents.front();
    AgentStatus Result;
    Result.VendorState = Torrent.value("state", std::string());
    Result.Status = MapState(Result.VendorState);
    Result.Progress = Torrent.value("progress", 0.0) * 100.0;
    Result.SizeBytes = Torrent.value("size", static_cast<uint64_t>(0));

    Result.ContentPath = Torrent.value("content_path", std::string());
    if (Result.ContentPath.empty())
    {
        std::string SavePath = Torrent.value("save_path", std::string());
        std::string Name = Torrent.value("name", std::string());
        if (!SavePath.empty() && !Name.empty())
        {
            Result.ContentPath = SavePath + (SavePath.back() == '/' ? "" : "/") + Name;
        }
    }

    if (Result.Status == CanonicalStatus::Failed)
    {
        Result.ErrorMessage = "Torrent in error state: " + Result.VendorState;
    }
    return Result;
}

bool QBittorrentClient::Control(const std::string& Action, const std::vector<std::pair<std::string, std::string>>& Fields)
{
    HttpRequest Request = MakeRequest("POST", "/api/v2/torrents/" + Action);
    Request.Headers.emplace_back("Content-Type", "application/x-www-form-urlencoded");
    Request.Body = FormEncode(Fields);

    std::optional<HttpResponse> Response = SendAuthenticated(Request);
    if (!Response || !Response->IsSuccess())
    {
        Log.Error(Tag() + " Error controlling torrent: " + Action);
        return false;
    }
    return true;
}

bool QBittorrentClient::Pause(const std::string& Handle)
{
    return Control("pause", { { "hashes", Handle } });
}

bool QBittorrentClient::Resume(const std::string& Handle)
{
    return Control("resume", { { "hashes", Handle } });
}

bool QBittorrentClient::Remove(const std::string& Handle)
{
    return Control("delete", { { "hashes", Handle }, { "deleteFiles", "false" } });
}
