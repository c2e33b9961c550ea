#include "TransmissionClient.hpp"
#include "Logger.hpp"

using json = nlohmann::json;

namespace
{
    const std::string SessionHeader = "X-Transmission-Session-Id";

    // tr_torrent_activity
    constexpr int StatusStopped = 0;
    constexpr int StatusCheckWait = 1;
    constexpr int StatusCheck = 2;
    constexpr int StatusDownloadWait = 3;
    constexpr int StatusDownload = 4;
    constexpr int StatusSeedWait = 5;
    constexpr int StatusSeed = 6;

    constexpr int ErrorLocal = 3;
}

TransmissionClient::TransmissionClient(FetchAgentConfig Config, std::shared_ptr<HttpTransport> Transport)
    : FetchAgentClient(std::move(Config), std::move(Transport))
{
}

CanonicalStatus TransmissionClient::MapStatus(int StatusCode, double PercentDone, int ErrorCode)
{
    if (ErrorCode == ErrorLocal)
    {
        return CanonicalStatus::Failed;
    }

    switch (StatusCode)
    {
    case StatusStopped:
        return PercentDone >= 1.0 ? CanonicalStatus::Completed : CanonicalStatus::Paused;
    case StatusCheckWait:
    case StatusCheck:
    case StatusDownloadWait:
        return CanonicalStatus::Queued;
    case StatusDownload:
        return CanonicalStatus::Downloading;
    case StatusSeedWait:
    case StatusSeed:
        return CanonicalStatus::Completed;
    default:
        return CanonicalStatus::Downloading;
    }
}

HttpRequest TransmissionClient::MakeRpcRequest(const json& Payload) const
{
    HttpRequest Request = MakeRequest("POST", "/transmission/rpc");
    Request.Headers.emplace_back("Content-Type", "application/json");
    Request.Body = Payload.dump();
    Request.BasicUser = AgentConfig.Username;
    Request.BasicPassword = AgentConfig.Password;
    return Request;
}

std::optional<std::string> TransmissionClient::Login()
{
    std::optional<HttpResponse> Response = SendUnauthenticated(MakeRpcRequest(json{ { "method", "session-get" } }));
    if (!Response)
    {
        return std::nullopt;
    }
    if (Response->Status == 401)
    {
        Log.Warn(Tag() + " Credentials rejected");
        return std::nullopt;
    }

    std::string SessionId = Response->Header(SessionHeader);
    if (SessionId.empty())
    {
        Log.Warn(Tag() + " No session id in response (HTTP " + std::to_string(Response->Status) + ")");
        return std::nullopt;
    }
    Log.Info(Tag() + " Session established");
    return SessionId;
}

void TransmissionClient::ApplySession(HttpRequest& Request, const std::string& Token) const
{
    Request.Headers.emplace_back(SessionHeader, Token);
}

bool TransmissionClient::IsAuthFailure(const HttpResponse& Response) const
{
    // 409: session id expired, 401: credentials no longer accepted
    return Response.Status == 409 || Response.Status == 401;
}

std::optional<json> TransmissionClient::Rpc(const std::string& Method, const json& Arguments)
{
    json Payload = { { "method", Method }, { "arguments", Arguments } };

    std::optional<HttpResponse> Response = SendAuthenticated(MakeRpcRequest(Payload));
    if (!Response)
    {
        return std::nullopt;
    }
    if (!Response->IsSuccess())
    {
        Log.Warn(Tag() + " " + Method + " failed (HTTP " + std::to_string(Response->Status) + ")");
        return std::nullopt;
    }

    json Body = json::parse(Response->Body, nullptr, false);
    if (Body.is_discarded() || !Body.is_object())
    {
        Log.Warn(Tag() + " " + Method + " returned malformed JSON");
        return std::nullopt;
    }
    std::string Result = Body.value("result", std::string());
    if (Result != "success")
    {
        Log.Warn(Tag() + " " + Method + " result: " + Result);
        return std::nullopt;
    }
    return Body.value("arguments", json::object());
}

bool TransmissionClient::TestConnection()
{
    std::optional<json> Session = Rpc("session-get", json::object());
    if (!Session)
    {
        Log.Error(Tag() + " Connection test failed");
        return false;
    }
    Log.Info(Tag() + " Connected successfully. Version: " + Session->value("version", std::string("unknown")));
    return true;
}

std::optional<std::string> TransmissionClient::Enqueue(const std::string& SourceUri, const std::string& Category)
{
    json Arguments = { { "filename", SourceUri }, { "paused", false } };
    if (!Category.empty())
    {
        Arguments["labels"] = json::array({ Category });
    }

    std::optional<json> Added = Rpc("torrent-add", Arguments);
    if (!Added)
    {
        return std::nullopt;
    }

    for (const char* Key : { "torrent-added", "torrent-duplicate" })
    {
        if (Added->contains(Key) && (*Added)[Key].is_object())
        {
            std::string Hash = (*Added)[Key].value("hashString", std::string());
            if (!Hash.empty())
            {
                Log.Info(Tag() + " Torrent added: " + SourceUri);
                return Hash;
            }
        }
    }

    Log.Error(Tag() + " torrent-add returned no torrent");
    return std::nullopt;
}

std::optional<AgentStatus> TransmissionClient::Status(const std::string& Handle)
{
    json Arguments = {
        { "ids", json::array({ Handle }) },
        { "fields", json::array({ "hashString", "name", "status", "percentDone", "totalSize", "downloadDir", "error", "errorString" }) }
    };

    std::optional<json> Result = Rpc("torrent-get", Arguments);
    if (!Result)
    {
        return std::nullopt;
    }

    const json Torrents = Result->value("torrents", json::array());
    if (!Torrents.is_array() || Torrents.empty())
    {
        Log.Warn(Tag() + " Torrent " + Handle + " not found");
        return std::nullopt;
    }

    const json& Torrent = Torrents.front();
    int StatusCode = Torrent.value("status", StatusDownload);
    double PercentDone = Torrent.value("percentDone", 0.0);
    int ErrorCode = Torrent.value("error", 0);

    AgentStatus Status;
    Status.Status = MapStatus(StatusCode, PercentDone, ErrorCode);
    Status.VendorState = "status=" + std::to_string(StatusCode);
    Status.Progress = PercentDone * 100.0;
    Status.SizeBytes = Torrent.value("totalSize", static_cast<uint64_t>(0));

    std::string DownloadDir = Torrent.value("downloadDir", std::string());
    std::string Name = Torrent.value("name", std::string());
    if (!DownloadDir.empty() && !Name.empty())
    {
        Status.ContentPath = DownloadDir + (DownloadDir.back() == '/' ? "" : "/") + Name;
    }

    if (Status.Status == CanonicalStatus::Failed)
    {
        Status.ErrorMessage = "Torrent in error state: " + Torrent.value("errorString", std::string("local error"));
    }
    return Status;
}

bool TransmissionClient::Pause(const std::string& Handle)
{
    return Rpc("torrent-stop", json{ { "ids", json::array({ Handle }) } }).has_value();
}

bool TransmissionClient::Resume(const std::string& Handle)
{
    return Rpc("torrent-start", json{ { "ids", json::array({ Handle }) } }).has_value();
}

bool TransmissionClient::Remove(const std::string& Handle)
{
    return Rpc("torrent-remove", json{ { "ids", json::array({ Handle }) }, { "delete-local-data", false } }).has_value();
}
