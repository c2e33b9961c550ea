#include "FetchAgentClient.hpp"
#include "QBittorrentClient.hpp"
#include "TransmissionClient.hpp"
#include "SabnzbdClient.hpp"
#include "Logger.hpp"

const char* CanonicalStatusName(CanonicalStatus Status)
{
    switch (Status)
    {
    case CanonicalStatus::Queued:      return "Queued";
    case CanonicalStatus::Downloading: return "Downloading";
    case CanonicalStatus::Paused:      return "Paused";
    case CanonicalStatus::Completed:   return "Completed";
    case CanonicalStatus::Failed:      return "Failed";
    }
    return "Downloading";
}

FetchAgentClient::FetchAgentClient(FetchAgentConfig Config, std::shared_ptr<HttpTransport> Transport)
    : AgentConfig(std::move(Config)), Transport(std::move(Transport))
{
}

void FetchAgentClient::InvalidateSession()
{
    std::lock_guard<std::mutex> Lock(SessionMutex);
    SessionToken.reset();
}

bool FetchAgentClient::HasSession() const
{
    std::lock_guard<std::mutex> Lock(SessionMutex);
    return SessionToken.has_value();
}

std::string FetchAgentClient::Tag() const
{
    return std::string("[") + ProtocolName() + ":" + AgentConfig.Name + "]";
}

HttpRequest FetchAgentClient::MakeRequest(const std::string& Method, const std::string& PathAndQuery) const
{
    HttpRequest Request;
    Request.Method = Method;
    Request.Url = AgentConfig.BaseUrl() + PathAndQuery;
    Request.TimeoutSeconds = AgentConfig.TimeoutSeconds;
    return Request;
}

std::optional<std::string> FetchAgentClient::AcquireSession()
{
    {
        std::lock_guard<std::mutex> Lock(SessionMutex);
        if (SessionToken)
        {
            return SessionToken;
        }
    }

    // Login runs unlocked; two racing logins both yield a usable token
    std::optional<std::string> Fresh = Login();
    if (!Fresh)
    {
        Log.Warn(Tag() + " Login failed");
        return std::nullopt;
    }

    std::lock_guard<std::mutex> Lock(SessionMutex);
    SessionToken = Fresh;
    return SessionToken;
}

std::optional<HttpResponse> FetchAgentClient::SendAuthenticated(const HttpRequest& Request)
{
    for (int Attempt = 0; Attempt < 2; ++Attempt)
    {
        std::optional<std::string> Token = AcquireSession();
        if (!Token)
        {
            return std::nullopt;
        }

        HttpRequest Authorized = Request;
        ApplySession(Authorized, *Token);

        std::optional<HttpResponse> Response = Transport->Send(Authorized);
        if (!Response)
        {
            Log.Warn(Tag() + " Agent unreachable: " + Request.Method + " " + Request.Url);
            return std::nullopt;
        }

        if (!IsAuthFailure(*Response))
        {
            return Response;
        }

        InvalidateSession();
        if (Attempt == 0)
        {
            Log.Info(Tag() + " Session rejected (HTTP " + std::to_string(Response->Status) + "), logging in again");
        }
    }

    Log.Error(Tag() + " Authentication failed after re-login");
    return std::nullopt;
}

std::optional<HttpResponse> FetchAgentClient::SendUnauthenticated(const HttpRequest& Request)
{
    std::optional<HttpResponse> Response = Transport->Send(Request);
    if (!Response)
    {
        Log.Warn(Tag() + " Agent unreachable: " + Request.Method + " " + Request.Url);
    }
    return Response;
}

std::unique_ptr<FetchAgentClient> CreateFetchAgentClient(const FetchAgentConfig& Config, std::shared_ptr<HttpTransport> Transport)
{
    switch (Config.Kind)
    {
    case AgentKind::QBittorrent:  return std::make_unique<QBittorrentClient>(Config, std::move(Transport));
    case AgentKind::Transmission: return std::make_unique<TransmissionClient>(Config, std::move(Transport));
    case AgentKind::Sabnzbd:      return std::make_unique<SabnzbdClient>(Config, std::move(Transport));
    }
    return nullptr;
}
