#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "HttpTransport.hpp"
#include "MediaSettings.hpp"

enum class CanonicalStatus
{
    Queued,
    Downloading,
    Paused,
    Completed,
    Failed
};

const char* CanonicalStatusName(CanonicalStatus Status);

struct AgentStatus
{
    CanonicalStatus Status = CanonicalStatus::Downloading;
    double Progress = 0.0; // percent, 0-100
    uint64_t SizeBytes = 0;
    std::string ContentPath; // file or directory holding the payload
    std::string VendorState;
    std::string ErrorMessage;
};

// One adapter per backend protocol. Calls never throw: network and protocol
// failures come back as std::nullopt / false and are retried on the next poll.
class FetchAgentClient
{
public:
    FetchAgentClient(FetchAgentConfig Config, std::shared_ptr<HttpTransport> Transport);
    virtual ~FetchAgentClient() = default;

    FetchAgentClient(const FetchAgentClient&) = delete;
    FetchAgentClient& operator=(const FetchAgentClient&) = delete;

    virtual bool TestConnection() = 0;
    virtual std::optional<std::string> Enqueue(const std::string& SourceUri, const std::string& Category) = 0;
    virtual std::optional<AgentStatus> Status(const std::string& Handle) = 0;
    virtual bool Pause(const std::string& Handle) = 0;
    virtual bool Resume(const std::string& Handle) = 0;
    virtual bool Remove(const std::string& Handle) = 0;

    const FetchAgentConfig& Config() const { return AgentConfig; }
    const std::string& Name() const { return AgentConfig.Name; }

    void InvalidateSession();
    bool HasSession() const;

protected:
    // Credential exchange producing the opaque session token
    virtual std::optional<std::string> Login() = 0;
    virtual void ApplySession(HttpRequest& Request, const std::string& Token) const = 0;
    virtual bool IsAuthFailure(const HttpResponse& Response) const = 0;
    virtual const char* ProtocolName() const = 0;

    // Sends with the cached session. On an authentication failure the token is
    // discarded and login is retried exactly once before giving up.
    std::optional<HttpResponse> SendAuthenticated(const HttpRequest& Request);

    std::optional<HttpResponse> SendUnauthenticated(const HttpRequest& Request);

    HttpRequest MakeRequest(const std::string& Method, const std::string& PathAndQuery) const;
    std::string Tag() const;

    FetchAgentConfig AgentConfig;
    std::shared_ptr<HttpTransport> Transport;

private:
    std::optional<std::string> AcquireSession();

    mutable std::mutex SessionMutex;
    std::optional<std::string> SessionToken;
};

std::unique_ptr<FetchAgentClient> CreateFetchAgentClient(const FetchAgentConfig& Config, std::shared_ptr<HttpTransport> Transport);
