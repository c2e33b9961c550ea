#pragma once

#include "FetchAgentClient.hpp"

#include <nlohmann/json.hpp>

// Transmission RPC; the session token is the X-Transmission-Session-Id header
class TransmissionClient : public FetchAgentClient
{
public:
    TransmissionClient(FetchAgentConfig Config, std::shared_ptr<HttpTransport> Transport);

    bool TestConnection() override;
    std::optional<std::string> Enqueue(const std::string& SourceUri, const std::string& Category) override;
    std::optional<AgentStatus> Status(const std::string& Handle) override;
    bool Pause(const std::string& Handle) override;
    bool Resume(const std::string& Handle) override;
    bool Remove(const std::string& Handle) override;

    static CanonicalStatus MapStatus(int StatusCode, double PercentDone, int ErrorCode);

protected:
    std::optional<std::string> Login() override;
    void ApplySession(HttpRequest& Request, const std::string& Token) const override;
    bool IsAuthFailure(const HttpResponse& Response) const override;
    const char* ProtocolName() const override { return "Transmission"; }

private:
    HttpRequest MakeRpcRequest(const nlohmann::json& Payload) const;
    std::optional<nlohmann::json> Rpc(const std::string& Method, const nlohmann::json& Arguments);
};
