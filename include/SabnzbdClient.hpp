#pragma once

#include "FetchAgentClient.hpp"

#include <nlohmann/json.hpp>

// SABnzbd JSON API; the API key (configured as the password) is the token
class SabnzbdClient : public FetchAgentClient
{
public:
    SabnzbdClient(FetchAgentConfig Config, std::shared_ptr<HttpTransport> Transport);

    bool TestConnection() override;
    std::optional<std::string> Enqueue(const std::string& SourceUri, const std::string& Category) override;
    std::optional<AgentStatus> Status(const std::string& Handle) override;
    bool Pause(const std::string& Handle) override;
    bool Resume(const std::string& Handle) override;
    bool Remove(const std::string& Handle) override;

    static CanonicalStatus MapState(const std::string& VendorState);

protected:
    std::optional<std::string> Login() override;
    void ApplySession(HttpRequest& Request, const std::string& Token) const override;
    bool IsAuthFailure(const HttpResponse& Response) const override;
    const char* ProtocolName() const override { return "SABnzbd"; }

private:
    std::optional<nlohmann::json> Api(const std::string& Query);
};
