#pragma once

#include "FetchAgentClient.hpp"

// qBittorrent WebUI API v2, cookie (SID) session
class QBittorrentClient : public FetchAgentClient
{
public:
    QBittorrentClient(FetchAgentConfig Config, std::shared_ptr<HttpTransport> Transport);

    bool TestConnection() override;
    std::optional<std::string> Enqueue(const std::string& SourceUri, const std::string& Category) override;
    std::optional<AgentStatus> Status(const std::string& Handle) override;
    bool Pause(const std::string& Handle) override;
    bool Resume(const std::string& Handle) override;
    bool Remove(const std::string& Handle) override;

    static CanonicalStatus MapState(const std::string& VendorState);
    static std::optional<std::string> HashFromMagnet(const std::string& SourceUri);

protected:
    std::optional<std::string> Login() override;
    void ApplySession(HttpRequest& Request, const std::string& Token) const override;
    bool IsAuthFailure(const HttpResponse& Response) const override;
    const char* ProtocolName() const override { return "qBittorrent"; }

private:
    bool Control(const std::string& Action, const std::vector<std::pair<std::string, std::string>>& Fields);
    std::optional<std::string> NewestHashInCategory(const std::string& Category);
};
