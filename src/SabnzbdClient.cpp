#include "SabnzbdClient.hpp"
#include "Logger.hpp"

#include <unordered_map>

using json = nlohmann::json;

namespace
{
    // SABnzbd reports most numbers as strings
    double ParseNumber(const json& Value)
    {
        if (Value.is_number())
        {
            return Value.get<double>();
        }
        if (Value.is_string())
        {
            try
            {
                return std::stod(Value.get<std::string>());
            }
            catch (const std::exception&)
            {
                return 0.0;
            }
        }
        return 0.0;
    }

    uint64_t ToBytes(double Value)
    {
        return Value > 0.0 ? static_cast<uint64_t>(Value) : 0;
    }
}

SabnzbdClient::SabnzbdClient(FetchAgentConfig Config, std::shared_ptr<HttpTransport> Transport)
    : FetchAgentClient(std::move(Config), std::move(Transport))
{
}

CanonicalStatus SabnzbdClient::MapState(const std::string& VendorState)
{
    static const std::unordered_map<std::string, CanonicalStatus> StateMap = {
        { "Queued",      CanonicalStatus::Queued },
        { "Grabbing",    CanonicalStatus::Queued },
        { "Fetching",    CanonicalStatus::Queued },
        { "Propagating", CanonicalStatus::Queued },
        { "Downloading", CanonicalStatus::Downloading },
        { "Paused",      CanonicalStatus::Paused },
        { "Verifying",   CanonicalStatus::Downloading },
        { "Repairing",   CanonicalStatus::Downloading },
        { "Extracting",  CanonicalStatus::Downloading },
        { "Moving",      CanonicalStatus::Downloading },
        { "Running",     CanonicalStatus::Downloading },
        { "QuickCheck",  CanonicalStatus::Downloading },
        { "Completed",   CanonicalStatus::Completed },
        { "Failed",      CanonicalStatus::Failed }
    };

    auto it = StateMap.find(VendorState);
    return (it != StateMap.end()) ? it->second : CanonicalStatus::Downloading;
}

std::optional<std::string> SabnzbdClient::Login()
{
    if (AgentConfig.Password.empty())
    {
        Log.Warn(Tag() + " No API key configured");
        return std::nullopt;
    }
    return AgentConfig.Password;
}

void SabnzbdClient::ApplySession(HttpRequest& Request, const std::string& Token) const
{
    Request.Url += (Request.Url.find('?') == std::string::npos ? "?" : "&");
    Request.Url += "apikey=" + UrlEncode(Token);
}

bool SabnzbdClient::IsAuthFailure(const HttpResponse& Response) const
{
    if (Response.Status == 401 || Response.Status == 403)
    {
        return true;
    }
    json Body = json::parse(Response.Body, nullptr, false);
    if (Body.is_discarded() || !Body.is_object() || !Body.contains("error"))
    {
        return false;
    }
    return Body["error"].is_string() && Body["error"].get<std::string>().find("API Key") != std::string::npos;
}

std::optional<json> SabnzbdClient::Api(const std::string& Query)
{
    std::optional<HttpResponse> Response = SendAuthenticated(MakeRequest("GET", "/api?output=json&" + Query));
    if (!Response)
    {
        return std::nullopt;
    }
    if (!Response->IsSuccess())
    {
        Log.Warn(Tag() + " API call failed (HTTP " + std::to_string(Response->Status) + ")");
        return std::nullopt;
    }

    json Body = json::parse(Response->Body, nullptr, false);
    if (Body.is_discarded() || !Body.is_object())
    {
        Log.Warn(Tag() + " Malformed API response");
        return std::nullopt;
    }
    if (Body.contains("error") && Body["error"].is_string())
    {
        Log.Warn(Tag() + " API error: " + Body["error"].get<std::string>());
        return std::nullopt;
    }
    return Body;
}

bool SabnzbdClient::TestConnection()
{
    std::optional<json> Queue = Api("mode=queue&limit=0");
    if (!Queue)
    {
        Log.Error(Tag() + " Connection test failed");
        return false;
    }
    std::string Version = Queue->contains("queue") ? (*Queue)["queue"].value("version", std::string("unknown")) : "unknown";
    Log.Info(Tag() + " Connected successfully. Version: " + Version);
    return true;
}

std::optional<std::string> SabnzbdClient::Enqueue(const std::string& SourceUri, const std::string& Category)
{
    std::optional<json> Result = Api("mode=addurl&name=" + UrlEncode(SourceUri) + "&cat=" + UrlEncode(Category));
    if (!Result)
    {
        return std::nullopt;
    }

    const json Ids = Result->value("nzo_ids", json::array());
    if (!Result->value("status", false) || !Ids.is_array() || Ids.empty() || !Ids.front().is_string())
    {
        Log.Error(Tag() + " addurl returned no job id");
        return std::nullopt;
    }

    Log.Info(Tag() + " NZB added: " + SourceUri);
    return Ids.front().get<std::string>();
}

std::optional<AgentStatus> SabnzbdClient::Status(const std::string& Handle)
{
    // Active jobs live in the queue, finished ones move to history
    std::optional<json> Queue = Api("mode=queue&nzo_ids=" + UrlEncode(Handle));
    if (!Queue)
    {
        return std::nullopt;
    }

    const json QueueSlots = Queue->contains("queue") ? (*Queue)["queue"].value("slots", json::array()) : json::array();
    for (const json& Slot : QueueSlots)
    {
        if (Slot.value("nzo_id", std::string()) != Handle)
        {
            continue;
        }
        AgentStatus Status;
        Status.VendorState = Slot.value("status", std::string());
        Status.Status = MapState(Status.VendorState);
        Status.Progress = ParseNumber(Slot.value("percentage", json("0")));
        Status.SizeBytes = ToBytes(ParseNumber(Slot.value("mb", json("0"))) * 1024.0 * 1024.0);
        return Status;
    }

    std::optional<json> History = Api("mode=history&nzo_ids=" + UrlEncode(Handle));
    if (!History)
    {
        return std::nullopt;
    }

    const json HistorySlots = History->contains("history") ? (*History)["history"].value("slots", json::array()) : json::array();
    for (const json& Slot : HistorySlots)
    {
        if (Slot.value("nzo_id", std::string()) != Handle)
        {
            continue;
        }
        AgentStatus Status;
        Status.VendorState = Slot.value("status", std::string());
        Status.Status = MapState(Status.VendorState);
        Status.Progress = Status.Status == CanonicalStatus::Completed ? 100.0 : 0.0;
        Status.SizeBytes = ToBytes(ParseNumber(Slot.value("bytes", json(0))));
        Status.ContentPath = Slot.value("storage", std::string());
        if (Status.Status == CanonicalStatus::Failed)
        {
            Status.ErrorMessage = "Job failed: " + Slot.value("fail_message", std::string("unknown reason"));
        }
        return Status;
    }

    Log.Warn(Tag() + " Job " + Handle + " not found");
    return std::nullopt;
}

bool SabnzbdClient::Pause(const std::string& Handle)
{
    return Api("mode=queue&name=pause&value=" + UrlEncode(Handle)).has_value();
}

bool SabnzbdClient::Resume(const std::string& Handle)
{
    return Api("mode=queue&name=resume&value=" + UrlEncode(Handle)).has_value();
}

bool SabnzbdClient::Remove(const std::string& Handle)
{
    if (Api("mode=queue&name=delete&value=" + UrlEncode(Handle)).has_value())
    {
        return true;
    }
    return Api("mode=history&name=delete&value=" + UrlEncode(Handle)).has_value();
}
