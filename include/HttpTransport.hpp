#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

struct HttpRequest
{
    std::string Method = "GET";
    std::string Url;
    std::vector<std::pair<std::string, std::string>> Headers;
    std::string Body;
    std::string BasicUser;
    std::string BasicPassword;
    long TimeoutSeconds = 30;
};

struct HttpResponse
{
    long Status = 0;
    std::string Body;
    std::vector<std::pair<std::string, std::string>> Headers; // names lower-cased

    // First header with this (case-insensitive) name, empty when absent
    std::string Header(const std::string& Name) const;
    bool IsSuccess() const { return Status >= 200 && Status < 300; }
};

class HttpTransport
{
public:
    virtual ~HttpTransport() = default;

    // std::nullopt on any transport level failure (DNS, connect, timeout, TLS)
    virtual std::optional<HttpResponse> Send(const HttpRequest& Request) = 0;
};

class CurlHttpTransport : public HttpTransport
{
public:
    CurlHttpTransport();

    std::optional<HttpResponse> Send(const HttpRequest& Request) override;
};

std::string UrlEncode(const std::string& Value);
std::string FormEncode(const std::vector<std::pair<std::string, std::string>>& Fields);
