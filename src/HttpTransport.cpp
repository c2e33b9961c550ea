#include "HttpTransport.hpp"
#include "Logger.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <mutex>

namespace
{
    std::once_flag CurlInitFlag;

    std::string ToLower(std::string Text)
    {
        std::transform(Text.begin(), Text.end(), Text.begin(), [](unsigned char Ch) { return static_cast<char>(std::tolower(Ch)); });
        return Text;
    }

    size_t WriteBody(char* Ptr, size_t Size, size_t Count, void* UserData)
    {
        auto* Body = static_cast<std::string*>(UserData);
        Body->append(Ptr, Size * Count);
        return Size * Count;
    }

    size_t WriteHeader(char* Buffer, size_t Size, size_t Count, void* UserData)
    {
        auto* Headers = static_cast<std::vector<std::pair<std::string, std::string>>*>(UserData);
        std::string Line(Buffer, Size * Count);
        size_t Colon = Line.find(':');
        if (Colon != std::string::npos)
        {
            std::string Name = ToLower(Line.substr(0, Colon));
            std::string Value = Line.substr(Colon + 1);
            while (!Value.empty() && (Value.front() == ' ' || Value.front() == '\t'))
            {
                Value.erase(Value.begin());
            }
            while (!Value.empty() && (Value.back() == '\r' || Value.back() == '\n' || Value.back() == ' '))
            {
                Value.pop_back();
            }
            Headers->emplace_back(std::move(Name), std::move(Value));
        }
        return Size * Count;
    }

    // Owns an easy handle and its header list for one request
    struct CurlRequestHandle
    {
        CURL* Handle = curl_easy_init();
        curl_slist* HeaderList = nullptr;

        ~CurlRequestHandle()
        {
            if (HeaderList)
            {
                curl_slist_free_all(HeaderList);
            }
            if (Handle)
            {
                curl_easy_cleanup(Handle);
            }
        }
    };
}

std::string HttpResponse::Header(const std::string& Name) const
{
    const std::string Wanted = ToLower(Name);
    for (const auto& [Key, Value] : Headers)
    {
        if (Key == Wanted)
        {
            return Value;
        }
    }
    return {};
}

CurlHttpTransport::CurlHttpTransport()
{
    std::call_once(CurlInitFlag, []
    {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
        {
            Log.Error("[HttpTransport] curl_global_init failed");
        }
    });
}

std::optional<HttpResponse> CurlHttpTransport::Send(const HttpRequest& Request)
{
    CurlRequestHandle Curl;
    if (!Curl.Handle)
    {
        Log.Error("[HttpTransport] curl_easy_init failed");
        return std::nullopt;
    }

    HttpResponse Response;

    curl_easy_setopt(Curl.Handle, CURLOPT_URL, Request.Url.c_str());
    curl_easy_setopt(Curl.Handle, CURLOPT_USERAGENT, "ImportFlow/1.0");
    curl_easy_setopt(Curl.Handle, CURLOPT_TIMEOUT, Request.TimeoutSeconds);
    curl_easy_setopt(Curl.Handle, CURLOPT_CONNECTTIMEOUT, std::min(Request.TimeoutSeconds, 10L));
    curl_easy_setopt(Curl.Handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(Curl.Handle, CURLOPT_WRITEFUNCTION, &WriteBody);
    curl_easy_setopt(Curl.Handle, CURLOPT_WRITEDATA, &Response.Body);
    curl_easy_setopt(Curl.Handle, CURLOPT_HEADERFUNCTION, &WriteHeader);
    curl_easy_setopt(Curl.Handle, CURLOPT_HEADERDATA, &Response.Headers);

    if (Request.Method == "POST")
    {
        curl_easy_setopt(Curl.Handle, CURLOPT_POST, 1L);
        curl_easy_setopt(Curl.Handle, CURLOPT_POSTFIELDS, Request.Body.c_str());
        curl_easy_setopt(Curl.Handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(Request.Body.size()));
    }
    else if (Request.Method != "GET")
    {
        curl_easy_setopt(Curl.Handle, CURLOPT_CUSTOMREQUEST, Request.Method.c_str());
    }

    if (!Request.BasicUser.empty())
    {
        curl_easy_setopt(Curl.Handle, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
        curl_easy_setopt(Curl.Handle, CURLOPT_USERNAME, Request.BasicUser.c_str());
        curl_easy_setopt(Curl.Handle, CURLOPT_PASSWORD, Request.BasicPassword.c_str());
    }

    for (const auto& [Name, Value] : Request.Headers)
    {
        std::string Line = Name + ": " + Value;
        Curl.HeaderList = curl_slist_append(Curl.HeaderList, Line.c_str());
    }
    if (Curl.HeaderList)
    {
        curl_easy_setopt(Curl.Handle, CURLOPT_HTTPHEADER, Curl.HeaderList);
    }

    CURLcode Result = curl_easy_perform(Curl.Handle);
    if (Result != CURLE_OK)
    {
        Log.Warn("[HttpTransport] " + Request.Method + " " + Request.Url + " failed: " + curl_easy_strerror(Result));
        return std::nullopt;
    }

    curl_easy_getinfo(Curl.Handle, CURLINFO_RESPONSE_CODE, &Response.Status);
    return Response;
}

std::string UrlEncode(const std::string& Value)
{
    CurlRequestHandle Curl;
    if (!Curl.Handle)
    {
        return Value;
    }
    char* Escaped = curl_easy_escape(Curl.Handle, Value.c_str(), static_cast<int>(Value.size()));
    if (!Escaped)
    {
        return Value;
    }
    std::string Result(Escaped);
    curl_free(Escaped);
    return Result;
}

std::string FormEncode(const std::vector<std::pair<std::string, std::string>>& Fields)
{
    std::string Body;
    for (const auto& [Name, Value] : Fields)
    {
        if (!Body.empty())
        {
            Body += '&';
        }
        Body += UrlEncode(Name) + "=" + UrlEncode(Value);
    }
    return Body;
}
