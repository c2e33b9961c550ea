#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

//UNIX Time since Epoch, seconds
inline int64_t NowUnix()
{
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

// UTC, "YYYY-MM-DD HH:MM:SS"
inline std::string FormatUnixTime(int64_t UnixSeconds)
{
    if (UnixSeconds <= 0)
    {
        return "-";
    }
    std::time_t Time = static_cast<std::time_t>(UnixSeconds);
    std::tm Utc{};
#ifdef _WIN32
    gmtime_s(&Utc, &Time);
#else
    gmtime_r(&Time, &Utc);
#endif
    char Buffer[32];
    std::strftime(Buffer, sizeof(Buffer), "%Y-%m-%d %H:%M:%S", &Utc);
    return Buffer;
}
