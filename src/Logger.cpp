#include "Logger.hpp"
#include "ConfigGlobal.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <iostream>
#include <vector>
#include <algorithm>

Logger Log;
namespace FS = std::filesystem;

namespace
{
    const std::string LogFilePrefix = "ImportFlow_Log";
}

void Logger::Init(const std::string& logDir)
{
    std::error_code ec;
    FS::create_directories(logDir, ec);
    if (ec)
    {
        std::cerr << "Logger: Failed to create log directory: " << logDir << " - " << ec.message() << "\n";
    }

    LogDirectory = logDir;
    CurrentLogFilePath = (FS::path(logDir) / (LogFilePrefix + GetTimestampForFilename() + ".txt")).string();

    OpenLogFile(CurrentLogFilePath);

    Info("ImportFlow Started at " + GetTimestamp());
}

Logger::~Logger()
{
    if (LogFile.is_open())
    {
        LogFile << "[" << GetTimestamp() << "] [INFO] ImportFlow Stopped\n";
        LogFile.close();
    }
}

void Logger::SetConsoleMirror(bool Enabled)
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);
    MirrorToConsole = Enabled;
}

void Logger::OpenLogFile(const std::string& FilePath)
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);
    LogFile.open(FilePath, std::ios::out | std::ios::app);

    if (!LogFile.is_open())
    {
        std::cerr << "Logger: Failed to open log file: " << FilePath << "\n";
    }
}

void Logger::CleanupOldLogs()
{
    if (LogDirectory.empty())
    {
        return;
    }

    std::vector<FS::directory_entry> Logs;
    std::error_code ec;

    for (const auto& Entry : FS::directory_iterator(LogDirectory, ec))
    {
        if (Entry.is_regular_file() && Entry.path().filename().string().starts_with(LogFilePrefix))
        {
            Logs.push_back(Entry);
        }
    }
    if (ec)
    {
        Error("[Logger] Could not list log directory: " + ec.message());
        return;
    }

    if (Logs.size() <= ConfigGlobal::MaxLogFiles)
    {
        return;
    }

    // Timestamped names sort chronologically
    std::sort(Logs.begin(), Logs.end(), [](const FS::directory_entry& A, const FS::directory_entry& B)
    {
        return A.path().filename().string() < B.path().filename().string();
    });

    size_t Excess = Logs.size() - ConfigGlobal::MaxLogFiles;
    for (size_t i = 0; i < Excess; ++i)
    {
        FS::remove(Logs[i].path(), ec);
        if (ec)
        {
            Warn("[Logger] Could not remove old log " + Logs[i].path().string() + ": " + ec.message());
        }
    }
}

void Logger::Log(LogLevel Level, const std::string& Message)
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);

    if (!LogFile.is_open())
    {
        return;
    }

    const std::string Line = "[" + GetTimestamp() + "] [" + LevelToString(Level) + "] " + Message;
    LogFile << Line << "\n";
    LogFile.flush();

    if (MirrorToConsole)
    {
        std::cerr << Line << "\n";
    }
}

void Logger::Info(const std::string& Message)
{
    Log(LogLevel::INFO, Message);
}

void Logger::Warn(const std::string& Message)
{
    Log(LogLevel::WARN, Message);
}

void Logger::Error(const std::string& Message)
{
    Log(LogLevel::ERROR, Message);
}

std::string Logger::GetTimestampForFilename()
{
    auto Now = std::chrono::system_clock::now();
    std::time_t Time = std::chrono::system_clock::to_time_t(Now);
    std::tm Local{};

#ifdef _WIN32
    localtime_s(&Local, &Time);
#else
    localtime_r(&Time, &Local);
#endif

    std::ostringstream Stream;
    Stream << std::put_time(&Local, "%Y%m%d_%H%M%S");
    return Stream.str();
}

std::string Logger::GetTimestamp() const
{
    auto Now = std::chrono::system_clock::now();
    std::time_t Time = std::chrono::system_clock::to_time_t(Now);
    std::tm Local{};

#ifdef _WIN32
    localtime_s(&Local, &Time);
#else
    localtime_r(&Time, &Local);
#endif

    std::ostringstream Stream;
    Stream << std::put_time(&Local, "%Y-%m-%d %H:%M:%S");
    return Stream.str();
}

std::string Logger::LevelToString(LogLevel Level) const
{
    switch (Level)
    {
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    default:              return "UNKNOWN";
    }
}
