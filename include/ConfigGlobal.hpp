#pragma once

#include <string>
#include <filesystem>

namespace ConfigGlobal
{
    extern std::string ConfigFile;
    extern std::string SettingsFile;
    extern std::string LogDir;
    extern std::string StateDir;
    extern std::string LibraryFile;

    extern unsigned short int MaxLogFiles;
    extern unsigned short int ThreadCount;
    extern unsigned int PollIntervalSeconds;
    extern bool MirrorLogToConsole;

    extern std::filesystem::path QueueStateFile;
    extern std::filesystem::path LedgerFile;

    void InitializeDefaults();
    void ResolveStatePaths();
}
