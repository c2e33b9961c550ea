#include "ConfigGlobal.hpp"

namespace ConfigGlobal
{
    std::string ConfigFile;
    std::string SettingsFile;
    std::string LogDir;
    std::string StateDir;
    std::string LibraryFile;

    unsigned short int MaxLogFiles;
    unsigned short int ThreadCount;
    unsigned int PollIntervalSeconds;
    bool MirrorLogToConsole;

    std::filesystem::path QueueStateFile;
    std::filesystem::path LedgerFile;

    void InitializeDefaults()
    {
        ConfigFile = "ImportFlow.conf"; //Relative paths resolve against the working directory
        SettingsFile = "MediaManagement.conf";
        LogDir = "ImportFlow_Logs";
        StateDir = "ImportFlow_State";
        LibraryFile = "Library.json";
        MaxLogFiles = 10;
        ThreadCount = 4;
        PollIntervalSeconds = 60;
        MirrorLogToConsole = true;
        ResolveStatePaths();
    }

    void ResolveStatePaths()
    {
        QueueStateFile = std::filesystem::path(StateDir) / "Queue.bin";
        LedgerFile = std::filesystem::path(StateDir) / "ImportLedger.bin";
    }
}
