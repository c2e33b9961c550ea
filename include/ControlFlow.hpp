#pragma once

#include <memory>
#include <string>
#include <vector>

#include "ConfigParser.hpp"
#include "ImportLedger.hpp"
#include "ImportRunner.hpp"
#include "LibraryCatalog.hpp"
#include "QueueStore.hpp"
#include "QueueSynchronizer.hpp"
#include "SettingsStore.hpp"
#include "ThreadPool.hpp"
#include "TransferEngine.hpp"

struct CommandLine
{
    std::string ConfigFile;
    std::string Command = "run";
    std::vector<std::string> Args;
};

class ControlFlow
{
public:
    ControlFlow() = default;
    ~ControlFlow();

    int Run(int argc, char* argv[]);

    // importflow [--config <file>] [run | test-agent | grab | status | history | import]
    static bool ParseArguments(int argc, char* argv[], CommandLine& Out, std::string& Error);
    static void PrintUsage();

private:
    bool Initialize(const CommandLine& Cmd);

    int RunDaemon();
    int TestAgent(const std::vector<std::string>& Args);
    int GrabItem(const std::vector<std::string>& Args);
    int PrintStatus();
    int PrintHistory();
    int ImportItem(const std::vector<std::string>& Args);

    ConfigParser Parser;
    std::unique_ptr<SettingsStore> Settings;
    std::unique_ptr<JsonLibraryCatalog> Library;
    std::unique_ptr<QueueStore> Queue;
    std::unique_ptr<ImportLedger> Ledger;
    std::unique_ptr<TransferEngine> Transfers;
    std::unique_ptr<ImportRunner> Runner;
    std::unique_ptr<ThreadPool> Pool;
    std::unique_ptr<QueueSynchronizer> Synchronizer;
};
