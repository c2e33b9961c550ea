#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "ControlFlow.hpp"
#include "ConfigGlobal.hpp"
#include "HttpTransport.hpp"
#include "ImportRecovery.hpp"
#include "Logger.hpp"
#include "PlatformSupport.hpp"
#include "TimeUtils.hpp"

namespace
{
    std::atomic<bool> StopSignalled{ false };

    void HandleStopSignal(int)
    {
        StopSignalled.store(true);
    }

    bool ParseId(const std::string& Text, uint64_t& Out)
    {
        try
        {
            size_t Consumed = 0;
            unsigned long long Value = std::stoull(Text, &Consumed);
            if (Consumed != Text.size())
            {
                return false;
            }
            Out = Value;
            return true;
        }
        catch (const std::exception&)
        {
            return false;
        }
    }
}

ControlFlow::~ControlFlow()
{
    // The synchronizer holds references into everything below it
    Synchronizer.reset();
    Pool.reset();
}

bool ControlFlow::ParseArguments(int argc, char* argv[], CommandLine& Out, std::string& Error)
{
    std::vector<std::string> Args(argv + 1, argv + argc);
    size_t Index = 0;

    if (Index < Args.size() && (Args[Index] == "--config" || Args[Index] == "-c"))
    {
        if (Index + 1 >= Args.size())
        {
            Error = "--config needs a file path";
            return false;
        }
        Out.ConfigFile = Args[Index + 1];
        Index += 2;
    }

    if (Index < Args.size())
    {
        Out.Command = Args[Index++];
    }
    Out.Args.assign(Args.begin() + static_cast<std::ptrdiff_t>(Index), Args.end());

    static const std::vector<std::string> Known = { "run", "test-agent", "grab", "status", "history", "import", "help" };
    if (std::find(Known.begin(), Known.end(), Out.Command) == Known.end())
    {
        Error = "Unknown command '" + Out.Command + "'";
        return false;
    }
    return true;
}

void ControlFlow::PrintUsage()
{
    std::cout << "Usage: importflow [--config <file>] <command>\n"
              << "  run                                   recover, then poll agents until interrupted (default)\n"
              << "  test-agent <name>                     check connectivity and credentials of an agent\n"
              << "  grab <agent> <itemId> <uri> [title]   enqueue a download for a library item\n"
              << "  status                                print the download queue\n"
              << "  history                               print the import ledger\n"
              << "  import <queueId>                      import a completed queue item now\n";
}

int ControlFlow::Run(int argc, char* argv[])
{
    CommandLine Cmd;
    std::string ArgError;
    if (!ParseArguments(argc, argv, Cmd, ArgError))
    {
        std::cerr << ArgError << "\n";
        PrintUsage();
        return 2;
    }
    if (Cmd.Command == "help")
    {
        PrintUsage();
        return 0;
    }

    if (!Initialize(Cmd))
    {
        return 1;
    }

    if (Cmd.Command == "run")
    {
        return RunDaemon();
    }
    if (Cmd.Command == "test-agent")
    {
        return TestAgent(Cmd.Args);
    }
    if (Cmd.Command == "grab")
    {
        return GrabItem(Cmd.Args);
    }
    if (Cmd.Command == "status")
    {
        return PrintStatus();
    }
    if (Cmd.Command == "history")
    {
        return PrintHistory();
    }
    return ImportItem(Cmd.Args);
}

bool ControlFlow::Initialize(const CommandLine& Cmd)
{
    if (!Cmd.ConfigFile.empty())
    {
        ConfigGlobal::ConfigFile = Cmd.ConfigFile;
    }

    bool ConfigOk = Parser.Parse(ConfigGlobal::ConfigFile);

    Log.Init(ConfigGlobal::LogDir);
    Log.SetConsoleMirror(ConfigGlobal::MirrorLogToConsole && Cmd.Command == "run");

    if (!ConfigOk)
    {
        for (const auto& Error : Parser.GetErrors())
        {
            std::cerr << "Config Error: " << Error << "\n";
            Log.Error(Error);
        }
        std::cerr << "Check Errors and Fix Them, Exiting\n";
        Log.Error("Check Errors and Fix Them, Exiting");
        return false;
    }
    Log.Info("Config Parsed Successfully.");
    for (const auto& Info : Parser.GetInfos())
    {
        Log.Info(Info);
    }
    Log.CleanupOldLogs();

    Settings = std::make_unique<SettingsStore>(ConfigGlobal::SettingsFile);
    if (!Settings->Load())
    {
        for (const auto& Error : Settings->GetErrors())
        {
            std::cerr << "Settings Error: " << Error << "\n";
        }
        return false;
    }

    Library = std::make_unique<JsonLibraryCatalog>(ConfigGlobal::LibraryFile);
    if (!Library->Load())
    {
        std::cerr << "Library file could not be read: " << ConfigGlobal::LibraryFile << "\n";
        return false;
    }

    // Reporting commands read alongside a running daemon; everything else owns the state
    const bool ReadOnly = Cmd.Command == "status" || Cmd.Command == "history" || Cmd.Command == "test-agent";
    const StoreAccess Access = ReadOnly ? StoreAccess::ReadOnly : StoreAccess::ReadWrite;

    Queue = std::make_unique<QueueStore>(ConfigGlobal::QueueStateFile.string(), Access);
    if (!Queue->Load())
    {
        std::cerr << "Queue state is unreadable or owned by another importflow process (stop the daemon first): "
                  << ConfigGlobal::QueueStateFile.string() << "\n";
        return false;
    }

    Ledger = std::make_unique<ImportLedger>(ConfigGlobal::LedgerFile.string(), Access);
    if (!Ledger->Load())
    {
        std::cerr << "Import ledger is unreadable or owned by another importflow process (stop the daemon first): "
                  << ConfigGlobal::LedgerFile.string() << "\n";
        return false;
    }

    PlatformCapabilities Capabilities = PlatformCapabilities::Native();
    Transfers = std::make_unique<TransferEngine>(Capabilities, std::shared_ptr<PermissionApplier>(CreatePermissionApplier(Capabilities)));
    Runner = std::make_unique<ImportRunner>(*Queue, *Ledger, *Library, *Settings, *Transfers);
    Pool = std::make_unique<ThreadPool>(ConfigGlobal::ThreadCount, "Workers");
    Synchronizer = std::make_unique<QueueSynchronizer>(*Queue, *Runner, *Pool, std::chrono::seconds(ConfigGlobal::PollIntervalSeconds));

    std::shared_ptr<HttpTransport> Transport = std::make_shared<CurlHttpTransport>();
    for (const FetchAgentConfig& AgentConfig : Parser.GetAgents())
    {
        Synchronizer->AddAgent(std::shared_ptr<FetchAgentClient>(CreateFetchAgentClient(AgentConfig, Transport)));
    }
    return true;
}

int ControlFlow::RunDaemon()
{
    std::cout << "Starting ImportFlow\n";

    if (!ImportRecovery::WasLastShutdownClean(ConfigGlobal::StateDir))
    {
        std::cout << "Previous run did not shut down cleanly, reconciling interrupted imports.\n";
        Log.Warn("Previous run did not shut down cleanly.");
    }
    ImportRecovery::ReconcileInterruptedImports(*Queue, *Ledger, *Runner);
    if (!ImportRecovery::MarkRunning(ConfigGlobal::StateDir))
    {
        Log.Warn("Could not write the running marker in " + ConfigGlobal::StateDir);
    }

    std::signal(SIGINT, HandleStopSignal);
    std::signal(SIGTERM, HandleStopSignal);

    Synchronizer->Start();
    while (!StopSignalled.load())
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }

    std::cout << "Stopping, waiting for running imports...\n";
    Log.Info("Stop requested");
    Synchronizer->Stop();

    if (!ImportRecovery::MarkCleanShutdown(ConfigGlobal::StateDir))
    {
        Log.Warn("Could not remove the running marker in " + ConfigGlobal::StateDir);
    }
    std::cout << "Logs Saved to : " << Log.CurrentLogFilePath << "\n";
    return 0;
}

int ControlFlow::TestAgent(const std::vector<std::string>& Args)
{
    if (Args.size() != 1)
    {
        PrintUsage();
        return 2;
    }
    std::shared_ptr<FetchAgentClient> Agent = Synchronizer->FindAgent(Args[0]);
    if (!Agent)
    {
        std::cerr << "No agent named '" << Args[0] << "' in " << ConfigGlobal::ConfigFile << "\n";
        return 1;
    }
    bool Ok = Agent->TestConnection();
    std::cout << Args[0] << ": " << (Ok ? "OK" : "FAILED (see log)") << "\n";
    return Ok ? 0 : 1;
}

int ControlFlow::GrabItem(const std::vector<std::string>& Args)
{
    uint64_t ItemId = 0;
    if (Args.size() < 3 || Args.size() > 4 || !ParseId(Args[1], ItemId))
    {
        PrintUsage();
        return 2;
    }

    std::optional<LibraryItem> Item = Library->GetItem(ItemId);
    if (!Item)
    {
        std::cerr << "Library item " << ItemId << " not found\n";
        return 1;
    }

    std::string Title = Args.size() == 4 ? Args[3] : Item->Title;
    std::optional<QueueItem> Queued = Synchronizer->Grab(ItemId, Title, Args[0], Args[2]);
    if (!Queued)
    {
        std::cerr << "Grab failed, see " << Log.CurrentLogFilePath << "\n";
        return 1;
    }
    std::cout << "Queued as item " << Queued->Id << " (" << Queued->AgentHandle << ")\n";
    return 0;
}

int ControlFlow::PrintStatus()
{
    std::vector<QueueItem> Items = Queue->All();
    if (Items.empty())
    {
        std::cout << "Queue is empty\n";
        return 0;
    }

    std::cout << std::left << std::setw(6) << "ID" << std::setw(13) << "STATUS" << std::setw(8) << "PROG" << std::setw(14) << "AGENT" << "TITLE\n";
    for (const QueueItem& Item : Items)
    {
        std::ostringstream Progress;
        Progress << std::fixed << std::setprecision(1) << Item.Progress << "%";
        std::cout << std::left << std::setw(6) << Item.Id << std::setw(13) << QueueStatusName(Item.Status) << std::setw(8) << Progress.str()
                  << std::setw(14) << Item.AgentName << Item.Title << "\n";
        if (!Item.ErrorMessage.empty())
        {
            std::cout << "      " << Item.ErrorMessage << "\n";
        }
    }
    return 0;
}

int ControlFlow::PrintHistory()
{
    std::vector<ImportRecord> Records = Ledger->All();
    if (Records.empty())
    {
        std::cout << "No imports recorded\n";
        return 0;
    }
    for (const ImportRecord& Record : Records)
    {
        std::cout << "#" << Record.Id << "  " << FormatUnixTime(Record.ImportedAt) << "  queue " << Record.QueueItemId << "  " << Record.Quality
                  << "  " << ImportDecisionName(Record.Decision) << "\n"
                  << "    " << Record.SourcePath << "\n"
                  << "    -> " << Record.DestinationPath << " (" << Record.SizeBytes << " bytes)\n";
    }
    return 0;
}

int ControlFlow::ImportItem(const std::vector<std::string>& Args)
{
    uint64_t QueueId = 0;
    if (Args.size() != 1 || !ParseId(Args[0], QueueId))
    {
        PrintUsage();
        return 2;
    }
    bool Ok = Synchronizer->ImportNow(QueueId);
    std::optional<QueueItem> Item = Queue->Get(QueueId);
    std::cout << "Item " << QueueId << ": " << (Item ? QueueStatusName(Item->Status) : "not found");
    if (Item && !Item->ErrorMessage.empty())
    {
        std::cout << " - " << Item->ErrorMessage;
    }
    std::cout << "\n";
    return Ok ? 0 : 1;
}
