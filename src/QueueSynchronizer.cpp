#include "QueueSynchronizer.hpp"
#include "Logger.hpp"

namespace
{
    QueueStatus ToQueueStatus(CanonicalStatus Status)
    {
        switch (Status)
        {
        case CanonicalStatus::Queued:      return QueueStatus::Queued;
        case CanonicalStatus::Downloading: return QueueStatus::Downloading;
        case CanonicalStatus::Paused:      return QueueStatus::Paused;
        case CanonicalStatus::Completed:   return QueueStatus::Completed;
        case CanonicalStatus::Failed:      return QueueStatus::Failed;
        }
        return QueueStatus::Downloading;
    }

    // Clears the per-agent flag however the poll ends
    struct PollFlagGuard
    {
        std::atomic<bool>& Flag;
        ~PollFlagGuard() { Flag.store(false); }
    };
}

QueueSynchronizer::QueueSynchronizer(QueueStore& Queue, ImportRunner& Runner, ThreadPool& Workers, std::chrono::seconds PollInterval)
    : Queue(Queue), Runner(Runner), Workers(Workers), Interval(PollInterval)
{
}

QueueSynchronizer::~QueueSynchronizer()
{
    Stop();
}

void QueueSynchronizer::AddAgent(std::shared_ptr<FetchAgentClient> Agent)
{
    auto Slot = std::make_unique<AgentSlot>();
    Slot->Client = std::move(Agent);
    const std::string Name = Slot->Client->Name();
    Agents[Name] = std::move(Slot);
    Log.Info("[QueueSynchronizer] Registered fetch agent " + Name);
}

std::shared_ptr<FetchAgentClient> QueueSynchronizer::FindAgent(const std::string& AgentName) const
{
    auto it = Agents.find(AgentName);
    return it != Agents.end() ? it->second->Client : nullptr;
}

std::optional<QueueItem> QueueSynchronizer::Grab(uint64_t LibraryItemId, const std::string& Title, const std::string& AgentName, const std::string& SourceUri)
{
    std::shared_ptr<FetchAgentClient> Client = FindAgent(AgentName);
    if (!Client)
    {
        Log.Error("[QueueSynchronizer] Unknown fetch agent " + AgentName);
        return std::nullopt;
    }

    std::optional<std::string> Handle = Client->Enqueue(SourceUri, Client->Config().Category);
    if (!Handle)
    {
        Log.Error("[QueueSynchronizer] " + AgentName + " did not accept " + SourceUri);
        return std::nullopt;
    }
    std::optional<QueueItem> Item = Queue.Add(Title, LibraryItemId, AgentName, *Handle);
    if (!Item)
    {
        Log.Error("[QueueSynchronizer] " + AgentName + " accepted " + *Handle + " but the queue could not record it");
    }
    return Item;
}

bool QueueSynchronizer::PollOnce(const std::string& AgentName)
{
    auto it = Agents.find(AgentName);
    if (it == Agents.end())
    {
        Log.Error("[QueueSynchronizer] Unknown fetch agent " + AgentName);
        return false;
    }

    AgentSlot& Slot = *it->second;
    bool Expected = false;
    if (!Slot.PollInFlight.compare_exchange_strong(Expected, true))
    {
        Log.Warn("[QueueSynchronizer] Previous poll of " + AgentName + " still running, skipping");
        return false;
    }
    PollFlagGuard Guard{ Slot.PollInFlight };

    PollItems(*Slot.Client);
    return true;
}

void QueueSynchronizer::PollItems(FetchAgentClient& Client)
{
    for (const QueueItem& Item : Queue.ItemsForAgent(Client.Name()))
    {
        // Importing items belong to their import run
        if (IsTerminal(Item.Status) || Item.Status == QueueStatus::Importing)
        {
            continue;
        }

        std::optional<AgentStatus> Reported = Client.Status(Item.AgentHandle);
        if (!Reported)
        {
            Log.Warn("[QueueSynchronizer] No status for item " + std::to_string(Item.Id) + " from " + Client.Name() + ", retrying next poll");
            continue;
        }
        ApplyStatus(Item, *Reported);
    }
}

void QueueSynchronizer::ApplyStatus(const QueueItem& Item, const AgentStatus& Reported)
{
    Queue.UpdateProgress(Item.Id, Reported.Progress, Reported.ContentPath);

    QueueStatus Target = ToQueueStatus(Reported.Status);
    if (Target == QueueStatus::Failed)
    {
        std::string Message = Reported.ErrorMessage.empty() ? "Fetch agent reported failure (" + Reported.VendorState + ")" : Reported.ErrorMessage;
        Queue.MarkFailed(Item.Id, Message);
        return;
    }

    if (Target != Item.Status && !Queue.Transition(Item.Id, Target))
    {
        return;
    }

    if (Target == QueueStatus::Completed)
    {
        StartImport(Item.Id);
    }
}

void QueueSynchronizer::StartImport(uint64_t QueueItemId)
{
    // The compare-and-set is the gate; a concurrent poll loses it and moves on
    if (!Queue.BeginImport(QueueItemId))
    {
        return;
    }
    Workers.Submit([this, QueueItemId]()
    {
        Runner.Run(QueueItemId);
    });
}

bool QueueSynchronizer::ImportNow(uint64_t QueueItemId)
{
    if (!Queue.BeginImport(QueueItemId))
    {
        std::optional<QueueItem> Item = Queue.Get(QueueItemId);
        Log.Error("[QueueSynchronizer] Item " + std::to_string(QueueItemId) + " cannot be imported from state "
            + (Item ? QueueStatusName(Item->Status) : "missing"));
        return false;
    }
    return Runner.Run(QueueItemId);
}

void QueueSynchronizer::Start()
{
    std::lock_guard<std::mutex> Lock(SchedulerMutex);
    if (Scheduler.joinable())
    {
        return;
    }
    StopRequested = false;
    Scheduler = std::thread(&QueueSynchronizer::SchedulerLoop, this);
    Log.Info("[QueueSynchronizer] Polling " + std::to_string(Agents.size()) + " agent(s) every " + std::to_string(Interval.count()) + "s");
}

void QueueSynchronizer::Stop()
{
    {
        std::lock_guard<std::mutex> Lock(SchedulerMutex);
        StopRequested = true;
    }
    Scheduler_CV.notify_all();
    if (Scheduler.joinable())
    {
        Scheduler.join();
        Log.Info("[QueueSynchronizer] Scheduler stopped, waiting for running imports");
    }
    Workers.Join();
}

void QueueSynchronizer::SchedulerLoop()
{
    std::unique_lock<std::mutex> Lock(SchedulerMutex);
    while (!StopRequested)
    {
        for (const auto& [Name, Slot] : Agents)
        {
            // Checked again inside PollOnce; this only avoids queueing a job that would skip
            if (Slot->PollInFlight.load())
            {
                Log.Warn("[QueueSynchronizer] Previous poll of " + Name + " still running, skipping");
                continue;
            }
            std::string AgentName = Name;
            Workers.Submit([this, AgentName]()
            {
                PollOnce(AgentName);
            });
        }
        Scheduler_CV.wait_for(Lock, Interval, [this] { return StopRequested; });
    }
}
