#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "FetchAgentClient.hpp"
#include "ImportRunner.hpp"
#include "QueueStore.hpp"
#include "ThreadPool.hpp"

// Drives queue items through the state machine from fetch agent reports and
// hands Completed items to the import runner on the worker pool
class QueueSynchronizer
{
public:
    QueueSynchronizer(QueueStore& Queue, ImportRunner& Runner, ThreadPool& Workers, std::chrono::seconds PollInterval);
    ~QueueSynchronizer();

    QueueSynchronizer(const QueueSynchronizer&) = delete;
    QueueSynchronizer& operator=(const QueueSynchronizer&) = delete;

    // Register agents before Start()
    void AddAgent(std::shared_ptr<FetchAgentClient> Agent);
    std::shared_ptr<FetchAgentClient> FindAgent(const std::string& AgentName) const;

    std::optional<QueueItem> Grab(uint64_t LibraryItemId, const std::string& Title, const std::string& AgentName, const std::string& SourceUri);

    // One synchronous poll. Returns false when the agent is unknown or its
    // previous poll is still outstanding (the call is skipped, not queued).
    bool PollOnce(const std::string& AgentName);

    // Runs the import of a Completed item on the calling thread
    bool ImportNow(uint64_t QueueItemId);

    void Start();

    // Stops scheduling and waits for in-flight polls and import runs
    void Stop();

private:
    struct AgentSlot
    {
        std::shared_ptr<FetchAgentClient> Client;
        std::atomic<bool> PollInFlight{ false };
    };

    void PollItems(FetchAgentClient& Client);
    void ApplyStatus(const QueueItem& Item, const AgentStatus& Reported);
    void StartImport(uint64_t QueueItemId);
    void SchedulerLoop();

    QueueStore& Queue;
    ImportRunner& Runner;
    ThreadPool& Workers;
    std::chrono::seconds Interval;

    std::map<std::string, std::unique_ptr<AgentSlot>> Agents;

    std::thread Scheduler;
    std::mutex SchedulerMutex;
    std::condition_variable Scheduler_CV;
    bool StopRequested = false;
};
