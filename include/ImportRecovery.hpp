#pragma once

#include <cstddef>
#include <filesystem>

#include "ImportLedger.hpp"
#include "ImportRunner.hpp"
#include "QueueStore.hpp"

struct RecoverySummary
{
    size_t MarkedImported = 0; // ledger already held the record
    size_t Completed = 0;      // journaled transfer was whole, commit finished
    size_t RolledBack = 0;     // back to Completed for the next poll
    size_t Failed = 0;
};

namespace ImportRecovery
{
    // Settles every item left in Importing by a previous process. Runs before polling starts.
    RecoverySummary ReconcileInterruptedImports(QueueStore& Queue, ImportLedger& Ledger, ImportRunner& Runner);

    // ".Running" marker in the state folder, removed on clean shutdown
    bool MarkRunning(const std::filesystem::path& StateDir);
    bool MarkCleanShutdown(const std::filesystem::path& StateDir);
    bool WasLastShutdownClean(const std::filesystem::path& StateDir);
}
