#include "ImportRecovery.hpp"
#include "Logger.hpp"
#include "TransferEngine.hpp"

#include <fstream>

namespace FS = std::filesystem;

namespace ImportRecovery
{
    namespace
    {
        const char* RunningMarker = ".Running";

        bool DestinationIsWhole(const PendingImport& Journal)
        {
            std::error_code ec;
            if (!FS::is_regular_file(Journal.DestinationPath, ec))
            {
                return false;
            }
            uintmax_t Size = FS::file_size(Journal.DestinationPath, ec);
            return !ec && Size == Journal.SizeBytes;
        }

        void RemovePartial(const PendingImport& Journal)
        {
            std::error_code ec;
            FS::path Partial = TransferEngine::PartialPathFor(Journal.DestinationPath);
            if (FS::remove(Partial, ec))
            {
                Log.Info("[ImportRecovery] Removed leftover partial file " + Partial.string());
            }
            else if (ec)
            {
                Log.Warn("[ImportRecovery] Could not remove " + Partial.string() + ": " + ec.message());
            }
        }
    }

    RecoverySummary ReconcileInterruptedImports(QueueStore& Queue, ImportLedger& Ledger, ImportRunner& Runner)
    {
        RecoverySummary Summary;
        std::vector<QueueItem> Interrupted = Queue.ItemsInStatus(QueueStatus::Importing);
        if (Interrupted.empty())
        {
            return Summary;
        }

        Log.Warn("[ImportRecovery] Found " + std::to_string(Interrupted.size()) + " interrupted import(s)");

        for (const QueueItem& Item : Interrupted)
        {
            const std::string Id = std::to_string(Item.Id);

            if (Ledger.CountFor(Item.Id) > 0)
            {
                Log.Info("[ImportRecovery] Item " + Id + " reached the ledger before the stop, marking imported");
                if (Queue.MarkImported(Item.Id))
                {
                    ++Summary.MarkedImported;
                }
                continue;
            }

            if (!Item.Pending)
            {
                Log.Info("[ImportRecovery] Item " + Id + " had not started transferring, rolling back");
                if (Queue.RollBackToCompleted(Item.Id))
                {
                    ++Summary.RolledBack;
                }
                continue;
            }

            if (DestinationIsWhole(*Item.Pending))
            {
                Log.Info("[ImportRecovery] Item " + Id + " transfer to " + Item.Pending->DestinationPath + " is complete, finishing commit");
                if (Runner.CompleteFromJournal(Item))
                {
                    ++Summary.Completed;
                }
                else
                {
                    ++Summary.Failed;
                }
                continue;
            }

            // A Move may have left the source in place or already gone; the
            // next poll retries and reports NotFound if it is gone
            RemovePartial(*Item.Pending);
            Log.Info("[ImportRecovery] Item " + Id + " transfer did not finish, rolling back");
            if (Queue.RollBackToCompleted(Item.Id))
            {
                ++Summary.RolledBack;
            }
        }

        Log.Info("[ImportRecovery] Recovery finished: " + std::to_string(Summary.MarkedImported) + " imported, "
            + std::to_string(Summary.Completed) + " completed, " + std::to_string(Summary.RolledBack) + " rolled back, "
            + std::to_string(Summary.Failed) + " failed");
        return Summary;
    }

    bool MarkRunning(const FS::path& StateDir)
    {
        std::error_code ec;
        FS::create_directories(StateDir, ec);
        std::ofstream ofs(StateDir / RunningMarker, std::ios::trunc);
        return ofs.good();
    }

    bool MarkCleanShutdown(const FS::path& StateDir)
    {
        std::error_code ec;
        FS::remove(StateDir / RunningMarker, ec);
        return !ec;
    }

    bool WasLastShutdownClean(const FS::path& StateDir)
    {
        std::error_code ec;
        return !FS::exists(StateDir / RunningMarker, ec);
    }
}
