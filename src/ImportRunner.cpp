#include "ImportRunner.hpp"
#include "DestinationBuilder.hpp"
#include "ImportError.hpp"
#include "Logger.hpp"
#include "ReleaseParser.hpp"
#include "RootSelector.hpp"
#include "TimeUtils.hpp"

namespace FS = std::filesystem;

ImportRunner::ImportRunner(QueueStore& Queue, ImportLedger& Ledger, LibraryCatalog& Library, const SettingsStore& Settings, TransferEngine& Transfers)
    : Queue(Queue), Ledger(Ledger), Library(Library), Settings(Settings), Transfers(Transfers)
{
}

bool ImportRunner::Run(uint64_t QueueItemId)
{
    // Settings edits made while this run is in flight apply to the next run
    std::shared_ptr<const MediaManagementSettings> Snapshot = Settings.Current();

    std::optional<QueueItem> Item = Queue.Get(QueueItemId);
    if (!Item || Item->Status != QueueStatus::Importing)
    {
        Log.Warn("[ImportRunner] Queue item " + std::to_string(QueueItemId) + " is not importing, skipped");
        return false;
    }

    Log.Info("[ImportRunner] Importing queue item " + std::to_string(Item->Id) + " '" + Item->Title + "'");

    FS::path SourceFile;
    TransferMode Mode = Snapshot->Mode;
    try
    {
        std::optional<LibraryItem> Target = Library.GetItem(Item->LibraryItemId);
        if (!Target)
        {
            throw ImportError(ImportErrorCode::NotFound, "Library item " + std::to_string(Item->LibraryItemId) + " does not exist");
        }
        if (Item->ContentPath.empty())
        {
            throw ImportError(ImportErrorCode::NotFound, "Fetch agent reported no save path for " + Item->AgentHandle);
        }

        CandidateFile Candidate = Selector.Select(Item->ContentPath);
        SourceFile = Candidate.Path;

        ParsedPayloadInfo Parsed = ReleaseParser::Parse(Candidate.Path.filename().string());
        std::string Quality = ReleaseParser::QualityLabel(Parsed);

        std::vector<RootLocation> Roots = Snapshot->RootFolders;
        RootSelector::Refresh(Roots);
        RootLocation Root = RootSelector::Select(Roots, Candidate.Size, Snapshot->MinimumFreeSpaceBytes);

        DestinationBuilder Builder(*Snapshot);
        FS::path Destination = Builder.Build(Root.Path, *Target, Parsed, Candidate.Path.extension().string());

        PendingImport Journal;
        Journal.SourcePath = Candidate.Path.string();
        Journal.DestinationPath = Destination.string();
        Journal.Quality = Quality;
        Journal.SizeBytes = Candidate.Size;
        Journal.Mode = Mode;
        if (!Queue.SetPendingImport(Item->Id, Journal))
        {
            throw ImportError(ImportErrorCode::TransferFailure, "Could not record the pending import for queue item " + std::to_string(Item->Id));
        }

        TransferOutcome Outcome = Transfers.Transfer(Candidate.Path, Destination, *Snapshot);

        ImportRecord Record;
        Record.QueueItemId = Item->Id;
        Record.LibraryItemId = Item->LibraryItemId;
        Record.SourcePath = Candidate.Path.string();
        Record.DestinationPath = Destination.string();
        Record.Quality = Quality;
        Record.SizeBytes = Outcome.SizeBytes;
        Record.Decision = ImportDecision::Approved;
        Record.ImportedAt = NowUnix();

        Commit(*Item, Record, &Outcome);
    }
    catch (const ImportError& e)
    {
        if (e.Code() == ImportErrorCode::QueueWriteFailure)
        {
            // Recorded in the ledger; startup recovery marks the item imported
            Log.Error("[ImportRunner] " + std::string(e.what()));
            return false;
        }
        FailItem(Item->Id, e.what());
        return false;
    }
    catch (const std::exception& e)
    {
        FailItem(Item->Id, std::string(ImportErrorCodeName(ImportErrorCode::TransferFailure)) + ": " + e.what());
        return false;
    }

    Log.Info("[ImportRunner] Imported queue item " + std::to_string(Item->Id) + " '" + Item->Title + "'");

    if (Snapshot->RemoveCompletedDownloads)
    {
        Cleanup(SourceFile, Item->ContentPath, Mode);
    }
    return true;
}

void ImportRunner::Commit(const QueueItem& Item, ImportRecord& Record, const TransferOutcome* Outcome)
{
    std::optional<LibraryItem> Target = Library.GetItem(Item.LibraryItemId);
    if (!Target)
    {
        RevertTransfer(Outcome);
        throw ImportError(ImportErrorCode::NotFound, "Library item " + std::to_string(Item.LibraryItemId) + " disappeared before commit");
    }
    const std::string PreviousStatus = Target->Status;

    if (!Library.UpdateStatus(Item.LibraryItemId, LibraryStatusDownloaded))
    {
        RevertTransfer(Outcome);
        throw ImportError(ImportErrorCode::LibraryUpdateFailure, "Could not mark library item " + std::to_string(Item.LibraryItemId) + " as downloaded");
    }

    if (!Ledger.Append(Record))
    {
        if (!Library.UpdateStatus(Item.LibraryItemId, PreviousStatus))
        {
            Log.Error("[ImportRunner] Could not restore status '" + PreviousStatus + "' of library item " + std::to_string(Item.LibraryItemId));
        }
        RevertTransfer(Outcome);
        throw ImportError(ImportErrorCode::LedgerWriteFailure, "Could not append import record for queue item " + std::to_string(Item.Id));
    }

    // The record is durable. The item keeps Importing and its journal so
    // startup recovery can finish this step.
    if (!Queue.MarkImported(Item.Id))
    {
        throw ImportError(ImportErrorCode::QueueWriteFailure, "Import recorded but queue item " + std::to_string(Item.Id) + " could not be marked imported");
    }
}

void ImportRunner::FailItem(uint64_t QueueItemId, const std::string& Message)
{
    if (!Queue.MarkFailed(QueueItemId, Message))
    {
        Log.Error("[ImportRunner] Could not mark queue item " + std::to_string(QueueItemId) + " failed: " + Message);
    }
}

void ImportRunner::RevertTransfer(const TransferOutcome* Outcome)
{
    if (Outcome != nullptr && !Transfers.Revert(*Outcome))
    {
        Log.Error("[ImportRunner] Transfer could not be undone, " + Outcome->Destination.string() + " needs manual attention");
    }
}

bool ImportRunner::CompleteFromJournal(const QueueItem& Item)
{
    if (!Item.Pending)
    {
        return false;
    }

    ImportRecord Record;
    Record.QueueItemId = Item.Id;
    Record.LibraryItemId = Item.LibraryItemId;
    Record.SourcePath = Item.Pending->SourcePath;
    Record.DestinationPath = Item.Pending->DestinationPath;
    Record.Quality = Item.Pending->Quality;
    Record.SizeBytes = Item.Pending->SizeBytes;
    Record.Decision = ImportDecision::Approved;
    Record.ImportedAt = NowUnix();

    try
    {
        Commit(Item, Record, nullptr);
    }
    catch (const ImportError& e)
    {
        if (e.Code() == ImportErrorCode::QueueWriteFailure)
        {
            Log.Error("[ImportRunner] " + std::string(e.what()));
            return false;
        }
        FailItem(Item.Id, e.what());
        return false;
    }
    Log.Info("[ImportRunner] Finished interrupted import of queue item " + std::to_string(Item.Id));
    return true;
}

bool ImportRunner::DirectoryHoldsFiles(const FS::path& Directory)
{
    std::error_code ec;
    FS::recursive_directory_iterator it(Directory, FS::directory_options::none, ec);
    if (ec)
    {
        Log.Warn("[ImportRunner] Cannot list " + Directory.string() + ": " + ec.message());
        return true;
    }

    for (FS::recursive_directory_iterator end; it != end; it.increment(ec))
    {
        if (ec)
        {
            Log.Warn("[ImportRunner] Error while listing " + Directory.string() + ": " + ec.message());
            return true;
        }
        std::error_code StatusError;
        if (!it->is_directory(StatusError) || it->is_symlink(StatusError))
        {
            return true;
        }
    }
    if (ec)
    {
        Log.Warn("[ImportRunner] Error while listing " + Directory.string() + ": " + ec.message());
        return true;
    }
    return false;
}

void ImportRunner::Cleanup(const FS::path& SourceFile, const FS::path& PayloadRoot, TransferMode Mode)
{
    std::error_code ec;

    if (Mode != TransferMode::Move && !SourceFile.empty())
    {
        if (FS::remove(SourceFile, ec))
        {
            Log.Info("[ImportRunner] Cleanup removed source file " + SourceFile.string());
        }
        else if (ec)
        {
            Log.Warn("[ImportRunner] Cleanup could not remove " + SourceFile.string() + ": " + ec.message());
            return;
        }
    }

    // A single-file payload owns no folder; its parent is shared download space
    if (PayloadRoot.empty() || !FS::is_directory(PayloadRoot, ec))
    {
        return;
    }
    const FS::path& Directory = PayloadRoot;

    if (DirectoryHoldsFiles(Directory))
    {
        Log.Info("[ImportRunner] Cleanup kept " + Directory.string() + ", it still holds files");
        return;
    }

    FS::remove_all(Directory, ec);
    if (ec)
    {
        Log.Warn("[ImportRunner] Cleanup could not remove " + Directory.string() + ": " + ec.message());
        return;
    }
    Log.Info("[ImportRunner] Cleanup removed empty folder " + Directory.string());
}
