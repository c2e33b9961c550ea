#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "CandidateSelector.hpp"
#include "ImportLedger.hpp"
#include "LibraryCatalog.hpp"
#include "QueueStore.hpp"
#include "SettingsStore.hpp"
#include "TransferEngine.hpp"

// One end-to-end import of a queue item that already holds the Importing gate
class ImportRunner
{
public:
    ImportRunner(QueueStore& Queue, ImportLedger& Ledger, LibraryCatalog& Library, const SettingsStore& Settings, TransferEngine& Transfers);

    // Selection, placement, transfer, commit, cleanup. Any fatal error leaves
    // the item Failed with the message attached and no import record. The one
    // exception is a queue write lost after the record was appended: the item
    // stays Importing for recovery and Run returns false without cleanup.
    bool Run(uint64_t QueueItemId);

    // Commits a transfer that finished before the process stopped
    bool CompleteFromJournal(const QueueItem& Item);

    // Deletes the source file (unless already moved away), then the payload
    // folder when nothing but empty folders remain under it
    void Cleanup(const std::filesystem::path& SourceFile, const std::filesystem::path& PayloadRoot, TransferMode Mode);

    // Recursive: any non-directory entry counts. Unreadable trees count as non-empty.
    static bool DirectoryHoldsFiles(const std::filesystem::path& Directory);

private:
    // Library status, then ledger append (the commit point), then Imported.
    // Throws ImportError after undoing what it can.
    void Commit(const QueueItem& Item, ImportRecord& Record, const TransferOutcome* Outcome);
    void RevertTransfer(const TransferOutcome* Outcome);
    void FailItem(uint64_t QueueItemId, const std::string& Message);

    QueueStore& Queue;
    ImportLedger& Ledger;
    LibraryCatalog& Library;
    const SettingsStore& Settings;
    TransferEngine& Transfers;
    CandidateSelector Selector;
};
