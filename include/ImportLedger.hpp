#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "StateLock.hpp"

enum class ImportDecision : uint8_t
{
    Approved,
    RejectedInsufficientSpace,
    RejectedNoMedia,
    RejectedTransferFailure
};

const char* ImportDecisionName(ImportDecision Decision);

struct ImportRecord
{
    uint64_t Id = 0;
    uint64_t QueueItemId = 0;
    uint64_t LibraryItemId = 0;
    std::string SourcePath;
    std::string DestinationPath;
    std::string Quality;
    uint64_t SizeBytes = 0;
    ImportDecision Decision = ImportDecision::Approved;
    int64_t ImportedAt = 0;
};

// Append-only record of completed transfers. Records are never rewritten or
// removed; each append is flushed before it returns. A ReadWrite ledger owns
// its file through `<path>.lock` from Load on.
class ImportLedger
{
public:
    explicit ImportLedger(std::string LedgerFilePath = "", StoreAccess Access = StoreAccess::ReadWrite);

    // A truncated trailing record (crash mid-append) is dropped with a warning.
    // False when another process holds the lock.
    bool Load();

    // Assigns Id; false when the record could not be durably written
    bool Append(ImportRecord& Record);

    std::vector<ImportRecord> All() const;
    std::vector<ImportRecord> ForQueueItem(uint64_t QueueItemId) const;
    size_t CountFor(uint64_t QueueItemId) const;

private:
    std::string FilePath;
    StoreAccess Access;
    std::unique_ptr<StateLock> WriterLock;
    mutable std::mutex LedgerMutex;
    std::vector<ImportRecord> Records;
    uint64_t NextId = 1;
};
