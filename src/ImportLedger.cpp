#include "ImportLedger.hpp"
#include "BinaryIO.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <filesystem>
#include <sstream>

namespace FS = std::filesystem;

namespace
{
    constexpr uint32_t RECORD_MARKER = 0x52434C49; // "ILCR"

    bool ReadRecord(std::istream& file, ImportRecord& record)
    {
        uint32_t marker = 0;
        uint8_t decision = 0;
        if (!ReadBinary(file, marker) || marker != RECORD_MARKER) return false;
        if (!ReadBinary(file, record.Id)) return false;
        if (!ReadBinary(file, record.QueueItemId)) return false;
        if (!ReadBinary(file, record.LibraryItemId)) return false;
        if (!ReadString(file, record.SourcePath)) return false;
        if (!ReadString(file, record.DestinationPath)) return false;
        if (!ReadString(file, record.Quality)) return false;
        if (!ReadBinary(file, record.SizeBytes)) return false;
        if (!ReadBinary(file, decision) || decision > static_cast<uint8_t>(ImportDecision::RejectedTransferFailure)) return false;
        record.Decision = static_cast<ImportDecision>(decision);
        if (!ReadBinary(file, record.ImportedAt)) return false;
        return true;
    }

    bool WriteRecord(std::ostream& file, const ImportRecord& record)
    {
        return WriteBinary(file, RECORD_MARKER)
            && WriteBinary(file, record.Id)
            && WriteBinary(file, record.QueueItemId)
            && WriteBinary(file, record.LibraryItemId)
            && WriteString(file, record.SourcePath)
            && WriteString(file, record.DestinationPath)
            && WriteString(file, record.Quality)
            && WriteBinary(file, record.SizeBytes)
            && WriteBinary(file, static_cast<uint8_t>(record.Decision))
            && WriteBinary(file, record.ImportedAt);
    }
}

const char* ImportDecisionName(ImportDecision Decision)
{
    switch (Decision)
    {
    case ImportDecision::Approved:                  return "Approved";
    case ImportDecision::RejectedInsufficientSpace: return "Rejected (insufficient space)";
    case ImportDecision::RejectedNoMedia:           return "Rejected (no media)";
    case ImportDecision::RejectedTransferFailure:   return "Rejected (transfer failure)";
    }
    return "Unknown";
}

ImportLedger::ImportLedger(std::string LedgerFilePath, StoreAccess Access) : FilePath(std::move(LedgerFilePath)), Access(Access)
{
}

bool ImportLedger::Load()
{
    std::lock_guard<std::mutex> lock(LedgerMutex);
    Records.clear();
    NextId = 1;

    if (FilePath.empty())
    {
        return true;
    }

    if (Access == StoreAccess::ReadWrite)
    {
        if (!WriterLock)
        {
            WriterLock = std::make_unique<StateLock>(FilePath + ".lock");
        }
        if (!WriterLock->TryAcquire())
        {
            Log.Error("[ImportLedger] Ledger is owned by another importflow process: " + FilePath);
            return false;
        }
    }

    std::ifstream file(FilePath, std::ios::binary);
    if (!file)
    {
        Log.Info("[ImportLedger] Starting fresh. No ledger found at: " + FilePath);
        return true;
    }

    std::streamoff goodEnd = 0;
    bool truncated = false;
    while (file.peek() != std::char_traits<char>::eof())
    {
        ImportRecord record;
        if (!ReadRecord(file, record))
        {
            Log.Warn("[ImportLedger] Ignoring truncated record at the end of " + FilePath + " after " + std::to_string(Records.size()) + " records");
            truncated = true;
            break;
        }
        goodEnd = static_cast<std::streamoff>(file.tellg());
        NextId = std::max(NextId, record.Id + 1);
        Records.push_back(std::move(record));
    }
    file.close();

    // Cut the partial tail so later appends follow the last whole record
    if (truncated && Access == StoreAccess::ReadWrite)
    {
        std::error_code ec;
        FS::resize_file(FilePath, static_cast<uintmax_t>(goodEnd), ec);
        if (ec)
        {
            Log.Error("[ImportLedger] Could not trim ledger tail: " + ec.message());
            return false;
        }
    }

    Log.Info("[ImportLedger] Loaded " + std::to_string(Records.size()) + " import records");
    return true;
}

bool ImportLedger::Append(ImportRecord& Record)
{
    std::lock_guard<std::mutex> lock(LedgerMutex);
    Record.Id = NextId;

    if (!FilePath.empty())
    {
        if (Access == StoreAccess::ReadOnly || !WriterLock || !WriterLock->IsHeld())
        {
            Log.Error("[ImportLedger] Refusing to append without owning the ledger: " + FilePath);
            return false;
        }

        std::error_code ec;
        FS::path target(FilePath);
        if (target.has_parent_path())
        {
            FS::create_directories(target.parent_path(), ec);
        }

        // Serialise first so a record reaches the file in a single write
        std::ostringstream buffer(std::ios::binary);
        WriteRecord(buffer, Record);
        const std::string bytes = buffer.str();

        std::ofstream file(FilePath, std::ios::binary | std::ios::app);
        if (!file)
        {
            Log.Error("[ImportLedger] Failed to open ledger for append: " + FilePath);
            return false;
        }
        file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        file.flush();
        if (!file)
        {
            Log.Error("[ImportLedger] Failed to append record for queue item " + std::to_string(Record.QueueItemId));
            return false;
        }
    }

    ++NextId;
    Records.push_back(Record);
    Log.Info("[ImportLedger] Recorded import " + std::to_string(Record.Id) + " for queue item " + std::to_string(Record.QueueItemId)
        + ": " + Record.DestinationPath);
    return true;
}

std::vector<ImportRecord> ImportLedger::All() const
{
    std::lock_guard<std::mutex> lock(LedgerMutex);
    return Records;
}

std::vector<ImportRecord> ImportLedger::ForQueueItem(uint64_t QueueItemId) const
{
    std::lock_guard<std::mutex> lock(LedgerMutex);
    std::vector<ImportRecord> result;
    for (const ImportRecord& record : Records)
    {
        if (record.QueueItemId == QueueItemId)
        {
            result.push_back(record);
        }
    }
    return result;
}

size_t ImportLedger::CountFor(uint64_t QueueItemId) const
{
    std::lock_guard<std::mutex> lock(LedgerMutex);
    return static_cast<size_t>(std::count_if(Records.begin(), Records.end(), [QueueItemId](const ImportRecord& record)
    {
        return record.QueueItemId == QueueItemId;
    }));
}
