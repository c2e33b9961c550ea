#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "MediaSettings.hpp"
#include "StateLock.hpp"

enum class QueueStatus : uint8_t
{
    Queued,
    Downloading,
    Paused,
    Completed,
    Importing,
    Imported,
    Failed
};

const char* QueueStatusName(QueueStatus Status);
bool IsTerminal(QueueStatus Status);

// Forward edges a poll or import run may take. Importing -> Completed is not
// listed; only RollBackToCompleted takes it.
bool IsValidTransition(QueueStatus From, QueueStatus To);

// Written right before bytes move, cleared on commit or failure
struct PendingImport
{
    std::string SourcePath;
    std::string DestinationPath;
    std::string Quality;
    uint64_t SizeBytes = 0;
    TransferMode Mode = TransferMode::Move;
};

struct QueueItem
{
    uint64_t Id = 0;
    std::string Title;
    uint64_t LibraryItemId = 0;
    std::string AgentName;
    std::string AgentHandle;
    QueueStatus Status = QueueStatus::Queued;
    std::string ErrorMessage;
    int64_t AddedAt = 0;
    int64_t ImportedAt = 0;
    double Progress = 0.0;
    std::string ContentPath;
    std::optional<PendingImport> Pending;
};

// All queue items behind one mutex. Every mutation is persisted to the state
// file (temp file + rename) when a path is set; an empty path keeps it in memory.
// A ReadWrite store owns the file through `<path>.lock` from Load on, so only one
// process at a time can change it. A mutation whose save fails is undone and
// reports false.
class QueueStore
{
public:
    explicit QueueStore(std::string StateFilePath = "", StoreAccess Access = StoreAccess::ReadWrite);

    // False when the file is unreadable or another process holds the lock
    bool Load();

    std::optional<QueueItem> Add(const std::string& Title, uint64_t LibraryItemId, const std::string& AgentName, const std::string& AgentHandle);

    std::optional<QueueItem> Get(uint64_t Id) const;
    std::vector<QueueItem> All() const;
    std::vector<QueueItem> ItemsForAgent(const std::string& AgentName) const;
    std::vector<QueueItem> ItemsInStatus(QueueStatus Status) const;

    // Rejects edges IsValidTransition does not allow; same-state is a no-op
    bool Transition(uint64_t Id, QueueStatus To);
    bool UpdateProgress(uint64_t Id, double Progress, const std::string& ContentPath);

    // Compare-and-set Completed -> Importing, the per-item import gate
    bool BeginImport(uint64_t Id);
    bool SetPendingImport(uint64_t Id, const PendingImport& Journal);
    bool MarkImported(uint64_t Id);
    bool MarkFailed(uint64_t Id, const std::string& Message);
    bool RollBackToCompleted(uint64_t Id);

private:
    QueueItem* FindLocked(uint64_t Id);
    const QueueItem* FindLocked(uint64_t Id) const;
    bool SaveLocked() const;

    // Saves, or puts Previous back into Item when the save fails
    bool CommitLocked(QueueItem& Item, const QueueItem& Previous);

    std::string FilePath;
    StoreAccess Access;
    std::unique_ptr<StateLock> WriterLock;
    mutable std::mutex QueueMutex;
    std::vector<QueueItem> Items;
    uint64_t NextId = 1;
};
