#include "QueueStore.hpp"
#include "BinaryIO.hpp"
#include "Logger.hpp"
#include "TimeUtils.hpp"

#include <algorithm>
#include <filesystem>

namespace FS = std::filesystem;

namespace
{
    constexpr uint32_t QUEUE_FILE_MAGIC = 0x51464D49; // "IMFQ"
    constexpr uint32_t QUEUE_FILE_VERSION = 1;

    bool WriteItem(std::ofstream& file, const QueueItem& item)
    {
        if (!WriteBinary(file, item.Id)) return false;
        if (!WriteString(file, item.Title)) return false;
        if (!WriteBinary(file, item.LibraryItemId)) return false;
        if (!WriteString(file, item.AgentName)) return false;
        if (!WriteString(file, item.AgentHandle)) return false;
        if (!WriteBinary(file, static_cast<uint8_t>(item.Status))) return false;
        if (!WriteString(file, item.ErrorMessage)) return false;
        if (!WriteBinary(file, item.AddedAt)) return false;
        if (!WriteBinary(file, item.ImportedAt)) return false;
        if (!WriteBinary(file, item.Progress)) return false;
        if (!WriteString(file, item.ContentPath)) return false;

        uint8_t hasJournal = item.Pending ? 1 : 0;
        if (!WriteBinary(file, hasJournal)) return false;
        if (item.Pending)
        {
            if (!WriteString(file, item.Pending->SourcePath)) return false;
            if (!WriteString(file, item.Pending->DestinationPath)) return false;
            if (!WriteString(file, item.Pending->Quality)) return false;
            if (!WriteBinary(file, item.Pending->SizeBytes)) return false;
            if (!WriteBinary(file, static_cast<uint8_t>(item.Pending->Mode))) return false;
        }
        return true;
    }

    bool ReadItem(std::ifstream& file, QueueItem& item)
    {
        uint8_t status = 0;
        if (!ReadBinary(file, item.Id)) return false;
        if (!ReadString(file, item.Title)) return false;
        if (!ReadBinary(file, item.LibraryItemId)) return false;
        if (!ReadString(file, item.AgentName)) return false;
        if (!ReadString(file, item.AgentHandle)) return false;
        if (!ReadBinary(file, status) || status > static_cast<uint8_t>(QueueStatus::Failed)) return false;
        item.Status = static_cast<QueueStatus>(status);
        if (!ReadString(file, item.ErrorMessage)) return false;
        if (!ReadBinary(file, item.AddedAt)) return false;
        if (!ReadBinary(file, item.ImportedAt)) return false;
        if (!ReadBinary(file, item.Progress)) return false;
        if (!ReadString(file, item.ContentPath)) return false;

        uint8_t hasJournal = 0;
        if (!ReadBinary(file, hasJournal)) return false;
        if (hasJournal)
        {
            PendingImport journal;
            uint8_t mode = 0;
            if (!ReadString(file, journal.SourcePath)) return false;
            if (!ReadString(file, journal.DestinationPath)) return false;
            if (!ReadString(file, journal.Quality)) return false;
            if (!ReadBinary(file, journal.SizeBytes)) return false;
            if (!ReadBinary(file, mode) || mode > static_cast<uint8_t>(TransferMode::Hardlink)) return false;
            journal.Mode = static_cast<TransferMode>(mode);
            item.Pending = std::move(journal);
        }
        return true;
    }
}

const char* QueueStatusName(QueueStatus Status)
{
    switch (Status)
    {
    case QueueStatus::Queued:      return "Queued";
    case QueueStatus::Downloading: return "Downloading";
    case QueueStatus::Paused:      return "Paused";
    case QueueStatus::Completed:   return "Completed";
    case QueueStatus::Importing:   return "Importing";
    case QueueStatus::Imported:    return "Imported";
    case QueueStatus::Failed:      return "Failed";
    }
    return "Unknown";
}

bool IsTerminal(QueueStatus Status)
{
    return Status == QueueStatus::Imported || Status == QueueStatus::Failed;
}

bool IsValidTransition(QueueStatus From, QueueStatus To)
{
    if (IsTerminal(From) || From == To)
    {
        return false;
    }
    if (To == QueueStatus::Failed)
    {
        return true;
    }

    switch (From)
    {
    case QueueStatus::Queued:
        return To == QueueStatus::Downloading || To == QueueStatus::Paused || To == QueueStatus::Completed;
    case QueueStatus::Downloading:
        return To == QueueStatus::Paused || To == QueueStatus::Completed;
    case QueueStatus::Paused:
        return To == QueueStatus::Downloading || To == QueueStatus::Completed;
    case QueueStatus::Completed:
        return To == QueueStatus::Importing;
    case QueueStatus::Importing:
        return To == QueueStatus::Imported;
    default:
        return false;
    }
}

QueueStore::QueueStore(std::string StateFilePath, StoreAccess Access) : FilePath(std::move(StateFilePath)), Access(Access)
{
}

bool QueueStore::Load()
{
    std::lock_guard<std::mutex> lock(QueueMutex);
    Items.clear();
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
            Log.Error("[QueueStore] Queue state is owned by another importflow process: " + FilePath);
            return false;
        }
    }

    std::ifstream file(FilePath, std::ios::binary);
    if (!file)
    {
        Log.Info("[QueueStore] Starting fresh. No queue state found at: " + FilePath);
        return true;
    }

    uint32_t magic = 0;
    uint32_t version = 0;
    uint32_t count = 0;
    if (!ReadBinary(file, magic) || magic != QUEUE_FILE_MAGIC || !ReadBinary(file, version) || version != QUEUE_FILE_VERSION
        || !ReadBinary(file, count))
    {
        Log.Error("[QueueStore] Unrecognised queue state file: " + FilePath);
        return false;
    }

    for (uint32_t i = 0; i < count; ++i)
    {
        QueueItem item;
        if (!ReadItem(file, item))
        {
            Log.Error("[QueueStore] Queue state truncated after " + std::to_string(i) + " of " + std::to_string(count) + " items");
            Items.clear();
            return false;
        }
        NextId = std::max(NextId, item.Id + 1);
        Items.push_back(std::move(item));
    }

    Log.Info("[QueueStore] Loaded " + std::to_string(Items.size()) + " queue items");
    return true;
}

bool QueueStore::SaveLocked() const
{
    if (FilePath.empty())
    {
        return true;
    }
    if (Access == StoreAccess::ReadOnly || !WriterLock || !WriterLock->IsHeld())
    {
        Log.Error("[QueueStore] Refusing to write queue state without owning it: " + FilePath);
        return false;
    }

    std::error_code ec;
    FS::path target(FilePath);
    if (target.has_parent_path())
    {
        FS::create_directories(target.parent_path(), ec);
    }

    FS::path temp = target;
    temp += ".tmp";
    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file)
        {
            Log.Error("[QueueStore] Failed to open queue state for writing: " + temp.string());
            return false;
        }

        bool ok = WriteBinary(file, QUEUE_FILE_MAGIC) && WriteBinary(file, QUEUE_FILE_VERSION)
            && WriteBinary(file, static_cast<uint32_t>(Items.size()));
        for (const QueueItem& item : Items)
        {
            ok = ok && WriteItem(file, item);
        }
        file.flush();
        if (!ok || !file)
        {
            Log.Error("[QueueStore] Failed writing queue state: " + temp.string());
            file.close();
            FS::remove(temp, ec);
            return false;
        }
    }

    FS::rename(temp, target, ec);
    if (ec)
    {
        Log.Error("[QueueStore] Failed to replace queue state " + FilePath + ": " + ec.message());
        return false;
    }
    return true;
}

QueueItem* QueueStore::FindLocked(uint64_t Id)
{
    for (QueueItem& item : Items)
    {
        if (item.Id == Id)
        {
            return &item;
        }
    }
    return nullptr;
}

const QueueItem* QueueStore::FindLocked(uint64_t Id) const
{
    for (const QueueItem& item : Items)
    {
        if (item.Id == Id)
        {
            return &item;
        }
    }
    return nullptr;
}

bool QueueStore::CommitLocked(QueueItem& Item, const QueueItem& Previous)
{
    if (SaveLocked())
    {
        return true;
    }
    Item = Previous;
    return false;
}

std::optional<QueueItem> QueueStore::Add(const std::string& Title, uint64_t LibraryItemId, const std::string& AgentName, const std::string& AgentHandle)
{
    std::lock_guard<std::mutex> lock(QueueMutex);
    QueueItem item;
    item.Id = NextId++;
    item.Title = Title;
    item.LibraryItemId = LibraryItemId;
    item.AgentName = AgentName;
    item.AgentHandle = AgentHandle;
    item.Status = QueueStatus::Queued;
    item.AddedAt = NowUnix();
    Items.push_back(item);
    if (!SaveLocked())
    {
        Items.pop_back();
        --NextId;
        return std::nullopt;
    }

    Log.Info("[QueueStore] Added queue item " + std::to_string(item.Id) + " '" + Title + "' on " + AgentName + " (" + AgentHandle + ")");
    return item;
}

std::optional<QueueItem> QueueStore::Get(uint64_t Id) const
{
    std::lock_guard<std::mutex> lock(QueueMutex);
    const QueueItem* item = FindLocked(Id);
    if (item == nullptr)
    {
        return std::nullopt;
    }
    return *item;
}

std::vector<QueueItem> QueueStore::All() const
{
    std::lock_guard<std::mutex> lock(QueueMutex);
    return Items;
}

std::vector<QueueItem> QueueStore::ItemsForAgent(const std::string& AgentName) const
{
    std::lock_guard<std::mutex> lock(QueueMutex);
    std::vector<QueueItem> result;
    for (const QueueItem& item : Items)
    {
        if (item.AgentName == AgentName)
        {
            result.push_back(item);
        }
    }
    return result;
}

std::vector<QueueItem> QueueStore::ItemsInStatus(QueueStatus Status) const
{
    std::lock_guard<std::mutex> lock(QueueMutex);
    std::vector<QueueItem> result;
    for (const QueueItem& item : Items)
    {
        if (item.Status == Status)
        {
            result.push_back(item);
        }
    }
    return result;
}

bool QueueStore::Transition(uint64_t Id, QueueStatus To)
{
    std::lock_guard<std::mutex> lock(QueueMutex);
    QueueItem* item = FindLocked(Id);
    if (item == nullptr)
    {
        return false;
    }
    if (item->Status == To)
    {
        return true;
    }
    if (To == QueueStatus::Importing || To == QueueStatus::Imported || To == QueueStatus::Failed || !IsValidTransition(item->Status, To))
    {
        Log.Warn("[QueueStore] Ignoring transition " + std::string(QueueStatusName(item->Status)) + " -> " + QueueStatusName(To)
            + " for item " + std::to_string(Id));
        return false;
    }

    const QueueItem previous = *item;
    item->Status = To;
    if (!CommitLocked(*item, previous))
    {
        return false;
    }
    Log.Info("[QueueStore] Item " + std::to_string(Id) + ": " + QueueStatusName(previous.Status) + " -> " + QueueStatusName(To));
    return true;
}

bool QueueStore::UpdateProgress(uint64_t Id, double Progress, const std::string& ContentPath)
{
    std::lock_guard<std::mutex> lock(QueueMutex);
    QueueItem* item = FindLocked(Id);
    if (item == nullptr || IsTerminal(item->Status))
    {
        return false;
    }
    if (item->Progress == Progress && (ContentPath.empty() || item->ContentPath == ContentPath))
    {
        return true;
    }
    const QueueItem previous = *item;
    item->Progress = Progress;
    if (!ContentPath.empty())
    {
        item->ContentPath = ContentPath;
    }
    return CommitLocked(*item, previous);
}

bool QueueStore::BeginImport(uint64_t Id)
{
    std::lock_guard<std::mutex> lock(QueueMutex);
    QueueItem* item = FindLocked(Id);
    if (item == nullptr || item->Status != QueueStatus::Completed)
    {
        return false;
    }
    const QueueItem previous = *item;
    item->Status = QueueStatus::Importing;
    item->ErrorMessage.clear();
    if (!CommitLocked(*item, previous))
    {
        return false;
    }
    Log.Info("[QueueStore] Item " + std::to_string(Id) + ": Completed -> Importing");
    return true;
}

bool QueueStore::SetPendingImport(uint64_t Id, const PendingImport& Journal)
{
    std::lock_guard<std::mutex> lock(QueueMutex);
    QueueItem* item = FindLocked(Id);
    if (item == nullptr || item->Status != QueueStatus::Importing)
    {
        return false;
    }
    const QueueItem previous = *item;
    item->Pending = Journal;
    return CommitLocked(*item, previous);
}

bool QueueStore::MarkImported(uint64_t Id)
{
    std::lock_guard<std::mutex> lock(QueueMutex);
    QueueItem* item = FindLocked(Id);
    if (item == nullptr || item->Status != QueueStatus::Importing)
    {
        return false;
    }
    const QueueItem previous = *item;
    item->Status = QueueStatus::Imported;
    item->ImportedAt = NowUnix();
    item->Progress = 100.0;
    item->Pending.reset();
    if (!CommitLocked(*item, previous))
    {
        return false;
    }
    Log.Info("[QueueStore] Item " + std::to_string(Id) + ": Importing -> Imported");
    return true;
}

bool QueueStore::MarkFailed(uint64_t Id, const std::string& Message)
{
    std::lock_guard<std::mutex> lock(QueueMutex);
    QueueItem* item = FindLocked(Id);
    if (item == nullptr || IsTerminal(item->Status))
    {
        return false;
    }
    const QueueItem previous = *item;
    item->Status = QueueStatus::Failed;
    item->ErrorMessage = Message;
    item->Pending.reset();
    if (!CommitLocked(*item, previous))
    {
        return false;
    }
    Log.Error("[QueueStore] Item " + std::to_string(Id) + ": " + QueueStatusName(previous.Status) + " -> Failed: " + Message);
    return true;
}

bool QueueStore::RollBackToCompleted(uint64_t Id)
{
    std::lock_guard<std::mutex> lock(QueueMutex);
    QueueItem* item = FindLocked(Id);
    if (item == nullptr || item->Status != QueueStatus::Importing)
    {
        return false;
    }
    const QueueItem previous = *item;
    item->Status = QueueStatus::Completed;
    item->Pending.reset();
    if (!CommitLocked(*item, previous))
    {
        return false;
    }
    Log.Warn("[QueueStore] Item " + std::to_string(Id) + ": Importing -> Completed (rolled back)");
    return true;
}
