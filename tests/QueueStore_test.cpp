#include <gtest/gtest.h>

#include <memory>

#include "QueueStore.hpp"
#include "TestSupport.hpp"

namespace FS = std::filesystem;

namespace
{
    const QueueStatus AllStatuses[] = {
        QueueStatus::Queued, QueueStatus::Downloading, QueueStatus::Paused, QueueStatus::Completed,
        QueueStatus::Importing, QueueStatus::Imported, QueueStatus::Failed
    };

    QueueItem AddCompleted(QueueStore& Store)
    {
        QueueItem Item = *Store.Add("Main Event", 7, "qbit", "abc123");
        Store.Transition(Item.Id, QueueStatus::Downloading);
        Store.Transition(Item.Id, QueueStatus::Completed);
        return Item;
    }
}

TEST(QueueStoreTest, TransitionTable)
{
    EXPECT_TRUE(IsValidTransition(QueueStatus::Queued, QueueStatus::Downloading));
    EXPECT_TRUE(IsValidTransition(QueueStatus::Queued, QueueStatus::Completed));
    EXPECT_TRUE(IsValidTransition(QueueStatus::Downloading, QueueStatus::Paused));
    EXPECT_TRUE(IsValidTransition(QueueStatus::Paused, QueueStatus::Downloading));
    EXPECT_TRUE(IsValidTransition(QueueStatus::Downloading, QueueStatus::Completed));
    EXPECT_TRUE(IsValidTransition(QueueStatus::Completed, QueueStatus::Importing));
    EXPECT_TRUE(IsValidTransition(QueueStatus::Importing, QueueStatus::Imported));
    EXPECT_TRUE(IsValidTransition(QueueStatus::Importing, QueueStatus::Failed));

    EXPECT_FALSE(IsValidTransition(QueueStatus::Downloading, QueueStatus::Queued));
    EXPECT_FALSE(IsValidTransition(QueueStatus::Completed, QueueStatus::Downloading));
    EXPECT_FALSE(IsValidTransition(QueueStatus::Queued, QueueStatus::Importing));
    EXPECT_FALSE(IsValidTransition(QueueStatus::Completed, QueueStatus::Imported));
    EXPECT_FALSE(IsValidTransition(QueueStatus::Importing, QueueStatus::Completed));
}

TEST(QueueStoreTest, TerminalStatesHaveNoExit)
{
    for (QueueStatus To : AllStatuses)
    {
        EXPECT_FALSE(IsValidTransition(QueueStatus::Imported, To)) << QueueStatusName(To);
        EXPECT_FALSE(IsValidTransition(QueueStatus::Failed, To)) << QueueStatusName(To);
    }

    QueueStore Store;
    QueueItem Item = *Store.Add("t", 1, "a", "h");
    ASSERT_TRUE(Store.MarkFailed(Item.Id, "boom"));
    EXPECT_FALSE(Store.Transition(Item.Id, QueueStatus::Downloading));
    EXPECT_FALSE(Store.MarkFailed(Item.Id, "again"));
    EXPECT_FALSE(Store.BeginImport(Item.Id));
    EXPECT_EQ(Store.Get(Item.Id)->ErrorMessage, "boom");
}

TEST(QueueStoreTest, ImportingOnlyThroughBeginImport)
{
    QueueStore Store;
    QueueItem Item = *Store.Add("t", 1, "a", "h");

    EXPECT_FALSE(Store.BeginImport(Item.Id));
    EXPECT_TRUE(Store.Transition(Item.Id, QueueStatus::Completed));
    EXPECT_FALSE(Store.Transition(Item.Id, QueueStatus::Importing));
    EXPECT_EQ(Store.Get(Item.Id)->Status, QueueStatus::Completed);

    EXPECT_TRUE(Store.BeginImport(Item.Id));
    EXPECT_FALSE(Store.BeginImport(Item.Id));
    EXPECT_EQ(Store.Get(Item.Id)->Status, QueueStatus::Importing);
}

TEST(QueueStoreTest, BackwardTransitionIgnored)
{
    QueueStore Store;
    QueueItem Item = AddCompleted(Store);

    EXPECT_FALSE(Store.Transition(Item.Id, QueueStatus::Downloading));
    EXPECT_TRUE(Store.Transition(Item.Id, QueueStatus::Completed));
    EXPECT_EQ(Store.Get(Item.Id)->Status, QueueStatus::Completed);
}

TEST(QueueStoreTest, MarkImportedClearsJournal)
{
    QueueStore Store;
    QueueItem Item = AddCompleted(Store);
    EXPECT_FALSE(Store.MarkImported(Item.Id));

    ASSERT_TRUE(Store.BeginImport(Item.Id));
    PendingImport Journal;
    Journal.SourcePath = "/dl/a.mkv";
    Journal.DestinationPath = "/lib/a.mkv";
    ASSERT_TRUE(Store.SetPendingImport(Item.Id, Journal));
    ASSERT_TRUE(Store.MarkImported(Item.Id));

    QueueItem Done = *Store.Get(Item.Id);
    EXPECT_EQ(Done.Status, QueueStatus::Imported);
    EXPECT_FALSE(Done.Pending.has_value());
    EXPECT_DOUBLE_EQ(Done.Progress, 100.0);
    EXPECT_GT(Done.ImportedAt, 0);
}

TEST(QueueStoreTest, JournalRequiresImporting)
{
    QueueStore Store;
    QueueItem Item = AddCompleted(Store);
    EXPECT_FALSE(Store.SetPendingImport(Item.Id, PendingImport{}));
}

TEST(QueueStoreTest, RollBackReturnsToCompleted)
{
    QueueStore Store;
    QueueItem Item = AddCompleted(Store);
    EXPECT_FALSE(Store.RollBackToCompleted(Item.Id));

    ASSERT_TRUE(Store.BeginImport(Item.Id));
    ASSERT_TRUE(Store.SetPendingImport(Item.Id, PendingImport{}));
    ASSERT_TRUE(Store.RollBackToCompleted(Item.Id));

    QueueItem After = *Store.Get(Item.Id);
    EXPECT_EQ(After.Status, QueueStatus::Completed);
    EXPECT_FALSE(After.Pending.has_value());
    EXPECT_TRUE(Store.BeginImport(Item.Id));
}

TEST(QueueStoreTest, PersistsAcrossReload)
{
    TempDir Dir;
    const std::string StateFile = (Dir / "state/queue.bin").string();
    uint64_t ImportingId = 0;
    uint64_t QueuedId = 0;
    {
        QueueStore Store(StateFile);
        ASSERT_TRUE(Store.Load());
        QueueItem First = AddCompleted(Store);
        ASSERT_TRUE(Store.UpdateProgress(First.Id, 100.0, "/downloads/Main Event"));
        ASSERT_TRUE(Store.BeginImport(First.Id));

        PendingImport Journal;
        Journal.SourcePath = "/downloads/Main Event/main.mkv";
        Journal.DestinationPath = "/library/Main Event/Main Event.mkv";
        Journal.Quality = "WEBDL-1080p";
        Journal.SizeBytes = 4000;
        Journal.Mode = TransferMode::Copy;
        ASSERT_TRUE(Store.SetPendingImport(First.Id, Journal));
        ImportingId = First.Id;

        QueuedId = Store.Add("Second", 9, "sab", "SABnzbd_nzo_1")->Id;
    }

    QueueStore Reloaded(StateFile);
    ASSERT_TRUE(Reloaded.Load());
    ASSERT_EQ(Reloaded.All().size(), 2u);

    QueueItem First = *Reloaded.Get(ImportingId);
    EXPECT_EQ(First.Status, QueueStatus::Importing);
    EXPECT_EQ(First.ContentPath, "/downloads/Main Event");
    EXPECT_EQ(First.LibraryItemId, 7u);
    ASSERT_TRUE(First.Pending.has_value());
    EXPECT_EQ(First.Pending->DestinationPath, "/library/Main Event/Main Event.mkv");
    EXPECT_EQ(First.Pending->SizeBytes, 4000u);
    EXPECT_EQ(First.Pending->Mode, TransferMode::Copy);

    EXPECT_EQ(Reloaded.Get(QueuedId)->AgentHandle, "SABnzbd_nzo_1");
    EXPECT_EQ(Reloaded.ItemsForAgent("sab").size(), 1u);
    EXPECT_EQ(Reloaded.ItemsInStatus(QueueStatus::Importing).size(), 1u);

    // Ids keep increasing after a reload
    EXPECT_GT(Reloaded.Add("Third", 1, "qbit", "h")->Id, QueuedId);
}

TEST(QueueStoreTest, RejectsForeignFile)
{
    TempDir Dir;
    {
        std::ofstream Out(Dir / "queue.bin", std::ios::binary);
        Out << "not a queue file";
    }
    QueueStore Store((Dir / "queue.bin").string());
    EXPECT_FALSE(Store.Load());
}

TEST(QueueStoreTest, SecondWriterOnSameFileIsRefused)
{
    TempDir Dir;
    const std::string StateFile = (Dir / "state/queue.bin").string();

    auto Owner = std::make_unique<QueueStore>(StateFile);
    ASSERT_TRUE(Owner->Load());
    QueueItem Existing = *Owner->Add("Existing", 1, "qbit", "h1");

    // A second writer cannot load, so it cannot overwrite the owner's items
    QueueStore Intruder(StateFile);
    EXPECT_FALSE(Intruder.Load());
    EXPECT_FALSE(Intruder.Add("Grabbed", 2, "qbit", "h2").has_value());
    EXPECT_TRUE(Intruder.All().empty());

    ASSERT_TRUE(Owner->Transition(Existing.Id, QueueStatus::Downloading));

    // Readers see the owner's last save without taking the lock
    QueueStore Reader(StateFile, StoreAccess::ReadOnly);
    ASSERT_TRUE(Reader.Load());
    ASSERT_EQ(Reader.All().size(), 1u);
    EXPECT_EQ(Reader.Get(Existing.Id)->Status, QueueStatus::Downloading);
    EXPECT_FALSE(Reader.Transition(Existing.Id, QueueStatus::Completed));
    EXPECT_FALSE(Reader.Add("Grabbed", 2, "qbit", "h2").has_value());

    // Once the owner is gone the next writer takes over with everything intact
    Owner.reset();
    ASSERT_TRUE(Intruder.Load());
    ASSERT_EQ(Intruder.All().size(), 1u);
    EXPECT_EQ(Intruder.Get(Existing.Id)->Title, "Existing");
    std::optional<QueueItem> Grabbed = Intruder.Add("Grabbed", 2, "qbit", "h2");
    ASSERT_TRUE(Grabbed.has_value());
    EXPECT_GT(Grabbed->Id, Existing.Id);
}

TEST(QueueStoreTest, ImportGateHoldsAcrossTwoStores)
{
    TempDir Dir;
    const std::string StateFile = (Dir / "queue.bin").string();

    QueueStore Daemon(StateFile);
    ASSERT_TRUE(Daemon.Load());
    QueueItem Item = AddCompleted(Daemon);

    QueueStore Cli(StateFile);
    EXPECT_FALSE(Cli.Load());
    EXPECT_TRUE(Daemon.BeginImport(Item.Id));
    EXPECT_FALSE(Cli.BeginImport(Item.Id));
}

TEST(QueueStoreTest, FailedSaveLeavesItemUnchanged)
{
    TempDir Dir;
    const FS::path StateFile = Dir / "queue.bin";
    FS::path Blocker = StateFile;
    Blocker += ".tmp";

    QueueStore Store(StateFile.string());
    ASSERT_TRUE(Store.Load());
    QueueItem Item = AddCompleted(Store);

    // A folder where the temp file goes makes every save fail
    FS::create_directories(Blocker / "held");

    EXPECT_FALSE(Store.BeginImport(Item.Id));
    EXPECT_EQ(Store.Get(Item.Id)->Status, QueueStatus::Completed);
    EXPECT_FALSE(Store.MarkFailed(Item.Id, "boom"));
    EXPECT_EQ(Store.Get(Item.Id)->Status, QueueStatus::Completed);
    EXPECT_TRUE(Store.Get(Item.Id)->ErrorMessage.empty());
    EXPECT_FALSE(Store.UpdateProgress(Item.Id, 42.0, "/downloads/x"));
    EXPECT_DOUBLE_EQ(Store.Get(Item.Id)->Progress, 0.0);
    EXPECT_FALSE(Store.Add("Lost", 2, "qbit", "h2").has_value());
    EXPECT_EQ(Store.All().size(), 1u);

    FS::remove_all(Blocker);

    ASSERT_TRUE(Store.BeginImport(Item.Id));
    ASSERT_TRUE(Store.SetPendingImport(Item.Id, PendingImport{}));
    FS::create_directories(Blocker / "held");
    EXPECT_FALSE(Store.MarkImported(Item.Id));
    EXPECT_FALSE(Store.RollBackToCompleted(Item.Id));
    QueueItem Held = *Store.Get(Item.Id);
    EXPECT_EQ(Held.Status, QueueStatus::Importing);
    EXPECT_TRUE(Held.Pending.has_value());

    // The id given back by the failed Add is reused
    FS::remove_all(Blocker);
    std::optional<QueueItem> Next = Store.Add("Kept", 2, "qbit", "h2");
    ASSERT_TRUE(Next.has_value());
    EXPECT_EQ(Next->Id, Item.Id + 1);

    QueueStore Reader(StateFile.string(), StoreAccess::ReadOnly);
    ASSERT_TRUE(Reader.Load());
    EXPECT_EQ(Reader.Get(Item.Id)->Status, QueueStatus::Importing);
    EXPECT_EQ(Reader.All().size(), 2u);
}
