#include <gtest/gtest.h>

#include "ImportLedger.hpp"
#include "TestSupport.hpp"

namespace
{
    ImportRecord MakeRecord(uint64_t QueueItemId, const std::string& Destination)
    {
        ImportRecord Record;
        Record.QueueItemId = QueueItemId;
        Record.LibraryItemId = QueueItemId * 10;
        Record.SourcePath = "/downloads/" + std::to_string(QueueItemId) + ".mkv";
        Record.DestinationPath = Destination;
        Record.Quality = "WEBDL-1080p";
        Record.SizeBytes = 4000;
        Record.ImportedAt = 1710000000;
        return Record;
    }
}

TEST(ImportLedgerTest, AppendAssignsIdsAndSurvivesReload)
{
    TempDir Dir;
    const std::string LedgerFile = (Dir / "ledger.bin").string();
    {
        ImportLedger Ledger(LedgerFile);
        ASSERT_TRUE(Ledger.Load());
        ImportRecord First = MakeRecord(1, "/lib/one.mkv");
        ImportRecord Second = MakeRecord(2, "/lib/two.mkv");
        ASSERT_TRUE(Ledger.Append(First));
        ASSERT_TRUE(Ledger.Append(Second));
        EXPECT_EQ(First.Id, 1u);
        EXPECT_EQ(Second.Id, 2u);
    }

    ImportLedger Reloaded(LedgerFile);
    ASSERT_TRUE(Reloaded.Load());
    std::vector<ImportRecord> Records = Reloaded.All();
    ASSERT_EQ(Records.size(), 2u);
    EXPECT_EQ(Records[1].DestinationPath, "/lib/two.mkv");
    EXPECT_EQ(Records[1].LibraryItemId, 20u);
    EXPECT_EQ(Records[1].Decision, ImportDecision::Approved);
    EXPECT_EQ(Records[0].ImportedAt, 1710000000);

    ImportRecord Third = MakeRecord(3, "/lib/three.mkv");
    ASSERT_TRUE(Reloaded.Append(Third));
    EXPECT_EQ(Third.Id, 3u);
}

TEST(ImportLedgerTest, TruncatedTailIsDroppedAndAppendsContinue)
{
    TempDir Dir;
    const std::string LedgerFile = (Dir / "ledger.bin").string();
    {
        ImportLedger Ledger(LedgerFile);
        ASSERT_TRUE(Ledger.Load());
        ImportRecord Record = MakeRecord(1, "/lib/one.mkv");
        ASSERT_TRUE(Ledger.Append(Record));
    }
    const uintmax_t WholeSize = std::filesystem::file_size(LedgerFile);
    {
        // Half a record: marker plus a few id bytes
        std::ofstream Out(LedgerFile, std::ios::binary | std::ios::app);
        const char Partial[] = { 0x49, 0x4C, 0x43, 0x52, 0x02, 0x00 };
        Out.write(Partial, sizeof(Partial));
    }

    {
        ImportLedger Ledger(LedgerFile);
        ASSERT_TRUE(Ledger.Load());
        EXPECT_EQ(Ledger.All().size(), 1u);
        EXPECT_EQ(std::filesystem::file_size(LedgerFile), WholeSize);

        ImportRecord Next = MakeRecord(2, "/lib/two.mkv");
        ASSERT_TRUE(Ledger.Append(Next));
    }

    ImportLedger Reloaded(LedgerFile);
    ASSERT_TRUE(Reloaded.Load());
    ASSERT_EQ(Reloaded.All().size(), 2u);
    EXPECT_EQ(Reloaded.All()[1].DestinationPath, "/lib/two.mkv");
}

TEST(ImportLedgerTest, LookupByQueueItem)
{
    ImportLedger Ledger;
    ImportRecord A = MakeRecord(5, "/lib/a.mkv");
    ImportRecord B = MakeRecord(6, "/lib/b.mkv");
    ImportRecord C = MakeRecord(5, "/lib/c.mkv");
    Ledger.Append(A);
    Ledger.Append(B);
    Ledger.Append(C);

    EXPECT_EQ(Ledger.CountFor(5), 2u);
    EXPECT_EQ(Ledger.CountFor(6), 1u);
    EXPECT_EQ(Ledger.CountFor(7), 0u);
    std::vector<ImportRecord> ForFive = Ledger.ForQueueItem(5);
    ASSERT_EQ(ForFive.size(), 2u);
    EXPECT_EQ(ForFive[1].DestinationPath, "/lib/c.mkv");
}

TEST(ImportLedgerTest, MissingFileStartsEmpty)
{
    TempDir Dir;
    ImportLedger Ledger((Dir / "absent.bin").string());
    EXPECT_TRUE(Ledger.Load());
    EXPECT_TRUE(Ledger.All().empty());
}

TEST(ImportLedgerTest, OnlyOneWriterPerFile)
{
    TempDir Dir;
    const std::string LedgerFile = (Dir / "ledger.bin").string();

    ImportLedger Owner(LedgerFile);
    ASSERT_TRUE(Owner.Load());
    ImportRecord First = MakeRecord(1, "/lib/one.mkv");
    ASSERT_TRUE(Owner.Append(First));

    ImportLedger Second(LedgerFile);
    EXPECT_FALSE(Second.Load());
    ImportRecord Duplicate = MakeRecord(1, "/lib/one.mkv");
    EXPECT_FALSE(Second.Append(Duplicate));

    ImportLedger Reader(LedgerFile, StoreAccess::ReadOnly);
    ASSERT_TRUE(Reader.Load());
    EXPECT_EQ(Reader.CountFor(1), 1u);
    ImportRecord FromReader = MakeRecord(2, "/lib/two.mkv");
    EXPECT_FALSE(Reader.Append(FromReader));

    ImportLedger Check(LedgerFile, StoreAccess::ReadOnly);
    ASSERT_TRUE(Check.Load());
    EXPECT_EQ(Check.All().size(), 1u);
}
