#include <gtest/gtest.h>

#include "CandidateSelector.hpp"
#include "ImportError.hpp"
#include "TestSupport.hpp"

TEST(CandidateSelectorTest, RecognisesMediaExtensionsCaseInsensitively)
{
    EXPECT_TRUE(CandidateSelector::IsMediaFile("Movie.MKV"));
    EXPECT_TRUE(CandidateSelector::IsMediaFile("clip.m4v"));
    EXPECT_TRUE(CandidateSelector::IsMediaFile("show.ts"));
    EXPECT_FALSE(CandidateSelector::IsMediaFile("readme.nfo"));
    EXPECT_FALSE(CandidateSelector::IsMediaFile("archive.rar"));
    EXPECT_FALSE(CandidateSelector::IsMediaFile("noextension"));
}

TEST(CandidateSelectorTest, PicksLargestFileOverSample)
{
    TempDir Dir;
    WriteFileOfSize(Dir / "Payload/Sample/sample.mkv", 5000);
    WriteFileOfSize(Dir / "Payload/Feature.mkv", 40000);
    WriteFileOfSize(Dir / "Payload/Feature.nfo", 90000);

    CandidateSelector Selector;
    CandidateFile Chosen = Selector.Select(Dir / "Payload");
    EXPECT_EQ(Chosen.Path.filename(), "Feature.mkv");
    EXPECT_EQ(Chosen.Size, 40000u);
}

TEST(CandidateSelectorTest, SelectionIsIdempotent)
{
    TempDir Dir;
    WriteFileOfSize(Dir / "Payload/a.mp4", 100);
    WriteFileOfSize(Dir / "Payload/b/c.mkv", 300);
    WriteFileOfSize(Dir / "Payload/d.avi", 200);

    CandidateSelector Selector;
    CandidateFile First = Selector.Select(Dir / "Payload");
    CandidateFile Second = Selector.Select(Dir / "Payload");
    EXPECT_EQ(First.Path, Second.Path);
    EXPECT_EQ(First.Path.filename(), "c.mkv");
}

TEST(CandidateSelectorTest, TiesGoToFirstInScanOrder)
{
    TempDir Dir;
    WriteFileOfSize(Dir / "Payload/b.mkv", 500);
    WriteFileOfSize(Dir / "Payload/a.mkv", 500);

    CandidateSelector Selector;
    EXPECT_EQ(Selector.Select(Dir / "Payload").Path.filename(), "a.mkv");
}

TEST(CandidateSelectorTest, SingleFilePayloadIsItsOwnCandidate)
{
    TempDir Dir;
    WriteFileOfSize(Dir / "Movie.2024.1080p.mkv", 1234);

    CandidateSelector Selector;
    CandidateFile Chosen = Selector.Select(Dir / "Movie.2024.1080p.mkv");
    EXPECT_EQ(Chosen.Path, Dir / "Movie.2024.1080p.mkv");
    EXPECT_EQ(Chosen.Size, 1234u);
}

TEST(CandidateSelectorTest, NoMediaIsReported)
{
    TempDir Dir;
    WriteFileOfSize(Dir / "Payload/info.nfo", 10);
    WriteFileOfSize(Dir / "Payload/cover.jpg", 10);

    CandidateSelector Selector;
    try
    {
        Selector.Select(Dir / "Payload");
        FAIL() << "expected NoMediaFound";
    }
    catch (const ImportError& e)
    {
        EXPECT_EQ(e.Code(), ImportErrorCode::NoMediaFound);
    }
}

TEST(CandidateSelectorTest, MissingPathIsNotFound)
{
    TempDir Dir;
    CandidateSelector Selector;
    try
    {
        Selector.Select(Dir / "does-not-exist");
        FAIL() << "expected NotFound";
    }
    catch (const ImportError& e)
    {
        EXPECT_EQ(e.Code(), ImportErrorCode::NotFound);
    }
}
