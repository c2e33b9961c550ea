#include <gtest/gtest.h>

#include "ReleaseParser.hpp"

TEST(ReleaseParserTest, ParsesSceneStyleName)
{
    ParsedPayloadInfo Info = ReleaseParser::Parse("The.Big.Match.2024.1080p.WEB-DL.x264-GROUP.mkv");
    EXPECT_EQ(Info.Title, "The Big Match");
    EXPECT_EQ(Info.Year, "2024");
    EXPECT_EQ(Info.Resolution, "1080p");
    EXPECT_EQ(Info.Source, "WEBDL");
    EXPECT_EQ(Info.ReleaseGroup, "GROUP");
    EXPECT_EQ(Info.OriginalName, "The.Big.Match.2024.1080p.WEB-DL.x264-GROUP");
    EXPECT_EQ(ReleaseParser::QualityLabel(Info), "WEBDL-1080p");
}

TEST(ReleaseParserTest, NormalisesFourKAndBluray)
{
    ParsedPayloadInfo Info = ReleaseParser::Parse("Fight_Night_4K_BluRay-TEAM.mkv");
    EXPECT_EQ(Info.Resolution, "2160p");
    EXPECT_EQ(Info.Source, "Bluray");
    EXPECT_EQ(ReleaseParser::QualityLabel(Info), "Bluray-2160p");
}

TEST(ReleaseParserTest, QualityLabelFallsBack)
{
    EXPECT_EQ(ReleaseParser::QualityLabel(ReleaseParser::Parse("Show.HDTV.mkv")), "HDTV");
    EXPECT_EQ(ReleaseParser::QualityLabel(ReleaseParser::Parse("Show.720p.mkv")), "720p");
    EXPECT_EQ(ReleaseParser::QualityLabel(ReleaseParser::Parse("home video.mp4")), "Unknown");
}

TEST(ReleaseParserTest, HyphenInsideSourceIsNotAGroup)
{
    ParsedPayloadInfo Info = ReleaseParser::Parse("Event.720p.WEB-DL.mkv");
    EXPECT_TRUE(Info.ReleaseGroup.empty());
}
