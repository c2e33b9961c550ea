#include <gtest/gtest.h>

#include "LibraryCatalog.hpp"
#include "TestSupport.hpp"

TEST(JsonLibraryCatalogTest, LoadsAndPersistsStatus)
{
    TempDir Dir;
    const auto CatalogPath = Dir / "Library.json";
    {
        std::ofstream Out(CatalogPath);
        Out << R"({ "items": [
            { "id": 1, "title": "Main Event: Night One", "airDate": "2024-03-09", "status": "Wanted" },
            { "id": 2, "title": "Undercard" },
            { "title": "no id" }
        ] })";
    }

    {
        JsonLibraryCatalog Catalog(CatalogPath.string());
        ASSERT_TRUE(Catalog.Load());
        ASSERT_EQ(Catalog.Items().size(), 2u);
        EXPECT_EQ(Catalog.GetItem(2)->Status, "Wanted");
        EXPECT_EQ(Catalog.GetItem(1)->AirDate, "2024-03-09");
        EXPECT_FALSE(Catalog.GetItem(3).has_value());

        EXPECT_TRUE(Catalog.UpdateStatus(1, LibraryStatusDownloaded));
        EXPECT_FALSE(Catalog.UpdateStatus(9, LibraryStatusDownloaded));
    }

    JsonLibraryCatalog Reloaded(CatalogPath.string());
    ASSERT_TRUE(Reloaded.Load());
    EXPECT_EQ(Reloaded.GetItem(1)->Status, LibraryStatusDownloaded);
    EXPECT_EQ(Reloaded.GetItem(1)->Title, "Main Event: Night One");
}

TEST(JsonLibraryCatalogTest, RejectsMalformedFile)
{
    TempDir Dir;
    {
        std::ofstream Out(Dir / "Library.json");
        Out << "{ not json";
    }
    JsonLibraryCatalog Catalog((Dir / "Library.json").string());
    EXPECT_FALSE(Catalog.Load());
}

TEST(JsonLibraryCatalogTest, MissingFileStartsEmpty)
{
    TempDir Dir;
    JsonLibraryCatalog Catalog((Dir / "absent.json").string());
    EXPECT_TRUE(Catalog.Load());
    EXPECT_TRUE(Catalog.Items().empty());
}
