#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

inline constexpr const char* LibraryStatusDownloaded = "Downloaded";

struct LibraryItem
{
    uint64_t Id = 0;
    std::string Title;
    std::string AirDate; // YYYY-MM-DD, may be empty
    std::string Status;
};

class LibraryCatalog
{
public:
    virtual ~LibraryCatalog() = default;

    virtual std::optional<LibraryItem> GetItem(uint64_t Id) = 0;
    virtual bool UpdateStatus(uint64_t Id, const std::string& Status) = 0;
};

// { "items": [ { "id": 1, "title": "...", "airDate": "...", "status": "..." } ] }
class JsonLibraryCatalog : public LibraryCatalog
{
public:
    explicit JsonLibraryCatalog(std::string CatalogFilePath);

    bool Load();

    std::optional<LibraryItem> GetItem(uint64_t Id) override;
    bool UpdateStatus(uint64_t Id, const std::string& Status) override;

    std::vector<LibraryItem> Items() const;

private:
    bool SaveLocked() const;

    std::string FilePath;
    mutable std::mutex CatalogMutex;
    std::vector<LibraryItem> Entries;
};
