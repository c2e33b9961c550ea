#include "LibraryCatalog.hpp"
#include "Logger.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

namespace FS = std::filesystem;
using json = nlohmann::json;

JsonLibraryCatalog::JsonLibraryCatalog(std::string CatalogFilePath) : FilePath(std::move(CatalogFilePath))
{
}

bool JsonLibraryCatalog::Load()
{
    std::lock_guard<std::mutex> Lock(CatalogMutex);
    Entries.clear();

    std::ifstream File(FilePath);
    if (!File)
    {
        Log.Warn("[LibraryCatalog] No library file at " + FilePath + ", starting empty");
        return true;
    }

    json Document = json::parse(File, nullptr, false);
    if (Document.is_discarded() || !Document.is_object())
    {
        Log.Error("[LibraryCatalog] Library file is not valid JSON: " + FilePath);
        return false;
    }

    for (const json& Entry : Document.value("items", json::array()))
    {
        if (!Entry.is_object() || !Entry.contains("id") || !Entry["id"].is_number_unsigned())
        {
            Log.Warn("[LibraryCatalog] Skipping library entry without a numeric id");
            continue;
        }
        LibraryItem Item;
        Item.Id = Entry["id"].get<uint64_t>();
        Item.Title = Entry.value("title", std::string());
        Item.AirDate = Entry.value("airDate", std::string());
        Item.Status = Entry.value("status", std::string("Wanted"));
        Entries.push_back(std::move(Item));
    }

    Log.Info("[LibraryCatalog] Loaded " + std::to_string(Entries.size()) + " library items");
    return true;
}

std::optional<LibraryItem> JsonLibraryCatalog::GetItem(uint64_t Id)
{
    std::lock_guard<std::mutex> Lock(CatalogMutex);
    for (const auto& Item : Entries)
    {
        if (Item.Id == Id)
        {
            return Item;
        }
    }
    return std::nullopt;
}

bool JsonLibraryCatalog::UpdateStatus(uint64_t Id, const std::string& Status)
{
    std::lock_guard<std::mutex> Lock(CatalogMutex);
    for (auto& Item : Entries)
    {
        if (Item.Id != Id)
        {
            continue;
        }
        std::string Previous = Item.Status;
        Item.Status = Status;
        if (!SaveLocked())
        {
            Item.Status = Previous;
            return false;
        }
        return true;
    }
    Log.Error("[LibraryCatalog] Cannot update status, no library item " + std::to_string(Id));
    return false;
}

std::vector<LibraryItem> JsonLibraryCatalog::Items() const
{
    std::lock_guard<std::mutex> Lock(CatalogMutex);
    return Entries;
}

bool JsonLibraryCatalog::SaveLocked() const
{
    json Items = json::array();
    for (const auto& Item : Entries)
    {
        Items.push_back({ { "id", Item.Id }, { "title", Item.Title }, { "airDate", Item.AirDate }, { "status", Item.Status } });
    }
    json Document = { { "items", Items } };

    const FS::path Target(FilePath);
    const FS::path Temp = Target.string() + ".tmp";
    {
        std::ofstream File(Temp, std::ios::trunc);
        if (!File)
        {
            Log.Error("[LibraryCatalog] Failed to open " + Temp.string() + " for writing");
            return false;
        }
        File << Document.dump(2) << "\n";
        File.flush();
        if (!File)
        {
            Log.Error("[LibraryCatalog] Failed to write " + Temp.string());
            return false;
        }
    }

    std::error_code ec;
    FS::rename(Temp, Target, ec);
    if (ec)
    {
        Log.Error("[LibraryCatalog] Failed to replace " + Target.string() + ": " + ec.message());
        FS::remove(Temp, ec);
        return false;
    }
    return true;
}
