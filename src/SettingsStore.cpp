#include "SettingsStore.hpp"
#include "ConfigParser.hpp"
#include "Logger.hpp"

#include <filesystem>

namespace FS = std::filesystem;

SettingsStore::SettingsStore(std::string SettingsFilePath)
    : FilePath(std::move(SettingsFilePath)), Snapshot(std::make_shared<const MediaManagementSettings>())
{
}

bool SettingsStore::Load()
{
    if (!FS::exists(FilePath))
    {
        Log.Info("[SettingsStore] No settings file at " + FilePath + ", writing defaults.");
        if (!ConfigParser::WriteDefaultSettings(FilePath, MediaManagementSettings{}))
        {
            LastErrors = { "Failed to write default settings file: " + FilePath };
            Log.Error("[SettingsStore] " + LastErrors.front());
            return false;
        }
    }
    return Reload();
}

bool SettingsStore::Reload()
{
    ConfigParser Parser;
    MediaManagementSettings Parsed;

    bool Ok = Parser.ParseSettings(FilePath, Parsed);
    LastErrors = Parser.GetErrors();

    for (const auto& Info : Parser.GetInfos())
    {
        Log.Info("[SettingsStore] " + Info);
    }
    if (!Ok)
    {
        for (const auto& Error : LastErrors)
        {
            Log.Error("[SettingsStore] " + Error);
        }
        Log.Error("[SettingsStore] Settings not applied, keeping previous values.");
        return false;
    }

    Replace(std::move(Parsed));
    Log.Info("[SettingsStore] Settings loaded from " + FilePath);
    return true;
}

std::shared_ptr<const MediaManagementSettings> SettingsStore::Current() const
{
    std::lock_guard<std::mutex> Lock(SettingsMutex);
    return Snapshot;
}

void SettingsStore::Replace(MediaManagementSettings Settings)
{
    auto Fresh = std::make_shared<const MediaManagementSettings>(std::move(Settings));
    std::lock_guard<std::mutex> Lock(SettingsMutex);
    Snapshot = std::move(Fresh);
}

const std::vector<std::string>& SettingsStore::GetErrors() const
{
    return LastErrors;
}

const std::string& SettingsStore::GetPath() const
{
    return FilePath;
}
