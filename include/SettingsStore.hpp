#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "MediaSettings.hpp"

// Holds the media management settings as an explicit value. Import runs take a
// snapshot at their start, so a reload never changes a run already in flight.
class SettingsStore
{
public:
    explicit SettingsStore(std::string SettingsFilePath);

    // Materializes the defaults file when absent, then parses it
    bool Load();
    bool Reload();

    std::shared_ptr<const MediaManagementSettings> Current() const;
    void Replace(MediaManagementSettings Settings);

    const std::vector<std::string>& GetErrors() const;
    const std::string& GetPath() const;

private:
    std::string FilePath;
    std::vector<std::string> LastErrors;

    mutable std::mutex SettingsMutex;
    std::shared_ptr<const MediaManagementSettings> Snapshot;
};
