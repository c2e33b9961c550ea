#pragma once

#include <string>
#include <vector>

#include "MediaSettings.hpp"

class ConfigParser
{
public:
    ConfigParser() = default;

    // Process configuration: ConfigGlobal values and fetch agents
    bool Parse(const std::string& FilePath);

    // Media management settings file, applied over Settings' current values
    bool ParseSettings(const std::string& FilePath, MediaManagementSettings& Settings);

    const std::vector<std::string>& GetErrors() const;
    const std::vector<std::string>& GetInfos() const;
    const std::vector<FetchAgentConfig>& GetAgents() const;
    void Reset();

    static bool WriteDefaultSettings(const std::string& FilePath, const MediaManagementSettings& Defaults);

private:
    void AddError(const std::string& Message);
    void AddInfo(const std::string& Message);

    bool IsAbsolutePath(const std::string& Path);
    bool ParseYesNo(const std::string& Key, const std::string& Value, int LineNumber, bool& Out);
    bool ParseUnsigned(const std::string& Key, const std::string& Value, int LineNumber, unsigned long long MinValue, unsigned long long& Out);
    void ParseAgent(const std::string& Value, int LineNumber);

    template<typename Handler>
    bool ForEachEntry(const std::string& FilePath, Handler&& OnEntry);

    std::vector<FetchAgentConfig> Agents;
    std::vector<std::string> Errors;
    std::vector<std::string> Infos;
};
