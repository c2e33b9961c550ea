#include <thread>
#include <iostream>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <unordered_set>
#include <cstdint>
#include <limits>

#include "ConfigParser.hpp"
#include "ConfigGlobal.hpp"

namespace FS = std::filesystem;

namespace
{
    std::string Trim(std::string Text)
    {
        Text.erase(Text.begin(), std::find_if(Text.begin(), Text.end(), [](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }));
        Text.erase(std::find_if(Text.rbegin(), Text.rend(), [](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }).base(), Text.end());
        return Text;
    }

    std::vector<std::string> SplitFields(const std::string& Value, char Separator)
    {
        std::vector<std::string> Fields;
        std::stringstream Stream(Value);
        std::string Field;
        while (std::getline(Stream, Field, Separator))
        {
            Fields.push_back(Trim(Field));
        }
        return Fields;
    }
}

const std::vector<FetchAgentConfig>& ConfigParser::GetAgents() const
{
    return Agents;
}

const std::vector<std::string>& ConfigParser::GetErrors() const
{
    return Errors;
}

const std::vector<std::string>& ConfigParser::GetInfos() const
{
    return Infos;
}

void ConfigParser::Reset()
{
    Agents.clear();
    Errors.clear();
    Infos.clear();
}

void ConfigParser::AddError(const std::string& Message)
{
    Errors.push_back(Message);
}

void ConfigParser::AddInfo(const std::string& Message)
{
    Infos.push_back(Message);
}

bool ConfigParser::IsAbsolutePath(const std::string& Path)
{
#ifdef _WIN32
    if (Path.size() >= 3 && std::isalpha(static_cast<unsigned char>(Path[0])) && Path[1] == ':' && (Path[2] == '\\' || Path[2] == '/'))
    {
        return true;
    }
    return Path.size() >= 2 && Path[0] == '\\' && Path[1] == '\\';
#else
    return !Path.empty() && Path[0] == '/';
#endif
}

bool ConfigParser::ParseYesNo(const std::string& Key, const std::string& Value, int LineNumber, bool& Out)
{
    if (Value == "YES")
    {
        Out = true;
        AddInfo(Key + " enabled");
        return true;
    }
    if (Value == "NO")
    {
        Out = false;
        AddInfo(Key + " disabled");
        return true;
    }
    AddError("Line " + std::to_string(LineNumber) + ": Invalid Input for " + Key + ". Use 'YES' or 'NO'.");
    return false;
}

bool ConfigParser::ParseUnsigned(const std::string& Key, const std::string& Value, int LineNumber, unsigned long long MinValue, unsigned long long& Out)
{
    try
    {
        size_t Consumed = 0;
        if (!Value.empty() && Value[0] == '-')
        {
            throw std::invalid_argument("negative");
        }
        unsigned long long ValueNum = std::stoull(Value, &Consumed);
        if (Consumed != Value.size())
        {
            throw std::invalid_argument("trailing characters");
        }
        if (ValueNum < MinValue)
        {
            AddError("Line " + std::to_string(LineNumber) + ": " + Key + " must be at least " + std::to_string(MinValue) + ".");
            return false;
        }
        Out = ValueNum;
        AddInfo(Key + " set to " + std::to_string(ValueNum));
        return true;
    }
    catch (const std::exception&)
    {
        AddError("Line " + std::to_string(LineNumber) + ": Invalid number for " + Key + ".");
        return false;
    }
}

template<typename Handler>
bool ConfigParser::ForEachEntry(const std::string& FilePath, Handler&& OnEntry)
{
    if (!FS::exists(FilePath))
    {
        AddError("Config file does not exist: " + FilePath);
        return false;
    }

    std::ifstream File(FilePath);
    if (!File.is_open())
    {
        AddError("Failed to open config file: " + FilePath);
        return false;
    }

    std::string Line;
    int LineNumber = 0;

    while (std::getline(File, Line))
    {
        LineNumber++;
        Line = Trim(Line);

        if (Line.empty() || Line[0] == '#')
        {
            continue;
        }

        size_t EqualPos = Line.find('=');
        if (EqualPos == std::string::npos)
        {
            AddError("Invalid format on line " + std::to_string(LineNumber) + ": No '=' found.");
            continue;
        }

        std::string Key = Line.substr(0, EqualPos);
        Key.erase(std::remove_if(Key.begin(), Key.end(), [](char Ch) { return std::isspace(static_cast<unsigned char>(Ch)); }), Key.end());
        std::string Value = Trim(Line.substr(EqualPos + 1));

        OnEntry(Key, Value, LineNumber);
    }
    return true;
}

void ConfigParser::ParseAgent(const std::string& Value, int LineNumber)
{
    // Name | Kind | Host | Port | Secure | Username | Password | Category
    std::vector<std::string> Fields = SplitFields(Value, '|');
    if (Fields.size() < 4)
    {
        AddError("Line " + std::to_string(LineNumber) + ": Agent needs at least 'Name | Kind | Host | Port'.");
        return;
    }

    FetchAgentConfig Agent;
    Agent.Name = Fields[0];
    if (Agent.Name.empty())
    {
        AddError("Line " + std::to_string(LineNumber) + ": Agent name is empty.");
        return;
    }
    for (const auto& Existing : Agents)
    {
        if (Existing.Name == Agent.Name)
        {
            AddError("Line " + std::to_string(LineNumber) + ": Duplicate agent name '" + Agent.Name + "'.");
            return;
        }
    }

    auto Kind = ToAgentKind(Fields[1]);
    if (!Kind)
    {
        AddError("Line " + std::to_string(LineNumber) + ": Unknown agent kind '" + Fields[1] + "'. Use 'qBittorrent', 'Transmission' or 'SABnzbd'.");
        return;
    }
    Agent.Kind = *Kind;
    Agent.Host = Fields[2];

    unsigned long long Port = 0;
    if (!ParseUnsigned("Agent Port", Fields[3], LineNumber, 1, Port) || Port > 65535)
    {
        if (Port > 65535)
        {
            AddError("Line " + std::to_string(LineNumber) + ": Agent port out of range.");
        }
        return;
    }
    Agent.Port = static_cast<unsigned short int>(Port);

    if (Fields.size() > 4 && !Fields[4].empty() && !ParseYesNo("Agent Secure", Fields[4], LineNumber, Agent.UseSsl))
    {
        return;
    }
    if (Fields.size() > 5)
    {
        Agent.Username = Fields[5];
    }
    if (Fields.size() > 6)
    {
        Agent.Password = Fields[6];
    }
    if (Fields.size() > 7 && !Fields[7].empty())
    {
        Agent.Category = Fields[7];
    }
    if (Fields.size() > 8)
    {
        Agent.UrlBase = Fields[8];
    }

    AddInfo("Agent '" + Agent.Name + "' (" + Fields[1] + ") at " + Agent.BaseUrl());
    Agents.push_back(std::move(Agent));
}

bool ConfigParser::Parse(const std::string& FilePath)
{
    bool Readable = ForEachEntry(FilePath, [this](const std::string& Key, const std::string& Value, int LineNumber)
    {
        unsigned long long Number = 0;

        if (Key == "SettingsFile")
        {
            ConfigGlobal::SettingsFile = Value;
        }
        else if (Key == "LogDir")
        {
            ConfigGlobal::LogDir = Value;
        }
        else if (Key == "StateDir")
        {
            ConfigGlobal::StateDir = Value;
            ConfigGlobal::ResolveStatePaths();
        }
        else if (Key == "LibraryFile")
        {
            ConfigGlobal::LibraryFile = Value;
        }
        else if (Key == "MaxLogFiles")
        {
            if (ParseUnsigned(Key, Value, LineNumber, 1, Number))
            {
                ConfigGlobal::MaxLogFiles = static_cast<unsigned short int>(std::min<unsigned long long>(Number, 65535));
            }
        }
        else if (Key == "ThreadCount")
        {
            if (Value == "Auto")
            {
                ConfigGlobal::ThreadCount = static_cast<unsigned short int>(std::thread::hardware_concurrency());
                if (ConfigGlobal::ThreadCount == 0)
                {
                    ConfigGlobal::ThreadCount = 4;
                }
                AddInfo("ThreadCount set to " + std::to_string(ConfigGlobal::ThreadCount) + " (Auto)");
            }
            else if (ParseUnsigned(Key, Value, LineNumber, 1, Number))
            {
                ConfigGlobal::ThreadCount = static_cast<unsigned short int>(std::min<unsigned long long>(Number, 256));
            }
        }
        else if (Key == "PollIntervalSeconds")
        {
            if (ParseUnsigned(Key, Value, LineNumber, 1, Number))
            {
                ConfigGlobal::PollIntervalSeconds = static_cast<unsigned int>(Number);
            }
        }
        else if (Key == "MirrorLogToConsole")
        {
            ParseYesNo(Key, Value, LineNumber, ConfigGlobal::MirrorLogToConsole);
        }
        else if (Key == "Agent")
        {
            ParseAgent(Value, LineNumber);
        }
        else
        {
            AddError("Line " + std::to_string(LineNumber) + ": Unknown key '" + Key + "'.");
        }
    });

    if (!Readable)
    {
        return false;
    }

    if (Agents.empty())
    {
        AddInfo("No fetch agents configured. Polling is idle.");
    }
    return Errors.empty();
}

bool ConfigParser::ParseSettings(const std::string& FilePath, MediaManagementSettings& Settings)
{
    MediaManagementSettings Parsed = Settings;
    Parsed.RootFolders.clear();
    std::unordered_set<std::string> SeenRoots;

    bool Readable = ForEachEntry(FilePath, [&](const std::string& Key, const std::string& Value, int LineNumber)
    {
        unsigned long long Number = 0;

        if (Key == "RootFolder")
        {
            if (!IsAbsolutePath(Value))
            {
                AddError("Line " + std::to_string(LineNumber) + ": RootFolder path is not absolute.");
                return;
            }
            FS::path NormalPath = FS::path(Value).lexically_normal();
            if (!NormalPath.has_filename() && NormalPath.has_relative_path())
            {
                NormalPath = NormalPath.parent_path();
            }
            std::string Normal = NormalPath.string();
            if (!SeenRoots.insert(Normal).second)
            {
                AddInfo("Line " + std::to_string(LineNumber) + ": Duplicate root folder '" + Value + "'. Ignored.");
                return;
            }
            RootLocation Root;
            Root.Path = Value;
            Parsed.RootFolders.push_back(std::move(Root));
        }
        else if (Key == "FolderFormat")
        {
            Parsed.FolderFormat = Value;
        }
        else if (Key == "FileFormat")
        {
            if (Value.empty())
            {
                AddError("Line " + std::to_string(LineNumber) + ": FileFormat must not be empty.");
                return;
            }
            Parsed.FileFormat = Value;
        }
        else if (Key == "TransferMode")
        {
            auto Mode = ToTransferMode(Value);
            if (!Mode)
            {
                AddError("Line " + std::to_string(LineNumber) + ": Invalid TransferMode. Use 'Move', 'Copy' or 'Hardlink'.");
                return;
            }
            Parsed.Mode = *Mode;
            AddInfo("TransferMode set to '" + Value + "'");
        }
        else if (Key == "RenameFiles")
        {
            ParseYesNo(Key, Value, LineNumber, Parsed.RenameFiles);
        }
        else if (Key == "CreateItemFolder")
        {
            ParseYesNo(Key, Value, LineNumber, Parsed.CreateItemFolder);
        }
        else if (Key == "SetPermissions")
        {
            ParseYesNo(Key, Value, LineNumber, Parsed.Permissions.Enabled);
        }
        else if (Key == "FileMode")
        {
            bool Octal = !Value.empty() && Value.size() <= 4 && std::all_of(Value.begin(), Value.end(), [](char Ch) { return Ch >= '0' && Ch <= '7'; });
            if (!Octal)
            {
                AddError("Line " + std::to_string(LineNumber) + ": FileMode must be an octal mode such as 644.");
                return;
            }
            Parsed.Permissions.FileMode = Value;
        }
        else if (Key == "ChownUser")
        {
            Parsed.Permissions.OwnerUser = Value;
        }
        else if (Key == "ChownGroup")
        {
            Parsed.Permissions.OwnerGroup = Value;
        }
        else if (Key == "MinimumFreeSpaceMB")
        {
            if (ParseUnsigned(Key, Value, LineNumber, 0, Number))
            {
                if (Number > (std::numeric_limits<uint64_t>::max() >> 20))
                {
                    AddError("Line " + std::to_string(LineNumber) + ": " + Key + " is too large.");
                }
                else
                {
                    Parsed.MinimumFreeSpaceBytes = Number * 1024ULL * 1024ULL;
                }
            }
        }
        else if (Key == "SkipFreeSpaceCheck")
        {
            ParseYesNo(Key, Value, LineNumber, Parsed.SkipFreeSpaceCheck);
        }
        else if (Key == "RemoveCompletedDownloads")
        {
            ParseYesNo(Key, Value, LineNumber, Parsed.RemoveCompletedDownloads);
        }
        else if (Key == "VerifyTransfers")
        {
            ParseYesNo(Key, Value, LineNumber, Parsed.VerifyTransfers);
        }
        else
        {
            AddError("Line " + std::to_string(LineNumber) + ": Unknown key '" + Key + "'.");
        }
    });

    if (!Readable || !Errors.empty())
    {
        return false;
    }

    if (Parsed.RootFolders.empty())
    {
        AddInfo("No root folders configured. Imports will fail until one is added.");
    }

    Settings = std::move(Parsed);
    return true;
}

bool ConfigParser::WriteDefaultSettings(const std::string& FilePath, const MediaManagementSettings& Defaults)
{
    auto Parent = FS::path(FilePath).parent_path();
    std::error_code ec;
    if (!Parent.empty())
    {
        FS::create_directories(Parent, ec);
        if (ec)
        {
            return false;
        }
    }

    std::ofstream File(FilePath, std::ios::trunc);
    if (!File.is_open())
    {
        return false;
    }

    auto YesNo = [](bool Flag) { return Flag ? "YES" : "NO"; };

    File << "# Media management settings\n";
    File << "# RootFolder = /absolute/path   (repeat for each library root)\n";
    for (const auto& Root : Defaults.RootFolders)
    {
        File << "RootFolder = " << Root.Path << "\n";
    }
    File << "FolderFormat = " << Defaults.FolderFormat << "\n";
    File << "FileFormat = " << Defaults.FileFormat << "\n";
    File << "TransferMode = " << TransferModeName(Defaults.Mode) << "\n";
    File << "RenameFiles = " << YesNo(Defaults.RenameFiles) << "\n";
    File << "CreateItemFolder = " << YesNo(Defaults.CreateItemFolder) << "\n";
    File << "SetPermissions = " << YesNo(Defaults.Permissions.Enabled) << "\n";
    File << "FileMode = " << Defaults.Permissions.FileMode << "\n";
    File << "MinimumFreeSpaceMB = " << Defaults.MinimumFreeSpaceBytes / (1024ULL * 1024ULL) << "\n";
    File << "SkipFreeSpaceCheck = " << YesNo(Defaults.SkipFreeSpaceCheck) << "\n";
    File << "RemoveCompletedDownloads = " << YesNo(Defaults.RemoveCompletedDownloads) << "\n";
    File << "VerifyTransfers = " << YesNo(Defaults.VerifyTransfers) << "\n";

    File.flush();
    return File.good();
}
