#include <gtest/gtest.h>

#include "ConfigGlobal.hpp"
#include "ConfigParser.hpp"
#include "SettingsStore.hpp"
#include "TestSupport.hpp"

namespace
{
    void WriteText(const std::filesystem::path& FilePath, const std::string& Text)
    {
        std::filesystem::create_directories(FilePath.parent_path());
        std::ofstream Out(FilePath, std::ios::trunc);
        Out << Text;
    }

    class ConfigParserTest : public ::testing::Test
    {
    protected:
        void SetUp() override { ConfigGlobal::InitializeDefaults(); }
        void TearDown() override { ConfigGlobal::InitializeDefaults(); }

        TempDir Dir;
    };
}

TEST_F(ConfigParserTest, ParsesProcessConfigAndAgents)
{
    WriteText(Dir / "ImportFlow.conf",
        "# process settings\n"
        "LogDir = /var/log/importflow\n"
        "StateDir = /var/lib/importflow\n"
        "ThreadCount = 6\n"
        "PollIntervalSeconds = 15\n"
        "MirrorLogToConsole = NO\n"
        "\n"
        "Agent = qbit | qBittorrent | 10.0.0.5 | 8080 | NO | admin | pw | fights\n"
        "Agent = sab | SABnzbd | nas.local | 443 | YES | | apikey123 | | /sabnzbd\n");

    ConfigParser Parser;
    ASSERT_TRUE(Parser.Parse((Dir / "ImportFlow.conf").string())) << (Parser.GetErrors().empty() ? "" : Parser.GetErrors().front());

    EXPECT_EQ(ConfigGlobal::LogDir, "/var/log/importflow");
    EXPECT_EQ(ConfigGlobal::ThreadCount, 6);
    EXPECT_EQ(ConfigGlobal::PollIntervalSeconds, 15u);
    EXPECT_FALSE(ConfigGlobal::MirrorLogToConsole);
    EXPECT_EQ(ConfigGlobal::QueueStateFile, std::filesystem::path("/var/lib/importflow") / "Queue.bin");

    const auto& Agents = Parser.GetAgents();
    ASSERT_EQ(Agents.size(), 2u);
    EXPECT_EQ(Agents[0].Kind, AgentKind::QBittorrent);
    EXPECT_EQ(Agents[0].Category, "fights");
    EXPECT_EQ(Agents[0].BaseUrl(), "http://10.0.0.5:8080");
    EXPECT_EQ(Agents[1].Kind, AgentKind::Sabnzbd);
    EXPECT_EQ(Agents[1].Password, "apikey123");
    EXPECT_EQ(Agents[1].Category, "importflow");
    EXPECT_EQ(Agents[1].BaseUrl(), "https://nas.local:443/sabnzbd");
}

TEST_F(ConfigParserTest, ReportsBadLinesWithLineNumbers)
{
    WriteText(Dir / "ImportFlow.conf",
        "ThreadCount = many\n"
        "Agent = x | Deluge | host | 1\n"
        "Agent = y | Transmission | host | 70000\n"
        "NoEqualsHere\n"
        "Colour = blue\n");

    ConfigParser Parser;
    EXPECT_FALSE(Parser.Parse((Dir / "ImportFlow.conf").string()));
    const auto& Errors = Parser.GetErrors();
    ASSERT_EQ(Errors.size(), 5u);
    EXPECT_NE(Errors[0].find("Line 1"), std::string::npos);
    EXPECT_NE(Errors[1].find("Deluge"), std::string::npos);
    EXPECT_NE(Errors[2].find("out of range"), std::string::npos);
    EXPECT_NE(Errors[3].find("line 4"), std::string::npos);
    EXPECT_NE(Errors[4].find("Colour"), std::string::npos);
    EXPECT_TRUE(Parser.GetAgents().empty());
}

TEST_F(ConfigParserTest, DuplicateAgentNamesRejected)
{
    WriteText(Dir / "ImportFlow.conf",
        "Agent = a | qBittorrent | h | 1\n"
        "Agent = a | Transmission | h | 2\n");

    ConfigParser Parser;
    EXPECT_FALSE(Parser.Parse((Dir / "ImportFlow.conf").string()));
    EXPECT_EQ(Parser.GetAgents().size(), 1u);
}

TEST_F(ConfigParserTest, MissingConfigFileFails)
{
    ConfigParser Parser;
    EXPECT_FALSE(Parser.Parse((Dir / "absent.conf").string()));
    ASSERT_FALSE(Parser.GetErrors().empty());
}

TEST_F(ConfigParserTest, ParsesMediaSettings)
{
    WriteText(Dir / "Media.conf",
        "RootFolder = /mnt/a\n"
        "RootFolder = /mnt/b\n"
        "RootFolder = /mnt/a/\n"
        "FolderFormat = {Item Title} ({Air Year})\n"
        "FileFormat = {Item Title} - {Quality Full}\n"
        "TransferMode = Hardlink\n"
        "RenameFiles = NO\n"
        "SetPermissions = YES\n"
        "FileMode = 0640\n"
        "ChownUser = media\n"
        "MinimumFreeSpaceMB = 250\n"
        "VerifyTransfers = YES\n");

    ConfigParser Parser;
    MediaManagementSettings Settings;
    ASSERT_TRUE(Parser.ParseSettings((Dir / "Media.conf").string(), Settings));

    ASSERT_EQ(Settings.RootFolders.size(), 2u);
    EXPECT_EQ(Settings.RootFolders[1].Path, "/mnt/b");
    EXPECT_EQ(Settings.FolderFormat, "{Item Title} ({Air Year})");
    EXPECT_EQ(Settings.Mode, TransferMode::Hardlink);
    EXPECT_FALSE(Settings.RenameFiles);
    EXPECT_TRUE(Settings.CreateItemFolder);
    EXPECT_TRUE(Settings.Permissions.Enabled);
    EXPECT_EQ(Settings.Permissions.FileMode, "0640");
    EXPECT_EQ(Settings.Permissions.OwnerUser, "media");
    EXPECT_EQ(Settings.MinimumFreeSpaceBytes, 250ULL * 1024 * 1024);
    EXPECT_TRUE(Settings.VerifyTransfers);
}

TEST_F(ConfigParserTest, InvalidSettingsLeaveTargetUntouched)
{
    WriteText(Dir / "Media.conf",
        "RootFolder = relative/path\n"
        "TransferMode = Teleport\n"
        "FileMode = 999\n");

    ConfigParser Parser;
    MediaManagementSettings Settings;
    Settings.FolderFormat = "unchanged";
    EXPECT_FALSE(Parser.ParseSettings((Dir / "Media.conf").string(), Settings));
    EXPECT_EQ(Parser.GetErrors().size(), 3u);
    EXPECT_EQ(Settings.FolderFormat, "unchanged");
}

TEST_F(ConfigParserTest, MinimumFreeSpaceThatOverflowsBytesIsRejected)
{
    // 2^44 MB does not fit in 64 bits once converted to bytes
    WriteText(Dir / "Media.conf", "MinimumFreeSpaceMB = 17592186044416\n");

    ConfigParser Parser;
    MediaManagementSettings Settings;
    Settings.MinimumFreeSpaceBytes = 7;
    EXPECT_FALSE(Parser.ParseSettings((Dir / "Media.conf").string(), Settings));
    ASSERT_EQ(Parser.GetErrors().size(), 1u);
    EXPECT_NE(Parser.GetErrors().front().find("MinimumFreeSpaceMB"), std::string::npos);
    EXPECT_EQ(Settings.MinimumFreeSpaceBytes, 7u);

    // The largest value that still converts is accepted
    WriteText(Dir / "Media.conf", "MinimumFreeSpaceMB = 17592186044415\n");
    ConfigParser Accepting;
    ASSERT_TRUE(Accepting.ParseSettings((Dir / "Media.conf").string(), Settings));
    EXPECT_EQ(Settings.MinimumFreeSpaceBytes, 17592186044415ULL * 1024 * 1024);
}

TEST_F(ConfigParserTest, SettingsStoreWritesDefaultsWhenMissing)
{
    SettingsStore Store((Dir / "conf/Media.conf").string());
    ASSERT_TRUE(Store.Load());
    EXPECT_TRUE(std::filesystem::exists(Dir / "conf/Media.conf"));

    auto Current = Store.Current();
    MediaManagementSettings Defaults;
    EXPECT_EQ(Current->FileFormat, Defaults.FileFormat);
    EXPECT_EQ(Current->Mode, TransferMode::Move);
    EXPECT_EQ(Current->MinimumFreeSpaceBytes, Defaults.MinimumFreeSpaceBytes);
    EXPECT_TRUE(Current->RootFolders.empty());
}

TEST_F(ConfigParserTest, SettingsReloadKeepsPreviousOnError)
{
    const auto SettingsPath = Dir / "Media.conf";
    WriteText(SettingsPath, "RootFolder = /mnt/a\nTransferMode = Copy\n");

    SettingsStore Store(SettingsPath.string());
    ASSERT_TRUE(Store.Load());
    auto Before = Store.Current();
    EXPECT_EQ(Before->Mode, TransferMode::Copy);

    WriteText(SettingsPath, "TransferMode = Sideways\n");
    EXPECT_FALSE(Store.Reload());
    EXPECT_FALSE(Store.GetErrors().empty());
    EXPECT_EQ(Store.Current(), Before);

    // Snapshots already handed out never change
    WriteText(SettingsPath, "RootFolder = /mnt/b\nTransferMode = Hardlink\n");
    ASSERT_TRUE(Store.Reload());
    EXPECT_EQ(Before->Mode, TransferMode::Copy);
    EXPECT_EQ(Store.Current()->Mode, TransferMode::Hardlink);
    EXPECT_EQ(Store.Current()->RootFolders.front().Path, "/mnt/b");
}
