#include "DestinationBuilder.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace FS = std::filesystem;

namespace
{
    std::string Lower(std::string Text)
    {
        std::transform(Text.begin(), Text.end(), Text.begin(), [](unsigned char Ch) { return static_cast<char>(std::tolower(Ch)); });
        return Text;
    }

    std::string CleanTitle(const std::string& Title)
    {
        std::string Result;
        for (char Ch : Title)
        {
            if (std::isalnum(static_cast<unsigned char>(Ch)) || Ch == ' ')
            {
                Result += Ch;
            }
        }
        return Result;
    }

    std::unordered_map<std::string, std::string> BuildTokens(const LibraryItem& Item, const ParsedPayloadInfo& Parsed)
    {
        return {
            { "item title",        Item.Title },
            { "item cleantitle",   CleanTitle(Item.Title) },
            { "air date",          Item.AirDate },
            { "air year",          Item.AirDate.size() >= 4 ? Item.AirDate.substr(0, 4) : Parsed.Year },
            { "quality",           Parsed.Resolution.empty() ? "Unknown" : Parsed.Resolution },
            { "quality full",      ReleaseParser::QualityLabel(Parsed) },
            { "release group",     Parsed.ReleaseGroup },
            { "original title",    Parsed.Title },
            { "original filename", Parsed.OriginalName }
        };
    }
}

DestinationBuilder::DestinationBuilder(const MediaManagementSettings& Settings) : Settings(Settings)
{
}

std::string DestinationBuilder::ResolveTemplate(const std::string& Template, const LibraryItem& Item, const ParsedPayloadInfo& Parsed) const
{
    const auto Tokens = BuildTokens(Item, Parsed);

    std::string Result;
    size_t Pos = 0;
    while (Pos < Template.size())
    {
        size_t Open = Template.find('{', Pos);
        if (Open == std::string::npos)
        {
            Result += Template.substr(Pos);
            break;
        }
        size_t Close = Template.find('}', Open + 1);
        if (Close == std::string::npos)
        {
            Result += Template.substr(Pos); // unbalanced brace, keep literally
            break;
        }

        Result += Template.substr(Pos, Open - Pos);

        std::string Name = Lower(Template.substr(Open + 1, Close - Open - 1));
        auto it = Tokens.find(Name);
        if (it != Tokens.end())
        {
            Result += it->second;
        }
        else
        {
            Log.Warn("[DestinationBuilder] Unknown naming token {" + Template.substr(Open + 1, Close - Open - 1) + "}");
        }
        Pos = Close + 1;
    }
    return Result;
}

std::string DestinationBuilder::SanitizeComponent(const std::string& Name)
{
    static const std::string Illegal = "<>:\"/\\|?*";

    std::string Result;
    bool LastSpace = false;
    for (char Ch : Name)
    {
        unsigned char Byte = static_cast<unsigned char>(Ch);
        if (Byte < 0x20 || Illegal.find(Ch) != std::string::npos)
        {
            continue;
        }
        bool Space = std::isspace(Byte) != 0;
        if (Space && (LastSpace || Result.empty()))
        {
            continue;
        }
        Result += Space ? ' ' : Ch;
        LastSpace = Space;
    }
    while (!Result.empty() && (Result.back() == ' ' || Result.back() == '.'))
    {
        Result.pop_back();
    }
    // A dangling separator left by an empty token, e.g. "Title - 2024 - "
    while (Result.size() >= 2 && Result.ends_with(" -"))
    {
        Result.resize(Result.size() - 2);
    }
    return Result;
}

FS::path DestinationBuilder::Build(const FS::path& Root, const LibraryItem& Item, const ParsedPayloadInfo& Parsed, const std::string& Extension) const
{
    FS::path Destination = Root;

    if (Settings.CreateItemFolder)
    {
        std::string Folder = SanitizeComponent(ResolveTemplate(Settings.FolderFormat, Item, Parsed));
        if (Folder.empty())
        {
            Folder = SanitizeComponent(Item.Title);
        }
        if (!Folder.empty())
        {
            Destination /= Folder;
        }
    }

    std::string FileName;
    if (Settings.RenameFiles)
    {
        FileName = SanitizeComponent(ResolveTemplate(Settings.FileFormat, Item, Parsed));
    }
    if (FileName.empty())
    {
        FileName = SanitizeComponent(Parsed.OriginalName);
    }

    Destination /= FileName + Extension;
    return UniquePath(Destination);
}

FS::path DestinationBuilder::UniquePath(const FS::path& Desired)
{
    std::error_code ec;
    if (!FS::exists(Desired, ec))
    {
        return Desired;
    }

    const FS::path Directory = Desired.parent_path();
    const std::string Stem = Desired.stem().string();
    const std::string Extension = Desired.extension().string();

    for (unsigned long Counter = 1;; ++Counter)
    {
        FS::path Candidate = Directory / (Stem + " (" + std::to_string(Counter) + ")" + Extension);
        if (!FS::exists(Candidate, ec))
        {
            return Candidate;
        }
    }
}
