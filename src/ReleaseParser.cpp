#include "ReleaseParser.hpp"
#include "CandidateSelector.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <regex>

namespace
{
    const std::regex ResolutionPattern(R"((?:^|[^A-Za-z0-9])(2160p|1080p|720p|576p|480p|4k|uhd)(?=$|[^A-Za-z0-9]))", std::regex::icase);
    const std::regex SourcePattern(R"((?:^|[^A-Za-z0-9])(blu-?ray|bdrip|brrip|web-?dl|webrip|hdtv|dvdrip|dvd|ppv|hdrip|web)(?=$|[^A-Za-z0-9]))", std::regex::icase);
    const std::regex YearPattern(R"((?:^|[^0-9])((?:19|20)[0-9]{2})(?=$|[^0-9]))");
    const std::regex GroupPattern(R"(-([A-Za-z0-9]+)(?:\[[^\]]*\])?$)");

    std::string Lower(std::string Text)
    {
        std::transform(Text.begin(), Text.end(), Text.begin(), [](unsigned char Ch) { return static_cast<char>(std::tolower(Ch)); });
        return Text;
    }

    std::string NormalizeResolution(const std::string& Raw)
    {
        std::string Value = Lower(Raw);
        if (Value == "4k" || Value == "uhd")
        {
            return "2160p";
        }
        return Value;
    }

    std::string NormalizeSource(const std::string& Raw)
    {
        std::string Value = Lower(Raw);
        Value.erase(std::remove(Value.begin(), Value.end(), '-'), Value.end());

        if (Value == "bluray" || Value == "bdrip" || Value == "brrip") return "Bluray";
        if (Value == "webdl" || Value == "web")                       return "WEBDL";
        if (Value == "webrip")                                        return "WEBRip";
        if (Value == "hdtv")                                          return "HDTV";
        if (Value == "dvdrip" || Value == "dvd")                      return "DVD";
        if (Value == "ppv")                                           return "PPV";
        if (Value == "hdrip")                                         return "HDRip";
        return Raw;
    }

    std::string CleanTitle(std::string Raw)
    {
        std::replace(Raw.begin(), Raw.end(), '.', ' ');
        std::replace(Raw.begin(), Raw.end(), '_', ' ');

        std::string Result;
        bool LastSpace = true;
        for (char Ch : Raw)
        {
            bool Space = std::isspace(static_cast<unsigned char>(Ch)) != 0;
            if (Space && LastSpace)
            {
                continue;
            }
            Result += Space ? ' ' : Ch;
            LastSpace = Space;
        }
        while (!Result.empty() && (Result.back() == ' ' || Result.back() == '-' || Result.back() == '(' || Result.back() == '['))
        {
            Result.pop_back();
        }
        return Result;
    }
}

namespace ReleaseParser
{
    ParsedPayloadInfo Parse(const std::string& FileName)
    {
        ParsedPayloadInfo Info;

        std::filesystem::path Path(FileName);
        std::string Name = Path.filename().string();
        if (CandidateSelector::IsMediaFile(Path))
        {
            Name = Path.stem().string();
        }
        Info.OriginalName = Name;

        size_t TitleEnd = Name.size();
        size_t MarkersEnd = 0;
        std::smatch Match;

        if (std::regex_search(Name, Match, ResolutionPattern))
        {
            Info.Resolution = NormalizeResolution(Match[1].str());
            MarkersEnd = std::max(MarkersEnd, static_cast<size_t>(Match.position(1) + Match.length(1)));
            TitleEnd = std::min(TitleEnd, static_cast<size_t>(Match.position(1)));
        }
        if (std::regex_search(Name, Match, SourcePattern))
        {
            Info.Source = NormalizeSource(Match[1].str());
            MarkersEnd = std::max(MarkersEnd, static_cast<size_t>(Match.position(1) + Match.length(1)));
            TitleEnd = std::min(TitleEnd, static_cast<size_t>(Match.position(1)));
        }
        if (std::regex_search(Name, Match, YearPattern) && Match.position(1) > 0)
        {
            Info.Year = Match[1].str();
            MarkersEnd = std::max(MarkersEnd, static_cast<size_t>(Match.position(1) + Match.length(1)));
            TitleEnd = std::min(TitleEnd, static_cast<size_t>(Match.position(1)));
        }
        if (std::regex_search(Name, Match, GroupPattern) && TitleEnd < Name.size() && static_cast<size_t>(Match.position(1)) >= MarkersEnd)
        {
            Info.ReleaseGroup = Match[1].str();
        }

        Info.Title = CleanTitle(Name.substr(0, TitleEnd));
        if (Info.Title.empty())
        {
            Info.Title = CleanTitle(Name);
        }
        return Info;
    }

    std::string QualityLabel(const ParsedPayloadInfo& Info)
    {
        if (!Info.Source.empty() && !Info.Resolution.empty())
        {
            return Info.Source + "-" + Info.Resolution;
        }
        if (!Info.Source.empty())
        {
            return Info.Source;
        }
        if (!Info.Resolution.empty())
        {
            return Info.Resolution;
        }
        return "Unknown";
    }
}
