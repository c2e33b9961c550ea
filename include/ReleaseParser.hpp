#pragma once

#include <string>

struct ParsedPayloadInfo
{
    std::string Title;
    std::string Resolution;
    std::string Source;
    std::string ReleaseGroup;
    std::string Year;
    std::string OriginalName; // file name without extension
};

// Pure functions over release file names
namespace ReleaseParser
{
    ParsedPayloadInfo Parse(const std::string& FileName);
    std::string QualityLabel(const ParsedPayloadInfo& Info);
}
