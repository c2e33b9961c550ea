#pragma once

#include <filesystem>
#include <string>

#include "LibraryCatalog.hpp"
#include "MediaSettings.hpp"
#include "ReleaseParser.hpp"

class DestinationBuilder
{
public:
    explicit DestinationBuilder(const MediaManagementSettings& Settings);

    // Tokens are matched case-insensitively; unknown tokens resolve to ""
    std::string ResolveTemplate(const std::string& Template, const LibraryItem& Item, const ParsedPayloadInfo& Parsed) const;

    // <Root>/<folder>/<file><Extension>, made unique against the filesystem
    std::filesystem::path Build(const std::filesystem::path& Root, const LibraryItem& Item, const ParsedPayloadInfo& Parsed,
                                const std::string& Extension) const;

    // Appends " (1)", " (2)", ... before the extension until the path is unused
    static std::filesystem::path UniquePath(const std::filesystem::path& Desired);

    static std::string SanitizeComponent(const std::string& Name);

private:
    const MediaManagementSettings& Settings;
};
