#pragma once

#include <filesystem>
#include <memory>

#include "MediaSettings.hpp"

struct PlatformCapabilities
{
    bool SupportsHardlinks = false;
    bool SupportsPosixPermissions = false;

    // What the build target offers
    static PlatformCapabilities Native();
};

class PermissionApplier
{
public:
    virtual ~PermissionApplier() = default;

    // Failures are reported, never thrown; the import stands either way
    virtual bool Apply(const std::filesystem::path& FilePath, const PermissionPolicy& Policy) = 0;
};

// chmod / chown through system calls
class PosixPermissionApplier : public PermissionApplier
{
public:
    bool Apply(const std::filesystem::path& FilePath, const PermissionPolicy& Policy) override;
};

// Platforms without POSIX mode bits or ownership: logs and does nothing
class UnsupportedPermissionApplier : public PermissionApplier
{
public:
    bool Apply(const std::filesystem::path& FilePath, const PermissionPolicy& Policy) override;
};

std::unique_ptr<PermissionApplier> CreatePermissionApplier(const PlatformCapabilities& Capabilities);
