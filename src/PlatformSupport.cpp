#include "PlatformSupport.hpp"
#include "Logger.hpp"

#include <stdexcept>
#include <string>

#ifndef _WIN32
#include <grp.h>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#endif

PlatformCapabilities PlatformCapabilities::Native()
{
    PlatformCapabilities Capabilities;
#ifdef _WIN32
    Capabilities.SupportsHardlinks = true; // NTFS only, checked per volume by the filesystem call
    Capabilities.SupportsPosixPermissions = false;
#else
    Capabilities.SupportsHardlinks = true;
    Capabilities.SupportsPosixPermissions = true;
#endif
    return Capabilities;
}

bool PosixPermissionApplier::Apply(const std::filesystem::path& FilePath, const PermissionPolicy& Policy)
{
#ifdef _WIN32
    Log.Warn("[Permissions] POSIX permissions are not available on this platform: " + FilePath.string());
    return false;
#else
    bool Ok = true;

    if (!Policy.FileMode.empty())
    {
        unsigned long Mode = 0;
        try
        {
            size_t Consumed = 0;
            Mode = std::stoul(Policy.FileMode, &Consumed, 8);
            if (Consumed != Policy.FileMode.size() || Mode > 07777)
            {
                throw std::invalid_argument(Policy.FileMode);
            }
        }
        catch (const std::exception&)
        {
            Log.Error("[Permissions] Invalid file mode '" + Policy.FileMode + "' for " + FilePath.string());
            return false;
        }

        if (chmod(FilePath.c_str(), static_cast<mode_t>(Mode)) != 0)
        {
            Log.Error("[Permissions] chmod " + Policy.FileMode + " failed for " + FilePath.string() + ": " + std::strerror(errno));
            Ok = false;
        }
    }

    if (!Policy.OwnerUser.empty() || !Policy.OwnerGroup.empty())
    {
        uid_t Uid = static_cast<uid_t>(-1);
        gid_t Gid = static_cast<gid_t>(-1);

        if (!Policy.OwnerUser.empty())
        {
            struct passwd* Pw = getpwnam(Policy.OwnerUser.c_str());
            if (Pw == nullptr)
            {
                Log.Error("[Permissions] Unknown user '" + Policy.OwnerUser + "'");
                return false;
            }
            Uid = Pw->pw_uid;
        }
        if (!Policy.OwnerGroup.empty())
        {
            struct group* Gr = getgrnam(Policy.OwnerGroup.c_str());
            if (Gr == nullptr)
            {
                Log.Error("[Permissions] Unknown group '" + Policy.OwnerGroup + "'");
                return false;
            }
            Gid = Gr->gr_gid;
        }

        if (chown(FilePath.c_str(), Uid, Gid) != 0)
        {
            Log.Error("[Permissions] chown failed for " + FilePath.string() + ": " + std::strerror(errno));
            Ok = false;
        }
    }

    if (Ok)
    {
        Log.Info("[Permissions] Applied permissions to " + FilePath.string());
    }
    return Ok;
#endif
}

bool UnsupportedPermissionApplier::Apply(const std::filesystem::path& FilePath, const PermissionPolicy& Policy)
{
    (void)Policy;
    Log.Warn("[Permissions] Permission management enabled but unsupported on this platform, skipped for " + FilePath.string());
    return false;
}

std::unique_ptr<PermissionApplier> CreatePermissionApplier(const PlatformCapabilities& Capabilities)
{
    if (Capabilities.SupportsPosixPermissions)
    {
        return std::make_unique<PosixPermissionApplier>();
    }
    return std::make_unique<UnsupportedPermissionApplier>();
}
