#include "TransferEngine.hpp"
#include "FileHasher.hpp"
#include "ImportError.hpp"
#include "Logger.hpp"
#include "RootSelector.hpp"

#include <fstream>
#include <vector>

namespace FS = std::filesystem;

TransferEngine::TransferEngine(PlatformCapabilities Capabilities, std::shared_ptr<PermissionApplier> Applier, FreeSpaceProbe Probe)
    : Capabilities(Capabilities), Applier(std::move(Applier)), Probe(std::move(Probe))
{
    if (!this->Probe)
    {
        this->Probe = &TransferEngine::MeasureFreeSpace;
    }
}

FS::path TransferEngine::PartialPathFor(const FS::path& Destination)
{
    FS::path Partial = Destination;
    Partial += ".partial";
    return Partial;
}

// The destination folder may not exist yet, so measure the nearest existing ancestor
std::optional<uint64_t> TransferEngine::MeasureFreeSpace(const FS::path& Target)
{
    std::error_code ec;
    FS::path Probe = Target;
    while (!Probe.empty() && !FS::exists(Probe, ec))
    {
        FS::path Parent = Probe.parent_path();
        if (Parent == Probe)
        {
            break;
        }
        Probe = Parent;
    }
    if (Probe.empty())
    {
        return std::nullopt;
    }

    FS::space_info Space = FS::space(Probe, ec);
    if (ec)
    {
        Log.Warn("[TransferEngine] Free space query failed for " + Probe.string() + ": " + ec.message());
        return std::nullopt;
    }
    return Space.available;
}

TransferOutcome TransferEngine::Transfer(const FS::path& Source, const FS::path& Destination, const MediaManagementSettings& Settings)
{
    // Checked before anything touches the filesystem
    if (Settings.Mode == TransferMode::Hardlink && !Capabilities.SupportsHardlinks)
    {
        throw ImportError(ImportErrorCode::HardlinkUnsupported, "Hardlinks are not supported on this platform (" + Source.string() + ")");
    }

    std::error_code ec;
    uintmax_t SourceSize = FS::file_size(Source, ec);
    if (ec)
    {
        throw ImportError(ImportErrorCode::TransferFailure, "Cannot read source " + Source.string() + ": " + ec.message());
    }

    if (!Settings.SkipFreeSpaceCheck)
    {
        PreflightFreeSpace(Destination, SourceSize, Settings);
    }

    FS::create_directories(Destination.parent_path(), ec);
    if (ec)
    {
        throw ImportError(ImportErrorCode::TransferFailure, "Cannot create destination folder " + Destination.parent_path().string() + ": " + ec.message());
    }

    TransferOutcome Outcome;
    Outcome.Source = Source;
    Outcome.Destination = Destination;
    Outcome.Mode = Settings.Mode;
    Outcome.SizeBytes = SourceSize;

    Log.Info("[TransferEngine] " + TransferModeName(Settings.Mode) + ": " + Source.string() + " -> " + Destination.string());

    switch (Settings.Mode)
    {
    case TransferMode::Move:
    {
        ec = RenameInPlace(Source, Destination);
        if (!ec)
        {
            Outcome.RenamedInPlace = true;
            Outcome.SourceRemoved = true;
            break;
        }
        if (ec != std::errc::cross_device_link)
        {
            throw ImportError(ImportErrorCode::TransferFailure, "Move failed for " + Source.string() + ": " + ec.message());
        }

        Log.Info("[TransferEngine] Source and destination are on different volumes, copying then deleting");
        CopyBytes(Source, Destination, SourceSize, Settings.VerifyTransfers);

        FS::remove(Source, ec);
        if (ec)
        {
            Log.Error("[TransferEngine] Copy finished but source could not be removed: " + Source.string() + ": " + ec.message());
        }
        else
        {
            Outcome.SourceRemoved = true;
        }
        break;
    }
    case TransferMode::Copy:
        CopyBytes(Source, Destination, SourceSize, Settings.VerifyTransfers);
        break;
    case TransferMode::Hardlink:
        FS::create_hard_link(Source, Destination, ec);
        if (ec)
        {
            throw ImportError(ImportErrorCode::TransferFailure, "Hardlink failed for " + Source.string() + ": " + ec.message());
        }
        break;
    }

    ApplyPermissions(Destination, Settings);
    return Outcome;
}

std::error_code TransferEngine::RenameInPlace(const FS::path& From, const FS::path& To)
{
    std::error_code ec;
    FS::rename(From, To, ec);
    return ec;
}

void TransferEngine::PreflightFreeSpace(const FS::path& Destination, uint64_t PayloadBytes, const MediaManagementSettings& Settings)
{
    std::optional<uint64_t> FreeBytes = Probe(Destination.parent_path());
    if (!FreeBytes)
    {
        throw ImportError(ImportErrorCode::StorageUnavailable, "Cannot measure free space at " + Destination.parent_path().string());
    }
    if (!HasRoomFor(*FreeBytes, PayloadBytes, Settings.MinimumFreeSpaceBytes))
    {
        throw ImportError(ImportErrorCode::InsufficientSpace, std::to_string(*FreeBytes) + " bytes free at " + Destination.parent_path().string()
            + ", need more than " + std::to_string(PayloadBytes) + " + " + std::to_string(Settings.MinimumFreeSpaceBytes));
    }
}

void TransferEngine::CopyBytes(const FS::path& Source, const FS::path& Destination, uint64_t ExpectedBytes, bool Verify)
{
    const FS::path Partial = PartialPathFor(Destination);
    std::error_code ec;

    auto Fail = [&](const std::string& Reason)
    {
        FS::remove(Partial, ec);
        throw ImportError(ImportErrorCode::TransferFailure, Reason);
    };

    {
        std::ifstream In(Source, std::ios::binary);
        if (!In)
        {
            Fail("Failed to open source file: " + Source.string());
        }
        std::ofstream Out(Partial, std::ios::binary | std::ios::trunc);
        if (!Out)
        {
            Fail("Failed to open destination file: " + Partial.string());
        }

        std::vector<char> Buffer(CopyBufferSize);
        uint64_t Copied = 0;
        while (In)
        {
            In.read(Buffer.data(), static_cast<std::streamsize>(Buffer.size()));
            std::streamsize ReadCount = In.gcount();
            if (ReadCount <= 0)
            {
                break;
            }
            if (!Out.write(Buffer.data(), ReadCount))
            {
                Fail("Write failed at byte " + std::to_string(Copied) + " of " + Partial.string());
            }
            Copied += static_cast<uint64_t>(ReadCount);
        }
        if (In.bad())
        {
            Fail("Read failed at byte " + std::to_string(Copied) + " of " + Source.string());
        }
        Out.flush();
        if (!Out)
        {
            Fail("Flush failed for " + Partial.string());
        }
        if (Copied != ExpectedBytes)
        {
            Fail("Copied " + std::to_string(Copied) + " bytes, expected " + std::to_string(ExpectedBytes) + " for " + Source.string());
        }
    }

    if (Verify)
    {
        if (!FileHasher::SameContent(Source, Partial))
        {
            Fail("Verification failed, copy of " + Source.string() + " does not match");
        }
        Log.Info("[TransferEngine] Verified copy of " + Source.string());
    }

    FS::rename(Partial, Destination, ec);
    if (ec)
    {
        std::string Reason = "Failed to promote " + Partial.string() + ": " + ec.message();
        Fail(Reason);
    }
}

void TransferEngine::ApplyPermissions(const FS::path& Destination, const MediaManagementSettings& Settings)
{
    if (!Settings.Permissions.Enabled)
    {
        return;
    }
    if (!Applier || !Applier->Apply(Destination, Settings.Permissions))
    {
        Log.Warn("[TransferEngine] " + std::string(ImportErrorCodeName(ImportErrorCode::PermissionApplicationFailure)) + " for "
            + Destination.string() + ", import continues");
    }
}

bool TransferEngine::Revert(const TransferOutcome& Outcome)
{
    std::error_code ec;

    if (Outcome.Mode == TransferMode::Move && Outcome.SourceRemoved)
    {
        if (Outcome.RenamedInPlace)
        {
            FS::rename(Outcome.Destination, Outcome.Source, ec);
            if (ec)
            {
                Log.Error("[TransferEngine] Revert: could not move " + Outcome.Destination.string() + " back: " + ec.message());
                return false;
            }
        }
        else
        {
            try
            {
                CopyBytes(Outcome.Destination, Outcome.Source, Outcome.SizeBytes, false);
            }
            catch (const ImportError& e)
            {
                Log.Error(std::string("[TransferEngine] Revert: could not copy back: ") + e.what());
                return false;
            }
            FS::remove(Outcome.Destination, ec);
            if (ec)
            {
                Log.Error("[TransferEngine] Revert: source restored but " + Outcome.Destination.string() + " remains: " + ec.message());
                return false;
            }
        }
        Log.Info("[TransferEngine] Reverted move, file restored to " + Outcome.Source.string());
        return true;
    }

    FS::remove(Outcome.Destination, ec);
    if (ec)
    {
        Log.Error("[TransferEngine] Revert: could not remove " + Outcome.Destination.string() + ": " + ec.message());
        return false;
    }
    Log.Info("[TransferEngine] Reverted transfer, removed " + Outcome.Destination.string());
    return true;
}
