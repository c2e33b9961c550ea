#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <system_error>

#include "MediaSettings.hpp"
#include "PlatformSupport.hpp"

struct TransferOutcome
{
    std::filesystem::path Source;
    std::filesystem::path Destination;
    TransferMode Mode = TransferMode::Move;
    uint64_t SizeBytes = 0;
    bool RenamedInPlace = false; // Move satisfied by a same-volume rename
    bool SourceRemoved = false;
};

// Available bytes at (or above) a path; nullopt when it cannot be measured
using FreeSpaceProbe = std::function<std::optional<uint64_t>(const std::filesystem::path&)>;

class TransferEngine
{
public:
    TransferEngine(PlatformCapabilities Capabilities, std::shared_ptr<PermissionApplier> Applier, FreeSpaceProbe Probe = FreeSpaceProbe());
    virtual ~TransferEngine() = default;

    // Places Source at Destination using Settings.Mode. Throws ImportError;
    // on failure the destination path holds no file written by this call.
    TransferOutcome Transfer(const std::filesystem::path& Source, const std::filesystem::path& Destination, const MediaManagementSettings& Settings);

    // Best effort undo of a finished transfer, used when the commit fails
    bool Revert(const TransferOutcome& Outcome);

    static std::filesystem::path PartialPathFor(const std::filesystem::path& Destination);
    static std::optional<uint64_t> MeasureFreeSpace(const std::filesystem::path& Target);

    static constexpr size_t CopyBufferSize = 81920;

protected:
    // Same-volume move. cross_device_link sends a Move down the copy path.
    virtual std::error_code RenameInPlace(const std::filesystem::path& From, const std::filesystem::path& To);

private:
    void PreflightFreeSpace(const std::filesystem::path& Destination, uint64_t PayloadBytes, const MediaManagementSettings& Settings);
    void CopyBytes(const std::filesystem::path& Source, const std::filesystem::path& Destination, uint64_t ExpectedBytes, bool Verify);
    void ApplyPermissions(const std::filesystem::path& Destination, const MediaManagementSettings& Settings);

    PlatformCapabilities Capabilities;
    std::shared_ptr<PermissionApplier> Applier;
    FreeSpaceProbe Probe;
};
