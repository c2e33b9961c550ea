#pragma once

#include <cstdint>
#include <vector>

#include "MediaSettings.hpp"

// Strictly greater: free space must exceed payload plus buffer.
// Compared by subtraction so huge values cannot wrap.
inline bool HasRoomFor(uint64_t FreeBytes, uint64_t PayloadBytes, uint64_t BufferBytes)
{
    return FreeBytes > PayloadBytes && FreeBytes - PayloadBytes > BufferBytes;
}

class RootSelector
{
public:
    // Probes every root for reachability and free space
    static void Refresh(std::vector<RootLocation>& Roots);

    // Reachable root with the most free space that still fits the payload.
    // Falls back to the roomiest reachable root (the transfer preflight
    // reports InsufficientSpace). Throws StorageUnavailable when none is reachable.
    static RootLocation Select(const std::vector<RootLocation>& Roots, uint64_t PayloadBytes, uint64_t MinimumFreeBytes);
};
