#pragma once

#include <filesystem>
#include <string>

// How a process opens a state file. ReadOnly never takes the lock and never writes.
enum class StoreAccess
{
    ReadWrite,
    ReadOnly
};

// Exclusive advisory lock on a sibling lock file, held until Release or destruction.
// The lock is per open file, so two instances conflict even inside one process.
class StateLock
{
public:
    explicit StateLock(std::filesystem::path LockFilePath);
    ~StateLock();

    StateLock(const StateLock&) = delete;
    StateLock& operator=(const StateLock&) = delete;

    // Non-blocking. False when another holder has it or the lock file cannot be opened.
    bool TryAcquire();
    void Release();
    bool IsHeld() const;

    const std::filesystem::path& Path() const { return LockPath; }

private:
    std::filesystem::path LockPath;
#ifdef _WIN32
    void* Handle = nullptr;
#else
    int Fd = -1;
#endif
};
