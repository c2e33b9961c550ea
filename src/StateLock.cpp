#include "StateLock.hpp"
#include "Logger.hpp"

#include <utility>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#endif

namespace FS = std::filesystem;

StateLock::StateLock(FS::path LockFilePath) : LockPath(std::move(LockFilePath))
{
}

StateLock::~StateLock()
{
    Release();
}

bool StateLock::TryAcquire()
{
    if (IsHeld())
    {
        return true;
    }

    std::error_code ec;
    if (LockPath.has_parent_path())
    {
        FS::create_directories(LockPath.parent_path(), ec);
    }

#ifdef _WIN32
    // No sharing: a second open fails while this handle lives
    HANDLE File = CreateFileW(LockPath.c_str(), GENERIC_READ | GENERIC_WRITE, 0, nullptr, OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (File == INVALID_HANDLE_VALUE)
    {
        if (GetLastError() != ERROR_SHARING_VIOLATION)
        {
            Log.Error("[StateLock] Could not open lock file " + LockPath.string() + " (error " + std::to_string(GetLastError()) + ")");
        }
        return false;
    }
    Handle = File;
    return true;
#else
    int File = ::open(LockPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (File < 0)
    {
        Log.Error("[StateLock] Could not open lock file " + LockPath.string() + ": " + std::strerror(errno));
        return false;
    }

    if (::flock(File, LOCK_EX | LOCK_NB) != 0)
    {
        int Error = errno;
        ::close(File);
        if (Error != EWOULDBLOCK)
        {
            Log.Error("[StateLock] flock failed on " + LockPath.string() + ": " + std::strerror(Error));
        }
        return false;
    }

    // Holder pid, for whoever finds the lock busy
    if (::ftruncate(File, 0) == 0)
    {
        const std::string Pid = std::to_string(::getpid()) + "\n";
        if (::write(File, Pid.data(), Pid.size()) < 0)
        {
            Log.Warn("[StateLock] Could not record pid in " + LockPath.string());
        }
    }
    Fd = File;
    return true;
#endif
}

void StateLock::Release()
{
#ifdef _WIN32
    if (Handle != nullptr)
    {
        CloseHandle(static_cast<HANDLE>(Handle));
        Handle = nullptr;
    }
#else
    if (Fd >= 0)
    {
        ::flock(Fd, LOCK_UN);
        ::close(Fd);
        Fd = -1;
    }
#endif
}

bool StateLock::IsHeld() const
{
#ifdef _WIN32
    return Handle != nullptr;
#else
    return Fd >= 0;
#endif
}
