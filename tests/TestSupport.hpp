#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "FetchAgentClient.hpp"
#include "HttpTransport.hpp"
#include "ImportLedger.hpp"
#include "ImportRunner.hpp"
#include "LibraryCatalog.hpp"
#include "QueueStore.hpp"
#include "SettingsStore.hpp"
#include "TransferEngine.hpp"

// Scripted transport: answers from a queue, or from a handler when one is set
class FakeHttpTransport : public HttpTransport
{
public:
    using Handler = std::function<std::optional<HttpResponse>(const HttpRequest&)>;

    std::optional<HttpResponse> Send(const HttpRequest& Request) override
    {
        std::lock_guard<std::mutex> Lock(Mutex);
        Requests.push_back(Request);
        if (OnRequest)
        {
            return OnRequest(Request);
        }
        if (Scripted.empty())
        {
            return std::nullopt;
        }
        std::optional<HttpResponse> Next = Scripted.front();
        Scripted.pop_front();
        return Next;
    }

    void Push(long Status, std::string Body, std::vector<std::pair<std::string, std::string>> Headers = {})
    {
        HttpResponse Response;
        Response.Status = Status;
        Response.Body = std::move(Body);
        Response.Headers = std::move(Headers);
        Scripted.push_back(Response);
    }

    void PushUnreachable()
    {
        Scripted.push_back(std::nullopt);
    }

    size_t RequestCount()
    {
        std::lock_guard<std::mutex> Lock(Mutex);
        return Requests.size();
    }

    std::vector<HttpRequest> Requests;
    Handler OnRequest;

private:
    std::mutex Mutex;
    std::deque<std::optional<HttpResponse>> Scripted;
};

inline bool HasHeader(const HttpRequest& Request, const std::string& Name, const std::string& Value)
{
    for (const auto& [HeaderName, HeaderValue] : Request.Headers)
    {
        if (HeaderName == Name && HeaderValue == Value)
        {
            return true;
        }
    }
    return false;
}

// Fresh directory under the system temp folder, removed on destruction
class TempDir
{
public:
    TempDir()
    {
        std::random_device Device;
        std::mt19937_64 Gen(Device());
        Path = std::filesystem::temp_directory_path() / ("importflow_test_" + std::to_string(Gen()));
        std::filesystem::create_directories(Path);
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(Path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::filesystem::path operator/(const std::string& Relative) const { return Path / Relative; }

    std::filesystem::path Path;
};

inline void WriteFileOfSize(const std::filesystem::path& FilePath, size_t Size, char Fill = 'x')
{
    std::filesystem::create_directories(FilePath.parent_path());
    std::ofstream Out(FilePath, std::ios::binary | std::ios::trunc);
    std::string Chunk(std::min<size_t>(Size, 65536), Fill);
    size_t Remaining = Size;
    while (Remaining > 0)
    {
        size_t Step = std::min(Remaining, Chunk.size());
        Out.write(Chunk.data(), static_cast<std::streamsize>(Step));
        Remaining -= Step;
    }
}

inline std::string ReadFileText(const std::filesystem::path& FilePath)
{
    std::ifstream In(FilePath, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(In), std::istreambuf_iterator<char>());
}

// In-memory library with switchable failures
class FakeLibraryCatalog : public LibraryCatalog
{
public:
    std::optional<LibraryItem> GetItem(uint64_t Id) override
    {
        std::lock_guard<std::mutex> Lock(Mutex);
        for (const auto& Item : Items)
        {
            if (Item.Id == Id)
            {
                return Item;
            }
        }
        return std::nullopt;
    }

    bool UpdateStatus(uint64_t Id, const std::string& Status) override
    {
        if (BeforeUpdate)
        {
            BeforeUpdate(Id, Status);
        }
        std::lock_guard<std::mutex> Lock(Mutex);
        ++UpdateCalls;
        if (FailUpdates)
        {
            return false;
        }
        for (auto& Item : Items)
        {
            if (Item.Id == Id)
            {
                Item.Status = Status;
                return true;
            }
        }
        return false;
    }

    std::string StatusOf(uint64_t Id)
    {
        auto Item = GetItem(Id);
        return Item ? Item->Status : "";
    }

    std::vector<LibraryItem> Items;
    bool FailUpdates = false;
    int UpdateCalls = 0;
    std::function<void(uint64_t, const std::string&)> BeforeUpdate;

private:
    std::mutex Mutex;
};

// Queue, ledger, library and runner wired together over a temp folder.
// Library item 1 is "Main Event: Night One", aired 2024-03-09.
// With PersistState the queue and ledger live in files under Dir/state.
struct ImportHarness
{
    TempDir Dir;
    QueueStore Queue;
    ImportLedger Ledger;
    FakeLibraryCatalog Library;
    SettingsStore Settings;
    TransferEngine Transfers;
    ImportRunner Runner;

    explicit ImportHarness(bool PersistState = false)
        : Queue(PersistState ? (Dir / "state/queue.bin").string() : ""),
          Ledger(PersistState ? (Dir / "state/ledger.bin").string() : ""),
          Settings((Dir / "settings.conf").string()),
          Transfers(LinuxCapabilities(), nullptr, [](const std::filesystem::path&) { return std::optional<uint64_t>(1ULL << 40); }),
          Runner(Queue, Ledger, Library, Settings, Transfers)
    {
        if (!Queue.Load() || !Ledger.Load())
        {
            throw std::runtime_error("Harness state could not be loaded under " + Dir.Path.string());
        }

        LibraryItem Item;
        Item.Id = 1;
        Item.Title = "Main Event: Night One";
        Item.AirDate = "2024-03-09";
        Item.Status = "Wanted";
        Library.Items.push_back(Item);

        std::filesystem::create_directories(LibraryRoot());
        RootLocation Root;
        Root.Path = LibraryRoot().string();

        MediaManagementSettings Defaults;
        Defaults.RootFolders = { Root };
        Defaults.MinimumFreeSpaceBytes = 0;
        Settings.Replace(Defaults);
    }

    static PlatformCapabilities LinuxCapabilities()
    {
        PlatformCapabilities Caps;
        Caps.SupportsHardlinks = true;
        Caps.SupportsPosixPermissions = true;
        return Caps;
    }

    void Configure(const std::function<void(MediaManagementSettings&)>& Edit)
    {
        MediaManagementSettings Next = *Settings.Current();
        Edit(Next);
        Settings.Replace(Next);
    }

    std::filesystem::path QueueFile() const { return Dir / "state/queue.bin"; }
    std::filesystem::path LedgerFile() const { return Dir / "state/ledger.bin"; }
    std::filesystem::path LibraryRoot() const { return Dir / "library"; }
    std::filesystem::path PayloadDir() const { return Dir / "downloads/Main.Event.Night.One.2024.1080p.WEB-DL-GROUP"; }
    std::filesystem::path FeatureFile() const { return PayloadDir() / "Main.Event.Night.One.2024.1080p.WEB-DL-GROUP.mkv"; }

    std::filesystem::path ExpectedDestination() const
    {
        return LibraryRoot() / "Main Event Night One" / "Main Event Night One - 2024-03-09 - WEBDL-1080p.mkv";
    }

    // Feature plus a small sample, the usual shape of a finished download
    void WritePayload()
    {
        WriteFileOfSize(FeatureFile(), 4000);
        WriteFileOfSize(PayloadDir() / "Sample/sample.mkv", 50);
    }

    // Queue item that has passed the import gate, pointing at ContentPath
    QueueItem AddImporting(const std::filesystem::path& ContentPath, uint64_t LibraryItemId = 1)
    {
        QueueItem Item = *Queue.Add("Main Event: Night One", LibraryItemId, "qbit", "abc123");
        Queue.Transition(Item.Id, QueueStatus::Completed);
        Queue.UpdateProgress(Item.Id, 100.0, ContentPath.string());
        Queue.BeginImport(Item.Id);
        return *Queue.Get(Item.Id);
    }
};
