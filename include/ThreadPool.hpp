#pragma once

#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <string>

class ThreadPool
{
public:
    explicit ThreadPool(size_t ThreadCount, std::string PoolName = "ThreadPool");
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void Submit(std::function<void()> Job);

    // Blocks until every submitted job has finished
    void Join();

    size_t PendingJobs();

private:
    std::vector<std::thread> Workers;
    std::queue<std::function<void()>> Jobs;
    std::string Name;

    std::mutex ThreadPoolMutex;
    std::condition_variable ThreadPool_CV;
    std::condition_variable Idle_CV;
    bool ThreadPoolStop = false;
    size_t ThreadPoolActiveJobs = 0;

    void WorkerThread();
};
