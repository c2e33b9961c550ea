#include "ThreadPool.hpp"
#include "Logger.hpp"

#include <exception>

ThreadPool::ThreadPool(size_t ThreadCount, std::string PoolName) : Name(std::move(PoolName))
{
    if (ThreadCount == 0)
    {
        ThreadCount = 1;
    }
    for (size_t i = 0; i < ThreadCount; ++i)
    {
        Workers.emplace_back(&ThreadPool::WorkerThread, this);
    }
}

ThreadPool::~ThreadPool()
{
    {
        std::unique_lock<std::mutex> Lock(ThreadPoolMutex);
        ThreadPoolStop = true;
    }
    ThreadPool_CV.notify_all();
    for (std::thread& Worker : Workers)
    {
        if (Worker.joinable())
        {
            Worker.join();
        }
    }
}

void ThreadPool::Submit(std::function<void()> Job)
{
    {
        std::unique_lock<std::mutex> Lock(ThreadPoolMutex);
        Jobs.push(std::move(Job));
        ++ThreadPoolActiveJobs;
    }
    ThreadPool_CV.notify_one();
}

void ThreadPool::Join()
{
    std::unique_lock<std::mutex> Lock(ThreadPoolMutex);
    Idle_CV.wait(Lock, [this] { return ThreadPoolActiveJobs == 0; });
}

size_t ThreadPool::PendingJobs()
{
    std::unique_lock<std::mutex> Lock(ThreadPoolMutex);
    return ThreadPoolActiveJobs;
}

void ThreadPool::WorkerThread()
{
    while (true)
    {
        std::function<void()> Job;
        {
            std::unique_lock<std::mutex> Lock(ThreadPoolMutex);
            ThreadPool_CV.wait(Lock, [this] { return ThreadPoolStop || !Jobs.empty(); });
            if (ThreadPoolStop && Jobs.empty())
            {
                return;
            }
            Job = std::move(Jobs.front());
            Jobs.pop();
        }

        try
        {
            Job();
        }
        catch (const std::exception& e)
        {
            Log.Error("[" + Name + "] Job terminated with exception: " + e.what());
        }

        {
            std::unique_lock<std::mutex> Lock(ThreadPoolMutex);
            --ThreadPoolActiveJobs;
            if (ThreadPoolActiveJobs == 0)
            {
                Idle_CV.notify_all();
            }
        }
    }
}
