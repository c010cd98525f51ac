#include "tilejump/core/JobSystem.hpp"

#include <exception>
#include <iostream>

namespace tilejump::core
{
bool JobSystem::Initialize(std::size_t workerCount)
{
    if (IsInitialized())
    {
        return true;
    }

    if (workerCount == 0)
    {
        const unsigned hardware = std::thread::hardware_concurrency();
        workerCount = hardware > 1 ? hardware - 1 : 1;
    }

    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        m_stopping = false;
    }
    m_workers.reserve(workerCount);
    for (std::size_t i = 0; i < workerCount; ++i)
    {
        m_workers.emplace_back(&JobSystem::WorkerThread, this);
    }

    std::cout << "[JobSystem] Initialized with " << workerCount << " workers\n";
    return true;
}

void JobSystem::Shutdown()
{
    if (!IsInitialized())
    {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        m_stopping = true;
    }
    m_jobAvailable.notify_all();

    for (std::thread& worker : m_workers)
    {
        worker.join();
    }
    m_workers.clear();
    std::cout << "[JobSystem] Shutdown complete\n";
}

void JobSystem::ScheduleBatch(std::vector<JobFunction> jobs, JobCounter& counter)
{
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        for (JobFunction& job : jobs)
        {
            ++counter.m_pending;
            m_jobs.push(Job{std::move(job), &counter});
        }
    }
    m_jobAvailable.notify_all();
}

void JobSystem::WaitForCounter(JobCounter& counter)
{
    std::unique_lock<std::mutex> lock(m_queueMutex);
    m_jobFinished.wait(lock, [&counter]() { return counter.m_pending == 0; });
}

void JobSystem::WorkerThread()
{
    while (true)
    {
        Job job;
        {
            std::unique_lock<std::mutex> lock(m_queueMutex);
            m_jobAvailable.wait(lock, [this]() { return m_stopping || !m_jobs.empty(); });
            if (m_jobs.empty())
            {
                return;
            }
            job = std::move(m_jobs.front());
            m_jobs.pop();
        }

        try
        {
            job.function();
        }
        catch (const std::exception& e)
        {
            std::cerr << "[JobSystem] Job threw exception: " << e.what() << "\n";
        }

        // The waiter may destroy the counter as soon as the lock is released.
        {
            std::lock_guard<std::mutex> lock(m_queueMutex);
            --job.counter->m_pending;
        }
        m_jobFinished.notify_all();
    }
}
} // namespace tilejump::core
