#pragma once

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace tilejump::core
{
class JobSystem;

// Outstanding job count for one ParallelFor call. Only the JobSystem changes it,
// and only while holding its queue lock, so a counter may live on the waiter's
// stack.
class JobCounter
{
public:
    JobCounter() = default;
    JobCounter(const JobCounter&) = delete;
    JobCounter& operator=(const JobCounter&) = delete;

private:
    friend class JobSystem;

    std::size_t m_pending = 0;
};

// Process-wide worker pool used for batch validation.
class JobSystem
{
public:
    using JobFunction = std::function<void()>;

    static JobSystem& Instance()
    {
        static JobSystem s_instance;
        return s_instance;
    }

    // workerCount == 0 picks hardware_concurrency - 1 (at least one worker).
    bool Initialize(std::size_t workerCount = 0);
    // Finishes queued jobs, then joins the workers.
    void Shutdown();

    [[nodiscard]] bool IsInitialized() const { return !m_workers.empty(); }
    [[nodiscard]] std::size_t WorkerCount() const { return m_workers.size(); }

    // Runs func(i) for i in [0, count) in batches of |batchSize|. Runs on the
    // calling thread when the pool is down or the work fits in one batch.
    // Pair with WaitForCounter(counter) before reading the results.
    template <typename Func>
    void ParallelFor(std::size_t count, std::size_t batchSize, Func&& func, JobCounter& counter)
    {
        if (count == 0)
        {
            return;
        }
        batchSize = std::max<std::size_t>(1, batchSize);

        if (!IsInitialized() || count <= batchSize)
        {
            for (std::size_t i = 0; i < count; ++i)
            {
                func(i);
            }
            return;
        }

        auto shared = std::make_shared<std::decay_t<Func>>(std::forward<Func>(func));
        std::vector<JobFunction> jobs;
        jobs.reserve((count + batchSize - 1) / batchSize);
        for (std::size_t begin = 0; begin < count; begin += batchSize)
        {
            const std::size_t end = std::min(begin + batchSize, count);
            jobs.push_back([begin, end, shared]() {
                for (std::size_t i = begin; i < end; ++i)
                {
                    (*shared)(i);
                }
            });
        }
        ScheduleBatch(std::move(jobs), counter);
    }

    // Blocks until every job scheduled against |counter| has finished.
    void WaitForCounter(JobCounter& counter);

private:
    JobSystem() = default;
    ~JobSystem() { Shutdown(); }

    JobSystem(const JobSystem&) = delete;
    JobSystem& operator=(const JobSystem&) = delete;

    struct Job
    {
        JobFunction function;
        JobCounter* counter = nullptr;
    };

    void ScheduleBatch(std::vector<JobFunction> jobs, JobCounter& counter);
    void WorkerThread();

    std::vector<std::thread> m_workers;
    std::queue<Job> m_jobs;
    std::mutex m_queueMutex;
    std::condition_variable m_jobAvailable;
    std::condition_variable m_jobFinished;
    bool m_stopping = false;
};
} // namespace tilejump::core
