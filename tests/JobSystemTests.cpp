#include "tilejump/core/JobSystem.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <vector>

using tilejump::core::JobCounter;
using tilejump::core::JobSystem;

namespace
{
class JobSystemTest : public ::testing::Test
{
protected:
    void SetUp() override { JobSystem::Instance().Initialize(4); }
    void TearDown() override { JobSystem::Instance().Shutdown(); }
};
} // namespace

TEST(JobSystemInline, ParallelForRunsOnCallerWhenNotInitialized)
{
    ASSERT_FALSE(JobSystem::Instance().IsInitialized());

    std::vector<int> hits(100, 0);
    JobCounter counter;
    JobSystem::Instance().ParallelFor(hits.size(), 8, [&hits](std::size_t i) { ++hits[i]; }, counter);
    JobSystem::Instance().WaitForCounter(counter);

    for (const int hit : hits)
    {
        EXPECT_EQ(hit, 1);
    }
}

TEST_F(JobSystemTest, ReportsWorkers)
{
    EXPECT_TRUE(JobSystem::Instance().IsInitialized());
    EXPECT_EQ(JobSystem::Instance().WorkerCount(), 4U);
}

TEST_F(JobSystemTest, ParallelForVisitsEveryIndexOnce)
{
    constexpr std::size_t kCount = 1000;
    std::vector<std::atomic<int>> hits(kCount);

    JobCounter counter;
    JobSystem::Instance().ParallelFor(kCount, 16, [&hits](std::size_t i) { hits[i].fetch_add(1); }, counter);
    JobSystem::Instance().WaitForCounter(counter);

    for (std::size_t i = 0; i < kCount; ++i)
    {
        EXPECT_EQ(hits[i].load(), 1) << "index " << i;
    }
}

TEST_F(JobSystemTest, SmallWorkRunsInline)
{
    std::vector<int> hits(4, 0);
    JobCounter counter;
    JobSystem::Instance().ParallelFor(hits.size(), 16, [&hits](std::size_t i) { ++hits[i]; }, counter);

    // Fits in one batch, so it is already done without waiting.
    EXPECT_EQ(hits, (std::vector<int>{1, 1, 1, 1}));
    JobSystem::Instance().WaitForCounter(counter);
}

TEST_F(JobSystemTest, StackCountersSurviveManyShortRounds)
{
    // Each round's counter dies right after the wait returns; workers must be
    // done with it by then.
    for (int round = 0; round < 20000; ++round)
    {
        std::atomic<int> sum{0};
        JobCounter counter;
        JobSystem::Instance().ParallelFor(4, 1, [&sum](std::size_t i) { sum.fetch_add(static_cast<int>(i) + 1); }, counter);
        JobSystem::Instance().WaitForCounter(counter);
        ASSERT_EQ(sum.load(), 10) << "round " << round;
    }
}

TEST_F(JobSystemTest, ThrowingJobDoesNotStallCounter)
{
    std::atomic<int> finished{0};
    JobCounter counter;
    JobSystem::Instance().ParallelFor(
        8,
        1,
        [&finished](std::size_t i) {
            if (i == 3)
            {
                throw std::runtime_error("boom");
            }
            finished.fetch_add(1);
        },
        counter);
    JobSystem::Instance().WaitForCounter(counter);

    EXPECT_EQ(finished.load(), 7);
}

TEST(JobSystemLifecycle, ShutdownFinishesQueuedWork)
{
    JobSystem& jobs = JobSystem::Instance();
    jobs.Initialize(2);

    std::atomic<int> done{0};
    JobCounter counter;
    jobs.ParallelFor(64, 1, [&done](std::size_t) { done.fetch_add(1); }, counter);
    jobs.Shutdown();

    EXPECT_EQ(done.load(), 64);
    EXPECT_FALSE(jobs.IsInitialized());
    jobs.WaitForCounter(counter);
}
