#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>
#include "../src/benchmark/Benchmarker.hpp"
#include "../src/threading/CancellationToken.hpp"
#include "../src/threading/ThreadPool.hpp"

using namespace ExecAggregator;
using namespace std::chrono_literals;

TEST(ThreadPool, RunsEverySubmittedTask)
{
    ThreadPool pool(4);
    EXPECT_EQ(pool.thread_count(), 4u);

    std::atomic<int> counter{0};
    for (int i = 0; i < 1'000; ++i)
        pool.submit([&counter]
                    { counter.fetch_add(1, std::memory_order_relaxed); });

    pool.shutdown();
    EXPECT_EQ(counter.load(), 1'000);
}

TEST(ThreadPool, FutureCarriesResultAndException)
{
    ThreadPool pool(2);

    auto value = pool.submit([]
                             { return 6 * 7; });
    auto failure = pool.submit([]() -> int
                               { throw std::runtime_error("boom"); });

    EXPECT_EQ(value.get(), 42);
    EXPECT_THROW(failure.get(), std::runtime_error);
}

TEST(ThreadPool, ShutdownDrainsQueueAndRejectsNewWork)
{
    std::atomic<int> counter{0};
    ThreadPool pool(1);
    for (int i = 0; i < 10; ++i)
        pool.submit([&counter]
                    {
                        std::this_thread::sleep_for(1ms);
                        ++counter; });

    pool.shutdown();
    EXPECT_EQ(counter.load(), 10);
    EXPECT_EQ(pool.thread_count(), 0u);
    EXPECT_THROW(pool.submit([] {}), std::runtime_error);

    pool.shutdown(); // second call is a no-op
}

TEST(ThreadPool, ZeroWorkersIsRejected)
{
    EXPECT_THROW(ThreadPool pool(0), std::invalid_argument);
}

TEST(CancellationToken, CancelIsSeenByOtherThreads)
{
    CancellationToken token;
    EXPECT_FALSE(token.cancelled());

    std::thread canceller([&token]
                          { token.cancel(); });
    canceller.join();

    EXPECT_TRUE(token.cancelled());
    token.cancel(); // idempotent
    EXPECT_TRUE(token.cancelled());
}

TEST(Benchmarker, RecordsIntoLedgerOnScopeExit)
{
    BenchmarkLedger ledger;
    {
        Benchmarker bm("Reduce", &ledger, 10);
    }
    {
        Benchmarker bm("Reduce", &ledger);
        bm.set_items(5);
    }

    const auto results = ledger.snapshot();
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].label, "Reduce");
    EXPECT_EQ(results[0].samples, 2u);
    EXPECT_EQ(results[0].item_count, 15u);
    EXPECT_GE(results[0].duration_ns, 0);
}

TEST(Benchmarker, RecordsEvenWhenTheStageThrows)
{
    BenchmarkLedger ledger;
    try
    {
        Benchmarker bm("Commit", &ledger, 1);
        throw std::runtime_error("commit failed");
    }
    catch (const std::runtime_error &)
    {
    }

    ASSERT_EQ(ledger.snapshot().size(), 1u);
    EXPECT_EQ(ledger.snapshot()[0].samples, 1u);
}

TEST(Benchmarker, NullLedgerIsAllowed)
{
    EXPECT_NO_THROW({ Benchmarker bm("Fetch", nullptr, 3); });
}

TEST(BenchmarkResult, DerivedRates)
{
    BenchmarkResult r;
    EXPECT_EQ(r.ns_per_item(), 0.0);
    EXPECT_EQ(r.items_per_second(), 0.0);

    r.duration_ns = 2'000'000'000;
    r.item_count = 1'000;
    EXPECT_DOUBLE_EQ(r.duration_ms(), 2'000.0);
    EXPECT_DOUBLE_EQ(r.ns_per_item(), 2'000'000.0);
    EXPECT_DOUBLE_EQ(r.items_per_second(), 500.0);
}
