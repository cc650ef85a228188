#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <string>
#include <vector>
#include "../src/pipeline/PartitionCycle.hpp"
#include "support/InMemoryStores.hpp"

using namespace ExecAggregator;
using test_support::Fault;
using test_support::InMemoryDatabase;
using test_support::InMemoryLeases;
using test_support::InMemoryRawSource;

namespace
{
    const PartitionKey kBtc{"bitflyer", "BTC_JPY"};

    class PartitionCycleTest : public ::testing::Test
    {
    protected:
        PartitionCycleTest()
        {
            config.scheduler.worker_id = "test-worker";
        }

        CycleResult run_once(PartitionCycle &cycle)
        {
            return cycle.run(kBtc, state, cancel);
        }

        PipelineStores stores() { return PipelineStores{source, db, db, nullptr}; }

        PipelineConfig config;
        InMemoryRawSource source;
        InMemoryDatabase db;
        CancellationToken cancel;
        std::atomic<PartitionState> state{PartitionState::Idle};
    };
}

TEST_F(PartitionCycleTest, CommitsReferenceBatch)
{
    source.append(kBtc, 1, 100, 10.0, 2.0, Side::Buy);
    source.append(kBtc, 2, 100, 12.0, 3.0, Side::Buy);
    source.append(kBtc, 3, 105, 9.0, 1.0, Side::Sell);

    PartitionCycle cycle(stores(), config);
    const auto result = run_once(cycle);

    EXPECT_EQ(result.status, CycleResult::Status::Committed);
    EXPECT_EQ(result.outcome, CommitOutcome::Committed);
    EXPECT_EQ(result.watermark_before, kBeginning);
    EXPECT_EQ(result.watermark_after, 3);
    EXPECT_EQ(result.raw_rows, 3u);
    EXPECT_EQ(result.aggregated_rows, 2u);
    EXPECT_EQ(state.load(), PartitionState::Idle);

    EXPECT_EQ(db.get(kBtc), 3);
    const auto rows = db.rows(kBtc);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].timestamp, 100);
    EXPECT_EQ(rows[0].trade_count, 2);
    EXPECT_DOUBLE_EQ(rows[0].volume_sum, 5.0);
    EXPECT_EQ(rows[1].timestamp, 105);
    EXPECT_EQ(rows[1].side, Side::Sell);
}

TEST_F(PartitionCycleTest, EmptyFetchLeavesWatermarkAndDestinationAlone)
{
    db.set_watermark(kBtc, 42);
    PartitionCycle cycle(stores(), config);

    const auto result = run_once(cycle);

    EXPECT_EQ(result.status, CycleResult::Status::Empty);
    EXPECT_EQ(db.get(kBtc), 42);
    EXPECT_EQ(db.bulk_loads(), 0u);
    EXPECT_EQ(db.commits(), 0u);
}

TEST_F(PartitionCycleTest, NoTimestampGroupIsSplitAcrossBatches)
{
    config.batch.max_rows = 2;
    source.append(kBtc, 1, 100, 1.0, 1.0);
    source.append(kBtc, 2, 101, 1.0, 1.0);
    source.append(kBtc, 3, 101, 1.0, 1.0);
    source.append(kBtc, 4, 102, 1.0, 1.0);

    PartitionCycle cycle(stores(), config);

    auto first = run_once(cycle);
    EXPECT_EQ(first.watermark_after, 1); // ts=101 group trimmed
    auto second = run_once(cycle);
    EXPECT_EQ(second.watermark_after, 3);
    auto third = run_once(cycle);
    EXPECT_EQ(third.watermark_after, 4);
    EXPECT_EQ(run_once(cycle).status, CycleResult::Status::Empty);

    const auto rows = db.rows(kBtc);
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[1].timestamp, 101);
    EXPECT_EQ(rows[1].trade_count, 2);
    EXPECT_EQ(db.watermark_history(kBtc), (std::vector<Sequence>{1, 3, 4}));
}

TEST_F(PartitionCycleTest, OversizedGroupExtendsTheBatch)
{
    config.batch.max_rows = 2;
    for (Sequence seq = 1; seq <= 5; ++seq)
        source.append(kBtc, seq, 100, 10.0 + seq, 1.0);
    source.append(kBtc, 6, 101, 1.0, 1.0);

    PartitionCycle cycle(stores(), config);
    const auto result = run_once(cycle);

    EXPECT_EQ(result.raw_rows, 5u);
    EXPECT_EQ(result.watermark_after, 5);

    const auto rows = db.rows(kBtc);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].trade_count, 5);
    EXPECT_DOUBLE_EQ(rows[0].price_open, 11.0);
    EXPECT_DOUBLE_EQ(rows[0].price_close, 15.0);
}

TEST_F(PartitionCycleTest, YoungTailIsHeldBackUntilSettled)
{
    config.batch.tail_settle = std::chrono::milliseconds(1'000);
    source.append(kBtc, 1, 100, 1.0, 1.0);
    source.append(kBtc, 2, 600, 1.0, 1.0);

    std::int64_t now = 1'500;
    PartitionCycle cycle(stores(), config);
    cycle.set_clock([&now]
                    { return now; });

    auto first = run_once(cycle);
    EXPECT_EQ(first.status, CycleResult::Status::Committed);
    EXPECT_EQ(first.held_back_rows, 1u);
    EXPECT_EQ(db.get(kBtc), 1);

    // A late row for ts=600 arrives before the group settles.
    source.append(kBtc, 3, 600, 2.0, 1.0);
    now = 2'000;

    auto second = run_once(cycle);
    EXPECT_EQ(second.status, CycleResult::Status::Committed);
    EXPECT_EQ(db.get(kBtc), 3);

    const auto rows = db.rows(kBtc);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[1].trade_count, 2);
}

TEST_F(PartitionCycleTest, LateRowForTheNewestTimestampJoinsItsGroup)
{
    // Default settling window.
    source.append(kBtc, 1, 100, 10.0, 1.0, Side::Buy);
    source.append(kBtc, 2, 105, 11.0, 1.0, Side::Sell);

    std::int64_t now = 1'105;
    PartitionCycle cycle(stores(), config);
    cycle.set_clock([&now]
                    { return now; });

    auto first = run_once(cycle);
    EXPECT_EQ(first.held_back_rows, 1u);
    EXPECT_EQ(db.get(kBtc), 1);

    // The downloader writes one more sell at ts=105, then moves on.
    source.append(kBtc, 3, 105, 12.0, 2.0, Side::Sell);
    source.append(kBtc, 4, 106, 13.0, 1.0, Side::Buy);
    now = 106 + config.batch.tail_settle.count();

    auto second = run_once(cycle);
    EXPECT_EQ(second.status, CycleResult::Status::Committed);
    EXPECT_EQ(second.held_back_rows, 1u);
    EXPECT_EQ(db.get(kBtc), 3);

    now += config.batch.tail_settle.count();
    auto third = run_once(cycle);
    EXPECT_EQ(third.outcome, CommitOutcome::Committed);
    EXPECT_EQ(db.get(kBtc), 4);

    const auto rows = db.rows(kBtc);
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[1].timestamp, 105);
    EXPECT_EQ(rows[1].side, Side::Sell);
    EXPECT_EQ(rows[1].trade_count, 2);
    EXPECT_DOUBLE_EQ(rows[1].price_open, 11.0);
    EXPECT_DOUBLE_EQ(rows[1].price_close, 12.0);
    EXPECT_EQ(db.watermark_history(kBtc), (std::vector<Sequence>{1, 3, 4}));
}

TEST_F(PartitionCycleTest, YoungOversizedGroupWaitsToSettle)
{
    config.batch.max_rows = 2;
    config.batch.tail_settle = std::chrono::milliseconds(1'000);
    for (Sequence seq = 1; seq <= 5; ++seq)
        source.append(kBtc, seq, 600, 10.0, 1.0);

    std::int64_t now = 1'500;
    PartitionCycle cycle(stores(), config);
    cycle.set_clock([&now]
                    { return now; });

    auto first = run_once(cycle);
    EXPECT_EQ(first.status, CycleResult::Status::Empty);
    EXPECT_EQ(first.held_back_rows, 5u);
    EXPECT_EQ(db.bulk_loads(), 0u);

    source.append(kBtc, 6, 600, 10.0, 1.0);
    now = 2'000;

    auto second = run_once(cycle);
    EXPECT_EQ(second.status, CycleResult::Status::Committed);
    EXPECT_EQ(second.raw_rows, 6u);
    EXPECT_EQ(db.get(kBtc), 6);

    const auto rows = db.rows(kBtc);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].trade_count, 6);
}

TEST_F(PartitionCycleTest, SplitStoresRebuildInterruptedBatchAfterSourceGrew)
{
    InMemoryDatabase split(false);
    split.inject(Fault::BetweenLoadAndAdvance, ErrorKind::TransientIo);
    source.append(kBtc, 1, 100, 10.0, 2.0, Side::Buy);
    source.append(kBtc, 2, 100, 12.0, 3.0, Side::Buy);
    source.append(kBtc, 3, 105, 9.0, 1.0, Side::Sell);

    PartitionCycle cycle(PipelineStores{source, split, split, nullptr}, config);
    EXPECT_THROW((void)run_once(cycle), PipelineError);

    // Rows landed without their watermark.
    EXPECT_EQ(split.rows(kBtc).size(), 2u);
    EXPECT_EQ(split.get(kBtc), kBeginning);
    ASSERT_TRUE(split.pending_intent(kBtc).has_value());

    source.append(kBtc, 4, 110, 8.0, 1.0, Side::Buy);

    auto recovered = run_once(cycle);
    EXPECT_EQ(recovered.outcome, CommitOutcome::Recovered);
    EXPECT_EQ(recovered.raw_rows, 3u);
    EXPECT_EQ(split.get(kBtc), 3);
    EXPECT_FALSE(split.pending_intent(kBtc).has_value());

    auto next = run_once(cycle);
    EXPECT_EQ(next.outcome, CommitOutcome::Committed);
    EXPECT_EQ(split.get(kBtc), 4);

    const auto rows = split.rows(kBtc);
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].trade_count, 2);
    EXPECT_EQ(rows[2].timestamp, 110);
}

TEST_F(PartitionCycleTest, CancelledBeforeFetchDoesNothing)
{
    source.append(kBtc, 1, 100, 1.0, 1.0);
    cancel.cancel();

    PartitionCycle cycle(stores(), config);
    EXPECT_EQ(run_once(cycle).status, CycleResult::Status::Cancelled);
    EXPECT_EQ(source.fetch_calls(), 0u);
    EXPECT_EQ(db.get(kBtc), kBeginning);
}

TEST_F(PartitionCycleTest, LeaseHeldElsewhereSkipsThePartition)
{
    source.append(kBtc, 1, 100, 1.0, 1.0);
    InMemoryLeases leases;
    leases.hold(kBtc, "other-process");

    PartitionCycle cycle(PipelineStores{source, db, db, &leases}, config);
    EXPECT_EQ(run_once(cycle).status, CycleResult::Status::LeaseHeld);
    EXPECT_EQ(source.fetch_calls(), 0u);
}

TEST_F(PartitionCycleTest, EncodingFailureCarriesPartitionAndRange)
{
    db.set_watermark(kBtc, 9);
    source.append(kBtc, 10, 100, 1.0, 1.0);
    auto bad = test_support::execution(kBtc, 11, 100, 1.0, 1.0);
    bad.volume.reset();
    source.append(bad);

    PartitionCycle cycle(stores(), config);
    try
    {
        (void)run_once(cycle);
        FAIL() << "expected PipelineError";
    }
    catch (const PipelineError &e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::Encoding);
        ASSERT_TRUE(e.partition().has_value());
        EXPECT_EQ(*e.partition(), kBtc);
        ASSERT_TRUE(e.range().has_value());
        EXPECT_EQ(e.range()->after, 9);
        EXPECT_EQ(e.range()->last, 11);
    }

    EXPECT_EQ(db.get(kBtc), 9);
    EXPECT_EQ(db.bulk_loads(), 0u);
}

TEST_F(PartitionCycleTest, EncodingFailureRangeStartsAtWatermarkAcrossGaps)
{
    db.set_watermark(kBtc, 5);
    source.append(kBtc, 8, 100, 1.0, 1.0);
    auto bad = test_support::execution(kBtc, 12, 100, 1.0, 1.0);
    bad.price.reset();
    source.append(bad);

    PartitionCycle cycle(stores(), config);
    try
    {
        (void)run_once(cycle);
        FAIL() << "expected PipelineError";
    }
    catch (const PipelineError &e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::Encoding);
        ASSERT_TRUE(e.range().has_value());
        EXPECT_EQ(e.range()->after, 5);
        EXPECT_EQ(e.range()->last, 12);
        EXPECT_NE(std::string(e.what()).find("seq (5, 12]"), std::string::npos) << e.what();
    }
}

TEST_F(PartitionCycleTest, FetchFailureIsTaggedWithWatermark)
{
    db.set_watermark(kBtc, 7);
    source.fail_fetches(kBtc, 1, ErrorKind::Timeout);

    PartitionCycle cycle(stores(), config);
    try
    {
        (void)run_once(cycle);
        FAIL() << "expected PipelineError";
    }
    catch (const PipelineError &e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::Timeout);
        ASSERT_TRUE(e.range().has_value());
        EXPECT_EQ(e.range()->after, 7);
    }
}

TEST_F(PartitionCycleTest, RecordsStageTimings)
{
    source.append(kBtc, 1, 100, 1.0, 1.0);
    BenchmarkLedger ledger;

    PartitionCycle cycle(stores(), config, &ledger);
    (void)run_once(cycle);

    std::vector<std::string> labels;
    for (const auto &r : ledger.snapshot())
        labels.push_back(r.label);

    for (const char *stage : {"Fetch", "Reduce", "Encode", "Commit"})
        EXPECT_NE(std::find(labels.begin(), labels.end(), stage), labels.end()) << stage;
}
