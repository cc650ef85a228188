#include <gtest/gtest.h>

#include <initializer_list>
#include <utility>
#include "../src/aggregation/BatchBoundary.hpp"
#include "support/InMemoryStores.hpp"

using namespace ExecAggregator;
using test_support::execution;

namespace
{
    const PartitionKey kBtc{"bitflyer", "BTC_JPY"};

    // {sequence, timestamp} pairs
    Batch rows(std::initializer_list<std::pair<Sequence, std::int64_t>> pairs)
    {
        Batch out;
        for (const auto &[seq, ts] : pairs)
            out.push_back(execution(kBtc, seq, ts, 1.0, 1.0));
        return out;
    }
}

TEST(BatchBoundary, ShortFetchMeansSourceExhausted)
{
    auto sealed = BatchBoundary::seal(rows({{1, 100}, {2, 100}, {3, 101}}), 4);

    EXPECT_TRUE(sealed.source_exhausted);
    EXPECT_FALSE(sealed.extend_timestamp.has_value());
    EXPECT_EQ(sealed.rows.size(), 3u);
}

TEST(BatchBoundary, LookaheadOnNewTimestampKeepsFullBatch)
{
    auto sealed = BatchBoundary::seal(rows({{1, 100}, {2, 100}, {3, 101}, {4, 102}, {5, 103}}), 4);

    EXPECT_FALSE(sealed.source_exhausted);
    ASSERT_EQ(sealed.rows.size(), 4u);
    EXPECT_EQ(sealed.rows.back().sequence, 4);
}

TEST(BatchBoundary, TrailingGroupSharedWithLookaheadIsTrimmed)
{
    auto sealed = BatchBoundary::seal(rows({{1, 100}, {2, 100}, {3, 101}, {4, 102}, {5, 102}}), 4);

    EXPECT_FALSE(sealed.source_exhausted);
    ASSERT_EQ(sealed.rows.size(), 3u);
    EXPECT_EQ(sealed.rows.back().sequence, 3);
    EXPECT_EQ(sealed.rows.back().timestamp, 101);
}

TEST(BatchBoundary, SingleOversizedGroupAsksForExtension)
{
    auto sealed = BatchBoundary::seal(rows({{1, 100}, {2, 100}, {3, 100}}), 2);

    ASSERT_TRUE(sealed.extend_timestamp.has_value());
    EXPECT_EQ(*sealed.extend_timestamp, 100);
    // The lookahead is kept: extension continues after it.
    ASSERT_EQ(sealed.rows.size(), 3u);
    EXPECT_EQ(sealed.rows.back().sequence, 3);
}

TEST(BatchBoundary, HoldsBackYoungTail)
{
    Batch batch = rows({{1, 100}, {2, 101}, {3, 105}, {4, 105}});

    EXPECT_EQ(BatchBoundary::hold_back_recent_tail(batch, 105), 2u);
    ASSERT_EQ(batch.size(), 2u);
    EXPECT_EQ(batch.back().timestamp, 101);
}

TEST(BatchBoundary, KeepsSettledTail)
{
    Batch batch = rows({{1, 100}, {2, 101}});

    EXPECT_EQ(BatchBoundary::hold_back_recent_tail(batch, 102), 0u);
    EXPECT_EQ(batch.size(), 2u);
}
