#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include "../src/aggregation/AggregationEngine.hpp"
#include "../src/tools/DataGenerator.hpp"
#include "../src/validator/ExecutionValidator.hpp"

using namespace ExecAggregator;

namespace
{
    const PartitionKey kBtc{"bitflyer", "BTC_JPY"};
}

TEST(DataGenerator, ProducesAValidOrderedFeed)
{
    const auto rows = DataGenerator::generate(kBtc, 500, 1'700'000'000'000, 2'000);

    ASSERT_EQ(rows.size(), 2'000u);
    EXPECT_EQ(rows.front().sequence, 501);
    EXPECT_GT(rows.front().timestamp, 1'700'000'000'000);

    for (std::size_t i = 0; i < rows.size(); ++i)
    {
        EXPECT_TRUE(ExecutionValidator::validate(rows[i]).valid);
        EXPECT_EQ(rows[i].partition, kBtc);
        if (i > 0)
            EXPECT_TRUE(ExecutionValidator::validate_order(rows[i - 1], rows[i]).valid) << "row " << i;
    }

    EXPECT_NO_THROW((void)AggregationEngine().reduce(rows));
}

TEST(DataGenerator, EmitsBurstsThatShareATimestamp)
{
    const auto rows = DataGenerator::generate(kBtc, kBeginning, 0, 1'000);

    std::map<std::int64_t, int> per_timestamp;
    for (const auto &row : rows)
        ++per_timestamp[row.timestamp];

    int largest = 0;
    for (const auto &[ts, count] : per_timestamp)
        largest = std::max(largest, count);

    EXPECT_GT(largest, 1);
    EXPECT_LE(largest, GeneratorOptions{}.max_burst);
    EXPECT_LT(per_timestamp.size(), rows.size());
}

TEST(DataGenerator, SameSeedSameRows)
{
    GeneratorOptions options;
    options.seed = 1234;

    const auto a = DataGenerator::generate(kBtc, kBeginning, 0, 300, options);
    const auto b = DataGenerator::generate(kBtc, kBeginning, 0, 300, options);

    ASSERT_EQ(a.size(), b.size());
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        EXPECT_EQ(a[i].sequence, b[i].sequence);
        EXPECT_EQ(a[i].timestamp, b[i].timestamp);
        EXPECT_EQ(a[i].price, b[i].price);
        EXPECT_EQ(a[i].side, b[i].side);
    }
}

TEST(DataGenerator, PriceStaysAboveFloor)
{
    GeneratorOptions options;
    options.start_price = 100.0;
    options.price_step = 50.0;

    for (const auto &row : DataGenerator::generate(kBtc, kBeginning, 0, 5'000, options))
        EXPECT_GE(*row.price, 10.0);
}
