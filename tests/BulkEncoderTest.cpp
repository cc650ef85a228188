#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include "../src/encoding/BulkEncoder.hpp"
#include "../src/errors/PipelineError.hpp"

using namespace ExecAggregator;

namespace
{
    AggregatedRow row(std::int64_t ts, Side side, double volume, std::int64_t count,
                      double open, double close, double high, double low, Sequence first, Sequence last)
    {
        AggregatedRow r;
        r.partition = PartitionKey{"bitflyer", "BTC_JPY"};
        r.timestamp = ts;
        r.side = side;
        r.volume_sum = volume;
        r.trade_count = count;
        r.price_open = open;
        r.price_close = close;
        r.price_high = high;
        r.price_low = low;
        r.first_sequence = first;
        r.last_sequence = last;
        return r;
    }
}

TEST(BulkEncoder, WritesCopyTextInColumnOrder)
{
    EncodingConfig config;
    config.price_precision = 2;
    config.volume_precision = 3;

    const auto payload = BulkEncoder(config).encode({row(100, Side::Buy, 5.0, 2, 10.0, 12.0, 12.0, 10.0, 1, 2)});

    EXPECT_EQ(payload.text, "bitflyer\tBTC_JPY\t100\tB\t5.000\t2\t10.00\t12.00\t12.00\t10.00\t1\t2\n");
    EXPECT_EQ(payload.row_count, 1u);
    EXPECT_EQ(payload.first_sequence, 1);
    EXPECT_EQ(payload.last_sequence, 2);
    EXPECT_EQ(payload.digest, BulkEncoder::digest(payload.text));
}

TEST(BulkEncoder, EmptyInputGivesEmptyPayload)
{
    const auto payload = BulkEncoder().encode({});

    EXPECT_TRUE(payload.empty());
    EXPECT_TRUE(payload.text.empty());
}

TEST(BulkEncoder, RangeSpansAllRows)
{
    const auto payload = BulkEncoder().encode({
        row(100, Side::Buy, 1.0, 1, 1.0, 1.0, 1.0, 1.0, 4, 6),
        row(100, Side::Sell, 1.0, 1, 1.0, 1.0, 1.0, 1.0, 5, 9),
        row(101, Side::Buy, 1.0, 1, 1.0, 1.0, 1.0, 1.0, 10, 10),
    });

    EXPECT_EQ(payload.first_sequence, 4);
    EXPECT_EQ(payload.last_sequence, 10);
    EXPECT_EQ(payload.row_count, 3u);
}

TEST(BulkEncoder, SameRowsGiveIdenticalBytes)
{
    const std::vector<AggregatedRow> rows = {
        row(100, Side::Buy, 0.1 + 0.2, 3, 4'000'000.5, 4'000'100.25, 4'000'200.0, 3'999'999.0, 1, 3),
        row(105, Side::Sell, 1e-8, 1, 9.0, 9.0, 9.0, 9.0, 4, 4),
    };

    const auto a = BulkEncoder().encode(rows);
    const auto b = BulkEncoder().encode(rows);

    EXPECT_EQ(a.text, b.text);
    EXPECT_EQ(a.digest, b.digest);
}

TEST(BulkEncoder, NonFiniteValueFailsWholePayload)
{
    const std::vector<AggregatedRow> rows = {
        row(100, Side::Buy, 1.0, 1, 1.0, 1.0, 1.0, 1.0, 1, 1),
        row(101, Side::Buy, std::numeric_limits<double>::quiet_NaN(), 1, 1.0, 1.0, 1.0, 1.0, 2, 2),
    };

    try
    {
        (void)BulkEncoder().encode(rows);
        FAIL() << "expected PipelineError";
    }
    catch (const PipelineError &e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::Encoding);
        ASSERT_TRUE(e.range().has_value());
        EXPECT_EQ(e.range()->last, 2);
    }
}

TEST(BulkEncoder, EscapesCopySpecialCharacters)
{
    AggregatedRow r = row(100, Side::Buy, 1.0, 1, 1.0, 1.0, 1.0, 1.0, 1, 1);
    r.partition.instrument = "a\tb\\c";

    const auto payload = BulkEncoder().encode({r});
    EXPECT_NE(payload.text.find("a\\tb\\\\c"), std::string::npos);

    const auto decoded = BulkEncoder::decode(payload.text);
    ASSERT_EQ(decoded.size(), 1u);
    EXPECT_EQ(decoded[0].partition.instrument, "a\tb\\c");
}

TEST(BulkEncoder, DecodeRestoresRows)
{
    const std::vector<AggregatedRow> rows = {
        row(100, Side::Buy, 5.0, 2, 10.0, 12.0, 12.0, 10.0, 1, 2),
        row(105, Side::Sell, 1.0, 1, 9.0, 9.0, 9.0, 9.0, 3, 3),
    };

    EXPECT_EQ(BulkEncoder::decode(BulkEncoder().encode(rows).text), rows);
}

TEST(BulkEncoder, DecodeRejectsMalformedText)
{
    EXPECT_THROW((void)BulkEncoder::decode("bitflyer\tBTC_JPY\t100\n"), PipelineError);
    EXPECT_THROW((void)BulkEncoder::decode("no terminator"), PipelineError);
    EXPECT_THROW((void)BulkEncoder::decode("x\ty\tnotanumber\tB\t1\t1\t1\t1\t1\t1\t1\t1\n"), PipelineError);
}

TEST(BulkEncoder, DigestIsFnv1a)
{
    // Reference values of 64-bit FNV-1a.
    EXPECT_EQ(BulkEncoder::digest(""), 14695981039346656037ull);
    EXPECT_EQ(BulkEncoder::digest("a"), 0xaf63dc4c8601ec8cull);
}
