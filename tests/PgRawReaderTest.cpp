#include <gtest/gtest.h>

#include <optional>
#include <string>
#include "../src/database/PgRawReader.hpp"
#include "../src/errors/PipelineError.hpp"

using namespace ExecAggregator;

namespace
{
    const PartitionKey kBtc{"bitflyer", "BTC_JPY"};

    void expect_side_rejected(const std::optional<std::string> &side, const std::string &needle)
    {
        try
        {
            (void)PgRawReader::parse_side(kBtc, 42, side);
            FAIL() << "expected PipelineError";
        }
        catch (const PipelineError &e)
        {
            EXPECT_EQ(e.kind(), ErrorKind::Encoding);
            ASSERT_TRUE(e.partition().has_value());
            EXPECT_EQ(*e.partition(), kBtc);
            ASSERT_TRUE(e.range().has_value());
            EXPECT_EQ(e.range()->after, 41);
            EXPECT_EQ(e.range()->last, 42);
            EXPECT_NE(e.detail().find(needle), std::string::npos) << e.detail();
        }
    }
}

TEST(PgRawReader, MapsSideColumn)
{
    EXPECT_EQ(PgRawReader::parse_side(kBtc, 1, std::string("B")), Side::Buy);
    EXPECT_EQ(PgRawReader::parse_side(kBtc, 2, std::string("S")), Side::Sell);
    EXPECT_EQ(PgRawReader::parse_side(kBtc, 3, std::string("N")), Side::None);
}

TEST(PgRawReader, NullSideIsAnEncodingError)
{
    expect_side_rejected(std::nullopt, "missing side at sequence 42");
}

TEST(PgRawReader, UnknownSideIsAnEncodingError)
{
    expect_side_rejected(std::string("X"), "unknown side 'X'");
    expect_side_rejected(std::string(""), "unknown side ''");
    expect_side_rejected(std::string("BUY"), "unknown side 'BUY'");
}
