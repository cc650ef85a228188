#pragma once

#include <string>
#include <vector>
#include <optional>
#include <compare>
#include <cstdint> // Fixed width integers (int64_t) are mandatory in finance

namespace ExecAggregator
{

    // Position of a raw row inside its partition. Real rows start at 1;
    // kBeginning means "nothing aggregated yet".
    using Sequence = std::int64_t;
    inline constexpr Sequence kBeginning = 0;

    // =========================================================================
    // PartitionKey: the unit of independent progress tracking
    // =========================================================================
    // One downloader feed = one (exchange, instrument) pair, e.g.
    // ("bitflyer", "BTC_JPY"). Every watermark, lease and batch is scoped to
    // exactly one key.
    // =========================================================================
    struct PartitionKey
    {
        std::string exchange;
        std::string instrument;

        auto operator<=>(const PartitionKey &) const = default;

        std::string to_string() const { return exchange + "/" + instrument; }
    };

    // 'N' is used for every row when the raw table has no side column,
    // so the side never splits a timestamp group in that case.
    enum class Side : char
    {
        Buy = 'B',
        Sell = 'S',
        None = 'N'
    };

    inline char to_char(Side side) { return static_cast<char>(side); }

    inline std::optional<Side> side_from_char(char c)
    {
        switch (c)
        {
        case 'B':
        case 'b':
            return Side::Buy;
        case 'S':
        case 's':
            return Side::Sell;
        case 'N':
        case 'n':
            return Side::None;
        default:
            return std::nullopt;
        }
    }

    /**
     * @brief One trade execution as written by the downloader.
     * price/volume are optional because the raw columns are nullable;
     * a NULL makes the row irreducible (see AggregationEngine).
     */
    struct RawExecution
    {
        PartitionKey partition;
        Sequence sequence = 0;
        std::int64_t timestamp = 0; // unit chosen by the downloader (epoch ms)
        std::optional<double> price;
        std::optional<double> volume;
        Side side = Side::None;
    };

    /**
     * @brief One row per distinct (partition, timestamp, side) of a batch.
     * first/last_sequence record which raw rows were folded into it.
     */
    struct AggregatedRow
    {
        PartitionKey partition;
        std::int64_t timestamp = 0;
        Side side = Side::None;

        double volume_sum = 0.0;
        std::int64_t trade_count = 0;

        double price_open = 0.0;
        double price_close = 0.0;
        double price_high = 0.0;
        double price_low = 0.0;

        Sequence first_sequence = 0;
        Sequence last_sequence = 0;

        bool operator==(const AggregatedRow &) const = default;
    };

    // Working set of one processing cycle, ascending by sequence.
    using Batch = std::vector<RawExecution>;

    // Half-open sequence interval (after, last] covered by one attempt.
    struct SequenceRange
    {
        Sequence after = kBeginning;
        Sequence last = kBeginning;

        bool empty() const { return last <= after; }
    };

} // namespace ExecAggregator
