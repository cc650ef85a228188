#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include "../model/Execution.hpp"
#include "../config/PipelineConfig.hpp"

namespace ExecAggregator
{

    /**
     * @brief A fully encoded batch, ready for PostgreSQL COPY ... FROM STDIN.
     *
     * `text` holds one line per AggregatedRow in COPY TEXT format
     * (tab separated, '\n' terminated). row_count and digest let the loader
     * and the recovery path verify they are looking at exactly this batch.
     */
    struct BulkPayload
    {
        std::string text;
        std::size_t row_count = 0;
        Sequence first_sequence = 0; // smallest raw sequence folded into the payload
        Sequence last_sequence = 0;  // largest raw sequence = the watermark after commit
        std::uint64_t digest = 0;    // FNV-1a 64 of text

        bool empty() const { return row_count == 0; }
    };

    class BulkEncoder
    {
    public:
        // Column order of every payload line. Matches the destination DDL in PgSchema.
        static constexpr std::array<const char *, 12> kColumns = {
            "exchange", "instrument", "traded_at", "side",
            "volume_sum", "trade_count",
            "price_open", "price_close", "price_high", "price_low",
            "first_sequence", "last_sequence"};

        explicit BulkEncoder(EncodingConfig config = {});

        /**
         * @brief Encodes all rows or nothing.
         * @throws PipelineError{Encoding} if any numeric field is not finite;
         *         no partial payload is ever returned.
         */
        [[nodiscard]]
        BulkPayload encode(const std::vector<AggregatedRow> &rows) const;

        /**
         * @brief Parses a payload produced by encode() back into rows.
         * Prices/volumes come back at the encoded precision.
         * @throws PipelineError{Encoding} on malformed text.
         */
        [[nodiscard]]
        static std::vector<AggregatedRow> decode(std::string_view text);

        [[nodiscard]]
        static std::uint64_t digest(std::string_view text);

    private:
        void append_fixed(std::string &out, double value, int precision) const;

        EncodingConfig config_;
    };

} // namespace ExecAggregator
