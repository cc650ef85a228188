#include "ParquetArchive.hpp"

#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <string>

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#include <parquet/properties.h>

// Arrow reports failures through arrow::Status; the rest of the pipeline
// speaks exceptions. Kept local to this translation unit.
#define EXEC_AGGREGATOR_THROW_IF_NOT_OK(expr)              \
    do                                                      \
    {                                                       \
        ::arrow::Status _s = (expr);                        \
        if (!_s.ok())                                       \
        {                                                   \
            throw std::runtime_error(                       \
                std::string("[ARCHIVE ERROR] ") + #expr +   \
                " -> " + _s.ToString());                    \
        }                                                   \
    } while (0)

namespace ExecAggregator
{

    ParquetArchive::ParquetArchive(std::filesystem::path directory)
        : directory_(std::move(directory))
    {
    }

    std::filesystem::path ParquetArchive::path_for(const PartitionKey &partition, SequenceRange range) const
    {
        // Zero-padded so a plain `ls` lists batches in sequence order.
        char seq[64];
        std::snprintf(seq, sizeof(seq), "%012lld_%012lld",
                      static_cast<long long>(range.after + 1),
                      static_cast<long long>(range.last));
        return directory_ / (partition.exchange + "_" + partition.instrument + "_" + seq + ".parquet");
    }

    // =========================================================================
    // write()
    // =========================================================================
    //   1. one Arrow builder per column
    //   2. fill builders in a single pass over the rows
    //   3. Finish() -> immutable arrays -> arrow::Table
    //   4. WriteTable into "<name>.tmp", then rename over the final name, so a
    //      reader never sees a half-written file
    // =========================================================================
    std::filesystem::path ParquetArchive::write(const PartitionKey &partition,
                                                SequenceRange range,
                                                const std::vector<AggregatedRow> &rows) const
    {
        const int64_t n = static_cast<int64_t>(rows.size());
        auto *pool = arrow::default_memory_pool();

        // exchange/instrument/side repeat on every row: dictionary-encode them.
        arrow::StringDictionaryBuilder exchange_builder(pool);
        arrow::StringDictionaryBuilder instrument_builder(pool);
        arrow::StringDictionaryBuilder side_builder(pool);
        arrow::Int64Builder traded_at_builder(pool);
        arrow::DoubleBuilder volume_sum_builder(pool);
        arrow::Int64Builder trade_count_builder(pool);
        arrow::DoubleBuilder open_builder(pool);
        arrow::DoubleBuilder close_builder(pool);
        arrow::DoubleBuilder high_builder(pool);
        arrow::DoubleBuilder low_builder(pool);
        arrow::Int64Builder first_seq_builder(pool);
        arrow::Int64Builder last_seq_builder(pool);

        EXEC_AGGREGATOR_THROW_IF_NOT_OK(traded_at_builder.Reserve(n));
        EXEC_AGGREGATOR_THROW_IF_NOT_OK(volume_sum_builder.Reserve(n));
        EXEC_AGGREGATOR_THROW_IF_NOT_OK(trade_count_builder.Reserve(n));
        EXEC_AGGREGATOR_THROW_IF_NOT_OK(open_builder.Reserve(n));
        EXEC_AGGREGATOR_THROW_IF_NOT_OK(close_builder.Reserve(n));
        EXEC_AGGREGATOR_THROW_IF_NOT_OK(high_builder.Reserve(n));
        EXEC_AGGREGATOR_THROW_IF_NOT_OK(low_builder.Reserve(n));
        EXEC_AGGREGATOR_THROW_IF_NOT_OK(first_seq_builder.Reserve(n));
        EXEC_AGGREGATOR_THROW_IF_NOT_OK(last_seq_builder.Reserve(n));

        for (const auto &r : rows)
        {
            traded_at_builder.UnsafeAppend(r.timestamp);
            volume_sum_builder.UnsafeAppend(r.volume_sum);
            trade_count_builder.UnsafeAppend(r.trade_count);
            open_builder.UnsafeAppend(r.price_open);
            close_builder.UnsafeAppend(r.price_close);
            high_builder.UnsafeAppend(r.price_high);
            low_builder.UnsafeAppend(r.price_low);
            first_seq_builder.UnsafeAppend(r.first_sequence);
            last_seq_builder.UnsafeAppend(r.last_sequence);

            const char side = to_char(r.side);
            EXEC_AGGREGATOR_THROW_IF_NOT_OK(exchange_builder.Append(std::string_view(r.partition.exchange)));
            EXEC_AGGREGATOR_THROW_IF_NOT_OK(instrument_builder.Append(std::string_view(r.partition.instrument)));
            EXEC_AGGREGATOR_THROW_IF_NOT_OK(side_builder.Append(std::string_view(&side, 1)));
        }

        std::shared_ptr<arrow::Array> exchange_arr, instrument_arr, side_arr, traded_at_arr;
        std::shared_ptr<arrow::Array> volume_sum_arr, trade_count_arr;
        std::shared_ptr<arrow::Array> open_arr, close_arr, high_arr, low_arr;
        std::shared_ptr<arrow::Array> first_seq_arr, last_seq_arr;

        EXEC_AGGREGATOR_THROW_IF_NOT_OK(exchange_builder.Finish(&exchange_arr));
        EXEC_AGGREGATOR_THROW_IF_NOT_OK(instrument_builder.Finish(&instrument_arr));
        EXEC_AGGREGATOR_THROW_IF_NOT_OK(side_builder.Finish(&side_arr));
        EXEC_AGGREGATOR_THROW_IF_NOT_OK(traded_at_builder.Finish(&traded_at_arr));
        EXEC_AGGREGATOR_THROW_IF_NOT_OK(volume_sum_builder.Finish(&volume_sum_arr));
        EXEC_AGGREGATOR_THROW_IF_NOT_OK(trade_count_builder.Finish(&trade_count_arr));
        EXEC_AGGREGATOR_THROW_IF_NOT_OK(open_builder.Finish(&open_arr));
        EXEC_AGGREGATOR_THROW_IF_NOT_OK(close_builder.Finish(&close_arr));
        EXEC_AGGREGATOR_THROW_IF_NOT_OK(high_builder.Finish(&high_arr));
        EXEC_AGGREGATOR_THROW_IF_NOT_OK(low_builder.Finish(&low_arr));
        EXEC_AGGREGATOR_THROW_IF_NOT_OK(first_seq_builder.Finish(&first_seq_arr));
        EXEC_AGGREGATOR_THROW_IF_NOT_OK(last_seq_builder.Finish(&last_seq_arr));

        // Dictionary builders pick the narrowest index type on Finish(), so the
        // schema takes its types from the finished arrays.
        auto schema = arrow::schema({arrow::field("exchange", exchange_arr->type()),
                                     arrow::field("instrument", instrument_arr->type()),
                                     arrow::field("traded_at", arrow::int64()),
                                     arrow::field("side", side_arr->type()),
                                     arrow::field("volume_sum", arrow::float64()),
                                     arrow::field("trade_count", arrow::int64()),
                                     arrow::field("price_open", arrow::float64()),
                                     arrow::field("price_close", arrow::float64()),
                                     arrow::field("price_high", arrow::float64()),
                                     arrow::field("price_low", arrow::float64()),
                                     arrow::field("first_sequence", arrow::int64()),
                                     arrow::field("last_sequence", arrow::int64())});

        auto table = arrow::Table::Make(
            schema,
            {exchange_arr, instrument_arr, traded_at_arr, side_arr,
             volume_sum_arr, trade_count_arr,
             open_arr, close_arr, high_arr, low_arr,
             first_seq_arr, last_seq_arr});

        std::filesystem::create_directories(directory_);
        const auto final_path = path_for(partition, range);
        auto tmp_path = final_path;
        tmp_path += ".tmp";

        auto outfile_result = arrow::io::FileOutputStream::Open(tmp_path.string());
        if (!outfile_result.ok())
        {
            throw std::runtime_error("[ARCHIVE ERROR] Cannot create " + tmp_path.string() +
                                     " -> " + outfile_result.status().ToString());
        }
        auto outfile = outfile_result.ValueOrDie();

        auto writer_props = parquet::WriterProperties::Builder()
                                .compression(arrow::Compression::SNAPPY)
                                ->build();
        auto arrow_props = parquet::ArrowWriterProperties::Builder()
                               .store_schema()
                               ->build();

        EXEC_AGGREGATOR_THROW_IF_NOT_OK(parquet::arrow::WriteTable(
            *table, pool, outfile, std::max<int64_t>(n, 1), writer_props, arrow_props));
        EXEC_AGGREGATOR_THROW_IF_NOT_OK(outfile->Close());

        std::filesystem::rename(tmp_path, final_path);
        return final_path;
    }

} // namespace ExecAggregator
