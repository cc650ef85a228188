#include <algorithm>
#include <charconv>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>
#include <pqxx/pqxx>
#include "DataGenerator.hpp"
#include "../config/ConfigLoader.hpp"
#include "../database/PgSchema.hpp"

// ============================================================================
// generate_executions: fills the raw execution table for local runs
//
// Usage:
//   generate_executions                    -> 1,000,000 rows over 4 partitions
//   generate_executions 200000             -> 200,000 rows over 4 partitions
//   generate_executions 200000 2           -> 200,000 rows over 2 partitions
//
// Connection and table name come from the same place as the aggregator's:
// defaults overridden by EXEC_AGGREGATOR_DATABASE_URL. Running it twice
// appends: each partition continues after its current max(sequence).
// ============================================================================

namespace
{
    const std::vector<ExecAggregator::PartitionKey> kPartitions = {
        {"bitflyer", "BTC_JPY"},
        {"bitflyer", "FX_BTC_JPY"},
        {"liquid", "BTCJPY"},
        {"bitmex", "XBTUSD"},
        {"coincheck", "btc_jpy"},
        {"zaif", "btc_jpy"}};

    std::size_t parse_count(std::string_view text, const char *what)
    {
        std::size_t value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc() || ptr != text.data() + text.size() || value == 0)
            throw std::invalid_argument(std::string("invalid ") + what + ": " + std::string(text));
        return value;
    }

    std::int64_t now_ms()
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    // COPY one partition's rows in one transaction.
    void load_partition(const ExecAggregator::DatabaseConfig &db,
                        const ExecAggregator::PartitionKey &partition,
                        std::size_t count,
                        std::uint64_t seed)
    {
        pqxx::connection C(db.url);
        pqxx::work W(C);

        pqxx::result last = W.exec("SELECT COALESCE(MAX(sequence), 0), COALESCE(MAX(traded_at), 0) FROM " +
                                       db.raw_table + " WHERE exchange = $1 AND instrument = $2",
                                   pqxx::params{partition.exchange, partition.instrument});
        const auto last_sequence = last[0][0].as<std::int64_t>();
        std::int64_t last_timestamp = last[0][1].as<std::int64_t>();
        if (last_timestamp == 0)
            last_timestamp = now_ms() - static_cast<std::int64_t>(count) * 1'000;

        ExecAggregator::GeneratorOptions options;
        options.seed = seed;
        const auto rows = ExecAggregator::DataGenerator::generate(partition, last_sequence, last_timestamp, count, options);

        auto stream = pqxx::stream_to::table(
            W,
            {db.raw_table},
            {"exchange", "instrument", "sequence", "traded_at", "price", "volume", "side"});

        for (const auto &e : rows)
        {
            stream << std::make_tuple(
                e.partition.exchange,
                e.partition.instrument,
                e.sequence,
                e.timestamp,
                *e.price,
                *e.volume,
                std::string(1, ExecAggregator::to_char(e.side)));
        }
        stream.complete();
        W.commit();

        std::cout << "[GENERATOR] " << partition.to_string() << ": " << rows.size()
                  << " rows, seq " << last_sequence + 1 << ".." << rows.back().sequence << "\n";
    }
}

int main(int argc, char *argv[])
{
    std::cout << "===================================================\n";
    std::cout << "   ExecAggregator: Synthetic Execution Generator\n";
    std::cout << "===================================================\n\n";

    try
    {
        const std::size_t total = argc > 1 ? parse_count(argv[1], "row count") : 1'000'000;
        const std::size_t partitions = std::min(argc > 2 ? parse_count(argv[2], "partition count") : 4,
                                                kPartitions.size());

        const auto config = ExecAggregator::ConfigLoader::defaults_with_environment();
        ExecAggregator::PgSchema::init_raw_table(config.database);

        for (std::size_t i = 0; i < partitions; ++i)
        {
            // The last partition takes the remainder.
            std::size_t count = total / partitions;
            if (i + 1 == partitions)
                count = total - count * (partitions - 1);
            if (count == 0)
                continue;

            load_partition(config.database, kPartitions[i], count, 42 + i);
        }

        std::cout << "\nRun the aggregator with:\n";
        std::cout << "  ./exec_aggregator [config-file]\n";
    }
    catch (const std::exception &e)
    {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }

    return 0;
}
