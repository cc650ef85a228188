#pragma once

// ============================================================================
// WHY A DATA GENERATOR?
//
// The aggregator reads what an exchange downloader wrote. For local runs and
// load tests we need that table filled with something that looks like a
// real crypto execution feed:
//
//   - prices follow a random walk (next = previous + small normal step)
//   - executions arrive in BURSTS: one taker order sweeping the book shows
//     up as several rows with the same timestamp, often on the same side
//   - sequences are strictly increasing per partition, timestamps never go
//     backwards
//
// Bursts are the interesting part for the aggregator: they are exactly the
// timestamp groups that must never be split across two batches.
// ============================================================================

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <random>
#include <vector>
#include "../model/Execution.hpp"

namespace ExecAggregator
{

    struct GeneratorOptions
    {
        std::uint64_t seed = 42;     // same seed = same rows = reproducible runs
        double start_price = 4'000'000.0;
        double price_step = 250.0;   // stddev of one random-walk step
        int max_burst = 8;           // rows sharing one timestamp, at most
        std::int64_t max_gap_ms = 1'500;
    };

    class DataGenerator
    {
    public:
        /**
         * @brief Produces `count` executions for one partition, continuing
         * after `last_sequence` / `last_timestamp` so repeated runs append.
         */
        static std::vector<RawExecution> generate(const PartitionKey &partition,
                                                  Sequence last_sequence,
                                                  std::int64_t last_timestamp,
                                                  std::size_t count,
                                                  const GeneratorOptions &options = {})
        {
            std::mt19937_64 rng(options.seed);

            std::normal_distribution<double> price_step_dist(0.0, options.price_step);
            std::exponential_distribution<double> volume_dist(20.0); // mostly small fills
            std::uniform_int_distribution<int> burst_dist(1, std::max(1, options.max_burst));
            std::uniform_int_distribution<std::int64_t> gap_dist(1, std::max<std::int64_t>(1, options.max_gap_ms));
            std::uniform_int_distribution<int> side_dist(0, 1);

            std::vector<RawExecution> rows;
            rows.reserve(count);

            double price = options.start_price;
            Sequence sequence = last_sequence;
            std::int64_t timestamp = last_timestamp;

            while (rows.size() < count)
            {
                timestamp += gap_dist(rng);
                const Side side = side_dist(rng) == 0 ? Side::Buy : Side::Sell;
                const int burst = burst_dist(rng);

                for (int i = 0; i < burst && rows.size() < count; ++i)
                {
                    // A sweep walks the book: buys move the price up, sells down.
                    price += side == Side::Buy ? std::abs(price_step_dist(rng)) : -std::abs(price_step_dist(rng));
                    price = std::max(price, options.start_price * 0.1);

                    RawExecution e;
                    e.partition = partition;
                    e.sequence = ++sequence;
                    e.timestamp = timestamp;
                    e.price = price;
                    e.volume = 0.0001 + volume_dist(rng);
                    e.side = side;
                    rows.push_back(std::move(e));
                }
            }
            return rows;
        }
    };

} // namespace ExecAggregator
