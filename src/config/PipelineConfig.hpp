#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstddef>
#include "../model/Execution.hpp"

namespace ExecAggregator
{

    // Table names are interpolated into SQL text (COPY and DDL cannot take
    // them as bind parameters), so ConfigLoader restricts them to plain
    // lower-case identifiers.
    struct DatabaseConfig
    {
        std::string url = "host=localhost port=5432 dbname=trades user=postgres";
        std::string raw_table = "raw_executions";
        std::string aggregate_table = "aggregated_executions";
        std::string watermark_table = "aggregation_watermarks";
        std::string lease_table = "partition_leases";
        bool source_has_side = true;
        bool init_schema = true;
    };

    // Upper bound for batch.max_rows: one batch is reduced and encoded in memory.
    constexpr std::size_t kMaxBatchRows = 10'000'000;

    struct BatchConfig
    {
        std::size_t max_rows = 100'000; // soft cap, extended to finish a timestamp group

        // How long the newest timestamp group waits for late rows before it is
        // committed. 0 commits it at once, which is only safe for a source
        // that is no longer being written.
        std::chrono::milliseconds tail_settle{5'000};
    };

    enum class RunMode
    {
        Drain,  // process every partition until its source is exhausted, then exit
        Follow  // keep polling until SIGINT/SIGTERM
    };

    struct SchedulerConfig
    {
        RunMode mode = RunMode::Drain;
        std::size_t max_workers = 4;
        std::chrono::milliseconds poll_interval{5'000};
        std::size_t max_attempts = 5; // consecutive failures before Drain gives a partition up
        std::string worker_id;        // lease owner; defaults to "<hostname>-<pid>"
        std::chrono::milliseconds lease_ttl{120'000};

        std::chrono::milliseconds backoff_initial{500};
        std::chrono::milliseconds backoff_max{60'000};

        std::chrono::milliseconds fetch_timeout{30'000};
        std::chrono::milliseconds commit_timeout{60'000};
    };

    struct EncodingConfig
    {
        int price_precision = 8;
        int volume_precision = 8;
    };

    struct PipelineConfig
    {
        DatabaseConfig database;
        BatchConfig batch;
        SchedulerConfig scheduler;
        EncodingConfig encoding;

        std::vector<PartitionKey> enabled_partitions; // empty = discover from the raw table
        std::vector<PartitionKey> disabled_partitions;

        std::string archive_directory; // empty = no Parquet archive
    };

} // namespace ExecAggregator
