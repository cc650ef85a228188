#pragma once

#include "../config/PipelineConfig.hpp"

namespace ExecAggregator
{

    class PgSchema
    {
    public:
        // Destination, watermark and lease tables. Idempotent.
        static void init(const DatabaseConfig &config);

        // The downloader normally owns the raw table; generate_executions
        // creates it for local runs.
        static void init_raw_table(const DatabaseConfig &config);
    };

} // namespace ExecAggregator
