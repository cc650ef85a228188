#pragma once

#include <chrono>
#include <optional>
#include <string>
#include "../config/PipelineConfig.hpp"
#include "../store/RawReader.hpp"

namespace ExecAggregator
{

    /**
     * @brief RawReader over the downloader's PostgreSQL table.
     *
     * Same lazy-connection pattern as the rest of src/database: only the
     * connection string is stored, every call opens its own connection, so
     * one instance is safely shared by all workers.
     */
    class PgRawReader : public RawReader
    {
    public:
        PgRawReader(const DatabaseConfig &config, std::chrono::milliseconds fetch_timeout);

        Batch fetch(const PartitionKey &partition, Sequence after_sequence, std::size_t max_rows) override;
        Batch fetch_group(const PartitionKey &partition, Sequence after_sequence, std::int64_t timestamp) override;
        Batch fetch_through(const PartitionKey &partition, Sequence after_sequence, Sequence last_sequence) override;
        std::vector<PartitionKey> list_partitions() override;

        // Maps the side column of one row. NULL or anything other than B/S/N
        // is an Encoding error naming the row's sequence.
        static Side parse_side(const PartitionKey &partition, Sequence sequence, const std::optional<std::string> &side);

    private:
        std::string select_columns() const;

        std::string conn_str_;
        std::string table_;
        bool has_side_;
        std::chrono::milliseconds timeout_;
    };

} // namespace ExecAggregator
