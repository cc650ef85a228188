#pragma once

// ============================================================================
// ParquetArchive: columnar copy of every committed batch
// ============================================================================
//
// The destination table is the system of record. The archive is an optional
// side output for analytics tooling that prefers files (DuckDB, Spark, pandas):
// one Parquet file per committed batch, named after the partition and the
// raw sequence range it covers, so re-running a batch overwrites the same
// file instead of producing a duplicate.
//
//   archive/bitflyer_BTC_JPY_000000000001_000000100000.parquet
//
// Written strictly AFTER the commit succeeded. A failed archive write is
// reported but never undoes a commit.
// ============================================================================

#include <filesystem>
#include <vector>
#include "../model/Execution.hpp"

namespace ExecAggregator
{

    class ParquetArchive
    {
    public:
        explicit ParquetArchive(std::filesystem::path directory);

        /**
         * @brief Writes `rows` (one partition, one committed batch) to a new file.
         * @return path of the written file.
         * @throws std::runtime_error if Arrow/Parquet operations fail.
         */
        std::filesystem::path write(const PartitionKey &partition,
                                    SequenceRange range,
                                    const std::vector<AggregatedRow> &rows) const;

        // Deterministic file name for a batch.
        std::filesystem::path path_for(const PartitionKey &partition, SequenceRange range) const;

        const std::filesystem::path &directory() const { return directory_; }

    private:
        std::filesystem::path directory_;
    };

} // namespace ExecAggregator
