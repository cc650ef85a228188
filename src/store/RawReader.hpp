#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include "../model/Execution.hpp"

namespace ExecAggregator
{

    /**
     * @brief Read side of the downloader's raw execution table.
     *
     * Implementations have no side effects on the source. Transient I/O
     * failures throw PipelineError{TransientIo} (or {Timeout}); an empty
     * result means "nothing new", never an error.
     */
    class RawReader
    {
    public:
        virtual ~RawReader() = default;

        // Rows with sequence > after_sequence, ascending, at most max_rows.
        virtual Batch fetch(const PartitionKey &partition, Sequence after_sequence, std::size_t max_rows) = 0;

        // Every row with sequence > after_sequence AND the given timestamp, ascending.
        // Used to finish a timestamp group larger than max_rows.
        virtual Batch fetch_group(const PartitionKey &partition, Sequence after_sequence, std::int64_t timestamp) = 0;

        // Every row with after_sequence < sequence <= last_sequence, ascending.
        // Used to rebuild the batch of an unresolved commit intent exactly.
        virtual Batch fetch_through(const PartitionKey &partition, Sequence after_sequence, Sequence last_sequence) = 0;

        // Distinct partitions present in the source.
        virtual std::vector<PartitionKey> list_partitions() = 0;
    };

} // namespace ExecAggregator
