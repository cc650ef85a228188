#pragma once

// ============================================================================
// BatchBoundary: cut batches on timestamp boundaries, never inside a group
// ============================================================================
//
// The destination table uses (partition, timestamp, side) as its natural key.
// That only works if every timestamp group is reduced in exactly ONE batch:
//
//   max_rows = 4
//
//   seq  1    2    3    4  |  5    6
//   ts  100  100  101  102 | 102  103       <- cut at row 4 would split ts=102
//                     ^^^^^^^^^^
//   sealed batch = seq 1..3  (trailing ts=102 group trimmed, next cycle starts at 4)
//
// The reader is asked for max_rows + 1 rows. The extra row is a lookahead:
// if it shares the last kept row's timestamp, the trailing group is trimmed.
// If the WHOLE batch is one group (a burst larger than max_rows), trimming
// would leave nothing, so instead the batch is extended to the end of the
// group with RawReader::fetch_group(). max_rows is therefore a soft cap.
// ============================================================================

#include <cstddef>
#include <cstdint>
#include <optional>
#include "../model/Execution.hpp"

namespace ExecAggregator
{

    struct SealedBatch
    {
        Batch rows;

        // The fetch returned fewer rows than asked for: nothing more was
        // visible in the source at fetch time.
        bool source_exhausted = false;

        // Set when rows is one oversized timestamp group. The caller must append
        // fetch_group(partition, rows.back().sequence, *extend_timestamp).
        std::optional<std::int64_t> extend_timestamp;
    };

    class BatchBoundary
    {
    public:
        /**
         * @param fetched result of fetch(partition, after, max_rows + 1)
         * @param max_rows configured soft cap
         */
        [[nodiscard]]
        static SealedBatch seal(Batch fetched, std::size_t max_rows);

        /**
         * @brief Drops the trailing timestamp group when it is at or after
         * `cutoff_timestamp`, i.e. still young enough that the downloader may
         * be writing more rows for it.
         * @return number of rows held back.
         */
        static std::size_t hold_back_recent_tail(Batch &rows, std::int64_t cutoff_timestamp);
    };

} // namespace ExecAggregator
