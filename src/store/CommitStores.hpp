#pragma once

// ============================================================================
// Commit-side store interfaces
// ============================================================================
//
//   Destination     opens CommitScopes; a scope bulk-loads one payload
//   WatermarkStore  per-partition cursor, written through a CommitScope
//
// When both live in one database (the PostgreSQL implementation), a single
// CommitScope is a single transaction and "load + advance" is atomic for
// free. When they do not, Destination::transactional_with_watermarks()
// returns false and the CommitCoordinator records a CommitIntent before the
// load, which is how a crash between load and advance gets recovered.
// ============================================================================

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include "../model/Execution.hpp"
#include "../encoding/BulkEncoder.hpp"

namespace ExecAggregator
{

    // "Payload with this range and digest is about to be written to the destination."
    struct CommitIntent
    {
        PartitionKey partition;
        Sequence first_sequence = 0;
        Sequence last_sequence = 0;
        std::size_t row_count = 0;
        std::uint64_t digest = 0;

        bool matches(const BulkPayload &payload) const
        {
            return first_sequence == payload.first_sequence &&
                   last_sequence == payload.last_sequence &&
                   row_count == payload.row_count &&
                   digest == payload.digest;
        }
    };

    /**
     * @brief One transactional scope. Destroying a scope that was not committed
     * rolls it back; implementations must not throw from the destructor.
     */
    class CommitScope
    {
    public:
        virtual ~CommitScope() = default;

        // Loads every payload row into the destination, inside this scope.
        // Duplicate natural key -> PipelineError{Conflict}.
        // Loaded count != payload.row_count -> PipelineError{Consistency}.
        virtual void bulk_load(const BulkPayload &payload) = 0;

        // Unknown result (connection lost mid-COMMIT) -> PipelineError{UnknownOutcome}.
        virtual void commit() = 0;
    };

    class Destination
    {
    public:
        virtual ~Destination() = default;

        [[nodiscard]]
        virtual std::unique_ptr<CommitScope> begin() = 0;

        // True when a CommitScope also covers WatermarkStore writes.
        virtual bool transactional_with_watermarks() const = 0;
    };

    class WatermarkStore
    {
    public:
        virtual ~WatermarkStore() = default;

        // Last committed sequence, or kBeginning for an unknown partition.
        virtual Sequence get(const PartitionKey &partition) = 0;

        /**
         * @brief Moves the watermark from `from` (value observed at cycle start)
         * to `to`, inside `scope`, and clears the partition's intent.
         * Watermark no longer equal to `from` -> PipelineError{Conflict}.
         * `to <= from` -> PipelineError{Consistency}.
         */
        virtual void advance(const PartitionKey &partition, Sequence from, Sequence to, CommitScope &scope) = 0;

        virtual std::optional<CommitIntent> pending_intent(const PartitionKey &partition) = 0;

        // Durable once `scope` commits; the coordinator commits an intent scope
        // on its own, before the destination load starts.
        virtual void record_intent(const CommitIntent &intent, CommitScope &scope) = 0;
    };

} // namespace ExecAggregator
