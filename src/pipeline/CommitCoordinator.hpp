#pragma once

#include <string_view>
#include "../model/Execution.hpp"
#include "../encoding/BulkEncoder.hpp"
#include "../errors/PipelineError.hpp"
#include "../store/CommitStores.hpp"

namespace ExecAggregator
{

    enum class CommitOutcome
    {
        NothingToCommit,  // empty payload: no scope opened, watermark untouched
        Committed,        // rows loaded and watermark advanced in one scope
        AlreadyCommitted, // benign conflict: an earlier attempt had already landed
        Recovered         // earlier attempt loaded the rows but died before the advance
    };

    std::string_view to_string(CommitOutcome outcome);

    /**
     * @brief Owns the exactly-once contract for one batch:
     * {bulk load of the payload, watermark advance to payload.last_sequence}
     * become visible together or not at all.
     *
     * Stateless between calls; one instance can be shared by all workers as
     * long as the Destination/WatermarkStore implementations are thread-safe.
     */
    class CommitCoordinator
    {
    public:
        CommitCoordinator(Destination &destination, WatermarkStore &watermarks);

        /**
         * @param observed_watermark watermark read at the start of the cycle;
         *        the advance is a compare-and-set against it.
         * @throws PipelineError Conflict is resolved internally; Consistency
         *         when it cannot be; everything else propagates with the
         *         partition and range attached.
         */
        CommitOutcome commit(const PartitionKey &partition,
                             Sequence observed_watermark,
                             const BulkPayload &payload);

    private:
        CommitOutcome resolve_conflict(const PartitionKey &partition,
                                       Sequence observed_watermark,
                                       const BulkPayload &payload,
                                       const std::optional<CommitIntent> &previous_intent,
                                       const PipelineError &conflict);

        Destination &destination_;
        WatermarkStore &watermarks_;
    };

} // namespace ExecAggregator
