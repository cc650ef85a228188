#pragma once

#include <vector>
#include "../model/Execution.hpp"

namespace ExecAggregator
{

    /**
     * @brief Folds a batch of raw executions into one row per (timestamp, side).
     *
     * Pure in-memory computation: never blocks, never touches a store.
     * For a fixed batch the output is always identical (same values, same
     * order), which is what makes a retried cycle produce the same payload.
     */
    class AggregationEngine
    {
    public:
        AggregationEngine() = default;

        /**
         * @param batch rows of ONE partition, ascending by sequence.
         * @return rows sorted by (timestamp, side); empty for an empty batch.
         * @throws PipelineError{Encoding} naming the partition and the batch's
         *         sequence range when a row cannot be reduced.
         */
        [[nodiscard]]
        std::vector<AggregatedRow> reduce(const Batch &batch) const;
    };

} // namespace ExecAggregator
