#include "CommitCoordinator.hpp"

#include <iostream>

namespace ExecAggregator
{

    std::string_view to_string(CommitOutcome outcome)
    {
        switch (outcome)
        {
        case CommitOutcome::NothingToCommit:
            return "nothing-to-commit";
        case CommitOutcome::Committed:
            return "committed";
        case CommitOutcome::AlreadyCommitted:
            return "already-committed";
        case CommitOutcome::Recovered:
            return "recovered";
        }
        return "unknown";
    }

    CommitCoordinator::CommitCoordinator(Destination &destination, WatermarkStore &watermarks)
        : destination_(destination), watermarks_(watermarks)
    {
    }

    // =========================================================================
    // commit()
    // =========================================================================
    // SINGLE DATABASE (transactional_with_watermarks() == true):
    //
    //   BEGIN
    //     bulk_load(payload)                      -- staged COPY into destination
    //     advance(watermark: observed -> last)    -- CAS on the watermark row
    //   COMMIT                                    -- both visible, or neither
    //
    // SPLIT STORES (false): the destination write cannot join the watermark
    // transaction, so an intent is made durable FIRST:
    //
    //   1. record_intent(range, digest)  -> committed on its own
    //   2. bulk_load(payload)            -> may land even if we crash right after
    //   3. advance(watermark)            -> clears the intent
    //
    // A crash between 2 and 3 leaves rows without a watermark. The retry
    // re-reads exactly the intent's range (PartitionCycle::unresolved_intent),
    // rebuilds the SAME payload (reduction and encoding are deterministic),
    // hits a duplicate key on step 2 and finds its own intent -> only step 3
    // is redone.
    // =========================================================================
    CommitOutcome CommitCoordinator::commit(const PartitionKey &partition,
                                            Sequence observed_watermark,
                                            const BulkPayload &payload)
    {
        const SequenceRange range{observed_watermark, payload.last_sequence};

        if (payload.empty())
            return CommitOutcome::NothingToCommit;

        if (payload.last_sequence <= observed_watermark)
        {
            throw PipelineError(ErrorKind::Consistency, partition, range,
                                "payload does not extend past the observed watermark");
        }

        std::optional<CommitIntent> previous_intent;

        try
        {
            if (!destination_.transactional_with_watermarks())
            {
                previous_intent = watermarks_.pending_intent(partition);

                if (previous_intent && !previous_intent->matches(payload) &&
                    watermarks_.get(partition) < previous_intent->last_sequence)
                {
                    throw PipelineError(
                        ErrorKind::Consistency, partition, range,
                        "unresolved intent for seq (" + std::to_string(previous_intent->first_sequence - 1) +
                            ", " + std::to_string(previous_intent->last_sequence) + "] (" +
                            std::to_string(previous_intent->row_count) +
                            " rows) does not match this batch; reconcile the destination manually");
                }

                if (!previous_intent || !previous_intent->matches(payload))
                {
                    CommitIntent intent{partition, payload.first_sequence, payload.last_sequence,
                                        payload.row_count, payload.digest};
                    auto intent_scope = destination_.begin();
                    watermarks_.record_intent(intent, *intent_scope);
                    intent_scope->commit();
                }
            }

            auto scope = destination_.begin();
            scope->bulk_load(payload);
            watermarks_.advance(partition, observed_watermark, payload.last_sequence, *scope);
            scope->commit();
            return CommitOutcome::Committed;
        }
        catch (const PipelineError &e)
        {
            if (e.kind() != ErrorKind::Conflict)
                throw e.with_context(partition, range);

            return resolve_conflict(partition, observed_watermark, payload, previous_intent, e);
        }
    }

    // =========================================================================
    // resolve_conflict(): the benign-conflict check
    // =========================================================================
    //   watermark >= batch end                -> an earlier attempt committed: benign
    //   watermark == observed, intent matches -> our rows landed, advance missing: finish it
    //   anything else                         -> the stores disagree: Consistency
    // =========================================================================
    CommitOutcome CommitCoordinator::resolve_conflict(const PartitionKey &partition,
                                                      Sequence observed_watermark,
                                                      const BulkPayload &payload,
                                                      const std::optional<CommitIntent> &previous_intent,
                                                      const PipelineError &conflict)
    {
        const SequenceRange range{observed_watermark, payload.last_sequence};

        std::cerr << "[COMMIT] " << partition.to_string() << " conflict on seq (" << range.after
                  << ", " << range.last << "]: " << conflict.detail() << " -- re-reading watermark\n";

        const Sequence current = watermarks_.get(partition);

        if (current >= payload.last_sequence)
        {
            std::cout << "[COMMIT] " << partition.to_string() << " benign conflict: watermark already at "
                      << current << "\n";
            return CommitOutcome::AlreadyCommitted;
        }

        if (current == observed_watermark && previous_intent && previous_intent->matches(payload))
        {
            auto scope = destination_.begin();
            watermarks_.advance(partition, observed_watermark, payload.last_sequence, *scope);
            scope->commit();

            std::cout << "[COMMIT] " << partition.to_string() << " recovered interrupted commit: watermark "
                      << observed_watermark << " -> " << payload.last_sequence << "\n";
            return CommitOutcome::Recovered;
        }

        throw PipelineError(ErrorKind::Consistency, partition, range,
                            "destination rejected the batch as duplicate but watermark is " +
                                std::to_string(current) + "; manual reconciliation required (" +
                                conflict.detail() + ")");
    }

} // namespace ExecAggregator
