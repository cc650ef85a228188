#include "PartitionCycle.hpp"
#include "../aggregation/BatchBoundary.hpp"
#include "../errors/PipelineError.hpp"

#include <chrono>
#include <iostream>

namespace ExecAggregator
{

    std::string_view to_string(PartitionState state)
    {
        switch (state)
        {
        case PartitionState::Idle:
            return "idle";
        case PartitionState::Fetching:
            return "fetching";
        case PartitionState::Reducing:
            return "reducing";
        case PartitionState::Committing:
            return "committing";
        case PartitionState::Backoff:
            return "backoff";
        }
        return "unknown";
    }

    std::string_view to_string(CycleResult::Status status)
    {
        switch (status)
        {
        case CycleResult::Status::Committed:
            return "committed";
        case CycleResult::Status::Empty:
            return "empty";
        case CycleResult::Status::Cancelled:
            return "cancelled";
        case CycleResult::Status::LeaseHeld:
            return "lease-held";
        }
        return "unknown";
    }

    static std::int64_t system_now_ms()
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    PartitionCycle::PartitionCycle(PipelineStores stores,
                                   const PipelineConfig &config,
                                   BenchmarkLedger *ledger,
                                   const ParquetArchive *archive)
        : stores_(stores),
          config_(config),
          ledger_(ledger),
          archive_(archive),
          encoder_(config.encoding),
          coordinator_(stores.destination, stores.watermarks),
          now_ms_(&system_now_ms)
    {
    }

    // =========================================================================
    // fetch_sealed(): ask for max_rows + 1, cut on a timestamp boundary
    // =========================================================================
    Batch PartitionCycle::fetch_sealed(const PartitionKey &partition, Sequence watermark, size_t &held_back)
    {
        const size_t max_rows = config_.batch.max_rows;

        SealedBatch sealed = BatchBoundary::seal(
            stores_.reader.fetch(partition, watermark, max_rows + 1), max_rows);

        if (sealed.extend_timestamp)
        {
            Batch tail = stores_.reader.fetch_group(partition, sealed.rows.back().sequence, *sealed.extend_timestamp);
            std::cout << "[CYCLE] " << partition.to_string() << " timestamp " << *sealed.extend_timestamp
                      << " spans more than " << max_rows << " rows, extending batch by " << tail.size() << "\n";
            sealed.rows.insert(sealed.rows.end(),
                               std::make_move_iterator(tail.begin()),
                               std::make_move_iterator(tail.end()));
        }

        // The newest group may still be receiving rows: the tail of an
        // exhausted fetch, or an extended group nothing was seen after.
        held_back = 0;
        if ((sealed.source_exhausted || sealed.extend_timestamp) && config_.batch.tail_settle.count() > 0)
        {
            const std::int64_t cutoff = now_ms_() - config_.batch.tail_settle.count();
            held_back = BatchBoundary::hold_back_recent_tail(sealed.rows, cutoff);
        }

        return std::move(sealed.rows);
    }

    // =========================================================================
    // unresolved_intent(): split stores only
    // =========================================================================
    // An intent above the watermark means an earlier attempt may have loaded
    // its rows and died before the advance. That batch has to be rebuilt
    // byte for byte, whatever the source received since.
    // =========================================================================
    std::optional<CommitIntent> PartitionCycle::unresolved_intent(const PartitionKey &partition, Sequence watermark)
    {
        if (stores_.destination.transactional_with_watermarks())
            return std::nullopt;

        auto intent = stores_.watermarks.pending_intent(partition);
        if (intent && intent->last_sequence <= watermark)
            return std::nullopt;
        return intent;
    }

    // =========================================================================
    // run()
    // =========================================================================
    // Checkpoints where cancellation is honoured: before the fetch and right
    // before the commit. Once the commit scope is open it always runs to
    // COMMIT or ROLLBACK; the scope object's destructor guarantees the latter.
    // =========================================================================
    CycleResult PartitionCycle::run(const PartitionKey &partition,
                                    std::atomic<PartitionState> &state,
                                    const CancellationToken &cancel,
                                    std::optional<SequenceRange> unverified_commit)
    {
        CycleResult result;

        if (cancel.cancelled())
        {
            result.status = CycleResult::Status::Cancelled;
            return result;
        }

        if (stores_.leases != nullptr &&
            !stores_.leases->try_acquire(partition, config_.scheduler.worker_id, config_.scheduler.lease_ttl))
        {
            result.status = CycleResult::Status::LeaseHeld;
            return result;
        }

        // ── FETCH ─────────────────────────────────────────────────────────
        state = PartitionState::Fetching;
        const Sequence watermark = stores_.watermarks.get(partition);
        result.watermark_before = watermark;
        result.watermark_after = watermark;

        if (unverified_commit)
        {
            if (watermark >= unverified_commit->last)
            {
                std::cout << "[CYCLE] " << partition.to_string() << " commit of seq (" << unverified_commit->after
                          << ", " << unverified_commit->last << "] with unknown outcome had landed (watermark "
                          << watermark << ")\n";
            }
            else
            {
                std::cout << "[CYCLE] " << partition.to_string() << " commit of seq (" << unverified_commit->after
                          << ", " << unverified_commit->last << "] with unknown outcome did not land, re-aggregating from "
                          << watermark << "\n";
            }
        }

        Batch batch;
        size_t held_back = 0;
        try
        {
            Benchmarker bm("Fetch", ledger_);
            if (auto intent = unresolved_intent(partition, watermark))
            {
                std::cout << "[CYCLE] " << partition.to_string() << " unresolved commit intent for seq ("
                          << watermark << ", " << intent->last_sequence << "], rebuilding that batch\n";
                batch = stores_.reader.fetch_through(partition, watermark, intent->last_sequence);
            }
            else
            {
                batch = fetch_sealed(partition, watermark, held_back);
            }
            bm.set_items(batch.size());
        }
        catch (const PipelineError &e)
        {
            throw e.with_context(partition, SequenceRange{watermark, watermark});
        }

        result.held_back_rows = held_back;
        if (batch.empty())
        {
            // Nothing to commit. The watermark stays where it is: moving it on an
            // empty batch would hide a stalled source.
            state = PartitionState::Idle;
            result.status = CycleResult::Status::Empty;
            return result;
        }

        const SequenceRange range{watermark, batch.back().sequence};
        result.raw_rows = batch.size();

        // ── REDUCE + ENCODE ───────────────────────────────────────────────
        state = PartitionState::Reducing;
        std::vector<AggregatedRow> rows;
        BulkPayload payload;
        try
        {
            {
                Benchmarker bm("Reduce", ledger_, batch.size());
                rows = engine_.reduce(batch);
            }
            {
                Benchmarker bm("Encode", ledger_, rows.size());
                payload = encoder_.encode(rows);
            }
        }
        catch (const PipelineError &e)
        {
            // Lower layers only know the rows they saw; the attempt starts at the watermark.
            throw PipelineError(e.kind(), partition, range, e.detail());
        }
        result.aggregated_rows = rows.size();

        if (cancel.cancelled())
        {
            state = PartitionState::Idle;
            result.status = CycleResult::Status::Cancelled;
            return result;
        }

        // ── COMMIT ────────────────────────────────────────────────────────
        state = PartitionState::Committing;
        {
            Benchmarker bm("Commit", ledger_, rows.size());
            result.outcome = coordinator_.commit(partition, watermark, payload);
        }
        result.status = CycleResult::Status::Committed;
        result.watermark_after = payload.last_sequence;

        // ── ARCHIVE (optional, after the fact) ────────────────────────────
        if (archive_ != nullptr && result.outcome != CommitOutcome::AlreadyCommitted)
        {
            try
            {
                Benchmarker bm("Archive", ledger_, rows.size());
                auto path = archive_->write(partition, range, rows);
                std::cout << "[ARCHIVE] " << partition.to_string() << " -> " << path.string() << "\n";
            }
            catch (const std::exception &e)
            {
                // The batch is committed; only the side copy is missing.
                std::cerr << "[ARCHIVE ERROR] " << partition.to_string() << " seq (" << range.after << ", "
                          << range.last << "] not archived: " << e.what() << "\n";
            }
        }

        state = PartitionState::Idle;
        return result;
    }

} // namespace ExecAggregator
