#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>
#include "../aggregation/AggregationEngine.hpp"
#include "../benchmark/Benchmarker.hpp"
#include "../config/PipelineConfig.hpp"
#include "../encoding/BulkEncoder.hpp"
#include "../model/Execution.hpp"
#include "../output/ParquetArchive.hpp"
#include "../store/CommitStores.hpp"
#include "../store/LeaseManager.hpp"
#include "../store/RawReader.hpp"
#include "../threading/CancellationToken.hpp"
#include "CommitCoordinator.hpp"

namespace ExecAggregator
{

    // Idle -> Fetching -> Reducing -> Committing -> Idle
    // Idle -> Fetching -> Idle                     (nothing new)
    // any  -> Backoff  -> Idle                     (set by the scheduler on failure)
    enum class PartitionState
    {
        Idle,
        Fetching,
        Reducing,
        Committing,
        Backoff
    };

    std::string_view to_string(PartitionState state);

    // The external collaborators one cycle talks to. leases may be null
    // (single-process deployments, tests).
    struct PipelineStores
    {
        RawReader &reader;
        WatermarkStore &watermarks;
        Destination &destination;
        LeaseManager *leases = nullptr;
    };

    struct CycleResult
    {
        enum class Status
        {
            Committed, // see `outcome` for committed / already-committed / recovered
            Empty,     // nothing new above the watermark (or only a held-back tail)
            Cancelled, // stopped at a checkpoint before fetch or before commit
            LeaseHeld  // another process owns the partition
        };

        Status status = Status::Empty;
        CommitOutcome outcome = CommitOutcome::NothingToCommit;

        Sequence watermark_before = kBeginning;
        Sequence watermark_after = kBeginning;
        size_t raw_rows = 0;
        size_t aggregated_rows = 0;
        size_t held_back_rows = 0;
    };

    std::string_view to_string(CycleResult::Status status);

    /**
     * @brief One processing cycle of one partition:
     * read watermark -> fetch -> seal boundary -> reduce -> encode -> commit -> archive.
     *
     * Holds no per-partition state; the same instance serves every worker.
     */
    class PartitionCycle
    {
    public:
        PartitionCycle(PipelineStores stores,
                       const PipelineConfig &config,
                       BenchmarkLedger *ledger = nullptr,
                       const ParquetArchive *archive = nullptr);

        /**
         * @param state updated as the cycle moves through its stages.
         * @param unverified_commit range of an earlier attempt whose COMMIT
         *        outcome is unknown; logged against the fresh watermark.
         * @throws PipelineError (partition and attempted range attached).
         */
        CycleResult run(const PartitionKey &partition,
                        std::atomic<PartitionState> &state,
                        const CancellationToken &cancel,
                        std::optional<SequenceRange> unverified_commit = std::nullopt);

        // Epoch milliseconds, used for tail settling. Replaceable for tests.
        void set_clock(std::function<std::int64_t()> now_ms) { now_ms_ = std::move(now_ms); }

    private:
        Batch fetch_sealed(const PartitionKey &partition, Sequence watermark, size_t &held_back);
        std::optional<CommitIntent> unresolved_intent(const PartitionKey &partition, Sequence watermark);

        PipelineStores stores_;
        const PipelineConfig &config_;
        BenchmarkLedger *ledger_;
        const ParquetArchive *archive_;

        AggregationEngine engine_;
        BulkEncoder encoder_;
        CommitCoordinator coordinator_;
        std::function<std::int64_t()> now_ms_;
    };

} // namespace ExecAggregator
