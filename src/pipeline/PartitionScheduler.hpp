#pragma once

// ============================================================================
// PartitionScheduler: drives PartitionCycles over every partition
// ============================================================================
//
//   dispatcher (caller of run())                 ThreadPool (max_workers)
//   ────────────────────────────                 ────────────────────────
//   pick eligible, unclaimed partition ──submit──> PartitionCycle::run()
//   wait for a completion or a deadline <──done──  (result or PipelineError)
//   update slot: backoff / finished / given up
//
// Only the dispatcher touches slots (under slots_mutex_ so status() can be
// called from another thread). Workers only write the slot's atomic state.
// A partition is never submitted while its previous cycle is in flight, so
// cycles of one partition are strictly sequential.
// ============================================================================

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "../benchmark/Benchmarker.hpp"
#include "../config/PipelineConfig.hpp"
#include "../errors/PipelineError.hpp"
#include "../output/ParquetArchive.hpp"
#include "../threading/CancellationToken.hpp"
#include "../threading/ThreadPool.hpp"
#include "PartitionCycle.hpp"

namespace ExecAggregator
{

    struct PartitionStatus
    {
        PartitionState state = PartitionState::Idle;
        std::size_t consecutive_failures = 0;
        bool finished = false; // drain mode: reached an empty fetch
        bool given_up = false; // drain mode: max_attempts consecutive failures
        std::optional<ErrorKind> last_error;
    };

    struct RunSummary
    {
        std::size_t cycles = 0;
        std::size_t committed_batches = 0;
        std::size_t raw_rows = 0;
        std::size_t aggregated_rows = 0;
        std::size_t empty_cycles = 0;
        std::size_t failures = 0;
        std::map<ErrorKind, std::size_t> failures_by_kind;
        std::vector<PartitionKey> given_up;

        bool halted = false;
        std::string halt_reason;
        bool cancelled = false;

        // Anything an operator has to look at before the next run.
        bool needs_attention() const
        {
            return halted || !given_up.empty() || failures_by_kind.count(ErrorKind::Consistency) > 0;
        }
    };

    void print_run_summary(const RunSummary &summary);

    class PartitionScheduler
    {
    public:
        PartitionScheduler(PipelineStores stores,
                           const PipelineConfig &config,
                           CancellationToken &cancel,
                           BenchmarkLedger *ledger = nullptr,
                           const ParquetArchive *archive = nullptr);

        /**
         * @brief Runs until done (Drain), cancelled, or halted.
         * @throws PipelineError only if the initial partition discovery fails.
         */
        RunSummary run();

        // Snapshot of one partition; nullopt for a partition the scheduler does not know.
        std::optional<PartitionStatus> status(const PartitionKey &partition) const;

        std::vector<PartitionKey> partitions() const;

        // initial * 2^(failures-1), capped at max.
        static std::chrono::milliseconds backoff_delay(const SchedulerConfig &config, std::size_t failures);

        PartitionCycle &cycle() { return cycle_; }

    private:
        using Clock = std::chrono::steady_clock;

        struct Slot
        {
            std::atomic<PartitionState> state{PartitionState::Idle};
            Clock::time_point next_eligible{};
            std::size_t consecutive_failures = 0;
            std::optional<SequenceRange> unverified_commit;
            std::optional<ErrorKind> last_error;
            bool in_flight = false;
            bool finished = false;
            bool given_up = false;
        };

        struct Completion
        {
            PartitionKey partition;
            std::optional<CycleResult> result;
            std::optional<PipelineError> error;
        };

        std::vector<PartitionKey> discover() const;
        void refresh_partitions();
        std::size_t dispatch_eligible(ThreadPool &pool, std::size_t in_flight);
        void handle(const Completion &completion, RunSummary &summary);
        void release_leases();
        bool drained() const;
        Clock::time_point next_deadline(Clock::time_point now) const;

        PipelineStores stores_;
        const PipelineConfig &config_;
        CancellationToken &cancel_;
        PartitionCycle cycle_;

        mutable std::mutex slots_mutex_;
        std::map<PartitionKey, Slot> slots_;

        std::mutex completions_mutex_;
        std::condition_variable completions_cv_;
        std::deque<Completion> completions_;

        bool halted_ = false;
        Clock::time_point next_discovery_{};
    };

} // namespace ExecAggregator
