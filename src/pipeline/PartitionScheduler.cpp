#include "PartitionScheduler.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>

namespace ExecAggregator
{

    namespace
    {
        // Upper bound on any single wait of the dispatcher, so a cancel() that
        // arrives while nothing completes is still noticed promptly.
        constexpr std::chrono::milliseconds kDispatcherTick{200};

        std::string_view mode_name(RunMode mode)
        {
            return mode == RunMode::Drain ? "drain" : "follow";
        }
    }

    PartitionScheduler::PartitionScheduler(PipelineStores stores,
                                           const PipelineConfig &config,
                                           CancellationToken &cancel,
                                           BenchmarkLedger *ledger,
                                           const ParquetArchive *archive)
        : stores_(stores),
          config_(config),
          cancel_(cancel),
          cycle_(stores, config, ledger, archive)
    {
    }

    std::chrono::milliseconds PartitionScheduler::backoff_delay(const SchedulerConfig &config, std::size_t failures)
    {
        if (failures == 0)
            return std::chrono::milliseconds{0};

        // Doubling step by step instead of shifting: no overflow for large
        // failure counts, and the cap is hit after a few dozen steps at most.
        std::chrono::milliseconds delay = config.backoff_initial;
        for (std::size_t i = 1; i < failures && delay < config.backoff_max; ++i)
            delay *= 2;

        return std::min(delay, config.backoff_max);
    }

    // =========================================================================
    // Partition set
    // =========================================================================
    std::vector<PartitionKey> PartitionScheduler::discover() const
    {
        std::vector<PartitionKey> keys = config_.enabled_partitions.empty()
                                             ? stores_.reader.list_partitions()
                                             : config_.enabled_partitions;

        const auto &disabled = config_.disabled_partitions;
        keys.erase(std::remove_if(keys.begin(), keys.end(),
                                  [&](const PartitionKey &key)
                                  {
                                      return std::find(disabled.begin(), disabled.end(), key) != disabled.end();
                                  }),
                   keys.end());
        return keys;
    }

    // Follow mode only: picks up partitions the downloader started writing
    // after this process came up.
    void PartitionScheduler::refresh_partitions()
    {
        if (!config_.enabled_partitions.empty() || Clock::now() < next_discovery_)
            return;
        next_discovery_ = Clock::now() + config_.scheduler.poll_interval;

        std::vector<PartitionKey> keys;
        try
        {
            keys = discover();
        }
        catch (const PipelineError &e)
        {
            std::cerr << "[SCHEDULER] Partition discovery failed, keeping the current set: " << e.what() << "\n";
            return;
        }

        std::lock_guard<std::mutex> lock(slots_mutex_);
        for (const auto &key : keys)
        {
            if (slots_.try_emplace(key).second)
                std::cout << "[SCHEDULER] New partition " << key.to_string() << "\n";
        }
    }

    std::vector<PartitionKey> PartitionScheduler::partitions() const
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        std::vector<PartitionKey> keys;
        keys.reserve(slots_.size());
        for (const auto &[key, slot] : slots_)
            keys.push_back(key);
        return keys;
    }

    std::optional<PartitionStatus> PartitionScheduler::status(const PartitionKey &partition) const
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        auto it = slots_.find(partition);
        if (it == slots_.end())
            return std::nullopt;

        const Slot &slot = it->second;
        PartitionStatus status;
        status.state = slot.state.load();
        status.consecutive_failures = slot.consecutive_failures;
        status.finished = slot.finished;
        status.given_up = slot.given_up;
        status.last_error = slot.last_error;
        return status;
    }

    // =========================================================================
    // Dispatch
    // =========================================================================
    std::size_t PartitionScheduler::dispatch_eligible(ThreadPool &pool, std::size_t in_flight)
    {
        const auto now = Clock::now();
        std::size_t dispatched = 0;

        std::lock_guard<std::mutex> lock(slots_mutex_);
        for (auto &[key, slot] : slots_)
        {
            if (in_flight + dispatched >= config_.scheduler.max_workers)
                break;
            if (slot.in_flight || slot.finished || slot.given_up || now < slot.next_eligible)
                continue;

            slot.in_flight = true;
            slot.state = PartitionState::Idle;
            ++dispatched;

            pool.submit([this, partition = key, state = &slot.state, unverified = slot.unverified_commit]()
                        {
                            Completion done{partition, std::nullopt, std::nullopt};
                            try
                            {
                                done.result = cycle_.run(partition, *state, cancel_, unverified);
                            }
                            catch (const PipelineError &e)
                            {
                                done.error = e;
                            }
                            catch (const std::exception &e)
                            {
                                done.error = PipelineError(ErrorKind::TransientIo,
                                                           partition.to_string() + ": unexpected error: " + e.what());
                            }

                            {
                                std::lock_guard<std::mutex> lock(completions_mutex_);
                                completions_.push_back(std::move(done));
                            }
                            completions_cv_.notify_one(); });
        }
        return dispatched;
    }

    // =========================================================================
    // handle(): the per-partition state machine after a cycle
    // =========================================================================
    void PartitionScheduler::handle(const Completion &completion, RunSummary &summary)
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        Slot &slot = slots_.at(completion.partition);
        const auto now = Clock::now();
        const bool drain = config_.scheduler.mode == RunMode::Drain;

        slot.in_flight = false;
        ++summary.cycles;

        if (completion.error)
        {
            const PipelineError &e = *completion.error;
            ++summary.failures;
            ++summary.failures_by_kind[e.kind()];
            ++slot.consecutive_failures;
            slot.last_error = e.kind();

            // The next cycle re-reads the watermark and reports whether this landed.
            if (e.kind() == ErrorKind::UnknownOutcome && e.range())
                slot.unverified_commit = *e.range();

            std::cerr << "[SCHEDULER] " << e.what()
                      << " (failure " << slot.consecutive_failures << " in a row)\n";

            if (halts_scheduler(e.kind()))
            {
                if (!halted_)
                {
                    halted_ = true;
                    summary.halt_reason = e.what();
                    std::cerr << "[SCHEDULER] " << to_string(e.kind())
                              << " error, no new cycles will be dispatched\n";
                }
                slot.state = PartitionState::Idle;
                return;
            }

            if (drain && slot.consecutive_failures >= config_.scheduler.max_attempts)
            {
                slot.given_up = true;
                slot.state = PartitionState::Idle;
                summary.given_up.push_back(completion.partition);
                std::cerr << "[SCHEDULER] Giving up on " << completion.partition.to_string()
                          << " for this run after " << slot.consecutive_failures << " attempts\n";
                return;
            }

            const auto delay = backoff_delay(config_.scheduler, slot.consecutive_failures);
            slot.state = PartitionState::Backoff;
            slot.next_eligible = now + delay;
            std::cerr << "[SCHEDULER] " << completion.partition.to_string()
                      << " retrying in " << delay.count() << " ms\n";
            return;
        }

        const CycleResult &result = *completion.result;
        switch (result.status)
        {
        case CycleResult::Status::Committed:
            slot.consecutive_failures = 0;
            slot.last_error.reset();
            slot.unverified_commit.reset();
            slot.next_eligible = now; // more rows may be waiting
            if (result.outcome != CommitOutcome::AlreadyCommitted)
            {
                ++summary.committed_batches;
                summary.raw_rows += result.raw_rows;
                summary.aggregated_rows += result.aggregated_rows;
            }
            std::cout << "[CYCLE] " << completion.partition.to_string() << " " << to_string(result.outcome)
                      << " seq (" << result.watermark_before << ", " << result.watermark_after << "] "
                      << result.raw_rows << " raw -> " << result.aggregated_rows << " aggregated\n";
            break;

        case CycleResult::Status::Empty:
            ++summary.empty_cycles;
            slot.consecutive_failures = 0;
            slot.last_error.reset();
            slot.unverified_commit.reset();
            if (drain)
                slot.finished = true;
            else
                slot.next_eligible = now + config_.scheduler.poll_interval;
            break;

        case CycleResult::Status::Cancelled:
            summary.cancelled = true;
            break;

        case CycleResult::Status::LeaseHeld:
            std::cout << "[SCHEDULER] " << completion.partition.to_string() << " is leased by another worker\n";
            if (drain)
                slot.finished = true;
            else
                slot.next_eligible = now + config_.scheduler.poll_interval;
            break;
        }
    }

    bool PartitionScheduler::drained() const
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        return std::all_of(slots_.begin(), slots_.end(), [](const auto &entry)
                           { return entry.second.finished || entry.second.given_up; });
    }

    PartitionScheduler::Clock::time_point PartitionScheduler::next_deadline(Clock::time_point now) const
    {
        auto deadline = now + kDispatcherTick;

        std::lock_guard<std::mutex> lock(slots_mutex_);
        for (const auto &[key, slot] : slots_)
        {
            if (!slot.in_flight && !slot.finished && !slot.given_up)
                deadline = std::min(deadline, std::max(now, slot.next_eligible));
        }
        return deadline;
    }

    void PartitionScheduler::release_leases()
    {
        if (stores_.leases == nullptr)
            return;

        for (const auto &key : partitions())
        {
            try
            {
                stores_.leases->release(key, config_.scheduler.worker_id);
            }
            catch (const PipelineError &e)
            {
                // The lease expires on its own after lease_ttl.
                std::cerr << "[SCHEDULER] Could not release lease on " << key.to_string() << ": " << e.what() << "\n";
            }
        }
    }

    // =========================================================================
    // run()
    // =========================================================================
    RunSummary PartitionScheduler::run()
    {
        RunSummary summary;
        halted_ = false;

        {
            auto keys = discover();
            std::lock_guard<std::mutex> lock(slots_mutex_);
            for (const auto &key : keys)
                slots_.try_emplace(key);
        }
        next_discovery_ = Clock::now() + config_.scheduler.poll_interval;

        std::cout << "[SCHEDULER] " << partitions().size() << " partition(s), "
                  << config_.scheduler.max_workers << " worker(s), mode " << mode_name(config_.scheduler.mode) << "\n";

        ThreadPool pool(config_.scheduler.max_workers);
        std::size_t in_flight = 0;

        while (true)
        {
            if (cancel_.cancelled())
                summary.cancelled = true;

            const bool stopping = halted_ || summary.cancelled;
            if (!stopping)
            {
                if (config_.scheduler.mode == RunMode::Follow)
                    refresh_partitions();
                in_flight += dispatch_eligible(pool, in_flight);
            }

            if (in_flight == 0 && (stopping || (config_.scheduler.mode == RunMode::Drain && drained())))
                break;

            std::deque<Completion> done;
            {
                const auto deadline = stopping ? Clock::now() + kDispatcherTick : next_deadline(Clock::now());
                std::unique_lock<std::mutex> lock(completions_mutex_);
                completions_cv_.wait_until(lock, deadline, [this]
                                           { return !completions_.empty(); });
                done.swap(completions_);
            }

            for (const auto &completion : done)
            {
                handle(completion, summary);
                --in_flight;
            }
        }

        pool.shutdown();
        release_leases();

        summary.halted = halted_;
        if (summary.cancelled)
            std::cout << "[SCHEDULER] Cancelled, in-flight cycles finished\n";
        return summary;
    }

    void print_run_summary(const RunSummary &summary)
    {
        std::cout << "\n";
        std::cout << "╔══════════════════════════╦══════════════╗\n";
        std::cout << "║ Run summary              ║              ║\n";
        std::cout << "╠══════════════════════════╬══════════════╣\n";

        auto line = [](std::string_view label, auto value)
        {
            std::cout << "║ " << std::left << std::setw(24) << label
                      << " ║ " << std::right << std::setw(12) << value << " ║\n";
        };

        line("Cycles", summary.cycles);
        line("Committed batches", summary.committed_batches);
        line("Raw rows consumed", summary.raw_rows);
        line("Aggregated rows written", summary.aggregated_rows);
        line("Empty fetches", summary.empty_cycles);
        line("Failures", summary.failures);
        for (const auto &[kind, count] : summary.failures_by_kind)
            line(std::string("  ") + std::string(to_string(kind)), count);
        line("Partitions given up", summary.given_up.size());

        std::cout << "╚══════════════════════════╩══════════════╝\n";

        for (const auto &key : summary.given_up)
            std::cerr << "[SCHEDULER] Given up: " << key.to_string() << "\n";
        if (summary.halted)
            std::cerr << "[SCHEDULER] Halted: " << summary.halt_reason << "\n";
        std::cout << "\n";
    }

} // namespace ExecAggregator
