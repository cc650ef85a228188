#pragma once

// ============================================================================
// Stage timing for the aggregation pipeline
// ============================================================================
//
// Every partition cycle runs the same stages (Fetch, Reduce, Encode, Commit,
// Archive) on some worker thread. Each stage is wrapped in a scoped
// Benchmarker; on scope exit the elapsed time and item count are folded into
// a shared BenchmarkLedger. At the end of a run the ledger prints one line
// per stage: total time, ns per item, items per second.
//
// WHY RAII FOR TIMING?
// The constructor records the start, the destructor records the end. If a
// stage throws, the destructor still runs and the failed attempt still shows
// up in the totals. You cannot forget to stop the timer.
// ============================================================================

#include <chrono>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace ExecAggregator
{

    struct BenchmarkResult
    {
        std::string label;
        long long duration_ns = 0;
        size_t item_count = 0;
        size_t samples = 0;

        double duration_ms() const
        {
            return static_cast<double>(duration_ns) / 1'000'000.0;
        }

        double ns_per_item() const
        {
            if (item_count == 0)
                return 0.0;
            return static_cast<double>(duration_ns) / static_cast<double>(item_count);
        }

        double items_per_second() const
        {
            if (duration_ns == 0)
                return 0.0;
            return static_cast<double>(item_count) * 1'000'000'000.0 / static_cast<double>(duration_ns);
        }
    };

    // Thread-safe accumulator; one per run, shared by all workers.
    class BenchmarkLedger
    {
    public:
        void record(const std::string &label, long long duration_ns, size_t item_count)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto &r = results_[label];
            r.label = label;
            r.duration_ns += duration_ns;
            r.item_count += item_count;
            r.samples += 1;
        }

        std::vector<BenchmarkResult> snapshot() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::vector<BenchmarkResult> out;
            out.reserve(results_.size());
            for (const auto &[label, r] : results_)
                out.push_back(r);
            return out;
        }

    private:
        mutable std::mutex mutex_;
        std::map<std::string, BenchmarkResult> results_;
    };

    class Benchmarker
    {
    public:
        using Clock = std::chrono::steady_clock;

        // ledger may be null: timing is then measured and dropped.
        Benchmarker(std::string label, BenchmarkLedger *ledger, size_t item_count = 0)
            : label_(std::move(label)), ledger_(ledger), item_count_(item_count), start_(Clock::now())
        {
        }

        ~Benchmarker()
        {
            if (ledger_ == nullptr)
                return;
            auto duration_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start_).count();
            ledger_->record(label_, duration_ns, item_count_);
        }

        // Item counts are often only known once the stage has produced them.
        void set_items(size_t item_count) { item_count_ = item_count; }

        Benchmarker(const Benchmarker &) = delete;
        Benchmarker &operator=(const Benchmarker &) = delete;

    private:
        std::string label_;
        BenchmarkLedger *ledger_;
        size_t item_count_;
        Clock::time_point start_;
    };

    inline void print_benchmark_report(const std::vector<BenchmarkResult> &results)
    {
        std::cout << "\n";
        std::cout << "╔══════════════════╦════════╦══════════════╦═════════════╦═════════════╗\n";
        std::cout << "║ Stage            ║ Calls  ║ Duration(ms) ║   ns/item   ║  items/sec  ║\n";
        std::cout << "╠══════════════════╬════════╬══════════════╬═════════════╬═════════════╣\n";

        for (const auto &r : results)
        {
            std::cout << "║ "
                      << std::left << std::setw(16) << r.label
                      << " ║ "
                      << std::right << std::setw(6) << r.samples
                      << " ║ "
                      << std::right << std::fixed << std::setprecision(3)
                      << std::setw(12) << r.duration_ms()
                      << " ║ "
                      << std::right << std::fixed << std::setprecision(1)
                      << std::setw(11) << r.ns_per_item()
                      << " ║ "
                      << std::right << std::fixed << std::setprecision(0)
                      << std::setw(11) << r.items_per_second()
                      << " ║\n";
        }

        std::cout << "╚══════════════════╩════════╩══════════════╩═════════════╩═════════════╝\n";
        std::cout << "\n";
    }

} // namespace ExecAggregator
