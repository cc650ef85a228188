#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <pthread.h>
#include <thread>
#include "benchmark/Benchmarker.hpp"
#include "config/ConfigLoader.hpp"
#include "database/PgAggregateStore.hpp"
#include "database/PgRawReader.hpp"
#include "database/PgSchema.hpp"
#include "errors/PipelineError.hpp"
#include "output/ParquetArchive.hpp"
#include "pipeline/PartitionScheduler.hpp"
#include "threading/CancellationToken.hpp"

namespace
{
    // =========================================================================
    // Signal forwarding
    // =========================================================================
    // SIGINT/SIGTERM are blocked in every thread (the mask is inherited, so it
    // is set before the pool starts) and collected by one thread in sigwait().
    // That thread is an ordinary thread, so it may write to std::cout.
    // SIGUSR1 is only used by main() to wake it up at the end of the run.
    // =========================================================================
    class SignalForwarder
    {
    public:
        explicit SignalForwarder(ExecAggregator::CancellationToken &cancel)
        {
            sigemptyset(&set_);
            sigaddset(&set_, SIGINT);
            sigaddset(&set_, SIGTERM);
            sigaddset(&set_, SIGUSR1);
            pthread_sigmask(SIG_BLOCK, &set_, nullptr);

            thread_ = std::thread([this, &cancel]
                                  {
                                      int sig = 0;
                                      if (sigwait(&set_, &sig) != 0 || sig == SIGUSR1)
                                          return;
                                      std::cout << "[MAIN] Signal " << sig
                                                << " received, finishing in-flight cycles...\n";
                                      cancel.cancel(); });
        }

        ~SignalForwarder()
        {
            pthread_kill(thread_.native_handle(), SIGUSR1);
            thread_.join();
        }

        SignalForwarder(const SignalForwarder &) = delete;
        SignalForwarder &operator=(const SignalForwarder &) = delete;

    private:
        sigset_t set_;
        std::thread thread_;
    };
}

int main(int argc, char **argv)
{
    // std::cout stays synced with stdio: every worker logs through it.
    std::cout << "===================================================\n";
    std::cout << "   ExecAggregator | Execution Aggregation Pipeline\n";
    std::cout << "===================================================\n\n";

    if (argc > 2)
    {
        std::cerr << "usage: " << argv[0] << " [config-file]\n";
        return 2;
    }

    try
    {
        // ── CONFIG ────────────────────────────────────────────────────────
        const ExecAggregator::PipelineConfig config = argc == 2
                                                          ? ExecAggregator::ConfigLoader::load(argv[1])
                                                          : ExecAggregator::ConfigLoader::defaults_with_environment();

        // ── SCHEMA ────────────────────────────────────────────────────────
        if (config.database.init_schema)
            ExecAggregator::PgSchema::init(config.database);

        // ── STORES ────────────────────────────────────────────────────────
        ExecAggregator::PgRawReader reader(config.database, config.scheduler.fetch_timeout);
        ExecAggregator::PgAggregateStore store(config.database,
                                               config.scheduler.commit_timeout,
                                               config.scheduler.fetch_timeout);

        std::optional<ExecAggregator::ParquetArchive> archive;
        if (!config.archive_directory.empty())
            archive.emplace(config.archive_directory);

        ExecAggregator::PipelineStores stores{reader, store, store, &store};

        // ── RUN ───────────────────────────────────────────────────────────
        ExecAggregator::CancellationToken cancel;
        SignalForwarder signals(cancel);

        ExecAggregator::BenchmarkLedger ledger;
        ExecAggregator::PartitionScheduler scheduler(stores, config, cancel, &ledger,
                                                     archive ? &*archive : nullptr);

        const ExecAggregator::RunSummary summary = scheduler.run();

        // ── REPORT ────────────────────────────────────────────────────────
        ExecAggregator::print_run_summary(summary);
        ExecAggregator::print_benchmark_report(ledger.snapshot());

        if (summary.needs_attention())
        {
            std::cerr << "[MAIN] Run finished with partitions that need attention.\n";
            return 1;
        }

        std::cout << "[SUCCESS] Aggregation run finished.\n";
        std::cout << "===================================================\n";
    }
    catch (const ExecAggregator::PipelineError &e)
    {
        std::cerr << "[CRITICAL ERROR] " << e.what() << "\n";
        return e.kind() == ExecAggregator::ErrorKind::Configuration ? 2 : 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "[CRITICAL ERROR] Pipeline crashed: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
