#pragma once

// ============================================================================
// CancellationToken: cooperative stop signal shared by the whole run
// ============================================================================
// Nothing is ever interrupted mid-operation. Workers poll cancelled() at
// their checkpoints (before fetch, before commit) and the scheduler checks
// it on every dispatcher tick.
//
// main() sets it from a dedicated sigwait() thread, never from an async
// signal handler.
// ============================================================================

#include <atomic>

namespace ExecAggregator
{

    class CancellationToken
    {
    public:
        CancellationToken() = default;

        CancellationToken(const CancellationToken &) = delete;
        CancellationToken &operator=(const CancellationToken &) = delete;

        void cancel()
        {
            cancelled_.store(true, std::memory_order_release);
        }

        bool cancelled() const
        {
            return cancelled_.load(std::memory_order_acquire);
        }

    private:
        std::atomic<bool> cancelled_{false};
    };

} // namespace ExecAggregator
