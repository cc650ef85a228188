#pragma once

// ============================================================================
// ThreadPool: fixed set of workers for partition cycles
// ============================================================================
//
//   PartitionScheduler (dispatcher thread)        Workers (max_workers)
//   ──────────────────────────────────────        ─────────────────────
//   submit(cycle bitflyer/BTC_JPY) ──┐            worker 0: runs a cycle
//   submit(cycle liquid/BTCJPY)    ──┼─> queue ─> worker 1: runs a cycle
//   submit(cycle bitmex/XBTUSD)    ──┘            worker 2: sleeping
//
// The scheduler never queues more cycles than there are workers, so the
// queue stays short; the pool's job is to keep threads (and their database
// sockets) alive across thousands of cycles instead of spawning one thread
// per cycle.
//
// Exceptions thrown by a task are captured by std::packaged_task and come
// back out of future.get() on the caller's thread.
// ============================================================================

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace ExecAggregator
{

    class ThreadPool
    {
    public:
        explicit ThreadPool(size_t num_threads)
        {
            if (num_threads == 0)
                throw std::invalid_argument("[ThreadPool] needs at least one worker");

            workers_.reserve(num_threads);
            for (size_t i = 0; i < num_threads; ++i)
                workers_.emplace_back(&ThreadPool::worker_loop, this);
        }

        // Drains the queue, then joins. Tasks already queued still run.
        ~ThreadPool()
        {
            shutdown();
        }

        template <typename F>
        auto submit(F &&f) -> std::future<std::invoke_result_t<F>>
        {
            using Result = std::invoke_result_t<F>;

            // packaged_task is move-only but std::function needs a copyable
            // callable, hence the shared_ptr.
            auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(f));
            std::future<Result> future = task->get_future();

            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (stopping_)
                    throw std::runtime_error("[ThreadPool] submit after shutdown");

                queue_.push([task]()
                            { (*task)(); });
            }

            task_cv_.notify_one();
            return future;
        }

        void shutdown()
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (stopping_ && workers_.empty())
                    return;
                stopping_ = true;
            }
            task_cv_.notify_all();

            for (auto &worker : workers_)
            {
                if (worker.joinable())
                    worker.join();
            }
            workers_.clear();
        }

        size_t thread_count() const { return workers_.size(); }

        ThreadPool(const ThreadPool &) = delete;
        ThreadPool &operator=(const ThreadPool &) = delete;
        ThreadPool(ThreadPool &&) = delete;
        ThreadPool &operator=(ThreadPool &&) = delete;

    private:
        void worker_loop()
        {
            while (true)
            {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lock(mutex_);
                    task_cv_.wait(lock, [this]
                                  { return stopping_ || !queue_.empty(); });

                    if (stopping_ && queue_.empty())
                        return;

                    task = std::move(queue_.front());
                    queue_.pop();
                }

                // Run outside the lock, otherwise the pool is single-threaded.
                task();
            }
        }

        std::vector<std::thread> workers_;

        std::queue<std::function<void()>> queue_;
        std::mutex mutex_;                 // guards queue_, stopping_
        std::condition_variable task_cv_;  // workers wait here for work

        bool stopping_ = false;
    };

} // namespace ExecAggregator
