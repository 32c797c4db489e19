/**
 * @file ThreadPool.hpp
 * @brief Fixed-size worker pool for blocking, CPU-bound jobs.
 *
 * Jobs run in submission order on dedicated std::jthread workers, so callers
 * never execute native encode work on their own thread. submit() returns a
 * std::future for the job's return value. After shutdown() nothing runs:
 * submit() hands back a future that is already ready and throws
 * std::runtime_error from get().
 *
 * @section Patterns
 * - RAII: workers are stopped and joined on destruction after the queue
 *   drains.
 */

#pragma once
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>
#include "Types.hpp"

namespace oc {

class ThreadPool {
public:
    explicit ThreadPool(usize numThreads = 1) {
        if (numThreads == 0)
            numThreads = 1;
        for (usize i = 0; i < numThreads; ++i) {
            workers_.emplace_back([this](std::stop_token st) { workerLoop(st); });
        }
    }

    ~ThreadPool() {
        shutdown();
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template <typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using R = std::invoke_result_t<std::decay_t<F>>;
        auto task =
                std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        auto future = task->get_future();
        {
            std::lock_guard lock(mutex_);
            if (stopping_) {
                std::promise<R> rejected;
                rejected.set_exception(std::make_exception_ptr(
                        std::runtime_error("ThreadPool is shut down")));
                return rejected.get_future();
            }
            jobs_.emplace([task] { (*task)(); });
        }
        cv_.notify_one();
        return future;
    }

    // Drains queued jobs, then joins the workers
    void shutdown() {
        {
            std::lock_guard lock(mutex_);
            if (stopping_)
                return;
            stopping_ = true;
        }
        cv_.notify_all();
        for (auto& w : workers_) {
            if (w.joinable())
                w.join();
        }
    }

    bool isShutdown() const {
        std::lock_guard lock(mutex_);
        return stopping_;
    }

    usize workerCount() const {
        return workers_.size();
    }

private:
    void workerLoop(std::stop_token st) {
        while (true) {
            std::function<void()> job;
            {
                std::unique_lock lock(mutex_);
                cv_.wait(lock, [this, &st] {
                    return stopping_ || st.stop_requested() || !jobs_.empty();
                });
                if (jobs_.empty())
                    return;
                job = std::move(jobs_.front());
                jobs_.pop();
            }
            job();
        }
    }

    std::vector<std::jthread> workers_;
    std::queue<std::function<void()>> jobs_;
    bool stopping_{false};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace oc
