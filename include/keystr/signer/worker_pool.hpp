#pragma once

#include "keystr/core/result.hpp"
#include "keystr/core/failures.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace keystr::signer {

/**
 * @brief Fixed set of threads draining a bounded task queue.
 *
 * Key derivation and signing run here so a slow scrypt pass never stalls
 * message routing. With zero threads every task runs inline on the
 * caller, which keeps tests deterministic.
 */
class WorkerPool {
public:
    WorkerPool(size_t threads, size_t queue_capacity);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// InvalidState when the queue is full or the pool is shut down.
    Result<Unit, KeystrFailure> Post(std::function<void()> task);

    template<typename F>
    auto Submit(F&& func) -> Result<std::future<std::invoke_result_t<F>>, KeystrFailure> {
        using T = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<T()>>(std::forward<F>(func));
        std::future<T> future = task->get_future();
        auto posted = Post([task] { (*task)(); });
        if (posted.IsErr()) {
            return Result<std::future<T>, KeystrFailure>::Err(std::move(posted).UnwrapErr());
        }
        return Result<std::future<T>, KeystrFailure>::Ok(std::move(future));
    }

    /// Blocks until the queue is empty and no task is running.
    void WaitIdle();

    /// Runs what is already queued, then joins. Idempotent.
    void Shutdown();

    [[nodiscard]] size_t ThreadCount() const noexcept { return threads_.size(); }

private:
    void RunWorker();
    static void RunTask(const std::function<void()>& task);

    const size_t capacity_;
    std::vector<std::thread> threads_;

    std::mutex mutex_;
    std::condition_variable work_available_;
    std::condition_variable idle_;
    std::deque<std::function<void()>> queue_;
    size_t active_ = 0;
    std::atomic<bool> running_{true};
};

}
