#include "keystr/signer/worker_pool.hpp"
#include "keystr/core/constants.hpp"
#include "keystr/debug/logger.hpp"

#include <exception>

namespace keystr::signer {

namespace {

constexpr std::string_view kComponent = "workers";

}

WorkerPool::WorkerPool(size_t threads, size_t queue_capacity)
    : capacity_(queue_capacity) {
    threads_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        threads_.emplace_back([this] { RunWorker(); });
    }
}

WorkerPool::~WorkerPool() {
    Shutdown();
}

Result<Unit, KeystrFailure> WorkerPool::Post(std::function<void()> task) {
    if (!running_.load()) {
        return Result<Unit, KeystrFailure>::Err(KeystrFailure::InvalidState("Worker pool is shut down"));
    }
    if (threads_.empty()) {
        RunTask(task);
        return Result<Unit, KeystrFailure>::Ok(unit);
    }
    {
        std::lock_guard<std::mutex> guard(mutex_);
        if (!running_.load()) {
            return Result<Unit, KeystrFailure>::Err(KeystrFailure::InvalidState("Worker pool is shut down"));
        }
        if (queue_.size() >= capacity_) {
            return Result<Unit, KeystrFailure>::Err(KeystrFailure::InvalidState("Worker queue is full"));
        }
        queue_.push_back(std::move(task));
    }
    work_available_.notify_one();
    return Result<Unit, KeystrFailure>::Ok(unit);
}

void WorkerPool::WaitIdle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return queue_.empty() && active_ == 0; });
}

void WorkerPool::Shutdown() {
    {
        std::lock_guard<std::mutex> guard(mutex_);
        bool expected = true;
        if (!running_.compare_exchange_strong(expected, false)) {
            return;
        }
    }
    work_available_.notify_all();
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void WorkerPool::RunWorker() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        work_available_.wait(lock, [this] { return !queue_.empty() || !running_.load(); });
        if (queue_.empty()) {
            return;
        }
        std::function<void()> task = std::move(queue_.front());
        queue_.pop_front();
        ++active_;
        lock.unlock();

        RunTask(task);

        lock.lock();
        --active_;
        if (queue_.empty() && active_ == 0) {
            idle_.notify_all();
        }
    }
}

void WorkerPool::RunTask(const std::function<void()>& task) {
    try {
        task();
    } catch (const std::exception& e) {
        KEYSTR_LOG_ERROR(kComponent, "task failed with exception: {}", e.what());
    }
}

}
