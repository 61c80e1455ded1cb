#include <catch2/catch_test_macros.hpp>
#include "keystr/signer/worker_pool.hpp"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
using namespace keystr;
using namespace keystr::signer;
TEST_CASE("WorkerPool - Inline mode", "[signer][workers]") {
    WorkerPool pool(0, 4);
    REQUIRE(pool.ThreadCount() == 0);
    SECTION("Tasks run on the caller before Post returns") {
        const auto caller = std::this_thread::get_id();
        std::thread::id ran_on;
        REQUIRE(pool.Post([&] { ran_on = std::this_thread::get_id(); }).IsOk());
        REQUIRE(ran_on == caller);
    }
    SECTION("Submit yields a ready future") {
        auto future = pool.Submit([] { return 21 * 2; });
        REQUIRE(future.IsOk());
        REQUIRE(future.Unwrap().get() == 42);
    }
    SECTION("Exceptions reach the future") {
        auto future = pool.Submit([]() -> int { throw std::runtime_error("boom"); });
        REQUIRE_THROWS_AS(future.Unwrap().get(), std::runtime_error);
    }
    SECTION("Posting after shutdown fails") {
        pool.Shutdown();
        pool.Shutdown();
        auto posted = pool.Post([] {});
        REQUIRE(posted.IsErr());
        REQUIRE(posted.UnwrapErr().type == FailureType::InvalidState);
    }
}
TEST_CASE("WorkerPool - Threaded mode", "[signer][workers]") {
    SECTION("Every task runs once") {
        WorkerPool pool(3, 128);
        std::atomic<int> counter{0};
        for (int i = 0; i < 100; ++i) {
            REQUIRE(pool.Post([&counter] { counter.fetch_add(1); }).IsOk());
        }
        pool.WaitIdle();
        REQUIRE(counter.load() == 100);
    }
    SECTION("Tasks leave the calling thread") {
        WorkerPool pool(1, 4);
        auto future = pool.Submit([] { return std::this_thread::get_id(); });
        REQUIRE(future.Unwrap().get() != std::this_thread::get_id());
    }
    SECTION("Bounded queue refuses overflow") {
        WorkerPool pool(1, 1);
        std::atomic<bool> release{false};
        std::atomic<bool> started{false};
        REQUIRE(pool.Post([&] {
            started = true;
            while (!release.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        }).IsOk());
        while (!started.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        REQUIRE(pool.Post([] {}).IsOk());
        auto overflow = pool.Post([] {});
        REQUIRE(overflow.IsErr());
        REQUIRE(overflow.UnwrapErr().type == FailureType::InvalidState);
        release = true;
        pool.WaitIdle();
    }
    SECTION("A throwing task does not stop the worker") {
        WorkerPool pool(1, 4);
        REQUIRE(pool.Post([] { throw std::runtime_error("task failure"); }).IsOk());
        auto future = pool.Submit([] { return 7; });
        REQUIRE(future.Unwrap().get() == 7);
    }
    SECTION("Shutdown drains queued work") {
        std::atomic<int> counter{0};
        {
            WorkerPool pool(2, 64);
            for (int i = 0; i < 20; ++i) {
                REQUIRE(pool.Post([&counter] { counter.fetch_add(1); }).IsOk());
            }
        }
        REQUIRE(counter.load() == 20);
    }
}
TEST_CASE("WorkerPool - Shutdown under contention", "[signer][workers][concurrency]") {
    SECTION("Idle pools created and destroyed in a loop always join") {
        for (int i = 0; i < 2000; ++i) {
            WorkerPool pool(4, 8);
        }
        SUCCEED();
    }
    SECTION("Posts racing shutdown either run or are refused") {
        for (int round = 0; round < 200; ++round) {
            std::atomic<int> accepted{0};
            std::atomic<int> ran{0};
            WorkerPool pool(2, 64);
            std::thread poster([&] {
                for (int i = 0; i < 16; ++i) {
                    if (pool.Post([&ran] { ran.fetch_add(1); }).IsOk()) {
                        accepted.fetch_add(1);
                    }
                }
            });
            pool.Shutdown();
            poster.join();
            REQUIRE(ran.load() == accepted.load());
        }
    }
}
