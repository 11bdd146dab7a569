// =============================================================================
// Scan Worker Pool Unit Tests
// Task futures, shutdown and worker startup failures
// =============================================================================

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <system_error>
#include "threads/scan_worker_pool.hpp"

using CanslimScanner::Core::SymbolResult;
using CanslimScanner::Threads::ScanWorkerPool;
using CanslimScanner::Threads::start_threads_or_unwind;

// -----------------------------------------------------------------------------
// Submit_ManyTasks_FuturesCarryEachResult
// -----------------------------------------------------------------------------
TEST(ScanWorkerPoolTest, Submit_ManyTasks_FuturesCarryEachResult) {
    ScanWorkerPool worker_pool(3, nullptr);
    std::vector<std::future<SymbolResult>> result_futures;
    for (int task_index = 0; task_index < 12; ++task_index) {
        result_futures.push_back(worker_pool.submit([task_index]() {
            SymbolResult symbol_result;
            symbol_result.symbol = "SYM" + std::to_string(task_index);
            return symbol_result;
        }));
    }

    EXPECT_EQ(worker_pool.get_worker_count(), 3);
    for (int task_index = 0; task_index < 12; ++task_index) {
        EXPECT_EQ(result_futures[task_index].get().symbol, "SYM" + std::to_string(task_index));
    }
}

// -----------------------------------------------------------------------------
// Submit_TaskThrows_ExceptionStoredInFuture
// -----------------------------------------------------------------------------
TEST(ScanWorkerPoolTest, Submit_TaskThrows_ExceptionStoredInFuture) {
    ScanWorkerPool worker_pool(2, nullptr);
    std::future<SymbolResult> failing_future = worker_pool.submit([]() -> SymbolResult {
        throw std::runtime_error("boom");
    });
    std::future<SymbolResult> healthy_future = worker_pool.submit([]() {
        SymbolResult symbol_result;
        symbol_result.symbol = "OK";
        return symbol_result;
    });

    EXPECT_THROW(failing_future.get(), std::runtime_error);
    EXPECT_EQ(healthy_future.get().symbol, "OK");
}

// -----------------------------------------------------------------------------
// Submit_AfterShutdown_Throws
// -----------------------------------------------------------------------------
TEST(ScanWorkerPoolTest, Submit_AfterShutdown_Throws) {
    ScanWorkerPool worker_pool(1, nullptr);
    worker_pool.shutdown();

    EXPECT_THROW(worker_pool.submit([]() { return SymbolResult(); }), std::runtime_error);
}

// -----------------------------------------------------------------------------
// Constructor_ZeroWorkers_Throws
// -----------------------------------------------------------------------------
TEST(ScanWorkerPoolTest, Constructor_ZeroWorkers_Throws) {
    EXPECT_THROW(ScanWorkerPool worker_pool(0, nullptr), std::runtime_error);
}

// -----------------------------------------------------------------------------
// StartThreadsOrUnwind_LaunchFails_StopsAndJoinsStartedThreads
// -----------------------------------------------------------------------------
TEST(ScanWorkerPoolTest, StartThreadsOrUnwind_LaunchFails_StopsAndJoinsStartedThreads) {
    std::atomic<bool> stop_requested(false);
    std::atomic<int> finished_threads(0);
    std::vector<std::thread> threads;

    auto launch = [&](int thread_number) {
        if (thread_number == 3) {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again), "thread start");
        }
        return std::thread([&]() {
            while (!stop_requested.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            finished_threads.fetch_add(1);
        });
    };

    EXPECT_THROW(start_threads_or_unwind(threads, 4, launch, [&]() { stop_requested.store(true); }), std::system_error);

    EXPECT_TRUE(stop_requested.load());
    ASSERT_EQ(threads.size(), 2u);
    EXPECT_EQ(finished_threads.load(), 2);
    for (const std::thread& started_thread : threads) {
        EXPECT_FALSE(started_thread.joinable());
    }
}
