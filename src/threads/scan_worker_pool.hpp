#ifndef SCAN_WORKER_POOL_HPP
#define SCAN_WORKER_POOL_HPP

#include "scanner/data_structures/data_structures.hpp"
#include "logging/logger/async_logger.hpp"
#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace CanslimScanner {
namespace Threads {

/**
 * Appends launch(1) .. launch(thread_count) to threads. When a launch throws, calls stop(),
 * joins the threads already started and rethrows.
 */
template <typename LaunchFunction, typename StopFunction>
void start_threads_or_unwind(std::vector<std::thread>& threads, int thread_count, LaunchFunction launch, StopFunction stop) {
    try {
        for (int thread_number = 1; thread_number <= thread_count; ++thread_number) {
            threads.push_back(launch(thread_number));
        }
    } catch (const std::exception&) {
        stop();
        for (std::thread& started_thread : threads) {
            if (started_thread.joinable()) {
                started_thread.join();
            }
        }
        throw;
    }
}

/**
 * Fixed-size pool running one packaged task per symbol.
 * Workers attach to the caller's logging context and tag themselves WRK01, WRK02, ...
 * Tasks already queued still run when the pool shuts down.
 */
class ScanWorkerPool {
public:
    using SymbolTask = std::function<CanslimScanner::Core::SymbolResult()>;

    ScanWorkerPool(int worker_count, CanslimScanner::Logging::LoggingContext* logging_context);
    ~ScanWorkerPool();

    ScanWorkerPool(const ScanWorkerPool&) = delete;
    ScanWorkerPool& operator=(const ScanWorkerPool&) = delete;

    // Throws std::runtime_error after shutdown().
    std::future<CanslimScanner::Core::SymbolResult> submit(SymbolTask task);

    // Waits for queued tasks to finish and joins the workers.
    void shutdown();

    int get_worker_count() const { return static_cast<int>(workers.size()); }

private:
    std::vector<std::thread> workers;
    std::queue<std::packaged_task<CanslimScanner::Core::SymbolResult()>> task_queue;
    std::mutex queue_mutex;
    std::condition_variable queue_cv;
    bool stopping;
    CanslimScanner::Logging::LoggingContext* logging_context;

    void request_stop();
    void worker_loop(int worker_number);
};

} // namespace Threads
} // namespace CanslimScanner

#endif // SCAN_WORKER_POOL_HPP
