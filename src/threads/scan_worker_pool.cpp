#include "scan_worker_pool.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace CanslimScanner {
namespace Threads {

ScanWorkerPool::ScanWorkerPool(int worker_count, CanslimScanner::Logging::LoggingContext* context)
    : workers(), task_queue(), queue_mutex(), queue_cv(), stopping(false), logging_context(context) {
    if (worker_count < 1) {
        throw std::runtime_error("ScanWorkerPool requires at least one worker, got " + std::to_string(worker_count));
    }
    workers.reserve(static_cast<size_t>(worker_count));
    start_threads_or_unwind(workers, worker_count,
                            [this](int worker_number) { return std::thread(&ScanWorkerPool::worker_loop, this, worker_number); },
                            [this]() { request_stop(); });
}

ScanWorkerPool::~ScanWorkerPool() {
    shutdown();
}

std::future<CanslimScanner::Core::SymbolResult> ScanWorkerPool::submit(SymbolTask task) {
    std::packaged_task<CanslimScanner::Core::SymbolResult()> packaged_symbol_task(std::move(task));
    std::future<CanslimScanner::Core::SymbolResult> result_future = packaged_symbol_task.get_future();
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        if (stopping) {
            throw std::runtime_error("ScanWorkerPool: submit after shutdown");
        }
        task_queue.push(std::move(packaged_symbol_task));
    }
    queue_cv.notify_one();
    return result_future;
}

void ScanWorkerPool::request_stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        stopping = true;
    }
    queue_cv.notify_all();
}

void ScanWorkerPool::shutdown() {
    request_stop();
    for (std::thread& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ScanWorkerPool::worker_loop(int worker_number) {
    if (logging_context) {
        CanslimScanner::Logging::set_logging_context(*logging_context);
        std::ostringstream tag_stream;
        tag_stream << "WRK" << std::setw(2) << std::setfill('0') << worker_number;
        CanslimScanner::Logging::set_log_thread_tag(tag_stream.str());
    }

    while (true) {
        std::packaged_task<CanslimScanner::Core::SymbolResult()> next_task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            queue_cv.wait(lock, [this] { return stopping || !task_queue.empty(); });
            if (task_queue.empty()) {
                return;
            }
            next_task = std::move(task_queue.front());
            task_queue.pop();
        }
        // Exceptions thrown by the task are stored in its future.
        next_task();
    }
}

} // namespace Threads
} // namespace CanslimScanner
