#ifndef ASYNC_LOGGER_HPP
#define ASYNC_LOGGER_HPP

#include <atomic>
#include <condition_variable>
#include <deque>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include "configs/logging_config.hpp"

namespace CanslimScanner {
namespace Logging {

constexpr size_t LOG_TAG_WIDTH = 6;

// Console output plus an optional log file. Console writes share the context's console mutex
// so lines from the logging thread and direct writers never interleave.
class LogSink {
public:
    LogSink(std::mutex& console_mutex, const std::string& log_file_path);

    bool has_file() const { return log_file.is_open(); }
    void write(const std::string& log_line);

private:
    std::mutex& console_guard;
    std::ofstream log_file;
};

/**
 * Queue between scan threads and the logging thread.
 * Producers call enqueue(); the logging thread calls drain() until stop(), then drain_remaining().
 * start() and stop() flip the running flag under the queue lock, so no line is queued after the final drain.
 */
class AsyncLogger {
public:
    explicit AsyncLogger(const std::string& log_file_path);

    const std::string& get_file_path() const { return file_path; }
    bool is_running() const { return running.load(); }
    size_t get_lines_written() const { return lines_written.load(); }

    void start();
    void stop();
    // False once stop() has been called; the line is then not queued.
    bool enqueue(std::string formatted_line);

    // Waits up to poll_interval_ms for lines, then writes everything queued. Returns lines written.
    size_t drain(LogSink& sink, int poll_interval_ms);
    size_t drain_remaining(LogSink& sink);

private:
    std::string file_path;
    std::mutex queue_mutex;
    std::condition_variable queue_cv;
    std::deque<std::string> pending_lines;
    std::atomic<bool> running{false};
    std::atomic<size_t> lines_written{0};

    size_t write_batch(std::deque<std::string>& batch, LogSink& sink);
};

// Per-process logging state. Each thread that logs installs a pointer to it with set_logging_context().
struct LoggingContext {
    std::shared_ptr<AsyncLogger> async_logger;
    std::mutex console_mutex;
    std::string run_folder;

    std::string get_thread_tag() const;
    void set_thread_tag(const std::string& tag_value);

private:
    mutable std::mutex thread_tag_mutex;
    std::unordered_map<std::thread::id, std::string> thread_tags;
};

// "<timestamp> [<tag>]   <message>\n", tag padded or cut to LOG_TAG_WIDTH.
std::string format_log_line(const std::string& timestamp, const std::string& thread_tag, const std::string& message);

void set_log_thread_tag(const std::string& thread_tag_value);

// Queues the line when the async logger runs; otherwise writes to the console and appends to
// log_file_path, or to the stopped logger's file when log_file_path is empty.
void log_message(const std::string& message, const std::string& log_file_path);

// <log_directory>/scan_<run_timestamp>, with a numeric suffix when a folder of that name exists.
std::string create_run_folder(const std::string& log_directory, const std::string& run_timestamp);

// Creates the run folder and a started AsyncLogger writing <run_folder>/<log_file>, and installs
// the logger in the calling thread's context. Throws std::runtime_error when the folder cannot be created.
std::shared_ptr<AsyncLogger> start_run_logging(const CanslimScanner::Config::LoggingConfig& logging_config);

// Throws std::runtime_error when the calling thread has no context.
LoggingContext* get_logging_context();
bool has_logging_context();
void set_logging_context(LoggingContext& context);

} // namespace Logging
} // namespace CanslimScanner

#endif // ASYNC_LOGGER_HPP
