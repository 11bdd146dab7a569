#include "async_logger.hpp"
#include "utils/time_utils.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>
#include <sstream>

namespace CanslimScanner {
namespace Logging {

thread_local LoggingContext* thread_local_logging_context_pointer = nullptr;

namespace {
    const char* DEFAULT_THREAD_TAG = "MAIN";

    std::string fit_tag(const std::string& tag_value) {
        std::string tag_string = tag_value.substr(0, LOG_TAG_WIDTH);
        tag_string.append(LOG_TAG_WIDTH - tag_string.size(), ' ');
        return tag_string;
    }

    std::string file_name_only(const std::string& configured_path) {
        return std::filesystem::path(configured_path).filename().string();
    }
}

// ----------------------------------------------------------------------------
// Context
// ----------------------------------------------------------------------------

std::string LoggingContext::get_thread_tag() const {
    std::lock_guard<std::mutex> thread_tag_lock(thread_tag_mutex);
    std::unordered_map<std::thread::id, std::string>::const_iterator tag_iterator = thread_tags.find(std::this_thread::get_id());
    return tag_iterator != thread_tags.end() ? tag_iterator->second : fit_tag(DEFAULT_THREAD_TAG);
}

void LoggingContext::set_thread_tag(const std::string& tag_value) {
    std::lock_guard<std::mutex> thread_tag_lock(thread_tag_mutex);
    thread_tags[std::this_thread::get_id()] = fit_tag(tag_value);
}

LoggingContext* get_logging_context() {
    if (!thread_local_logging_context_pointer) {
        throw std::runtime_error("Logging context not initialized for current thread");
    }
    return thread_local_logging_context_pointer;
}

bool has_logging_context() {
    return thread_local_logging_context_pointer != nullptr;
}

void set_logging_context(LoggingContext& context) {
    thread_local_logging_context_pointer = &context;
}

void set_log_thread_tag(const std::string& thread_tag_value) {
    get_logging_context()->set_thread_tag(thread_tag_value);
}

// ----------------------------------------------------------------------------
// Line formatting and direct output
// ----------------------------------------------------------------------------

std::string format_log_line(const std::string& timestamp, const std::string& thread_tag, const std::string& message) {
    std::string log_line;
    log_line.reserve(timestamp.size() + LOG_TAG_WIDTH + message.size() + 8);
    log_line += timestamp;
    log_line += " [";
    log_line += fit_tag(thread_tag);
    log_line += "]   ";
    log_line += message;
    log_line += '\n';
    return log_line;
}

void log_message(const std::string& message, const std::string& log_file_path) {
    if (!has_logging_context()) {
        std::cerr << message << std::endl;
        return;
    }
    LoggingContext* logging_context = get_logging_context();
    std::string log_line = format_log_line(TimeUtils::get_current_human_readable_time(), logging_context->get_thread_tag(), message);

    std::shared_ptr<AsyncLogger> async_logger = logging_context->async_logger;
    if (async_logger && async_logger->enqueue(log_line)) {
        return;
    }

    // Once the logger has stopped, lines go straight to its run log.
    const std::string& direct_file_path = (log_file_path.empty() && async_logger) ? async_logger->get_file_path() : log_file_path;
    LogSink direct_sink(logging_context->console_mutex, direct_file_path);
    if (!direct_file_path.empty() && !direct_sink.has_file()) {
        std::cerr << "Failed to open log file: " << direct_file_path << std::endl;
    }
    direct_sink.write(log_line);
}

// ----------------------------------------------------------------------------
// Run folder
// ----------------------------------------------------------------------------

std::string create_run_folder(const std::string& log_directory, const std::string& run_timestamp) {
    const std::string base_folder = log_directory + "/scan_" + run_timestamp;
    std::string run_folder = base_folder;
    for (int attempt = 2; std::filesystem::exists(run_folder); ++attempt) {
        run_folder = base_folder + "_" + std::to_string(attempt);
    }

    std::error_code directory_error;
    std::filesystem::create_directories(run_folder, directory_error);
    if (directory_error) {
        throw std::runtime_error("Failed to create run folder " + run_folder + ": " + directory_error.message());
    }
    return run_folder;
}

std::shared_ptr<AsyncLogger> start_run_logging(const CanslimScanner::Config::LoggingConfig& logging_config) {
    LoggingContext* logging_context = get_logging_context();

    logging_context->run_folder = create_run_folder(logging_config.log_directory,
                                                    TimeUtils::get_current_time_formatted(TimeUtils::RUN_ID_FORMAT));
    std::shared_ptr<AsyncLogger> async_logger =
        std::make_shared<AsyncLogger>(logging_context->run_folder + "/" + file_name_only(logging_config.log_file));
    // Lines logged before the logging thread starts wait in the queue.
    async_logger->start();

    logging_context->async_logger = async_logger;
    logging_context->set_thread_tag(DEFAULT_THREAD_TAG);
    return async_logger;
}

// ----------------------------------------------------------------------------
// LogSink
// ----------------------------------------------------------------------------

LogSink::LogSink(std::mutex& console_mutex, const std::string& log_file_path) : console_guard(console_mutex), log_file() {
    if (!log_file_path.empty()) {
        log_file.open(log_file_path, std::ios::app);
    }
}

void LogSink::write(const std::string& log_line) {
    {
        std::lock_guard<std::mutex> console_lock(console_guard);
        std::cout << log_line << std::flush;
    }
    if (log_file.is_open()) {
        log_file << log_line;
        log_file.flush();
    }
}

// ----------------------------------------------------------------------------
// AsyncLogger
// ----------------------------------------------------------------------------

AsyncLogger::AsyncLogger(const std::string& log_file_path) : file_path(log_file_path) {}

void AsyncLogger::start() {
    std::lock_guard<std::mutex> queue_lock(queue_mutex);
    running.store(true);
}

void AsyncLogger::stop() {
    {
        std::lock_guard<std::mutex> queue_lock(queue_mutex);
        running.store(false);
    }
    queue_cv.notify_all();
}

bool AsyncLogger::enqueue(std::string formatted_line) {
    {
        std::lock_guard<std::mutex> queue_lock(queue_mutex);
        if (!running.load()) {
            return false;
        }
        pending_lines.push_back(std::move(formatted_line));
    }
    queue_cv.notify_one();
    return true;
}

size_t AsyncLogger::write_batch(std::deque<std::string>& batch, LogSink& sink) {
    const size_t batch_size = batch.size();
    for (const std::string& log_line : batch) {
        sink.write(log_line);
    }
    batch.clear();
    lines_written.fetch_add(batch_size);
    return batch_size;
}

size_t AsyncLogger::drain(LogSink& sink, int poll_interval_ms) {
    std::deque<std::string> batch;
    {
        std::unique_lock<std::mutex> queue_lock(queue_mutex);
        queue_cv.wait_for(queue_lock, std::chrono::milliseconds(poll_interval_ms),
                          [this] { return !pending_lines.empty() || !running.load(); });
        batch.swap(pending_lines);
    }
    return write_batch(batch, sink);
}

size_t AsyncLogger::drain_remaining(LogSink& sink) {
    std::deque<std::string> batch;
    {
        std::lock_guard<std::mutex> queue_lock(queue_mutex);
        batch.swap(pending_lines);
    }
    return write_batch(batch, sink);
}

} // namespace Logging
} // namespace CanslimScanner
