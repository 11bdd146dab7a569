#include "logging_thread.hpp"
#include <iostream>

namespace CanslimScanner {
namespace Threads {

using CanslimScanner::Logging::LogSink;

void LoggingThread::operator()() {
    try {
        CanslimScanner::Logging::set_logging_context(logging_context);
        CanslimScanner::Logging::set_log_thread_tag("LOGGER");

        LogSink run_log_sink(logging_context.console_mutex, async_logger->get_file_path());
        if (!run_log_sink.has_file()) {
            std::cerr << "Cannot open run log " << async_logger->get_file_path() << ", logging to console only" << std::endl;
        }

        while (async_logger->is_running()) {
            async_logger->drain(run_log_sink, poll_interval_ms);
        }
        async_logger->drain_remaining(run_log_sink);
    } catch (const std::exception& logging_error) {
        std::cerr << "Logging thread stopped: " << logging_error.what() << std::endl;
    }
}

} // namespace Threads
} // namespace CanslimScanner
