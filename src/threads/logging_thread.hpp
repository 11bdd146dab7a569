#ifndef LOGGING_THREAD_HPP
#define LOGGING_THREAD_HPP

#include <memory>
#include "logging/logger/async_logger.hpp"
#include "configs/logging_config.hpp"

namespace CanslimScanner {
namespace Threads {

// Thread body that owns the run log file. Runs until the logger is stopped, then writes what is still queued.
class LoggingThread {
public:
    LoggingThread(std::shared_ptr<CanslimScanner::Logging::AsyncLogger> logger,
                  CanslimScanner::Logging::LoggingContext& context,
                  const CanslimScanner::Config::LoggingConfig& logging_config)
        : async_logger(std::move(logger)), logging_context(context), poll_interval_ms(logging_config.poll_interval_ms) {}

    void operator()();

private:
    std::shared_ptr<CanslimScanner::Logging::AsyncLogger> async_logger;
    CanslimScanner::Logging::LoggingContext& logging_context;
    int poll_interval_ms;
};

} // namespace Threads
} // namespace CanslimScanner

#endif // LOGGING_THREAD_HPP
