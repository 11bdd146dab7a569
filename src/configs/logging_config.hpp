#ifndef LOGGING_CONFIG_HPP
#define LOGGING_CONFIG_HPP

#include <string>

namespace CanslimScanner {
namespace Config {

struct LoggingConfig {
    std::string log_directory = "runtime_logs";      // Parent of the per-run folder
    std::string log_file = "canslim_scanner.log";
    int poll_interval_ms = 100;                      // Logging thread wake-up interval
    bool debug = false;                              // Per-symbol detail lines
    bool log_signals = true;                         // Log entry signals of accepted symbols
};

} // namespace Config
} // namespace CanslimScanner

#endif // LOGGING_CONFIG_HPP
