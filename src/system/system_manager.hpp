#ifndef SYSTEM_MANAGER_HPP
#define SYSTEM_MANAGER_HPP

#include <memory>
#include <optional>
#include <string>
#include <thread>
#include "configs/system_config.hpp"
#include "api/general/fundamentals_provider_interface.hpp"
#include "api/general/http_client_interface.hpp"
#include "api/general/price_data_provider_interface.hpp"
#include "api/general/ticker_universe_interface.hpp"
#include "logging/logger/async_logger.hpp"
#include "scanner/data_structures/data_structures.hpp"

namespace CanslimScanner {
namespace System {

struct CommandLineOptions {
    std::string config_directory = "config";
    std::optional<std::string> universe;
    std::optional<std::string> export_directory;
    std::optional<int> max_workers;
    bool debug = false;
    bool show_help = false;
};

// Throws ConfigurationError on unknown flags or missing/invalid values.
CommandLineOptions parse_command_line(int argc, const char* const* argv);
std::string get_usage_text();

// Applies CLI overrides and re-validates. Throws ConfigurationError.
void apply_command_line_overrides(CanslimScanner::Config::SystemConfig& config, const CommandLineOptions& options);

struct SystemModules {
    CanslimScanner::API::HttpClientPtr http_client;
    CanslimScanner::API::PriceDataProviderPtr price_provider;
    CanslimScanner::API::FundamentalsProviderPtr fundamentals_provider;
    CanslimScanner::API::TickerUniversePtr ticker_universe;
};

struct SystemState {
    CanslimScanner::Config::SystemConfig config;
    std::shared_ptr<CanslimScanner::Logging::LoggingContext> logging_context;
    std::shared_ptr<CanslimScanner::Logging::AsyncLogger> logger;
    std::thread logging_thread_handle;
    SystemModules modules;

    SystemState() = default;
    SystemState(const SystemState&) = delete;
    SystemState& operator=(const SystemState&) = delete;
};

// Logging context, configuration, async logger and logging thread. Throws on any failure.
std::unique_ptr<SystemState> initialize(const CommandLineOptions& options);

// Builds the providers named by the data source configuration.
SystemModules create_scanner_modules(const CanslimScanner::Config::SystemConfig& config);

// Resolves the universe, runs the scan, logs the report and exports it. Returns the process exit code.
int run(SystemState& system_state);

// Exports the ranked results and entry signals; returns the written file paths.
std::vector<std::string> export_scan_report(const CanslimScanner::Core::ScanReport& scan_report,
                                            const CanslimScanner::Config::DataSourceConfig& data_source_config);

// Stops and joins the logging thread after flushing queued lines.
void shutdown(SystemState& system_state);

} // namespace System
} // namespace CanslimScanner

#endif // SYSTEM_MANAGER_HPP
