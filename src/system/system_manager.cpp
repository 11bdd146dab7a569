#include "system_manager.hpp"
#include <chrono>
#include <cstdlib>
#include "api/csv/csv_price_data_provider.hpp"
#include "api/universe/index_ticker_fetcher.hpp"
#include "api/universe/ticker_cache.hpp"
#include "api/yahoo/yahoo_fundamentals_client.hpp"
#include "api/yahoo/yahoo_price_client.hpp"
#include "configs/universe_config.hpp"
#include "logging/logger/scan_results_csv_writer.hpp"
#include "logging/logs/scan_logs.hpp"
#include "logging/logs/startup_logs.hpp"
#include "logging/logs/system_logs.hpp"
#include "scanner/config_loader/config_loader.hpp"
#include "scanner/errors/scan_errors.hpp"
#include "scanner/screening/screening_orchestrator.hpp"
#include "threads/logging_thread.hpp"
#include "utils/http_utils.hpp"
#include "utils/time_utils.hpp"

using namespace CanslimScanner::Logging;
using namespace CanslimScanner::Threads;

namespace CanslimScanner {
namespace System {

namespace {
    std::string require_flag_value(int argc, const char* const* argv, int& arg_index, const std::string& flag_name) {
        if (arg_index + 1 >= argc) {
            throw Core::ConfigurationError("Missing value for " + flag_name);
        }
        return argv[++arg_index];
    }
}

std::string get_usage_text() {
    return "Usage: canslim_scanner [options]\n"
           "  --config-dir <dir>     Configuration directory (default: config)\n"
           "  --universe <selector>  sp500 | nasdaq100 | russell2000 | all | list:A,B,C | file:<path>\n"
           "  --export-dir <dir>     Directory for CSV exports\n"
           "  --max-workers <n>      Concurrent symbol pipelines (1-32)\n"
           "  --debug                Per-symbol detail lines\n"
           "  --help                 Show this message\n";
}

CommandLineOptions parse_command_line(int argc, const char* const* argv) {
    CommandLineOptions options;
    for (int arg_index = 1; arg_index < argc; ++arg_index) {
        const std::string argument = argv[arg_index];
        if (argument == "--config-dir") {
            options.config_directory = require_flag_value(argc, argv, arg_index, argument);
        } else if (argument == "--universe") {
            options.universe = require_flag_value(argc, argv, arg_index, argument);
        } else if (argument == "--export-dir") {
            options.export_directory = require_flag_value(argc, argv, arg_index, argument);
        } else if (argument == "--max-workers") {
            std::string worker_value = require_flag_value(argc, argv, arg_index, argument);
            try {
                size_t consumed = 0;
                options.max_workers = std::stoi(worker_value, &consumed);
                if (consumed != worker_value.size()) {
                    throw Core::ConfigurationError("Invalid value for --max-workers: " + worker_value);
                }
            } catch (const std::invalid_argument&) {
                throw Core::ConfigurationError("Invalid value for --max-workers: " + worker_value);
            } catch (const std::out_of_range&) {
                throw Core::ConfigurationError("Invalid value for --max-workers: " + worker_value);
            }
        } else if (argument == "--debug") {
            options.debug = true;
        } else if (argument == "--help" || argument == "-h") {
            options.show_help = true;
        } else {
            throw Core::ConfigurationError("Unknown argument: " + argument);
        }
    }
    return options;
}

void apply_command_line_overrides(CanslimScanner::Config::SystemConfig& config, const CommandLineOptions& options) {
    if (options.universe) {
        config.screening.universe = *options.universe;
    }
    if (options.export_directory) {
        config.data_source.export_directory = *options.export_directory;
    }
    if (options.max_workers) {
        config.screening.max_workers = *options.max_workers;
    }
    if (options.debug) {
        config.logging.debug = true;
    }

    std::string validation_error;
    if (!validate_config(config, validation_error)) {
        throw Core::ConfigurationError("Invalid command line override: " + validation_error);
    }
}

std::unique_ptr<SystemState> initialize(const CommandLineOptions& options) {
    std::unique_ptr<SystemState> system_state = std::make_unique<SystemState>();

    // Logging context first: config loading may log before the async logger exists.
    system_state->logging_context = std::make_shared<LoggingContext>();
    set_logging_context(*system_state->logging_context);

    try {
        load_system_config(system_state->config, options.config_directory);
        apply_command_line_overrides(system_state->config, options);
    } catch (const Core::ConfigurationError& configuration_error) {
        SystemLogs::log_configuration_error(configuration_error.what());
        throw;
    }

    system_state->logger = start_run_logging(system_state->config.logging);
    system_state->logging_thread_handle = std::thread(LoggingThread(system_state->logger, *system_state->logging_context,
                                                                    system_state->config.logging));

    try {
        StartupLogs::log_application_header(options.config_directory, system_state->logger->get_file_path());
        SystemLogs::log_configuration_validated(true, "");
        StartupLogs::log_configuration_summary(system_state->config);
    } catch (const std::exception&) {
        shutdown(*system_state);
        throw;
    }
    return system_state;
}

SystemModules create_scanner_modules(const CanslimScanner::Config::SystemConfig& config) {
    SystemModules modules;
    modules.http_client = std::make_shared<CanslimScanner::API::CurlHttpClient>();

    if (config.data_source.price_provider == "csv") {
        modules.price_provider = std::make_unique<CanslimScanner::API::CsvPriceDataProvider>(config.data_source.price_data_directory);
    } else {
        modules.price_provider = std::make_unique<CanslimScanner::API::YahooPriceClient>(config.data_source, modules.http_client);
    }

    if (config.data_source.fundamentals_provider == "none") {
        modules.fundamentals_provider = std::make_unique<CanslimScanner::API::EmptyFundamentalsProvider>();
    } else {
        modules.fundamentals_provider = std::make_unique<CanslimScanner::API::YahooFundamentalsClient>(config.data_source, modules.http_client);
    }

    CanslimScanner::API::TickerCachePtr ticker_cache =
        std::make_shared<CanslimScanner::API::JsonFileTickerCache>(config.data_source.universe_cache_file);
    modules.ticker_universe = std::make_unique<CanslimScanner::API::IndexTickerFetcher>(config.data_source, modules.http_client, ticker_cache);
    return modules;
}

std::vector<std::string> export_scan_report(const CanslimScanner::Core::ScanReport& scan_report,
                                            const CanslimScanner::Config::DataSourceConfig& data_source_config) {
    std::vector<std::string> written_files;
    const std::string timestamp = TimeUtils::get_current_time_formatted(TimeUtils::RUN_ID_FORMAT);

    ScanResultsCsvWriter results_writer(
        ScanResultsCsvWriter::build_export_file_path(data_source_config.export_directory, "canslim_results", timestamp),
        ExportKind::RANKED_RESULTS);
    ScanLogs::log_export_written(results_writer.get_file_path(), results_writer.write_report(scan_report));
    written_files.push_back(results_writer.get_file_path());

    ScanResultsCsvWriter signals_writer(
        ScanResultsCsvWriter::build_export_file_path(data_source_config.export_directory, "entry_signals", timestamp),
        ExportKind::ENTRY_SIGNALS);
    ScanLogs::log_export_written(signals_writer.get_file_path(), signals_writer.write_report(scan_report));
    written_files.push_back(signals_writer.get_file_path());

    return written_files;
}

int run(SystemState& system_state) {
    const CanslimScanner::Config::SystemConfig& config = system_state.config;
    system_state.modules = create_scanner_modules(config);
    StartupLogs::log_data_sources(system_state.modules.price_provider->get_provider_name(),
                                  system_state.modules.fundamentals_provider->get_provider_name());

    // Single pre-scan universe refresh
    CanslimScanner::Config::UniverseSelection universe_selection = CanslimScanner::Config::UniverseSelection::parse(config.screening.universe);
    std::vector<std::string> symbols = system_state.modules.ticker_universe->get_universe(universe_selection);
    StartupLogs::log_universe_resolved(config.screening.universe, symbols);

    const auto scan_start_time = std::chrono::steady_clock::now();
    CanslimScanner::Core::ScreeningOrchestrator screening_orchestrator(config, *system_state.modules.price_provider,
                                                                      *system_state.modules.fundamentals_provider);
    CanslimScanner::Core::ScanReport scan_report = screening_orchestrator.run_scan(symbols);
    const double elapsed_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - scan_start_time).count();

    ScanLogs::log_scan_summary(scan_report, elapsed_seconds);
    ScanLogs::log_ranked_results(scan_report, config.logging.log_signals);

    if (config.data_source.export_enabled) {
        try {
            export_scan_report(scan_report, config.data_source);
        } catch (const std::runtime_error& export_error) {
            SystemLogs::log_system_warning(std::string("Export failed: ") + export_error.what());
        }
    }
    return 0;
}

void shutdown(SystemState& system_state) {
    if (system_state.logger) {
        system_state.logger->stop();
    }
    if (system_state.logging_thread_handle.joinable()) {
        system_state.logging_thread_handle.join();
    }
}

} // namespace System
} // namespace CanslimScanner
