#include "startup_logs.hpp"
#include "logging/logging_macros.hpp"
#include <iomanip>
#include <sstream>

namespace CanslimScanner {
namespace Logging {

namespace {
    std::string format_number(double value, int precision) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(precision) << value;
        return oss.str();
    }
}

void StartupLogs::log_application_header(const std::string& config_directory, const std::string& log_file_path) {
    log_message("", "");
    log_message("================================================================================", "");
    log_message("                          CANSLIM MOMENTUM / PULLBACK SCANNER", "");
    log_message("================================================================================", "");
    LOG_SECTION_HEADER("STARTUP");
    LOG_SECTION_LINE("Config directory: " + config_directory);
    LOG_SECTION_LINE("Log file: " + log_file_path);
    LOG_SECTION_BREAK();
}

void StartupLogs::log_configuration_summary(const CanslimScanner::Config::SystemConfig& config) {
    LOG_TABLE_HEADER("CONFIGURATION", "Screening parameters");
    LOG_TABLE_ROW("Universe", config.screening.universe);
    LOG_TABLE_ROW("Benchmark", config.screening.benchmark_symbol);
    LOG_TABLE_ROW("Workers", std::to_string(config.screening.max_workers));
    LOG_TABLE_ROW("History", std::to_string(config.screening.history_lookback_days) + " days");
    LOG_TABLE_RULE();
    LOG_TABLE_ROW("Min Market Cap", "$" + format_number(config.screening.minimum_market_cap / 1e9, 1) + "B");
    LOG_TABLE_ROW("Min RS Score", format_number(config.screening.minimum_rs_score, 1));
    LOG_TABLE_ROW("Min CANSLIM", format_number(config.screening.minimum_canslim_score, 1));
    LOG_TABLE_RULE();
    LOG_TABLE_ROW("EMAs", std::to_string(config.indicators.ema_short_period) + "/" +
                 std::to_string(config.indicators.ema_long_period) + "/" +
                 std::to_string(config.indicators.ema_medium_period) + "/" +
                 std::to_string(config.indicators.ema_trend_period));
    LOG_TABLE_ROW("RS Period", std::to_string(config.relative_strength.period_days) + " bars");
    LOG_TABLE_ROW("Signal Window", std::to_string(config.pullback.signal_recency_bars) + " bars");
    const CanslimScanner::Config::CanslimWeights& weights = config.canslim.weights;
    LOG_TABLE_ROW("Weights C/A/N/S", format_number(weights.current_earnings, 2) + " / " + format_number(weights.annual_earnings, 2) + " / " +
                 format_number(weights.new_highs, 2) + " / " + format_number(weights.supply_demand, 2));
    LOG_TABLE_ROW("Weights L/I/M", format_number(weights.leadership, 2) + " / " + format_number(weights.institutional, 2) + " / " +
                 format_number(weights.market_direction, 2));
    LOG_TABLE_RULE();
}

void StartupLogs::log_data_sources(const std::string& price_provider_name, const std::string& fundamentals_provider_name) {
    LOG_SECTION_HEADER("DATA SOURCES");
    LOG_SECTION_LINE("Price history: " + price_provider_name);
    LOG_SECTION_LINE("Fundamentals: " + fundamentals_provider_name);
    LOG_SECTION_BREAK();
}

void StartupLogs::log_universe_resolved(const std::string& universe_selector, const std::vector<std::string>& symbols) {
    LOG_SECTION_HEADER("UNIVERSE");
    LOG_SECTION_LINE("Selector: " + universe_selector);
    LOG_SECTION_LINE("Symbols: " + std::to_string(symbols.size()));
    std::string preview;
    for (size_t symbol_index = 0; symbol_index < symbols.size() && symbol_index < 10; ++symbol_index) {
        preview += (symbol_index == 0 ? "" : ", ") + symbols[symbol_index];
    }
    if (symbols.size() > 10) {
        preview += ", ...";
    }
    LOG_SECTION_LINE("First: " + preview);
    LOG_SECTION_BREAK();
}

} // namespace Logging
} // namespace CanslimScanner
