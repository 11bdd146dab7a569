#include "scan_logs.hpp"
#include "logging/logging_macros.hpp"
#include <iomanip>
#include <sstream>

namespace CanslimScanner {
namespace Logging {

using namespace CanslimScanner::Core;

std::string ScanLogs::format_decimal(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

void ScanLogs::log_scan_start(size_t universe_size, int worker_count, const std::string& benchmark_symbol) {
    LOG_SECTION_HEADER("SCAN STARTED");
    LOG_SECTION_LINE("Symbols: " + std::to_string(universe_size) + "  Workers: " + std::to_string(worker_count) +
                       "  Benchmark: " + benchmark_symbol);
    LOG_SECTION_FOOTER();
}

void ScanLogs::log_market_trend(const MarketTrend& market_trend) {
    LOG_TABLE_HEADER("MARKET DIRECTION", market_trend.reference_symbol + (market_trend.degraded ? " (fallback)" : ""));
    LOG_TABLE_ROW("Direction", market_direction_to_string(market_trend.direction));
    LOG_TABLE_ROW("Score", format_decimal(market_trend.score, 1));
    if (!market_trend.degraded) {
        LOG_TABLE_ROW("Close", format_decimal(market_trend.latest_close, 2));
        LOG_TABLE_ROW("EMA 21/50/200", format_decimal(market_trend.ema_long, 2) + " / " + format_decimal(market_trend.ema_medium, 2) +
                     " / " + format_decimal(market_trend.ema_trend, 2));
        LOG_TABLE_ROW("EMA 50 Rising", market_trend.medium_rising ? "YES" : "NO");
    }
    LOG_TABLE_ROW("Computed At", market_trend.computed_at);
    LOG_TABLE_RULE();
}

void ScanLogs::log_benchmark_fallback(const std::string& benchmark_symbol, const std::string& reason) {
    log_message("WARNING: Benchmark " + benchmark_symbol + " unavailable, market direction degraded: " + reason, "");
}

void ScanLogs::log_symbol_failed(const std::string& symbol, const std::string& reason) {
    log_message("FAILED " + symbol + ": " + reason, "");
}

void ScanLogs::log_fundamentals_unavailable(const std::string& symbol, const std::string& reason) {
    log_message("Fundamentals unavailable for " + symbol + ", scoring technical criteria only: " + reason, "");
}

void ScanLogs::log_symbol_detail(const SymbolResult& symbol_result) {
    std::ostringstream detail_stream;
    detail_stream << symbol_result.symbol << " " << symbol_state_to_string(symbol_result.state);
    if (symbol_result.rs_score) {
        detail_stream << " RS=" << format_decimal(symbol_result.rs_score->value, 2);
    } else if (!symbol_result.rs_unscored_reason.empty()) {
        detail_stream << " RS=unscored";
    }
    if (symbol_result.trend_score) {
        detail_stream << " trend=" << format_decimal(symbol_result.trend_score->score, 1);
    }
    if (symbol_result.composite) {
        detail_stream << " canslim=" << format_decimal(symbol_result.composite->total, 1);
        std::string degraded = symbol_result.composite->degraded_criteria();
        if (!degraded.empty()) {
            detail_stream << " degraded=" << degraded;
        }
    }
    detail_stream << " signals=" << symbol_result.entry_signals.size();
    if (!symbol_result.reason.empty()) {
        detail_stream << " (" << symbol_result.reason << ")";
    }
    log_message(detail_stream.str(), "");
}

void ScanLogs::log_scan_summary(const ScanReport& scan_report, double elapsed_seconds) {
    LOG_TABLE_HEADER("SCAN SUMMARY", "Market " + market_direction_to_string(scan_report.market_trend.direction));
    LOG_TABLE_ROW("Analyzed", std::to_string(scan_report.analyzed));
    LOG_TABLE_ROW("Failed", std::to_string(scan_report.failed));
    LOG_TABLE_ROW("Rejected", std::to_string(scan_report.rejected));
    LOG_TABLE_ROW("Opportunities", std::to_string(scan_report.accepted));
    LOG_TABLE_ROW("Elapsed", format_decimal(elapsed_seconds, 1) + "s");
    LOG_TABLE_RULE();
}

void ScanLogs::log_ranked_results(const ScanReport& scan_report, bool include_signals) {
    LOG_SECTION_HEADER("RANKED OPPORTUNITIES");
    if (scan_report.ranked_results.empty()) {
        LOG_SECTION_LINE("No symbols met the screening thresholds");
        LOG_SECTION_FOOTER();
        return;
    }

    LOG_SECTION_LINE("  #  SYMBOL   CANSLIM   RS      RATING  TREND  CLOSE      DEGRADED");
    int rank = 1;
    for (const SymbolResult& symbol_result : scan_report.ranked_results) {
        std::ostringstream row_stream;
        row_stream << std::setw(3) << rank++ << "  " << std::left << std::setw(8) << symbol_result.symbol << std::right
                   << std::setw(7) << format_decimal(symbol_result.composite ? symbol_result.composite->total : 0.0, 1) << "   "
                   << std::setw(6) << format_decimal(symbol_result.rs_score ? symbol_result.rs_score->value : 0.0, 2) << "  "
                   << std::setw(6) << symbol_result.rs_rating << "  "
                   << std::setw(5) << format_decimal(symbol_result.trend_score ? symbol_result.trend_score->score : 0.0, 0) << "  "
                   << std::setw(9) << format_decimal(symbol_result.latest_close, 2) << "  "
                   << (symbol_result.composite ? symbol_result.composite->degraded_criteria() : "");
        LOG_SECTION_LINE(row_stream.str());

        if (include_signals) {
            for (const EntrySignal& entry_signal : symbol_result.entry_signals) {
                LOG_SECTION_DETAIL("      " + entry_signal.date + " " + signal_type_to_string(entry_signal.signal_type) +
                                      " close=" + format_decimal(entry_signal.close_price, 2) +
                                      " rsi=" + format_decimal(entry_signal.rsi, 1) +
                                      " d8=" + format_decimal(entry_signal.distance_ema_short_pct, 2) + "%" +
                                      " d21=" + format_decimal(entry_signal.distance_ema_long_pct, 2) + "%");
            }
        }
    }
    LOG_SECTION_FOOTER();
}

void ScanLogs::log_export_written(const std::string& file_path, size_t row_count) {
    log_message("Exported " + std::to_string(row_count) + " rows to " + file_path, "");
}

} // namespace Logging
} // namespace CanslimScanner
