#ifndef SCAN_LOGS_HPP
#define SCAN_LOGS_HPP

#include "scanner/data_structures/data_structures.hpp"
#include <string>

namespace CanslimScanner {
namespace Logging {

/**
 * Scan progress and report output.
 * Per-symbol detail lines are only written when debug logging is enabled.
 */
class ScanLogs {
public:
    static void log_scan_start(size_t universe_size, int worker_count, const std::string& benchmark_symbol);
    static void log_market_trend(const CanslimScanner::Core::MarketTrend& market_trend);
    static void log_benchmark_fallback(const std::string& benchmark_symbol, const std::string& reason);

    static void log_symbol_failed(const std::string& symbol, const std::string& reason);
    static void log_symbol_detail(const CanslimScanner::Core::SymbolResult& symbol_result);
    static void log_fundamentals_unavailable(const std::string& symbol, const std::string& reason);

    static void log_scan_summary(const CanslimScanner::Core::ScanReport& scan_report, double elapsed_seconds);
    static void log_ranked_results(const CanslimScanner::Core::ScanReport& scan_report, bool include_signals);
    static void log_export_written(const std::string& file_path, size_t row_count);

    static std::string format_decimal(double value, int precision);
};

} // namespace Logging
} // namespace CanslimScanner

#endif // SCAN_LOGS_HPP
