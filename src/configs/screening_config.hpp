#ifndef SCREENING_CONFIG_HPP
#define SCREENING_CONFIG_HPP

#include <string>

namespace CanslimScanner {
namespace Config {

struct ScreeningConfig {
    // ========================================================================
    // ACCEPTANCE THRESHOLDS
    // ========================================================================

    double minimum_market_cap = 10e9;                // Reject symbols with a known market cap below this value
    double minimum_rs_score = 5.0;                   // Minimum relative strength outperformance (percentage points)
    double minimum_canslim_score = 70.0;             // Minimum composite CANSLIM score (0-100)

    // ========================================================================
    // EXECUTION
    // ========================================================================

    int max_workers = 3;                             // Concurrent symbol pipelines (1-32)
    int history_lookback_days = 420;                 // Calendar days of price history requested per symbol
    std::string benchmark_symbol = "SPY";            // Benchmark for relative strength and market direction
    std::string universe = "sp500";                  // Universe selector (sp500, nasdaq100, russell2000, all, list:..., file:...)
};

} // namespace Config
} // namespace CanslimScanner

#endif // SCREENING_CONFIG_HPP
