#ifndef TREND_CONFIG_HPP
#define TREND_CONFIG_HPP

namespace CanslimScanner {
namespace Config {

struct TrendConfig {
    int window_bars = 60;                            // Trailing bars evaluated (minimum 60)
    double ema_short_adherence_threshold = 70.0;     // Trending when close >= EMA8 on at least this % of bars
    double ema_long_adherence_threshold = 80.0;      // ... or close >= EMA21 on at least this % of bars
};

struct PullbackConfig {
    int signal_recency_bars = 15;                    // Only the most recent bars can produce entry signals
    double ema_short_band_percent = 2.0;             // Retest band around EMA8 (% of price)
    double ema_long_band_percent = 3.0;              // Retest band around EMA21 (% of price)
    int reclaim_lookback_bars = 5;                   // Longest break below EMA8 that can still be reclaimed
};

} // namespace Config
} // namespace CanslimScanner

#endif // TREND_CONFIG_HPP
