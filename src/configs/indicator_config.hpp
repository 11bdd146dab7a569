#ifndef INDICATOR_CONFIG_HPP
#define INDICATOR_CONFIG_HPP

namespace CanslimScanner {
namespace Config {

struct IndicatorConfig {
    int ema_short_period = 8;                        // Short EMA used for retest/reclaim signals
    int ema_long_period = 21;                        // Long EMA used for retest signals
    int ema_medium_period = 50;                      // Intermediate EMA used by market direction
    int ema_trend_period = 200;                      // Longest EMA, defines the minimum usable history
    int rsi_period = 14;                             // Wilder RSI period
    int high_lookback_bars = 252;                    // Bars in the rolling 52-week high
    int volume_average_bars = 50;                    // Bars in the trailing average volume
    int minimum_history_bars = 200;                  // Bars required after normalization
};

} // namespace Config
} // namespace CanslimScanner

#endif // INDICATOR_CONFIG_HPP
