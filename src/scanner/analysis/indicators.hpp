#ifndef INDICATORS_HPP
#define INDICATORS_HPP

#include <vector>
#include "configs/system_config.hpp"
#include "scanner/data_structures/data_structures.hpp"

namespace CanslimScanner {
namespace Core {

using CanslimScanner::Config::IndicatorConfig;

// EMA seeded with the simple average of the first period values, then smoothed by 2/(period+1).
// Entries before index period-1 are NaN; the whole result is NaN when values are shorter than period.
std::vector<double> calculate_ema_series(const std::vector<double>& values, int period);

// RSI with Wilder smoothing. The first value is available at index period.
std::vector<double> calculate_rsi_series(const std::vector<double>& closes, int period);

// Trailing maximum over at most window values ending at each index.
std::vector<double> calculate_rolling_max(const std::vector<double>& values, int window);

// Trailing mean over at most window values ending at each index.
std::vector<double> calculate_rolling_mean(const std::vector<double>& values, int window);

// Close-to-close percentage returns. The first entry is NaN.
std::vector<double> calculate_daily_returns(const std::vector<double>& closes);

// Signed distance from close to EMA in percent of price.
double distance_to_ema_percent(double close_price, double ema_value);

// Throws InsufficientHistoryError when the series is shorter than the longest EMA period.
IndicatorSet compute_indicator_set(const PriceSeries& price_series, const IndicatorConfig& indicator_config);

} // namespace Core
} // namespace CanslimScanner

#endif // INDICATORS_HPP
