#ifndef TREND_ANALYZER_HPP
#define TREND_ANALYZER_HPP

#include "configs/system_config.hpp"
#include "scanner/data_structures/data_structures.hpp"

namespace CanslimScanner {
namespace Core {

using CanslimScanner::Config::TrendConfig;

/**
 * Maps measured trend fields to a 0-100 score.
 * Bands: trending with higher highs and higher lows 80-100, trending with one of them 60-80,
 * trending without structure 50-60, not trending below 50. Within a band the score rises
 * linearly with the mean of the two adherence percentages.
 */
TrendScore compute_trend_score(double ema_short_adherence_pct, double ema_long_adherence_pct,
                               bool higher_highs, bool higher_lows, const TrendConfig& trend_config);

// Measures adherence and structure over the trailing trend window.
// Throws InsufficientHistoryError when the series is shorter than the window.
TrendScore analyze_trend(const PriceSeries& price_series, const IndicatorSet& indicator_set, const TrendConfig& trend_config);

} // namespace Core
} // namespace CanslimScanner

#endif // TREND_ANALYZER_HPP
