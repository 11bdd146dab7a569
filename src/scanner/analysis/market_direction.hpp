#ifndef MARKET_DIRECTION_HPP
#define MARKET_DIRECTION_HPP

#include <string>
#include "configs/system_config.hpp"
#include "scanner/data_structures/data_structures.hpp"

namespace CanslimScanner {
namespace Core {

using CanslimScanner::Config::SystemConfig;

/**
 * Scores the benchmark trend from its EMA structure:
 * close above EMA200, EMA21 > EMA50 > EMA200, EMA50 rising over the lookback, close above EMA21.
 */
MarketTrend evaluate_market_direction(const PriceSeries& benchmark_series, const IndicatorSet& benchmark_indicators,
                                      const SystemConfig& config);

// Degraded neutral trend used when the benchmark cannot be evaluated.
MarketTrend fallback_market_trend(const std::string& reference_symbol, const SystemConfig& config);

MarketDirection classify_market_direction(double market_score, const SystemConfig& config);

} // namespace Core
} // namespace CanslimScanner

#endif // MARKET_DIRECTION_HPP
