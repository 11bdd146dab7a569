#include "market_direction.hpp"
#include "scanner/errors/scan_errors.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <cmath>

namespace CanslimScanner {
namespace Core {

MarketDirection classify_market_direction(double market_score, const SystemConfig& config) {
    if (market_score >= config.canslim.m_bullish_threshold) {
        return MarketDirection::BULLISH;
    }
    if (market_score < config.canslim.m_bearish_threshold) {
        return MarketDirection::BEARISH;
    }
    return MarketDirection::NEUTRAL;
}

MarketTrend evaluate_market_direction(const PriceSeries& benchmark_series, const IndicatorSet& benchmark_indicators,
                                      const SystemConfig& config) {
    if (benchmark_series.empty()) {
        throw DataUnavailableError("Benchmark series is empty");
    }

    const size_t latest_index = benchmark_series.size() - 1;
    const int rising_lookback = config.canslim.m_medium_rising_lookback;
    if (static_cast<int>(latest_index) < rising_lookback) {
        throw InsufficientHistoryError(benchmark_series.symbol + ": series too short for market direction",
                                       static_cast<int>(benchmark_series.size()), rising_lookback + 1);
    }

    MarketTrend market_trend;
    market_trend.reference_symbol = benchmark_series.symbol;
    market_trend.computed_at = TimeUtils::get_current_iso_time_with_z();
    market_trend.latest_close = benchmark_series.bars[latest_index].close_price;
    market_trend.ema_long = benchmark_indicators.ema_long[latest_index];
    market_trend.ema_medium = benchmark_indicators.ema_medium[latest_index];
    market_trend.ema_trend = benchmark_indicators.ema_trend[latest_index];

    const double previous_ema_medium = benchmark_indicators.ema_medium[latest_index - static_cast<size_t>(rising_lookback)];
    if (std::isnan(market_trend.ema_long) || std::isnan(market_trend.ema_medium) ||
        std::isnan(market_trend.ema_trend) || std::isnan(previous_ema_medium)) {
        throw InsufficientHistoryError(benchmark_series.symbol + ": EMAs not seeded for market direction",
                                       static_cast<int>(benchmark_series.size()),
                                       config.indicators.ema_trend_period + rising_lookback);
    }
    market_trend.medium_rising = market_trend.ema_medium > previous_ema_medium;

    const bool price_above_trend = market_trend.latest_close > market_trend.ema_trend;
    const bool ema_alignment = market_trend.ema_long > market_trend.ema_medium && market_trend.ema_medium > market_trend.ema_trend;
    const bool price_above_long = market_trend.latest_close > market_trend.ema_long;

    double score_fraction = 0.0;
    if (price_above_trend) score_fraction += config.canslim.m_price_above_trend_weight;
    if (ema_alignment) score_fraction += config.canslim.m_ema_alignment_weight;
    if (market_trend.medium_rising) score_fraction += config.canslim.m_medium_rising_weight;
    if (price_above_long) score_fraction += config.canslim.m_price_above_long_weight;

    market_trend.score = std::max(0.0, std::min(100.0, score_fraction * 100.0));
    market_trend.direction = classify_market_direction(market_trend.score, config);
    market_trend.degraded = false;
    return market_trend;
}

MarketTrend fallback_market_trend(const std::string& reference_symbol, const SystemConfig& config) {
    MarketTrend market_trend;
    market_trend.reference_symbol = reference_symbol;
    market_trend.computed_at = TimeUtils::get_current_iso_time_with_z();
    market_trend.score = config.canslim.m_fallback_score;
    market_trend.direction = MarketDirection::NEUTRAL;
    market_trend.degraded = true;
    return market_trend;
}

} // namespace Core
} // namespace CanslimScanner
