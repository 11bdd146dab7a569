#include "trend_analyzer.hpp"
#include "scanner/errors/scan_errors.hpp"
#include <algorithm>

namespace CanslimScanner {
namespace Core {

TrendScore compute_trend_score(double ema_short_adherence_pct, double ema_long_adherence_pct,
                               bool higher_highs, bool higher_lows, const TrendConfig& trend_config) {
    TrendScore trend_score;
    trend_score.ema_short_adherence_pct = std::max(0.0, std::min(100.0, ema_short_adherence_pct));
    trend_score.ema_long_adherence_pct = std::max(0.0, std::min(100.0, ema_long_adherence_pct));
    trend_score.higher_highs = higher_highs;
    trend_score.higher_lows = higher_lows;
    trend_score.is_trending = trend_score.ema_short_adherence_pct >= trend_config.ema_short_adherence_threshold ||
                              trend_score.ema_long_adherence_pct >= trend_config.ema_long_adherence_threshold;

    const double adherence_fraction = (trend_score.ema_short_adherence_pct + trend_score.ema_long_adherence_pct) / 200.0;
    const int structure_flags = (higher_highs ? 1 : 0) + (higher_lows ? 1 : 0);

    double score_value = 0.0;
    if (trend_score.is_trending) {
        if (structure_flags == 2) {
            score_value = 80.0 + 20.0 * adherence_fraction;
        } else if (structure_flags == 1) {
            score_value = 60.0 + 20.0 * adherence_fraction;
        } else {
            score_value = 50.0 + 10.0 * adherence_fraction;
        }
    } else {
        // Both adherences are below 100 here, so the score stays under 44.
        score_value = 40.0 * adherence_fraction + 2.0 * structure_flags;
    }

    trend_score.score = std::max(0.0, std::min(100.0, score_value));
    trend_score.is_strong_trend = trend_score.is_trending && structure_flags == 2;
    return trend_score;
}

TrendScore analyze_trend(const PriceSeries& price_series, const IndicatorSet& indicator_set, const TrendConfig& trend_config) {
    const int window_bars = trend_config.window_bars;
    const int available_bars = static_cast<int>(price_series.size());
    if (available_bars < window_bars) {
        throw InsufficientHistoryError(price_series.symbol + ": series too short for trend analysis", available_bars, window_bars);
    }

    const size_t window_end = price_series.size();
    const size_t window_start = window_end - static_cast<size_t>(window_bars);
    const size_t half_start = window_start + static_cast<size_t>(window_bars / 2);

    int bars_above_short = 0;
    int bars_above_long = 0;
    for (size_t bar_index = window_start; bar_index < window_end; ++bar_index) {
        if (indicator_set.above_ema_short[bar_index]) ++bars_above_short;
        if (indicator_set.above_ema_long[bar_index]) ++bars_above_long;
    }

    double first_half_high = price_series.bars[window_start].high_price;
    double first_half_low = price_series.bars[window_start].low_price;
    for (size_t bar_index = window_start; bar_index < half_start; ++bar_index) {
        first_half_high = std::max(first_half_high, price_series.bars[bar_index].high_price);
        first_half_low = std::min(first_half_low, price_series.bars[bar_index].low_price);
    }
    double second_half_high = price_series.bars[half_start].high_price;
    double second_half_low = price_series.bars[half_start].low_price;
    for (size_t bar_index = half_start; bar_index < window_end; ++bar_index) {
        second_half_high = std::max(second_half_high, price_series.bars[bar_index].high_price);
        second_half_low = std::min(second_half_low, price_series.bars[bar_index].low_price);
    }

    double ema_short_adherence_pct = 100.0 * bars_above_short / window_bars;
    double ema_long_adherence_pct = 100.0 * bars_above_long / window_bars;
    return compute_trend_score(ema_short_adherence_pct, ema_long_adherence_pct,
                               second_half_high > first_half_high, second_half_low > first_half_low, trend_config);
}

} // namespace Core
} // namespace CanslimScanner
