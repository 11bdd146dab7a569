#include "entry_signals.hpp"
#include "indicators.hpp"
#include <algorithm>
#include <cmath>

namespace CanslimScanner {
namespace Core {

std::optional<SignalType> classify_bar(const BarContext& bar_context, const PullbackConfig& pullback_config) {
    const double distance_short_pct = distance_to_ema_percent(bar_context.close_price, bar_context.ema_short);
    const double distance_long_pct = distance_to_ema_percent(bar_context.close_price, bar_context.ema_long);
    const double previous_distance_short_pct = distance_to_ema_percent(bar_context.previous_close, bar_context.previous_ema_short);
    const double previous_distance_long_pct = distance_to_ema_percent(bar_context.previous_close, bar_context.previous_ema_long);
    const bool holds_long = bar_context.close_price >= bar_context.ema_long;

    // Reclaim: a short break below EMA8 that never lost EMA21, closed back above EMA8.
    if (bar_context.previous_close < bar_context.previous_ema_short &&
        bar_context.close_price > bar_context.ema_short &&
        holds_long &&
        bar_context.below_short_run_bars >= 1 &&
        bar_context.below_short_run_bars <= pullback_config.reclaim_lookback_bars &&
        bar_context.below_short_run_held_long) {
        return SignalType::EMA8_RECLAIM;
    }

    if (previous_distance_short_pct > pullback_config.ema_short_band_percent &&
        std::fabs(distance_short_pct) <= pullback_config.ema_short_band_percent &&
        holds_long) {
        return SignalType::EMA8_RETEST;
    }

    if (previous_distance_long_pct > pullback_config.ema_long_band_percent &&
        bar_context.close_price < bar_context.ema_short &&
        holds_long &&
        std::fabs(distance_long_pct) <= pullback_config.ema_long_band_percent) {
        return SignalType::EMA21_RETEST;
    }

    return std::nullopt;
}

std::vector<EntrySignal> detect_entry_signals(const PriceSeries& price_series, const IndicatorSet& indicator_set,
                                              const PullbackConfig& pullback_config) {
    std::vector<EntrySignal> entry_signals;
    const size_t bar_count = price_series.size();
    if (bar_count < 2) {
        return entry_signals;
    }

    const size_t recency_bars = static_cast<size_t>(pullback_config.signal_recency_bars);
    const size_t first_bar_index = bar_count > recency_bars ? std::max<size_t>(1, bar_count - recency_bars) : 1;

    for (size_t bar_index = first_bar_index; bar_index < bar_count; ++bar_index) {
        const size_t previous_index = bar_index - 1;
        if (std::isnan(indicator_set.ema_short[bar_index]) || std::isnan(indicator_set.ema_long[bar_index]) ||
            std::isnan(indicator_set.ema_short[previous_index]) || std::isnan(indicator_set.ema_long[previous_index])) {
            continue;
        }

        BarContext bar_context;
        bar_context.previous_close = price_series.bars[previous_index].close_price;
        bar_context.previous_ema_short = indicator_set.ema_short[previous_index];
        bar_context.previous_ema_long = indicator_set.ema_long[previous_index];
        bar_context.close_price = price_series.bars[bar_index].close_price;
        bar_context.ema_short = indicator_set.ema_short[bar_index];
        bar_context.ema_long = indicator_set.ema_long[bar_index];

        // Walk back through the run below EMA8; one bar past the lookback is enough to reject it.
        const int run_scan_limit = pullback_config.reclaim_lookback_bars + 1;
        size_t run_index = previous_index;
        while (bar_context.below_short_run_bars < run_scan_limit &&
               !std::isnan(indicator_set.ema_short[run_index]) &&
               price_series.bars[run_index].close_price < indicator_set.ema_short[run_index]) {
            ++bar_context.below_short_run_bars;
            if (std::isnan(indicator_set.ema_long[run_index]) ||
                price_series.bars[run_index].close_price < indicator_set.ema_long[run_index]) {
                bar_context.below_short_run_held_long = false;
            }
            if (run_index == 0) break;
            --run_index;
        }

        std::optional<SignalType> signal_type = classify_bar(bar_context, pullback_config);
        if (!signal_type) {
            continue;
        }

        EntrySignal entry_signal;
        entry_signal.date = price_series.bars[bar_index].date;
        entry_signal.signal_type = *signal_type;
        entry_signal.close_price = bar_context.close_price;
        entry_signal.rsi = indicator_set.rsi[bar_index];
        entry_signal.distance_ema_short_pct = indicator_set.distance_ema_short_pct[bar_index];
        entry_signal.distance_ema_long_pct = indicator_set.distance_ema_long_pct[bar_index];
        entry_signals.push_back(entry_signal);
    }

    return entry_signals;
}

} // namespace Core
} // namespace CanslimScanner
