#ifndef ENTRY_SIGNALS_HPP
#define ENTRY_SIGNALS_HPP

#include <optional>
#include <vector>
#include "configs/system_config.hpp"
#include "scanner/data_structures/data_structures.hpp"

namespace CanslimScanner {
namespace Core {

using CanslimScanner::Config::PullbackConfig;

// Everything needed to classify one bar, taken from the bar and the one before it.
struct BarContext {
    double previous_close;
    double previous_ema_short;
    double previous_ema_long;
    double close_price;
    double ema_short;
    double ema_long;
    int below_short_run_bars;              // Consecutive bars below EMA8 ending at the previous bar
    bool below_short_run_held_long;        // Every bar of that run closed at or above EMA21

    BarContext() : previous_close(0.0), previous_ema_short(0.0), previous_ema_long(0.0), close_price(0.0),
                   ema_short(0.0), ema_long(0.0), below_short_run_bars(0), below_short_run_held_long(true) {}
};

// At most one signal per bar, priority EMA8_Reclaim > EMA8_Retest > EMA21_Retest.
// Band checks are inclusive.
std::optional<SignalType> classify_bar(const BarContext& bar_context, const PullbackConfig& pullback_config);

// Signals inside the trailing signal_recency_bars window, ordered by date.
std::vector<EntrySignal> detect_entry_signals(const PriceSeries& price_series, const IndicatorSet& indicator_set,
                                              const PullbackConfig& pullback_config);

} // namespace Core
} // namespace CanslimScanner

#endif // ENTRY_SIGNALS_HPP
