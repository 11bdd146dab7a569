#include "indicators.hpp"
#include "scanner/errors/scan_errors.hpp"
#include <algorithm>
#include <cmath>
#include <deque>
#include <limits>
#include <stdexcept>

namespace CanslimScanner {
namespace Core {

namespace {
    const double NOT_A_NUMBER = std::numeric_limits<double>::quiet_NaN();
}

std::vector<double> calculate_ema_series(const std::vector<double>& values, int period) {
    if (period < 1) {
        throw std::invalid_argument("EMA period must be >= 1");
    }

    std::vector<double> ema_values(values.size(), NOT_A_NUMBER);
    if (static_cast<int>(values.size()) < period) {
        return ema_values;
    }

    double seed_sum = 0.0;
    for (int seed_index = 0; seed_index < period; ++seed_index) {
        seed_sum += values[seed_index];
    }
    double ema_value = seed_sum / period;
    ema_values[period - 1] = ema_value;

    const double smoothing_multiplier = 2.0 / (period + 1.0);
    for (size_t value_index = static_cast<size_t>(period); value_index < values.size(); ++value_index) {
        ema_value = (values[value_index] - ema_value) * smoothing_multiplier + ema_value;
        ema_values[value_index] = ema_value;
    }
    return ema_values;
}

std::vector<double> calculate_rsi_series(const std::vector<double>& closes, int period) {
    if (period < 1) {
        throw std::invalid_argument("RSI period must be >= 1");
    }

    std::vector<double> rsi_values(closes.size(), NOT_A_NUMBER);
    if (static_cast<int>(closes.size()) <= period) {
        return rsi_values;
    }

    auto rsi_from_averages = [](double average_gain, double average_loss) {
        if (average_loss == 0.0) {
            return average_gain == 0.0 ? 50.0 : 100.0;
        }
        double relative_strength = average_gain / average_loss;
        return 100.0 - (100.0 / (1.0 + relative_strength));
    };

    double gain_sum = 0.0;
    double loss_sum = 0.0;
    for (int change_index = 1; change_index <= period; ++change_index) {
        double price_change = closes[change_index] - closes[change_index - 1];
        if (price_change > 0.0) gain_sum += price_change;
        else loss_sum -= price_change;
    }
    double average_gain = gain_sum / period;
    double average_loss = loss_sum / period;
    rsi_values[period] = rsi_from_averages(average_gain, average_loss);

    for (size_t close_index = static_cast<size_t>(period) + 1; close_index < closes.size(); ++close_index) {
        double price_change = closes[close_index] - closes[close_index - 1];
        double current_gain = price_change > 0.0 ? price_change : 0.0;
        double current_loss = price_change < 0.0 ? -price_change : 0.0;
        average_gain = (average_gain * (period - 1) + current_gain) / period;
        average_loss = (average_loss * (period - 1) + current_loss) / period;
        rsi_values[close_index] = rsi_from_averages(average_gain, average_loss);
    }
    return rsi_values;
}

std::vector<double> calculate_rolling_max(const std::vector<double>& values, int window) {
    if (window < 1) {
        throw std::invalid_argument("Rolling window must be >= 1");
    }

    // Monotonic deque of candidate indices, values decreasing from front to back.
    std::vector<double> rolling_max_values(values.size(), NOT_A_NUMBER);
    std::deque<size_t> candidate_indices;
    for (size_t value_index = 0; value_index < values.size(); ++value_index) {
        while (!candidate_indices.empty() && values[candidate_indices.back()] <= values[value_index]) {
            candidate_indices.pop_back();
        }
        candidate_indices.push_back(value_index);
        if (candidate_indices.front() + static_cast<size_t>(window) <= value_index) {
            candidate_indices.pop_front();
        }
        rolling_max_values[value_index] = values[candidate_indices.front()];
    }
    return rolling_max_values;
}

std::vector<double> calculate_rolling_mean(const std::vector<double>& values, int window) {
    if (window < 1) {
        throw std::invalid_argument("Rolling window must be >= 1");
    }

    std::vector<double> rolling_mean_values(values.size(), NOT_A_NUMBER);
    double running_sum = 0.0;
    for (size_t value_index = 0; value_index < values.size(); ++value_index) {
        running_sum += values[value_index];
        if (value_index >= static_cast<size_t>(window)) {
            running_sum -= values[value_index - window];
        }
        size_t values_in_window = std::min(value_index + 1, static_cast<size_t>(window));
        rolling_mean_values[value_index] = running_sum / static_cast<double>(values_in_window);
    }
    return rolling_mean_values;
}

std::vector<double> calculate_daily_returns(const std::vector<double>& closes) {
    std::vector<double> return_values(closes.size(), NOT_A_NUMBER);
    for (size_t close_index = 1; close_index < closes.size(); ++close_index) {
        if (closes[close_index - 1] != 0.0) {
            return_values[close_index] = (closes[close_index] / closes[close_index - 1] - 1.0) * 100.0;
        }
    }
    return return_values;
}

double distance_to_ema_percent(double close_price, double ema_value) {
    if (close_price == 0.0 || std::isnan(ema_value)) {
        return NOT_A_NUMBER;
    }
    return (close_price - ema_value) / close_price * 100.0;
}

IndicatorSet compute_indicator_set(const PriceSeries& price_series, const IndicatorConfig& indicator_config) {
    const int required_bars = std::max({indicator_config.ema_trend_period, indicator_config.ema_medium_period,
                                        indicator_config.ema_long_period, indicator_config.ema_short_period,
                                        indicator_config.rsi_period + 1});
    const int available_bars = static_cast<int>(price_series.size());
    if (available_bars < required_bars) {
        throw InsufficientHistoryError(price_series.symbol + ": series too short for indicators", available_bars, required_bars);
    }

    std::vector<double> closes = price_series.closes();

    IndicatorSet indicator_set;
    indicator_set.ema_short = calculate_ema_series(closes, indicator_config.ema_short_period);
    indicator_set.ema_long = calculate_ema_series(closes, indicator_config.ema_long_period);
    indicator_set.ema_medium = calculate_ema_series(closes, indicator_config.ema_medium_period);
    indicator_set.ema_trend = calculate_ema_series(closes, indicator_config.ema_trend_period);
    indicator_set.rsi = calculate_rsi_series(closes, indicator_config.rsi_period);
    indicator_set.rolling_high = calculate_rolling_max(closes, indicator_config.high_lookback_bars);
    indicator_set.daily_returns = calculate_daily_returns(closes);

    indicator_set.above_ema_short.resize(closes.size(), false);
    indicator_set.above_ema_long.resize(closes.size(), false);
    indicator_set.distance_ema_short_pct.resize(closes.size(), NOT_A_NUMBER);
    indicator_set.distance_ema_long_pct.resize(closes.size(), NOT_A_NUMBER);
    for (size_t bar_index = 0; bar_index < closes.size(); ++bar_index) {
        double close_price = closes[bar_index];
        double ema_short_value = indicator_set.ema_short[bar_index];
        double ema_long_value = indicator_set.ema_long[bar_index];
        indicator_set.above_ema_short[bar_index] = !std::isnan(ema_short_value) && close_price >= ema_short_value;
        indicator_set.above_ema_long[bar_index] = !std::isnan(ema_long_value) && close_price >= ema_long_value;
        indicator_set.distance_ema_short_pct[bar_index] = distance_to_ema_percent(close_price, ema_short_value);
        indicator_set.distance_ema_long_pct[bar_index] = distance_to_ema_percent(close_price, ema_long_value);
    }

    if (price_series.has_volume) {
        std::vector<double> volumes;
        volumes.reserve(price_series.size());
        for (const PriceBar& price_bar : price_series.bars) {
            volumes.push_back(price_bar.volume);
        }
        indicator_set.average_volume = calculate_rolling_mean(volumes, indicator_config.volume_average_bars);
    }

    return indicator_set;
}

} // namespace Core
} // namespace CanslimScanner
