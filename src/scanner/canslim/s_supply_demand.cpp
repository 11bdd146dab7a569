#include "canslim_criteria.hpp"
#include <cmath>

namespace CanslimScanner {
namespace Core {

namespace {
    constexpr double TRADING_DAYS_PER_YEAR = 252.0;
    // Breakout credit lost per percentage point below the breakout level.
    constexpr double BREAKOUT_DECAY_PER_PERCENT = 0.1;
}

SupplyDemandInputs extract_supply_demand_inputs(const PriceSeries& price_series, const IndicatorSet& indicator_set,
                                                const CanslimConfig& canslim_config) {
    SupplyDemandInputs supply_demand_inputs;
    if (price_series.empty()) {
        return supply_demand_inputs;
    }

    const size_t latest_index = price_series.size() - 1;
    const double rolling_high = indicator_set.rolling_high[latest_index];
    if (rolling_high > 0.0) {
        supply_demand_inputs.proximity_to_high = price_series.bars[latest_index].close_price / rolling_high;
    }

    if (!price_series.has_volume || indicator_set.average_volume.size() != price_series.size()) {
        return supply_demand_inputs;
    }

    supply_demand_inputs.has_volume = true;
    supply_demand_inputs.latest_volume = price_series.bars[latest_index].volume;
    supply_demand_inputs.average_volume = indicator_set.average_volume[latest_index];

    const size_t lookback_bars = static_cast<size_t>(canslim_config.s_power_gap_lookback);
    const size_t first_gap_index = latest_index >= lookback_bars ? latest_index - lookback_bars + 1 : 1;
    for (size_t bar_index = std::max<size_t>(first_gap_index, 1); bar_index <= latest_index; ++bar_index) {
        const double previous_close = price_series.bars[bar_index - 1].close_price;
        const double gap_pct = (price_series.bars[bar_index].open_price / previous_close - 1.0) * 100.0;
        // Volume is compared with the average as it stood before the gap day.
        const double reference_volume = indicator_set.average_volume[bar_index - 1];
        const bool volume_confirms = reference_volume > 0.0 &&
                                     price_series.bars[bar_index].volume >= canslim_config.s_volume_surge_threshold * reference_volume;
        if (gap_pct >= canslim_config.s_power_gap_min_percent && volume_confirms) {
            supply_demand_inputs.power_gap_found = true;
            supply_demand_inputs.largest_gap_pct = std::max(supply_demand_inputs.largest_gap_pct, gap_pct);
        }
    }
    return supply_demand_inputs;
}

CanslimSubScore evaluate_supply_demand(const Fundamentals& fundamentals, const SupplyDemandInputs& supply_demand_inputs,
                                       const CanslimConfig& canslim_config) {
    if (!supply_demand_inputs.has_volume) {
        return make_unavailable_sub_score(CanslimCriterion::S, canslim_config);
    }

    SubScoreStatus status = SubScoreStatus::OK;

    double volume_ratio = 0.0;
    if (supply_demand_inputs.average_volume > 0.0) {
        volume_ratio = supply_demand_inputs.latest_volume / supply_demand_inputs.average_volume;
    }
    const double surge_score = clamp_ratio(volume_ratio / canslim_config.s_volume_surge_threshold, 1.0);

    double breakout_score = 1.0;
    if (supply_demand_inputs.proximity_to_high < canslim_config.s_breakout_proximity) {
        const double percent_below_breakout = (canslim_config.s_breakout_proximity - supply_demand_inputs.proximity_to_high) * 100.0;
        breakout_score = clamp_ratio(1.0 - BREAKOUT_DECAY_PER_PERCENT * percent_below_breakout, 1.0);
    }

    const double power_gap_score = supply_demand_inputs.power_gap_found ? 1.0 : 0.0;

    const double average_volume = fundamentals.avg_volume_50d ? *fundamentals.avg_volume_50d : supply_demand_inputs.average_volume;
    double turnover_score = 0.5;
    double turnover_ratio = 0.0;
    if (fundamentals.shares_outstanding && *fundamentals.shares_outstanding > 0.0) {
        turnover_ratio = average_volume * TRADING_DAYS_PER_YEAR / *fundamentals.shares_outstanding;
        turnover_score = clamp_ratio(turnover_ratio / canslim_config.s_turnover_cap, 1.0);
    } else {
        status = SubScoreStatus::DEGRADED;
    }

    const double score_fraction = canslim_config.s_surge_weight * surge_score +
                                  canslim_config.s_breakout_weight * breakout_score +
                                  canslim_config.s_power_gap_weight * power_gap_score +
                                  canslim_config.s_turnover_weight * turnover_score;

    CanslimSubScore sub_score = make_sub_score(CanslimCriterion::S, score_fraction * 100.0, status);
    sub_score.details["volume_ratio"] = volume_ratio;
    sub_score.details["proximity_to_high"] = supply_demand_inputs.proximity_to_high;
    sub_score.details["power_gap_pct"] = supply_demand_inputs.largest_gap_pct;
    if (status == SubScoreStatus::OK) {
        sub_score.details["turnover_ratio"] = turnover_ratio;
    }
    return sub_score;
}

} // namespace Core
} // namespace CanslimScanner
