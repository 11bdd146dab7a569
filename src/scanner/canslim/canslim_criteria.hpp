#ifndef CANSLIM_CRITERIA_HPP
#define CANSLIM_CRITERIA_HPP

#include <algorithm>
#include <optional>
#include "configs/system_config.hpp"
#include "scanner/data_structures/data_structures.hpp"

namespace CanslimScanner {
namespace Core {

using CanslimScanner::Config::CanslimConfig;

// Price and volume facts the S criterion needs, extracted once per symbol.
struct SupplyDemandInputs {
    bool has_volume;
    double latest_volume;
    double average_volume;                 // Trailing average ending at the latest bar
    double proximity_to_high;              // Latest close / rolling 52-week high
    bool power_gap_found;
    double largest_gap_pct;

    SupplyDemandInputs() : has_volume(false), latest_volume(0.0), average_volume(0.0), proximity_to_high(0.0),
                           power_gap_found(false), largest_gap_pct(0.0) {}
};

// Scans the last s_power_gap_lookback bars for a gap up on surging volume.
SupplyDemandInputs extract_supply_demand_inputs(const PriceSeries& price_series, const IndicatorSet& indicator_set,
                                                const CanslimConfig& canslim_config);

// ========================================================================
// SUB-SCORERS
// Each returns a 0-100 value. A missing required input yields the configured
// fallback with status UNAVAILABLE; a missing secondary input yields DEGRADED.
// ========================================================================

CanslimSubScore evaluate_current_earnings(const Fundamentals& fundamentals, const CanslimConfig& canslim_config);
CanslimSubScore evaluate_annual_earnings(const Fundamentals& fundamentals, const CanslimConfig& canslim_config);
CanslimSubScore evaluate_new_highs(const Fundamentals& fundamentals, std::optional<double> proximity_to_high,
                                   const CanslimConfig& canslim_config);
CanslimSubScore evaluate_supply_demand(const Fundamentals& fundamentals, const SupplyDemandInputs& supply_demand_inputs,
                                       const CanslimConfig& canslim_config);
CanslimSubScore evaluate_leadership(const std::optional<RSScore>& rs_score, const CanslimConfig& canslim_config);
CanslimSubScore evaluate_institutional(const Fundamentals& fundamentals, const CanslimConfig& canslim_config);
CanslimSubScore evaluate_market_criterion(const MarketTrend& market_trend);

// Leadership rating 1-99 derived from RS outperformance.
double leadership_rating_from_rs(double rs_value, const CanslimConfig& canslim_config);

inline double clamp_ratio(double ratio_value, double upper_bound) {
    return std::max(0.0, std::min(upper_bound, ratio_value));
}

inline CanslimSubScore make_sub_score(CanslimCriterion criterion, double value, SubScoreStatus status) {
    CanslimSubScore sub_score;
    sub_score.criterion = criterion;
    sub_score.value = std::max(0.0, std::min(100.0, value));
    sub_score.status = status;
    return sub_score;
}

inline CanslimSubScore make_unavailable_sub_score(CanslimCriterion criterion, const CanslimConfig& canslim_config) {
    return make_sub_score(criterion, canslim_config.fallback_score, SubScoreStatus::UNAVAILABLE);
}

} // namespace Core
} // namespace CanslimScanner

#endif // CANSLIM_CRITERIA_HPP
