#include "canslim_criteria.hpp"

namespace CanslimScanner {
namespace Core {

CanslimSubScore evaluate_annual_earnings(const Fundamentals& fundamentals, const CanslimConfig& canslim_config) {
    std::vector<double> growth_history = fundamentals.annual_eps_growth_history;
    if (growth_history.empty() && fundamentals.annual_eps_growth) {
        growth_history.push_back(*fundamentals.annual_eps_growth);
    }
    if (growth_history.empty()) {
        return make_unavailable_sub_score(CanslimCriterion::A, canslim_config);
    }

    const double latest_growth = fundamentals.annual_eps_growth ? *fundamentals.annual_eps_growth : growth_history.front();
    const double growth_score = clamp_ratio(latest_growth / canslim_config.a_growth_target, 2.0) / 2.0;

    const int years_available = static_cast<int>(growth_history.size());
    const bool limited_history = years_available < canslim_config.a_min_years_growth;
    const int consistency_years = limited_history ? years_available : canslim_config.a_min_years_growth;
    int years_above_target = 0;
    for (int year_index = 0; year_index < consistency_years; ++year_index) {
        if (growth_history[year_index] >= canslim_config.a_growth_target) ++years_above_target;
    }
    const double consistency_score = static_cast<double>(years_above_target) / consistency_years;

    double growth_weight = limited_history ? canslim_config.a_ipo_growth_weight : canslim_config.a_growth_weight;
    double consistency_weight = limited_history ? canslim_config.a_ipo_consistency_weight : canslim_config.a_consistency_weight;
    double roe_weight = limited_history ? canslim_config.a_ipo_roe_weight : canslim_config.a_roe_weight;

    SubScoreStatus status = SubScoreStatus::OK;
    double roe_score = 0.0;
    if (fundamentals.return_on_equity) {
        roe_score = clamp_ratio(*fundamentals.return_on_equity / canslim_config.a_roe_target, 2.0) / 2.0;
    } else {
        // Without ROE the remaining components carry the full weight.
        const double remaining_weight = growth_weight + consistency_weight;
        if (remaining_weight > 0.0) {
            growth_weight /= remaining_weight;
            consistency_weight /= remaining_weight;
        } else {
            growth_weight = 1.0;
            consistency_weight = 0.0;
        }
        roe_weight = 0.0;
        status = SubScoreStatus::DEGRADED;
    }

    double score_fraction = growth_weight * growth_score + consistency_weight * consistency_score + roe_weight * roe_score;
    if (limited_history) {
        score_fraction *= canslim_config.a_ipo_data_discount;
    }

    CanslimSubScore sub_score = make_sub_score(CanslimCriterion::A, clamp_ratio(score_fraction, 1.0) * 100.0, status);
    sub_score.details["annual_eps_growth"] = latest_growth;
    sub_score.details["years_available"] = years_available;
    sub_score.details["consistency"] = consistency_score;
    sub_score.details["limited_history"] = limited_history ? 1.0 : 0.0;
    if (fundamentals.return_on_equity) {
        sub_score.details["return_on_equity"] = *fundamentals.return_on_equity;
    }
    return sub_score;
}

} // namespace Core
} // namespace CanslimScanner
