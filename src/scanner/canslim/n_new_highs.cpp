#include "canslim_criteria.hpp"

namespace CanslimScanner {
namespace Core {

CanslimSubScore evaluate_new_highs(const Fundamentals& fundamentals, std::optional<double> proximity_to_high,
                                   const CanslimConfig& canslim_config) {
    if (!proximity_to_high && !fundamentals.revenue_growth) {
        return make_unavailable_sub_score(CanslimCriterion::N, canslim_config);
    }

    SubScoreStatus status = SubScoreStatus::OK;

    double revenue_score = 0.5;
    if (fundamentals.revenue_growth) {
        revenue_score = clamp_ratio(*fundamentals.revenue_growth / canslim_config.n_revenue_growth_target, 2.0) / 2.0;
    } else {
        status = SubScoreStatus::DEGRADED;
    }

    double proximity_score = 0.5;
    if (proximity_to_high) {
        proximity_score = clamp_ratio(*proximity_to_high / canslim_config.n_proximity_cap, 1.0);
    } else {
        status = SubScoreStatus::DEGRADED;
    }

    const double score_fraction = canslim_config.n_revenue_weight * revenue_score + canslim_config.n_proximity_weight * proximity_score;
    CanslimSubScore sub_score = make_sub_score(CanslimCriterion::N, score_fraction * 100.0, status);
    if (fundamentals.revenue_growth) sub_score.details["revenue_growth"] = *fundamentals.revenue_growth;
    if (proximity_to_high) sub_score.details["proximity_to_high"] = *proximity_to_high;
    return sub_score;
}

} // namespace Core
} // namespace CanslimScanner
