#ifndef CANSLIM_EVALUATOR_HPP
#define CANSLIM_EVALUATOR_HPP

#include <map>
#include <optional>
#include <string>
#include "canslim_criteria.hpp"

namespace CanslimScanner {
namespace Core {

using CanslimScanner::Config::CanslimWeights;

struct CanslimInputs {
    Fundamentals fundamentals;
    std::optional<RSScore> rs_score;
    std::optional<double> proximity_to_high;
    SupplyDemandInputs supply_demand;
};

std::map<CanslimCriterion, double> build_weight_map(const CanslimWeights& weights);

// Weighted sum of the seven sub-scores, clamped to [0, 100].
// Throws ConfigurationError when a criterion has no sub-score or no weight.
CanslimComposite combine_sub_scores(const std::string& symbol,
                                    const std::map<CanslimCriterion, CanslimSubScore>& sub_scores,
                                    const std::map<CanslimCriterion, double>& weights);

// Runs every sub-scorer and combines them with the configured weights.
CanslimComposite evaluate_canslim(const std::string& symbol, const CanslimInputs& canslim_inputs,
                                  const MarketTrend& market_trend, const CanslimConfig& canslim_config);

} // namespace Core
} // namespace CanslimScanner

#endif // CANSLIM_EVALUATOR_HPP
