#include "canslim_evaluator.hpp"
#include "scanner/errors/scan_errors.hpp"

namespace CanslimScanner {
namespace Core {

std::map<CanslimCriterion, double> build_weight_map(const CanslimWeights& weights) {
    return {
        {CanslimCriterion::C, weights.current_earnings},
        {CanslimCriterion::A, weights.annual_earnings},
        {CanslimCriterion::N, weights.new_highs},
        {CanslimCriterion::S, weights.supply_demand},
        {CanslimCriterion::L, weights.leadership},
        {CanslimCriterion::I, weights.institutional},
        {CanslimCriterion::M, weights.market_direction}
    };
}

CanslimComposite combine_sub_scores(const std::string& symbol,
                                    const std::map<CanslimCriterion, CanslimSubScore>& sub_scores,
                                    const std::map<CanslimCriterion, double>& weights) {
    CanslimComposite composite;
    composite.symbol = symbol;
    composite.sub_scores = sub_scores;
    composite.weights = weights;

    double weighted_total = 0.0;
    for (CanslimCriterion criterion : ALL_CANSLIM_CRITERIA) {
        auto sub_score_iterator = sub_scores.find(criterion);
        auto weight_iterator = weights.find(criterion);
        if (sub_score_iterator == sub_scores.end() || weight_iterator == weights.end()) {
            throw ConfigurationError("CANSLIM criterion " + criterion_to_string(criterion) + " has no sub-score or weight");
        }
        weighted_total += weight_iterator->second * sub_score_iterator->second.value;
    }

    composite.total = std::max(0.0, std::min(100.0, weighted_total));
    return composite;
}

CanslimComposite evaluate_canslim(const std::string& symbol, const CanslimInputs& canslim_inputs,
                                  const MarketTrend& market_trend, const CanslimConfig& canslim_config) {
    const Fundamentals& fundamentals = canslim_inputs.fundamentals;

    std::map<CanslimCriterion, CanslimSubScore> sub_scores;
    sub_scores[CanslimCriterion::C] = evaluate_current_earnings(fundamentals, canslim_config);
    sub_scores[CanslimCriterion::A] = evaluate_annual_earnings(fundamentals, canslim_config);
    sub_scores[CanslimCriterion::N] = evaluate_new_highs(fundamentals, canslim_inputs.proximity_to_high, canslim_config);
    sub_scores[CanslimCriterion::S] = evaluate_supply_demand(fundamentals, canslim_inputs.supply_demand, canslim_config);
    sub_scores[CanslimCriterion::L] = evaluate_leadership(canslim_inputs.rs_score, canslim_config);
    sub_scores[CanslimCriterion::I] = evaluate_institutional(fundamentals, canslim_config);
    sub_scores[CanslimCriterion::M] = evaluate_market_criterion(market_trend);

    return combine_sub_scores(symbol, sub_scores, build_weight_map(canslim_config.weights));
}

} // namespace Core
} // namespace CanslimScanner
