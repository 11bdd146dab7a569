#include "canslim_criteria.hpp"

namespace CanslimScanner {
namespace Core {

CanslimSubScore evaluate_market_criterion(const MarketTrend& market_trend) {
    CanslimSubScore sub_score = make_sub_score(CanslimCriterion::M, market_trend.score,
                                               market_trend.degraded ? SubScoreStatus::DEGRADED : SubScoreStatus::OK);
    sub_score.details["market_score"] = market_trend.score;
    sub_score.details["medium_rising"] = market_trend.medium_rising ? 1.0 : 0.0;
    return sub_score;
}

} // namespace Core
} // namespace CanslimScanner
