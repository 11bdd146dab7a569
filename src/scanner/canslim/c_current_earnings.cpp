#include "canslim_criteria.hpp"

namespace CanslimScanner {
namespace Core {

CanslimSubScore evaluate_current_earnings(const Fundamentals& fundamentals, const CanslimConfig& canslim_config) {
    if (!fundamentals.quarterly_eps_growth) {
        return make_unavailable_sub_score(CanslimCriterion::C, canslim_config);
    }

    const double quarterly_growth = *fundamentals.quarterly_eps_growth;
    // Full credit at twice the target growth.
    const double growth_score = clamp_ratio(quarterly_growth / canslim_config.c_growth_target, 2.0) / 2.0;

    CanslimSubScore sub_score = make_sub_score(CanslimCriterion::C, growth_score * 100.0, SubScoreStatus::OK);
    sub_score.details["quarterly_eps_growth"] = quarterly_growth;
    return sub_score;
}

} // namespace Core
} // namespace CanslimScanner
