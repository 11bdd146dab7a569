#include "canslim_criteria.hpp"

namespace CanslimScanner {
namespace Core {

CanslimSubScore evaluate_institutional(const Fundamentals& fundamentals, const CanslimConfig& canslim_config) {
    if (!fundamentals.institutional_ownership_pct) {
        return make_unavailable_sub_score(CanslimCriterion::I, canslim_config);
    }

    const double ownership_fraction = *fundamentals.institutional_ownership_pct;
    CanslimSubScore sub_score = make_sub_score(
        CanslimCriterion::I, clamp_ratio(ownership_fraction / canslim_config.i_institutional_cap, 1.0) * 100.0, SubScoreStatus::OK);
    sub_score.details["institutional_ownership_pct"] = ownership_fraction;
    return sub_score;
}

} // namespace Core
} // namespace CanslimScanner
