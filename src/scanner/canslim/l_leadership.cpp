#include "canslim_criteria.hpp"
#include <cmath>

namespace CanslimScanner {
namespace Core {

double leadership_rating_from_rs(double rs_value, const CanslimConfig& canslim_config) {
    return std::max(1.0, std::min(99.0, 50.0 + rs_value * canslim_config.l_rating_slope));
}

CanslimSubScore evaluate_leadership(const std::optional<RSScore>& rs_score, const CanslimConfig& canslim_config) {
    if (!rs_score) {
        return make_unavailable_sub_score(CanslimCriterion::L, canslim_config);
    }

    // Power curve: rating 80 -> 64, rating 50 -> 25.
    const double leadership_rating = leadership_rating_from_rs(rs_score->value, canslim_config);
    const double normalized_rating = leadership_rating / 100.0;

    CanslimSubScore sub_score = make_sub_score(CanslimCriterion::L, std::pow(normalized_rating, 2.0) * 100.0, SubScoreStatus::OK);
    sub_score.details["rs_value"] = rs_score->value;
    sub_score.details["leadership_rating"] = leadership_rating;
    return sub_score;
}

} // namespace Core
} // namespace CanslimScanner
