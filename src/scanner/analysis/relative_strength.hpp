#ifndef RELATIVE_STRENGTH_HPP
#define RELATIVE_STRENGTH_HPP

#include <array>
#include <string>
#include <vector>
#include "configs/system_config.hpp"
#include "scanner/data_structures/data_structures.hpp"

namespace CanslimScanner {
namespace Core {

using CanslimScanner::Config::RelativeStrengthConfig;

// Interval counts of the four quarter-buckets, oldest first. The remainder of
// period_days / 4 goes to the oldest buckets, so 63 splits as 16, 16, 16, 15.
std::array<int, 4> quarter_bucket_sizes(int period_days);

/**
 * Weighted stock-minus-benchmark return over the last period_days intervals.
 * Both series are aligned on common dates first; identical series score exactly 0.
 * Adjusted closes are compared only when both series have them, plain closes otherwise.
 * Throws BenchmarkDataInsufficientError when the benchmark (or the overlap) is shorter than
 * period_days + 1 closes, and InsufficientHistoryError when the stock is.
 */
RSScore calculate_relative_strength(const PriceSeries& stock_series, const PriceSeries& benchmark_series,
                                    const RelativeStrengthConfig& rs_config);

// Percentile ratings across a scan: average rank / count scaled into [rating_minimum, rating_maximum].
std::vector<int> calculate_rs_percentile_ratings(const std::vector<double>& rs_values, const RelativeStrengthConfig& rs_config);

} // namespace Core
} // namespace CanslimScanner

#endif // RELATIVE_STRENGTH_HPP
