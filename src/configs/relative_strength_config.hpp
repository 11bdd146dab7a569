#ifndef RELATIVE_STRENGTH_CONFIG_HPP
#define RELATIVE_STRENGTH_CONFIG_HPP

namespace CanslimScanner {
namespace Config {

struct RelativeStrengthConfig {
    int period_days = 63;                            // Return intervals compared against the benchmark
    double q1_weight = 0.40;                         // Most recent quarter-bucket
    double q2_weight = 0.20;
    double q3_weight = 0.20;
    double q4_weight = 0.20;                         // Oldest quarter-bucket
    int rating_minimum = 1;                          // Percentile rating floor
    int rating_maximum = 99;                         // Percentile rating ceiling
};

} // namespace Config
} // namespace CanslimScanner

#endif // RELATIVE_STRENGTH_CONFIG_HPP
