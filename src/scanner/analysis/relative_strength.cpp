#include "relative_strength.hpp"
#include "scanner/errors/scan_errors.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <unordered_map>

namespace CanslimScanner {
namespace Core {

namespace {
    struct AlignedClose {
        double stock_close;
        double benchmark_close;
    };

    double comparison_price(const PriceBar& price_bar, bool use_adjusted) {
        return use_adjusted ? price_bar.adjusted_close : price_bar.close_price;
    }

    double percent_return(double start_price, double end_price) {
        return (end_price / start_price - 1.0) * 100.0;
    }
}

std::array<int, 4> quarter_bucket_sizes(int period_days) {
    std::array<int, 4> bucket_sizes{{0, 0, 0, 0}};
    const int base_size = period_days / 4;
    const int remainder = period_days % 4;
    for (int bucket_index = 0; bucket_index < 4; ++bucket_index) {
        bucket_sizes[bucket_index] = base_size + (bucket_index < remainder ? 1 : 0);
    }
    return bucket_sizes;
}

RSScore calculate_relative_strength(const PriceSeries& stock_series, const PriceSeries& benchmark_series,
                                    const RelativeStrengthConfig& rs_config) {
    const int period_days = rs_config.period_days;
    const int required_closes = period_days + 1;

    if (static_cast<int>(benchmark_series.size()) < required_closes) {
        throw BenchmarkDataInsufficientError("Benchmark " + benchmark_series.symbol + " has " +
                                             std::to_string(benchmark_series.size()) + " bars, relative strength needs " +
                                             std::to_string(required_closes));
    }
    if (static_cast<int>(stock_series.size()) < required_closes) {
        throw InsufficientHistoryError(stock_series.symbol + ": series too short for relative strength",
                                       static_cast<int>(stock_series.size()), required_closes);
    }

    // Adjusted prices only when both series carry them.
    const bool use_adjusted = stock_series.has_adjusted_close && benchmark_series.has_adjusted_close;

    std::unordered_map<std::string, double> benchmark_close_by_date;
    benchmark_close_by_date.reserve(benchmark_series.size());
    for (const PriceBar& benchmark_bar : benchmark_series.bars) {
        benchmark_close_by_date[benchmark_bar.date] = comparison_price(benchmark_bar, use_adjusted);
    }

    std::vector<AlignedClose> aligned_closes;
    aligned_closes.reserve(stock_series.size());
    for (const PriceBar& stock_bar : stock_series.bars) {
        auto benchmark_iterator = benchmark_close_by_date.find(stock_bar.date);
        if (benchmark_iterator != benchmark_close_by_date.end()) {
            aligned_closes.push_back(AlignedClose{comparison_price(stock_bar, use_adjusted), benchmark_iterator->second});
        }
    }

    if (static_cast<int>(aligned_closes.size()) < required_closes) {
        throw BenchmarkDataInsufficientError(stock_series.symbol + " and " + benchmark_series.symbol + " share only " +
                                             std::to_string(aligned_closes.size()) + " dates, relative strength needs " +
                                             std::to_string(required_closes));
    }

    const size_t window_start = aligned_closes.size() - static_cast<size_t>(required_closes);
    const std::array<int, 4> bucket_sizes = quarter_bucket_sizes(period_days);
    // Oldest bucket first, so the most recent quarter takes q1_weight.
    const std::array<double, 4> bucket_weights{{rs_config.q4_weight, rs_config.q3_weight, rs_config.q2_weight, rs_config.q1_weight}};

    RSScore rs_score;
    rs_score.benchmark_symbol = benchmark_series.symbol;
    rs_score.period_days = period_days;

    size_t bucket_start = window_start;
    double weighted_outperformance = 0.0;
    for (size_t bucket_index = 0; bucket_index < bucket_sizes.size(); ++bucket_index) {
        size_t bucket_end = bucket_start + static_cast<size_t>(bucket_sizes[bucket_index]);
        double stock_return = percent_return(aligned_closes[bucket_start].stock_close, aligned_closes[bucket_end].stock_close);
        double benchmark_return = percent_return(aligned_closes[bucket_start].benchmark_close, aligned_closes[bucket_end].benchmark_close);
        double bucket_contribution = stock_return - benchmark_return;
        rs_score.quarter_contributions[bucket_index] = bucket_contribution;
        weighted_outperformance += bucket_weights[bucket_index] * bucket_contribution;
        bucket_start = bucket_end;
    }

    rs_score.value = weighted_outperformance;
    return rs_score;
}

std::vector<int> calculate_rs_percentile_ratings(const std::vector<double>& rs_values, const RelativeStrengthConfig& rs_config) {
    const size_t value_count = rs_values.size();
    std::vector<int> ratings(value_count, 0);
    if (value_count == 0) {
        return ratings;
    }

    std::vector<size_t> sorted_indices(value_count);
    std::iota(sorted_indices.begin(), sorted_indices.end(), 0);
    std::sort(sorted_indices.begin(), sorted_indices.end(), [&rs_values](size_t left_index, size_t right_index) {
        return rs_values[left_index] < rs_values[right_index];
    });

    const double rating_span = static_cast<double>(rs_config.rating_maximum - rs_config.rating_minimum);
    size_t group_start = 0;
    while (group_start < value_count) {
        // Ties share the average of their 1-based ranks.
        size_t group_end = group_start + 1;
        while (group_end < value_count && rs_values[sorted_indices[group_end]] == rs_values[sorted_indices[group_start]]) {
            ++group_end;
        }
        double average_rank = (static_cast<double>(group_start + 1) + static_cast<double>(group_end)) / 2.0;
        double rank_percentile = average_rank / static_cast<double>(value_count);
        int rating = static_cast<int>(std::lround(rank_percentile * rating_span + rs_config.rating_minimum));
        rating = std::max(rs_config.rating_minimum, std::min(rs_config.rating_maximum, rating));
        for (size_t sorted_position = group_start; sorted_position < group_end; ++sorted_position) {
            ratings[sorted_indices[sorted_position]] = rating;
        }
        group_start = group_end;
    }
    return ratings;
}

} // namespace Core
} // namespace CanslimScanner
