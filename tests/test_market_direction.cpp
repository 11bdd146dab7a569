// =============================================================================
// Market Direction Unit Tests
// Benchmark EMA structure scoring, classification thresholds and fallback
// =============================================================================

#include <gtest/gtest.h>
#include "scanner/analysis/indicators.hpp"
#include "scanner/analysis/market_direction.hpp"
#include "test_helpers.hpp"

using namespace CanslimScanner::Core;
using CanslimScanner::Config::SystemConfig;

// -----------------------------------------------------------------------------
// EvaluateMarketDirection_SteadyUptrend_Bullish
// -----------------------------------------------------------------------------
TEST(MarketDirectionTest, EvaluateMarketDirection_SteadyUptrend_Bullish) {
    SystemConfig config;
    PriceSeries benchmark_series = TestHelpers::make_series("SPY", TestHelpers::geometric_closes(300, 400.0, 0.001));
    IndicatorSet benchmark_indicators = compute_indicator_set(benchmark_series, config.indicators);

    MarketTrend market_trend = evaluate_market_direction(benchmark_series, benchmark_indicators, config);

    EXPECT_NEAR(market_trend.score, 100.0, 1e-9);
    EXPECT_EQ(market_trend.direction, MarketDirection::BULLISH);
    EXPECT_TRUE(market_trend.medium_rising);
    EXPECT_FALSE(market_trend.degraded);
    EXPECT_EQ(market_trend.reference_symbol, "SPY");
    EXPECT_GT(market_trend.ema_long, market_trend.ema_medium);
    EXPECT_GT(market_trend.ema_medium, market_trend.ema_trend);
}

// -----------------------------------------------------------------------------
// EvaluateMarketDirection_SteadyDowntrend_Bearish
// -----------------------------------------------------------------------------
TEST(MarketDirectionTest, EvaluateMarketDirection_SteadyDowntrend_Bearish) {
    SystemConfig config;
    PriceSeries benchmark_series = TestHelpers::make_series("SPY", TestHelpers::geometric_closes(300, 400.0, -0.001));
    IndicatorSet benchmark_indicators = compute_indicator_set(benchmark_series, config.indicators);

    MarketTrend market_trend = evaluate_market_direction(benchmark_series, benchmark_indicators, config);

    EXPECT_NEAR(market_trend.score, 0.0, 1e-9);
    EXPECT_EQ(market_trend.direction, MarketDirection::BEARISH);
    EXPECT_FALSE(market_trend.medium_rising);
}

// -----------------------------------------------------------------------------
// EvaluateMarketDirection_EmptySeries_ThrowsDataUnavailable
// -----------------------------------------------------------------------------
TEST(MarketDirectionTest, EvaluateMarketDirection_EmptySeries_ThrowsDataUnavailable) {
    SystemConfig config;
    PriceSeries benchmark_series;
    benchmark_series.symbol = "SPY";

    EXPECT_THROW(evaluate_market_direction(benchmark_series, IndicatorSet(), config), DataUnavailableError);
}

// -----------------------------------------------------------------------------
// EvaluateMarketDirection_UnseededTrendEma_ThrowsInsufficientHistory
// -----------------------------------------------------------------------------
TEST(MarketDirectionTest, EvaluateMarketDirection_UnseededTrendEma_ThrowsInsufficientHistory) {
    SystemConfig config;
    PriceSeries benchmark_series = TestHelpers::make_series("SPY", TestHelpers::geometric_closes(100, 400.0, 0.001));
    std::vector<double> closes = benchmark_series.closes();
    IndicatorSet benchmark_indicators;
    benchmark_indicators.ema_long = calculate_ema_series(closes, config.indicators.ema_long_period);
    benchmark_indicators.ema_medium = calculate_ema_series(closes, config.indicators.ema_medium_period);
    benchmark_indicators.ema_trend = calculate_ema_series(closes, config.indicators.ema_trend_period);

    EXPECT_THROW(evaluate_market_direction(benchmark_series, benchmark_indicators, config), InsufficientHistoryError);
}

// -----------------------------------------------------------------------------
// ClassifyMarketDirection_ThresholdEdges
// -----------------------------------------------------------------------------
TEST(MarketDirectionTest, ClassifyMarketDirection_ThresholdEdges) {
    SystemConfig config;

    EXPECT_EQ(classify_market_direction(60.0, config), MarketDirection::BULLISH);
    EXPECT_EQ(classify_market_direction(59.9, config), MarketDirection::NEUTRAL);
    EXPECT_EQ(classify_market_direction(40.0, config), MarketDirection::NEUTRAL);
    EXPECT_EQ(classify_market_direction(39.9, config), MarketDirection::BEARISH);
}

// -----------------------------------------------------------------------------
// FallbackMarketTrend_NeutralDegradedAtConfiguredScore
// -----------------------------------------------------------------------------
TEST(MarketDirectionTest, FallbackMarketTrend_NeutralDegradedAtConfiguredScore) {
    SystemConfig config;

    MarketTrend market_trend = fallback_market_trend("SPY", config);

    EXPECT_DOUBLE_EQ(market_trend.score, config.canslim.m_fallback_score);
    EXPECT_EQ(market_trend.direction, MarketDirection::NEUTRAL);
    EXPECT_TRUE(market_trend.degraded);
    EXPECT_EQ(market_direction_to_string(market_trend.direction), "Neutral");
}
