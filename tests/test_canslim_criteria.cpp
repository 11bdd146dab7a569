// =============================================================================
// CANSLIM Sub-Scorer Unit Tests
// Each criterion: full inputs, partial inputs (DEGRADED) and missing inputs
// =============================================================================

#include <gtest/gtest.h>
#include "scanner/analysis/indicators.hpp"
#include "scanner/canslim/canslim_criteria.hpp"
#include "test_helpers.hpp"

using namespace CanslimScanner::Core;
using CanslimScanner::Config::CanslimConfig;
using CanslimScanner::Config::IndicatorConfig;

// -----------------------------------------------------------------------------
// CurrentEarnings_GrowthAtTarget_ScoresHalfCredit
// -----------------------------------------------------------------------------
TEST(CanslimCriteriaTest, CurrentEarnings_GrowthAtTarget_ScoresHalfCredit) {
    CanslimConfig canslim_config;
    Fundamentals fundamentals;

    fundamentals.quarterly_eps_growth = 0.25;
    EXPECT_NEAR(evaluate_current_earnings(fundamentals, canslim_config).value, 50.0, 1e-9);

    fundamentals.quarterly_eps_growth = 0.75;
    EXPECT_NEAR(evaluate_current_earnings(fundamentals, canslim_config).value, 100.0, 1e-9);

    fundamentals.quarterly_eps_growth = -0.40;
    EXPECT_NEAR(evaluate_current_earnings(fundamentals, canslim_config).value, 0.0, 1e-9);
}

// -----------------------------------------------------------------------------
// CurrentEarnings_Missing_FallsBackUnavailable
// -----------------------------------------------------------------------------
TEST(CanslimCriteriaTest, CurrentEarnings_Missing_FallsBackUnavailable) {
    CanslimConfig canslim_config;

    CanslimSubScore sub_score = evaluate_current_earnings(Fundamentals(), canslim_config);

    EXPECT_DOUBLE_EQ(sub_score.value, canslim_config.fallback_score);
    EXPECT_EQ(sub_score.status, SubScoreStatus::UNAVAILABLE);
    EXPECT_TRUE(sub_score.is_degraded());
}

// -----------------------------------------------------------------------------
// AnnualEarnings_ConsistentGrowthWithRoe_CombinesComponents
// -----------------------------------------------------------------------------
TEST(CanslimCriteriaTest, AnnualEarnings_ConsistentGrowthWithRoe_CombinesComponents) {
    CanslimConfig canslim_config;
    Fundamentals fundamentals;
    fundamentals.annual_eps_growth_history = {0.30, 0.28, 0.26};
    fundamentals.return_on_equity = 0.17;

    CanslimSubScore sub_score = evaluate_annual_earnings(fundamentals, canslim_config);

    // 0.5 * 0.6 + 0.3 * 1.0 + 0.2 * 0.5
    EXPECT_NEAR(sub_score.value, 70.0, 1e-9);
    EXPECT_EQ(sub_score.status, SubScoreStatus::OK);
    EXPECT_DOUBLE_EQ(sub_score.details.at("limited_history"), 0.0);
}

// -----------------------------------------------------------------------------
// AnnualEarnings_OneYearWithoutRoe_DiscountedAndDegraded
// -----------------------------------------------------------------------------
TEST(CanslimCriteriaTest, AnnualEarnings_OneYearWithoutRoe_DiscountedAndDegraded) {
    CanslimConfig canslim_config;
    Fundamentals fundamentals;
    fundamentals.annual_eps_growth_history = {0.50};

    CanslimSubScore sub_score = evaluate_annual_earnings(fundamentals, canslim_config);

    EXPECT_NEAR(sub_score.value, 100.0 * canslim_config.a_ipo_data_discount, 1e-9);
    EXPECT_EQ(sub_score.status, SubScoreStatus::DEGRADED);
    EXPECT_DOUBLE_EQ(sub_score.details.at("limited_history"), 1.0);
}

// -----------------------------------------------------------------------------
// AnnualEarnings_NoHistory_FallsBackUnavailable
// -----------------------------------------------------------------------------
TEST(CanslimCriteriaTest, AnnualEarnings_NoHistory_FallsBackUnavailable) {
    CanslimConfig canslim_config;

    CanslimSubScore sub_score = evaluate_annual_earnings(Fundamentals(), canslim_config);

    EXPECT_DOUBLE_EQ(sub_score.value, 50.0);
    EXPECT_EQ(sub_score.status, SubScoreStatus::UNAVAILABLE);
}

// -----------------------------------------------------------------------------
// NewHighs_RevenueAndProximity_WeightedBlend
// -----------------------------------------------------------------------------
TEST(CanslimCriteriaTest, NewHighs_RevenueAndProximity_WeightedBlend) {
    CanslimConfig canslim_config;
    Fundamentals fundamentals;
    fundamentals.revenue_growth = 0.20;

    CanslimSubScore full_score = evaluate_new_highs(fundamentals, 1.05, canslim_config);
    CanslimSubScore revenue_missing = evaluate_new_highs(Fundamentals(), 1.05, canslim_config);
    CanslimSubScore nothing_known = evaluate_new_highs(Fundamentals(), std::nullopt, canslim_config);

    EXPECT_NEAR(full_score.value, 65.0, 1e-9);
    EXPECT_EQ(full_score.status, SubScoreStatus::OK);
    EXPECT_NEAR(revenue_missing.value, 65.0, 1e-9);
    EXPECT_EQ(revenue_missing.status, SubScoreStatus::DEGRADED);
    EXPECT_EQ(nothing_known.status, SubScoreStatus::UNAVAILABLE);
    EXPECT_DOUBLE_EQ(nothing_known.value, 50.0);
}

// -----------------------------------------------------------------------------
// SupplyDemand_SurgeBreakoutGapTurnover_ScoresFull
// -----------------------------------------------------------------------------
TEST(CanslimCriteriaTest, SupplyDemand_SurgeBreakoutGapTurnover_ScoresFull) {
    CanslimConfig canslim_config;
    SupplyDemandInputs supply_demand_inputs;
    supply_demand_inputs.has_volume = true;
    supply_demand_inputs.latest_volume = 3000000.0;
    supply_demand_inputs.average_volume = 1000000.0;
    supply_demand_inputs.proximity_to_high = 0.99;
    supply_demand_inputs.power_gap_found = true;
    Fundamentals fundamentals;
    fundamentals.shares_outstanding = 100000000.0;
    fundamentals.avg_volume_50d = 1000000.0;

    CanslimSubScore sub_score = evaluate_supply_demand(fundamentals, supply_demand_inputs, canslim_config);

    EXPECT_NEAR(sub_score.value, 100.0, 1e-9);
    EXPECT_EQ(sub_score.status, SubScoreStatus::OK);
    EXPECT_NEAR(sub_score.details.at("turnover_ratio"), 2.52, 1e-9);
}

// -----------------------------------------------------------------------------
// SupplyDemand_NoSharesOutstanding_NeutralTurnoverDegraded
// -----------------------------------------------------------------------------
TEST(CanslimCriteriaTest, SupplyDemand_NoSharesOutstanding_NeutralTurnoverDegraded) {
    CanslimConfig canslim_config;
    SupplyDemandInputs supply_demand_inputs;
    supply_demand_inputs.has_volume = true;
    supply_demand_inputs.latest_volume = 3000000.0;
    supply_demand_inputs.average_volume = 1000000.0;
    supply_demand_inputs.proximity_to_high = 0.93;
    supply_demand_inputs.power_gap_found = false;

    CanslimSubScore sub_score = evaluate_supply_demand(Fundamentals(), supply_demand_inputs, canslim_config);

    // surge 1.0, breakout 0.5 at 5 points below 0.98, no gap, turnover 0.5
    EXPECT_NEAR(sub_score.value, 35.0 + 12.5 + 0.0 + 10.0, 1e-9);
    EXPECT_EQ(sub_score.status, SubScoreStatus::DEGRADED);
}

// -----------------------------------------------------------------------------
// SupplyDemand_NoVolume_FallsBackUnavailable
// -----------------------------------------------------------------------------
TEST(CanslimCriteriaTest, SupplyDemand_NoVolume_FallsBackUnavailable) {
    CanslimConfig canslim_config;

    CanslimSubScore sub_score = evaluate_supply_demand(Fundamentals(), SupplyDemandInputs(), canslim_config);

    EXPECT_EQ(sub_score.status, SubScoreStatus::UNAVAILABLE);
    EXPECT_DOUBLE_EQ(sub_score.value, 50.0);
}

// -----------------------------------------------------------------------------
// ExtractSupplyDemandInputs_GapUpOnVolume_DetectsPowerGap
// -----------------------------------------------------------------------------
TEST(CanslimCriteriaTest, ExtractSupplyDemandInputs_GapUpOnVolume_DetectsPowerGap) {
    CanslimConfig canslim_config;
    IndicatorConfig indicator_config;
    PriceSeries price_series = TestHelpers::make_series("GAP", TestHelpers::geometric_closes(260, 40.0, 0.001));
    PriceBar& gap_bar = price_series.bars.back();
    gap_bar.open_price = price_series.bars[price_series.size() - 2].close_price * 1.05;
    gap_bar.close_price = gap_bar.open_price;
    gap_bar.adjusted_close = gap_bar.open_price;
    gap_bar.high_price = gap_bar.open_price * 1.01;
    gap_bar.volume = 3000000.0;
    IndicatorSet indicator_set = compute_indicator_set(price_series, indicator_config);

    SupplyDemandInputs supply_demand_inputs = extract_supply_demand_inputs(price_series, indicator_set, canslim_config);

    EXPECT_TRUE(supply_demand_inputs.has_volume);
    EXPECT_TRUE(supply_demand_inputs.power_gap_found);
    EXPECT_NEAR(supply_demand_inputs.largest_gap_pct, 5.0, 1e-6);
    EXPECT_DOUBLE_EQ(supply_demand_inputs.proximity_to_high, 1.0);
    EXPECT_DOUBLE_EQ(supply_demand_inputs.latest_volume, 3000000.0);
}

// -----------------------------------------------------------------------------
// ExtractSupplyDemandInputs_GapWithoutVolume_NotAPowerGap
// -----------------------------------------------------------------------------
TEST(CanslimCriteriaTest, ExtractSupplyDemandInputs_GapWithoutVolume_NotAPowerGap) {
    CanslimConfig canslim_config;
    IndicatorConfig indicator_config;
    PriceSeries price_series = TestHelpers::make_series("GAP", TestHelpers::geometric_closes(260, 40.0, 0.001));
    price_series.bars.back().open_price = price_series.bars[price_series.size() - 2].close_price * 1.05;
    IndicatorSet indicator_set = compute_indicator_set(price_series, indicator_config);

    SupplyDemandInputs supply_demand_inputs = extract_supply_demand_inputs(price_series, indicator_set, canslim_config);

    EXPECT_FALSE(supply_demand_inputs.power_gap_found);
}

// -----------------------------------------------------------------------------
// Leadership_RsOutperformance_MapsThroughRatingCurve
// -----------------------------------------------------------------------------
TEST(CanslimCriteriaTest, Leadership_RsOutperformance_MapsThroughRatingCurve) {
    CanslimConfig canslim_config;
    RSScore rs_score;
    rs_score.value = 15.0;

    CanslimSubScore sub_score = evaluate_leadership(rs_score, canslim_config);

    EXPECT_NEAR(sub_score.details.at("leadership_rating"), 80.0, 1e-9);
    EXPECT_NEAR(sub_score.value, 64.0, 1e-9);
    EXPECT_DOUBLE_EQ(leadership_rating_from_rs(500.0, canslim_config), 99.0);
    EXPECT_DOUBLE_EQ(leadership_rating_from_rs(-500.0, canslim_config), 1.0);
}

// -----------------------------------------------------------------------------
// Leadership_Unscored_FallsBackUnavailable
// -----------------------------------------------------------------------------
TEST(CanslimCriteriaTest, Leadership_Unscored_FallsBackUnavailable) {
    CanslimConfig canslim_config;

    CanslimSubScore sub_score = evaluate_leadership(std::nullopt, canslim_config);

    EXPECT_EQ(sub_score.status, SubScoreStatus::UNAVAILABLE);
    EXPECT_DOUBLE_EQ(sub_score.value, 50.0);
}

// -----------------------------------------------------------------------------
// Institutional_OwnershipFraction_ScaledAndCapped
// -----------------------------------------------------------------------------
TEST(CanslimCriteriaTest, Institutional_OwnershipFraction_ScaledAndCapped) {
    CanslimConfig canslim_config;
    Fundamentals fundamentals;

    fundamentals.institutional_ownership_pct = 0.65;
    EXPECT_NEAR(evaluate_institutional(fundamentals, canslim_config).value, 65.0, 1e-9);

    fundamentals.institutional_ownership_pct = 1.2;
    EXPECT_NEAR(evaluate_institutional(fundamentals, canslim_config).value, 100.0, 1e-9);

    EXPECT_EQ(evaluate_institutional(Fundamentals(), canslim_config).status, SubScoreStatus::UNAVAILABLE);
}

// -----------------------------------------------------------------------------
// MarketCriterion_UsesTrendScoreAndDegradedFlag
// -----------------------------------------------------------------------------
TEST(CanslimCriteriaTest, MarketCriterion_UsesTrendScoreAndDegradedFlag) {
    MarketTrend market_trend;
    market_trend.score = 72.0;

    CanslimSubScore live_score = evaluate_market_criterion(market_trend);
    market_trend.degraded = true;
    CanslimSubScore fallback_score = evaluate_market_criterion(market_trend);

    EXPECT_DOUBLE_EQ(live_score.value, 72.0);
    EXPECT_EQ(live_score.status, SubScoreStatus::OK);
    EXPECT_EQ(fallback_score.status, SubScoreStatus::DEGRADED);
}
