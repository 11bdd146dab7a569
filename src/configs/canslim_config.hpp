#ifndef CANSLIM_CONFIG_HPP
#define CANSLIM_CONFIG_HPP

namespace CanslimScanner {
namespace Config {

struct CanslimWeights {
    double current_earnings = 0.15;                  // C
    double annual_earnings = 0.15;                   // A
    double new_highs = 0.15;                         // N
    double supply_demand = 0.15;                     // S
    double leadership = 0.15;                        // L
    double institutional = 0.10;                     // I
    double market_direction = 0.15;                  // M

    double sum() const {
        return current_earnings + annual_earnings + new_highs + supply_demand +
               leadership + institutional + market_direction;
    }
};

struct CanslimConfig {
    // ========================================================================
    // C / A - EARNINGS
    // ========================================================================

    double c_growth_target = 0.25;                   // Quarterly EPS growth earning full credit at 2x
    double a_growth_target = 0.25;                   // Annual EPS growth target
    double a_growth_weight = 0.50;
    double a_consistency_weight = 0.30;
    double a_roe_weight = 0.20;
    double a_roe_target = 0.17;                      // Return on equity target
    int a_min_years_growth = 3;                      // Fewer years of growth history takes the IPO path
    double a_ipo_growth_weight = 0.60;
    double a_ipo_consistency_weight = 0.15;
    double a_ipo_roe_weight = 0.25;
    double a_ipo_data_discount = 0.85;               // Multiplier applied on the IPO path

    // ========================================================================
    // N - NEW HIGHS / REVENUE
    // ========================================================================

    double n_revenue_growth_target = 0.20;
    double n_revenue_weight = 0.70;
    double n_proximity_weight = 0.30;
    double n_proximity_cap = 1.05;                   // close / 52w high ratio earning full proximity credit

    // ========================================================================
    // S - SUPPLY AND DEMAND
    // ========================================================================

    double s_volume_surge_threshold = 1.5;           // Latest volume / average volume counted as a surge
    double s_breakout_proximity = 0.98;              // close / 52w high counted as a breakout
    int s_power_gap_lookback = 10;                   // Bars searched for a power gap
    double s_power_gap_min_percent = 3.0;            // Minimum gap up (% of prior close)
    double s_turnover_cap = 1.5;                     // Annualized turnover earning full credit
    double s_surge_weight = 0.35;
    double s_breakout_weight = 0.25;
    double s_power_gap_weight = 0.20;
    double s_turnover_weight = 0.20;

    // ========================================================================
    // L / I
    // ========================================================================

    double l_rating_slope = 2.0;                     // Rating points per RS percentage point around 50
    double i_institutional_cap = 1.0;                // Institutional ownership earning full credit

    // ========================================================================
    // M - MARKET DIRECTION
    // ========================================================================

    double m_price_above_trend_weight = 0.4;         // close > EMA200
    double m_ema_alignment_weight = 0.3;             // EMA21 > EMA50 > EMA200
    double m_medium_rising_weight = 0.2;             // EMA50 rising over the lookback
    double m_price_above_long_weight = 0.1;          // close > EMA21
    double m_bullish_threshold = 60.0;
    double m_bearish_threshold = 40.0;
    int m_medium_rising_lookback = 20;
    double m_fallback_score = 40.0;                  // Score used when the benchmark trend cannot be computed

    // ========================================================================
    // COMPOSITE
    // ========================================================================

    double fallback_score = 50.0;                    // Sub-score used when a required input is missing
    double weight_sum_tolerance = 1e-6;
    CanslimWeights weights;
};

} // namespace Config
} // namespace CanslimScanner

#endif // CANSLIM_CONFIG_HPP
