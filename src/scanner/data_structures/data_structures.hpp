#ifndef DATA_STRUCTURES_HPP
#define DATA_STRUCTURES_HPP

#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <stdexcept>

namespace CanslimScanner {
namespace Core {

// ========================================================================
// PRICE DATA
// ========================================================================

struct PriceBar {
    std::string date;                      // ISO YYYY-MM-DD
    double open_price;
    double high_price;
    double low_price;
    double close_price;
    double volume;
    double adjusted_close;

    PriceBar() : date(""), open_price(0.0), high_price(0.0), low_price(0.0), close_price(0.0), volume(0.0), adjusted_close(0.0) {}
};

// Canonical daily series, ascending by date with unique dates.
struct PriceSeries {
    std::string symbol;
    std::vector<PriceBar> bars;
    bool has_volume;
    bool has_adjusted_close;

    PriceSeries() : symbol(""), bars(), has_volume(false), has_adjusted_close(false) {}

    size_t size() const { return bars.size(); }
    bool empty() const { return bars.empty(); }

    std::vector<double> closes() const {
        std::vector<double> close_values;
        close_values.reserve(bars.size());
        for (const PriceBar& price_bar : bars) {
            close_values.push_back(price_bar.close_price);
        }
        return close_values;
    }
};

// Unnormalized provider output. Missing cells are NaN.
struct RawPriceTable {
    std::string symbol;
    std::vector<std::string> column_names;
    std::vector<std::string> dates;
    std::vector<std::vector<double>> rows;
};

// Per-bar derived values, index-aligned with the PriceSeries they were computed from.
// EMA and RSI entries before their seed index are NaN.
struct IndicatorSet {
    std::vector<double> ema_short;
    std::vector<double> ema_long;
    std::vector<double> ema_medium;
    std::vector<double> ema_trend;
    std::vector<double> rsi;
    std::vector<double> rolling_high;
    std::vector<bool> above_ema_short;
    std::vector<bool> above_ema_long;
    std::vector<double> distance_ema_short_pct;
    std::vector<double> distance_ema_long_pct;
    std::vector<double> daily_returns;
    std::vector<double> average_volume;     // Empty when the series has no volume
};

// ========================================================================
// TECHNICAL SCORES
// ========================================================================

struct RSScore {
    double value;                          // Weighted outperformance in percentage points
    std::string benchmark_symbol;
    int period_days;
    std::array<double, 4> quarter_contributions; // Stock minus benchmark return, oldest first

    RSScore() : value(0.0), benchmark_symbol(""), period_days(0), quarter_contributions{{0.0, 0.0, 0.0, 0.0}} {}
};

struct TrendScore {
    double score;
    double ema_short_adherence_pct;
    double ema_long_adherence_pct;
    bool higher_highs;
    bool higher_lows;
    bool is_trending;
    bool is_strong_trend;

    TrendScore() : score(0.0), ema_short_adherence_pct(0.0), ema_long_adherence_pct(0.0),
                   higher_highs(false), higher_lows(false), is_trending(false), is_strong_trend(false) {}
};

enum class SignalType {
    EMA8_RETEST,
    EMA21_RETEST,
    EMA8_RECLAIM
};

inline std::string signal_type_to_string(SignalType signal_type) {
    switch (signal_type) {
        case SignalType::EMA8_RETEST:
            return "EMA8_Retest";
        case SignalType::EMA21_RETEST:
            return "EMA21_Retest";
        case SignalType::EMA8_RECLAIM:
            return "EMA8_Reclaim";
        default:
            throw std::runtime_error("Unknown signal type");
    }
}

struct EntrySignal {
    std::string date;
    SignalType signal_type;
    double close_price;
    double rsi;
    double distance_ema_short_pct;
    double distance_ema_long_pct;

    EntrySignal() : date(""), signal_type(SignalType::EMA8_RETEST), close_price(0.0), rsi(0.0),
                    distance_ema_short_pct(0.0), distance_ema_long_pct(0.0) {}
};

// ========================================================================
// FUNDAMENTALS
// ========================================================================

// Every field is independently optional; absence is never encoded as a sentinel number.
struct Fundamentals {
    std::optional<double> quarterly_eps_growth;     // Latest quarter YoY, decimal
    std::optional<double> annual_eps_growth;        // Latest fiscal year YoY, decimal
    std::vector<double> annual_eps_growth_history;  // YoY growth per fiscal year, most recent first
    std::optional<double> revenue_growth;           // Latest quarter YoY, decimal
    std::optional<double> institutional_ownership_pct; // Fraction 0-1
    std::optional<double> shares_outstanding;
    std::optional<double> avg_volume_50d;
    std::optional<double> market_cap;
    std::optional<double> return_on_equity;         // Decimal
};

// ========================================================================
// CANSLIM
// ========================================================================

enum class CanslimCriterion {
    C,
    A,
    N,
    S,
    L,
    I,
    M
};

constexpr std::array<CanslimCriterion, 7> ALL_CANSLIM_CRITERIA = {{
    CanslimCriterion::C, CanslimCriterion::A, CanslimCriterion::N, CanslimCriterion::S,
    CanslimCriterion::L, CanslimCriterion::I, CanslimCriterion::M
}};

inline std::string criterion_to_string(CanslimCriterion criterion) {
    switch (criterion) {
        case CanslimCriterion::C: return "C";
        case CanslimCriterion::A: return "A";
        case CanslimCriterion::N: return "N";
        case CanslimCriterion::S: return "S";
        case CanslimCriterion::L: return "L";
        case CanslimCriterion::I: return "I";
        case CanslimCriterion::M: return "M";
        default:
            throw std::runtime_error("Unknown CANSLIM criterion");
    }
}

enum class SubScoreStatus {
    OK,
    DEGRADED,                              // Scored with part of the inputs missing
    UNAVAILABLE                            // Required input missing, fallback value used
};

struct CanslimSubScore {
    CanslimCriterion criterion;
    double value;                          // 0-100
    std::map<std::string, double> details;
    SubScoreStatus status;

    CanslimSubScore() : criterion(CanslimCriterion::C), value(0.0), details(), status(SubScoreStatus::OK) {}

    bool is_degraded() const { return status != SubScoreStatus::OK; }
};

struct CanslimComposite {
    std::string symbol;
    double total;                          // 0-100
    std::map<CanslimCriterion, CanslimSubScore> sub_scores;
    std::map<CanslimCriterion, double> weights;

    CanslimComposite() : symbol(""), total(0.0), sub_scores(), weights() {}

    std::string degraded_criteria() const {
        std::string degraded_string;
        for (const auto& sub_score_entry : sub_scores) {
            if (sub_score_entry.second.is_degraded()) {
                degraded_string += criterion_to_string(sub_score_entry.first);
            }
        }
        return degraded_string;
    }
};

enum class MarketDirection {
    BULLISH,
    BEARISH,
    NEUTRAL
};

inline std::string market_direction_to_string(MarketDirection direction) {
    switch (direction) {
        case MarketDirection::BULLISH:
            return "Bullish";
        case MarketDirection::BEARISH:
            return "Bearish";
        case MarketDirection::NEUTRAL:
            return "Neutral";
        default:
            throw std::runtime_error("Unknown market direction");
    }
}

// Computed once per scan from the benchmark and shared read-only by all symbols.
struct MarketTrend {
    MarketDirection direction;
    double score;                          // 0-100
    std::string reference_symbol;
    std::string computed_at;
    double latest_close;
    double ema_long;
    double ema_medium;
    double ema_trend;
    bool medium_rising;
    bool degraded;

    MarketTrend() : direction(MarketDirection::NEUTRAL), score(0.0), reference_symbol(""), computed_at(""),
                    latest_close(0.0), ema_long(0.0), ema_medium(0.0), ema_trend(0.0), medium_rising(false), degraded(false) {}
};

// ========================================================================
// SCREENING
// ========================================================================

enum class SymbolState {
    PENDING,
    VALIDATED,
    SCORED,
    ACCEPTED,
    REJECTED,
    FAILED
};

inline std::string symbol_state_to_string(SymbolState state) {
    switch (state) {
        case SymbolState::PENDING: return "PENDING";
        case SymbolState::VALIDATED: return "VALIDATED";
        case SymbolState::SCORED: return "SCORED";
        case SymbolState::ACCEPTED: return "ACCEPTED";
        case SymbolState::REJECTED: return "REJECTED";
        case SymbolState::FAILED: return "FAILED";
        default:
            throw std::runtime_error("Unknown symbol state");
    }
}

struct SymbolResult {
    std::string symbol;
    SymbolState state;
    std::string reason;                    // Failure or rejection reason
    std::optional<RSScore> rs_score;
    std::string rs_unscored_reason;
    std::optional<TrendScore> trend_score;
    std::vector<EntrySignal> entry_signals;
    std::optional<CanslimComposite> composite;
    int rs_rating;                         // 1-99 percentile across the scan, 0 when unrated
    double latest_close;
    double proximity_to_high;

    SymbolResult() : symbol(""), state(SymbolState::PENDING), reason(""), rs_score(), rs_unscored_reason(""), trend_score(),
                     entry_signals(), composite(), rs_rating(0), latest_close(0.0), proximity_to_high(0.0) {}
};

struct ScanReport {
    MarketTrend market_trend;
    int analyzed;
    int failed;
    int accepted;
    int rejected;
    std::vector<SymbolResult> ranked_results;  // Accepted symbols, best first
    std::vector<SymbolResult> all_results;     // Every symbol in universe order

    ScanReport() : market_trend(), analyzed(0), failed(0), accepted(0), rejected(0), ranked_results(), all_results() {}
};

} // namespace Core
} // namespace CanslimScanner

#endif // DATA_STRUCTURES_HPP
