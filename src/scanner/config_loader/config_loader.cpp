#include "config_loader.hpp"
#include "configs/universe_config.hpp"
#include "scanner/errors/scan_errors.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cmath>

using CanslimScanner::Config::SystemConfig;
using CanslimScanner::Core::ConfigurationError;

namespace {
    inline std::string trim(const std::string& input_string) {
        const char* whitespace_chars = " \t\r\n";
        auto begin_position = input_string.find_first_not_of(whitespace_chars);
        auto end_position = input_string.find_last_not_of(whitespace_chars);
        if (begin_position == std::string::npos) return "";
        return input_string.substr(begin_position, end_position - begin_position + 1);
    }

    inline bool to_bool(const std::string& config_key_string, const std::string& input_value) {
        std::string normalized_value = input_value;
        std::transform(normalized_value.begin(), normalized_value.end(), normalized_value.begin(), ::tolower);
        if (normalized_value == "1" || normalized_value == "true" || normalized_value == "yes") return true;
        if (normalized_value == "0" || normalized_value == "false" || normalized_value == "no") return false;
        throw ConfigurationError("Invalid boolean for " + config_key_string + ": " + input_value);
    }

    inline int to_int(const std::string& config_key_string, const std::string& input_value) {
        try {
            size_t parsed_characters = 0;
            int parsed_value = std::stoi(input_value, &parsed_characters);
            if (parsed_characters != input_value.size()) {
                throw ConfigurationError("Invalid integer for " + config_key_string + ": " + input_value);
            }
            return parsed_value;
        } catch (const std::logic_error&) {
            throw ConfigurationError("Invalid integer for " + config_key_string + ": " + input_value);
        }
    }

    inline double to_double(const std::string& config_key_string, const std::string& input_value) {
        try {
            size_t parsed_characters = 0;
            double parsed_value = std::stod(input_value, &parsed_characters);
            if (parsed_characters != input_value.size() || !std::isfinite(parsed_value)) {
                throw ConfigurationError("Invalid number for " + config_key_string + ": " + input_value);
            }
            return parsed_value;
        } catch (const std::logic_error&) {
            throw ConfigurationError("Invalid number for " + config_key_string + ": " + input_value);
        }
    }

    inline bool weights_sum_to_one(double weight_sum, double tolerance) {
        return std::fabs(weight_sum - 1.0) <= tolerance;
    }

    inline bool is_unit_interval(double value) {
        return value >= 0.0 && value <= 1.0;
    }
}

const std::vector<std::string>& get_config_file_names() {
    static const std::vector<std::string> config_file_names = {
        "scanner_config.csv",
        "canslim_config.csv",
        "data_source_config.csv",
        "logging_config.csv"
    };
    return config_file_names;
}

void apply_config_value(SystemConfig& cfg, const std::string& config_key_string, const std::string& config_value_string) {
    const std::string& key = config_key_string;
    const std::string& value = config_value_string;

    // Screening
    if (key == "screening.minimum_market_cap") cfg.screening.minimum_market_cap = to_double(key, value);
    else if (key == "screening.minimum_rs_score") cfg.screening.minimum_rs_score = to_double(key, value);
    else if (key == "screening.minimum_canslim_score") cfg.screening.minimum_canslim_score = to_double(key, value);
    else if (key == "screening.max_workers") cfg.screening.max_workers = to_int(key, value);
    else if (key == "screening.history_lookback_days") cfg.screening.history_lookback_days = to_int(key, value);
    else if (key == "screening.benchmark_symbol") cfg.screening.benchmark_symbol = value;
    else if (key == "screening.universe") cfg.screening.universe = value;

    // Indicators
    else if (key == "indicators.ema_short_period") cfg.indicators.ema_short_period = to_int(key, value);
    else if (key == "indicators.ema_long_period") cfg.indicators.ema_long_period = to_int(key, value);
    else if (key == "indicators.ema_medium_period") cfg.indicators.ema_medium_period = to_int(key, value);
    else if (key == "indicators.ema_trend_period") cfg.indicators.ema_trend_period = to_int(key, value);
    else if (key == "indicators.rsi_period") cfg.indicators.rsi_period = to_int(key, value);
    else if (key == "indicators.high_lookback_bars") cfg.indicators.high_lookback_bars = to_int(key, value);
    else if (key == "indicators.volume_average_bars") cfg.indicators.volume_average_bars = to_int(key, value);
    else if (key == "indicators.minimum_history_bars") cfg.indicators.minimum_history_bars = to_int(key, value);

    // Relative strength
    else if (key == "relative_strength.period_days") cfg.relative_strength.period_days = to_int(key, value);
    else if (key == "relative_strength.q1_weight") cfg.relative_strength.q1_weight = to_double(key, value);
    else if (key == "relative_strength.q2_weight") cfg.relative_strength.q2_weight = to_double(key, value);
    else if (key == "relative_strength.q3_weight") cfg.relative_strength.q3_weight = to_double(key, value);
    else if (key == "relative_strength.q4_weight") cfg.relative_strength.q4_weight = to_double(key, value);
    else if (key == "relative_strength.rating_minimum") cfg.relative_strength.rating_minimum = to_int(key, value);
    else if (key == "relative_strength.rating_maximum") cfg.relative_strength.rating_maximum = to_int(key, value);

    // Trend and pullback
    else if (key == "trend.window_bars") cfg.trend.window_bars = to_int(key, value);
    else if (key == "trend.ema_short_adherence_threshold") cfg.trend.ema_short_adherence_threshold = to_double(key, value);
    else if (key == "trend.ema_long_adherence_threshold") cfg.trend.ema_long_adherence_threshold = to_double(key, value);
    else if (key == "pullback.signal_recency_bars") cfg.pullback.signal_recency_bars = to_int(key, value);
    else if (key == "pullback.ema_short_band_percent") cfg.pullback.ema_short_band_percent = to_double(key, value);
    else if (key == "pullback.ema_long_band_percent") cfg.pullback.ema_long_band_percent = to_double(key, value);
    else if (key == "pullback.reclaim_lookback_bars") cfg.pullback.reclaim_lookback_bars = to_int(key, value);

    // CANSLIM sub-scorers
    else if (key == "canslim.c_growth_target") cfg.canslim.c_growth_target = to_double(key, value);
    else if (key == "canslim.a_growth_target") cfg.canslim.a_growth_target = to_double(key, value);
    else if (key == "canslim.a_growth_weight") cfg.canslim.a_growth_weight = to_double(key, value);
    else if (key == "canslim.a_consistency_weight") cfg.canslim.a_consistency_weight = to_double(key, value);
    else if (key == "canslim.a_roe_weight") cfg.canslim.a_roe_weight = to_double(key, value);
    else if (key == "canslim.a_roe_target") cfg.canslim.a_roe_target = to_double(key, value);
    else if (key == "canslim.a_min_years_growth") cfg.canslim.a_min_years_growth = to_int(key, value);
    else if (key == "canslim.a_ipo_growth_weight") cfg.canslim.a_ipo_growth_weight = to_double(key, value);
    else if (key == "canslim.a_ipo_consistency_weight") cfg.canslim.a_ipo_consistency_weight = to_double(key, value);
    else if (key == "canslim.a_ipo_roe_weight") cfg.canslim.a_ipo_roe_weight = to_double(key, value);
    else if (key == "canslim.a_ipo_data_discount") cfg.canslim.a_ipo_data_discount = to_double(key, value);
    else if (key == "canslim.n_revenue_growth_target") cfg.canslim.n_revenue_growth_target = to_double(key, value);
    else if (key == "canslim.n_revenue_weight") cfg.canslim.n_revenue_weight = to_double(key, value);
    else if (key == "canslim.n_proximity_weight") cfg.canslim.n_proximity_weight = to_double(key, value);
    else if (key == "canslim.n_proximity_cap") cfg.canslim.n_proximity_cap = to_double(key, value);
    else if (key == "canslim.s_volume_surge_threshold") cfg.canslim.s_volume_surge_threshold = to_double(key, value);
    else if (key == "canslim.s_breakout_proximity") cfg.canslim.s_breakout_proximity = to_double(key, value);
    else if (key == "canslim.s_power_gap_lookback") cfg.canslim.s_power_gap_lookback = to_int(key, value);
    else if (key == "canslim.s_power_gap_min_percent") cfg.canslim.s_power_gap_min_percent = to_double(key, value);
    else if (key == "canslim.s_turnover_cap") cfg.canslim.s_turnover_cap = to_double(key, value);
    else if (key == "canslim.s_surge_weight") cfg.canslim.s_surge_weight = to_double(key, value);
    else if (key == "canslim.s_breakout_weight") cfg.canslim.s_breakout_weight = to_double(key, value);
    else if (key == "canslim.s_power_gap_weight") cfg.canslim.s_power_gap_weight = to_double(key, value);
    else if (key == "canslim.s_turnover_weight") cfg.canslim.s_turnover_weight = to_double(key, value);
    else if (key == "canslim.l_rating_slope") cfg.canslim.l_rating_slope = to_double(key, value);
    else if (key == "canslim.i_institutional_cap") cfg.canslim.i_institutional_cap = to_double(key, value);
    else if (key == "canslim.fallback_score") cfg.canslim.fallback_score = to_double(key, value);

    // Market direction
    else if (key == "market.price_above_trend_weight") cfg.canslim.m_price_above_trend_weight = to_double(key, value);
    else if (key == "market.ema_alignment_weight") cfg.canslim.m_ema_alignment_weight = to_double(key, value);
    else if (key == "market.medium_rising_weight") cfg.canslim.m_medium_rising_weight = to_double(key, value);
    else if (key == "market.price_above_long_weight") cfg.canslim.m_price_above_long_weight = to_double(key, value);
    else if (key == "market.bullish_threshold") cfg.canslim.m_bullish_threshold = to_double(key, value);
    else if (key == "market.bearish_threshold") cfg.canslim.m_bearish_threshold = to_double(key, value);
    else if (key == "market.medium_rising_lookback") cfg.canslim.m_medium_rising_lookback = to_int(key, value);
    else if (key == "market.fallback_score") cfg.canslim.m_fallback_score = to_double(key, value);

    // Composite weights
    else if (key == "weights.c") cfg.canslim.weights.current_earnings = to_double(key, value);
    else if (key == "weights.a") cfg.canslim.weights.annual_earnings = to_double(key, value);
    else if (key == "weights.n") cfg.canslim.weights.new_highs = to_double(key, value);
    else if (key == "weights.s") cfg.canslim.weights.supply_demand = to_double(key, value);
    else if (key == "weights.l") cfg.canslim.weights.leadership = to_double(key, value);
    else if (key == "weights.i") cfg.canslim.weights.institutional = to_double(key, value);
    else if (key == "weights.m") cfg.canslim.weights.market_direction = to_double(key, value);

    // Data sources
    else if (key == "data_source.price_provider") cfg.data_source.price_provider = value;
    else if (key == "data_source.price_data_directory") cfg.data_source.price_data_directory = value;
    else if (key == "data_source.fundamentals_provider") cfg.data_source.fundamentals_provider = value;
    else if (key == "data_source.yahoo_chart_url") cfg.data_source.yahoo_chart_url = value;
    else if (key == "data_source.yahoo_quote_summary_url") cfg.data_source.yahoo_quote_summary_url = value;
    else if (key == "data_source.user_agent") cfg.data_source.user_agent = value;
    else if (key == "data_source.http_timeout_seconds") cfg.data_source.http_timeout_seconds = to_int(key, value);
    else if (key == "data_source.http_retries") cfg.data_source.http_retries = to_int(key, value);
    else if (key == "data_source.http_retry_delay_ms") cfg.data_source.http_retry_delay_ms = to_int(key, value);
    else if (key == "data_source.enable_ssl_verification") cfg.data_source.enable_ssl_verification = to_bool(key, value);
    else if (key == "data_source.sp500_constituents_url") cfg.data_source.sp500_constituents_url = value;
    else if (key == "data_source.nasdaq100_constituents_url") cfg.data_source.nasdaq100_constituents_url = value;
    else if (key == "data_source.russell2000_constituents_url") cfg.data_source.russell2000_constituents_url = value;
    else if (key == "data_source.universe_cache_file") cfg.data_source.universe_cache_file = value;
    else if (key == "data_source.universe_cache_ttl_hours") cfg.data_source.universe_cache_ttl_hours = to_int(key, value);
    else if (key == "data_source.export_directory") cfg.data_source.export_directory = value;
    else if (key == "data_source.export_enabled") cfg.data_source.export_enabled = to_bool(key, value);

    // Logging
    else if (key == "logging.log_directory") cfg.logging.log_directory = value;
    else if (key == "logging.log_file") cfg.logging.log_file = value;
    else if (key == "logging.poll_interval_ms") cfg.logging.poll_interval_ms = to_int(key, value);
    else if (key == "logging.debug") cfg.logging.debug = to_bool(key, value);
    else if (key == "logging.log_signals") cfg.logging.log_signals = to_bool(key, value);

    else {
        throw ConfigurationError("Unknown configuration key: " + key);
    }
}

bool load_config_from_csv(SystemConfig& cfg, const std::string& csv_path) {
    std::ifstream config_file_stream(csv_path);
    if (!config_file_stream.is_open()) {
        return false;
    }

    std::string config_line_string;
    int config_line_number = 0;
    while (std::getline(config_file_stream, config_line_string)) {
        ++config_line_number;
        config_line_string = trim(config_line_string);
        if (config_line_string.empty() || config_line_string[0] == '#') continue;

        std::stringstream config_line_stream(config_line_string);
        std::string config_key_string, config_value_string;
        if (!std::getline(config_line_stream, config_key_string, ',') ||
            !std::getline(config_line_stream, config_value_string)) {
            throw ConfigurationError(csv_path + ":" + std::to_string(config_line_number) + ": expected key,value");
        }
        config_key_string = trim(config_key_string);
        config_value_string = trim(config_value_string);

        try {
            apply_config_value(cfg, config_key_string, config_value_string);
        } catch (const ConfigurationError& config_error) {
            throw ConfigurationError(csv_path + ":" + std::to_string(config_line_number) + ": " + config_error.what());
        }
    }
    return true;
}

void load_system_config(SystemConfig& config, const std::string& config_directory) {
    for (const std::string& config_file_name : get_config_file_names()) {
        std::string config_path = config_directory + "/" + config_file_name;
        if (!load_config_from_csv(config, config_path)) {
            throw ConfigurationError("Failed to open config CSV: " + config_path);
        }
    }

    std::string validation_error;
    if (!validate_config(config, validation_error)) {
        throw ConfigurationError("Configuration validation failed: " + validation_error);
    }
}

bool validate_config(const SystemConfig& config, std::string& error_message) {
    const double tolerance = config.canslim.weight_sum_tolerance;

    // Screening
    if (config.screening.max_workers < 1 || config.screening.max_workers > 32) {
        error_message = "screening.max_workers must be between 1 and 32";
        return false;
    }
    if (config.screening.minimum_market_cap < 0.0) {
        error_message = "screening.minimum_market_cap must be >= 0";
        return false;
    }
    if (config.screening.minimum_canslim_score < 0.0 || config.screening.minimum_canslim_score > 100.0) {
        error_message = "screening.minimum_canslim_score must be between 0 and 100";
        return false;
    }
    if (config.screening.history_lookback_days < 1) {
        error_message = "screening.history_lookback_days must be >= 1";
        return false;
    }
    if (config.screening.benchmark_symbol.empty()) {
        error_message = "screening.benchmark_symbol is required";
        return false;
    }
    try {
        CanslimScanner::Config::UniverseSelection::parse(config.screening.universe);
    } catch (const std::runtime_error& selector_error) {
        error_message = selector_error.what();
        return false;
    }

    // Indicators
    const CanslimScanner::Config::IndicatorConfig& indicators = config.indicators;
    if (indicators.ema_short_period < 1 || indicators.rsi_period < 1 || indicators.high_lookback_bars < 1 ||
        indicators.volume_average_bars < 1) {
        error_message = "indicators periods must be >= 1";
        return false;
    }
    if (!(indicators.ema_short_period < indicators.ema_long_period &&
          indicators.ema_long_period < indicators.ema_medium_period &&
          indicators.ema_medium_period < indicators.ema_trend_period)) {
        error_message = "indicators EMA periods must be strictly increasing (short < long < medium < trend)";
        return false;
    }
    if (indicators.minimum_history_bars < indicators.ema_trend_period) {
        error_message = "indicators.minimum_history_bars must be >= indicators.ema_trend_period";
        return false;
    }

    // Relative strength
    const CanslimScanner::Config::RelativeStrengthConfig& relative_strength = config.relative_strength;
    if (relative_strength.period_days < 4) {
        error_message = "relative_strength.period_days must be >= 4";
        return false;
    }
    if (!is_unit_interval(relative_strength.q1_weight) || !is_unit_interval(relative_strength.q2_weight) ||
        !is_unit_interval(relative_strength.q3_weight) || !is_unit_interval(relative_strength.q4_weight)) {
        error_message = "relative_strength quarter weights must be between 0 and 1";
        return false;
    }
    if (!weights_sum_to_one(relative_strength.q1_weight + relative_strength.q2_weight +
                            relative_strength.q3_weight + relative_strength.q4_weight, tolerance)) {
        error_message = "relative_strength quarter weights must sum to 1.0";
        return false;
    }
    if (relative_strength.rating_minimum < 1 || relative_strength.rating_maximum > 99 ||
        relative_strength.rating_minimum >= relative_strength.rating_maximum) {
        error_message = "relative_strength rating range must satisfy 1 <= minimum < maximum <= 99";
        return false;
    }

    // Trend and pullback
    if (config.trend.window_bars < 60) {
        error_message = "trend.window_bars must be >= 60";
        return false;
    }
    if (config.trend.window_bars > indicators.minimum_history_bars) {
        error_message = "trend.window_bars must not exceed indicators.minimum_history_bars";
        return false;
    }
    if (config.trend.ema_short_adherence_threshold <= 0.0 || config.trend.ema_short_adherence_threshold > 100.0 ||
        config.trend.ema_long_adherence_threshold <= 0.0 || config.trend.ema_long_adherence_threshold > 100.0) {
        error_message = "trend adherence thresholds must be in (0, 100]";
        return false;
    }
    if (config.pullback.signal_recency_bars < 1 || config.pullback.reclaim_lookback_bars < 1) {
        error_message = "pullback.signal_recency_bars and pullback.reclaim_lookback_bars must be >= 1";
        return false;
    }
    if (config.pullback.ema_short_band_percent <= 0.0 || config.pullback.ema_long_band_percent <= 0.0) {
        error_message = "pullback bands must be > 0";
        return false;
    }

    // CANSLIM sub-scorers
    const CanslimScanner::Config::CanslimConfig& canslim = config.canslim;
    if (canslim.c_growth_target <= 0.0 || canslim.a_growth_target <= 0.0 || canslim.a_roe_target <= 0.0 ||
        canslim.n_revenue_growth_target <= 0.0 || canslim.n_proximity_cap <= 0.0) {
        error_message = "canslim growth targets and caps must be > 0";
        return false;
    }
    if (!weights_sum_to_one(canslim.a_growth_weight + canslim.a_consistency_weight + canslim.a_roe_weight, tolerance) ||
        !weights_sum_to_one(canslim.a_ipo_growth_weight + canslim.a_ipo_consistency_weight + canslim.a_ipo_roe_weight, tolerance)) {
        error_message = "canslim A component weights must sum to 1.0";
        return false;
    }
    if (canslim.a_min_years_growth < 1) {
        error_message = "canslim.a_min_years_growth must be >= 1";
        return false;
    }
    if (canslim.a_ipo_data_discount <= 0.0 || canslim.a_ipo_data_discount > 1.0) {
        error_message = "canslim.a_ipo_data_discount must be in (0, 1]";
        return false;
    }
    if (!weights_sum_to_one(canslim.n_revenue_weight + canslim.n_proximity_weight, tolerance)) {
        error_message = "canslim N component weights must sum to 1.0";
        return false;
    }
    if (!weights_sum_to_one(canslim.s_surge_weight + canslim.s_breakout_weight +
                            canslim.s_power_gap_weight + canslim.s_turnover_weight, tolerance)) {
        error_message = "canslim S component weights must sum to 1.0";
        return false;
    }
    if (canslim.s_volume_surge_threshold <= 0.0 || canslim.s_breakout_proximity <= 0.0 ||
        canslim.s_power_gap_lookback < 1 || canslim.s_power_gap_min_percent <= 0.0 || canslim.s_turnover_cap <= 0.0) {
        error_message = "canslim S thresholds must be > 0";
        return false;
    }
    if (canslim.l_rating_slope <= 0.0 || canslim.i_institutional_cap <= 0.0) {
        error_message = "canslim.l_rating_slope and canslim.i_institutional_cap must be > 0";
        return false;
    }
    if (canslim.fallback_score < 0.0 || canslim.fallback_score > 100.0 ||
        canslim.m_fallback_score < 0.0 || canslim.m_fallback_score > 100.0) {
        error_message = "fallback scores must be between 0 and 100";
        return false;
    }

    // Market direction
    if (!weights_sum_to_one(canslim.m_price_above_trend_weight + canslim.m_ema_alignment_weight +
                            canslim.m_medium_rising_weight + canslim.m_price_above_long_weight, tolerance)) {
        error_message = "market component weights must sum to 1.0";
        return false;
    }
    if (canslim.m_bearish_threshold < 0.0 || canslim.m_bullish_threshold > 100.0 ||
        canslim.m_bearish_threshold >= canslim.m_bullish_threshold) {
        error_message = "market thresholds must satisfy 0 <= bearish < bullish <= 100";
        return false;
    }
    if (canslim.m_medium_rising_lookback < 1) {
        error_message = "market.medium_rising_lookback must be >= 1";
        return false;
    }

    // Composite weights
    const CanslimScanner::Config::CanslimWeights& weights = canslim.weights;
    const double criterion_weights[] = {
        weights.current_earnings, weights.annual_earnings, weights.new_highs, weights.supply_demand,
        weights.leadership, weights.institutional, weights.market_direction
    };
    for (double criterion_weight : criterion_weights) {
        if (!is_unit_interval(criterion_weight)) {
            error_message = "CANSLIM weights must each be between 0 and 1";
            return false;
        }
    }
    if (!weights_sum_to_one(weights.sum(), tolerance)) {
        error_message = "CANSLIM weights must sum to 1.0 (got " + std::to_string(weights.sum()) + ")";
        return false;
    }

    // Data sources
    if (config.data_source.price_provider != "yahoo" && config.data_source.price_provider != "csv") {
        error_message = "data_source.price_provider must be yahoo or csv";
        return false;
    }
    if (config.data_source.fundamentals_provider != "yahoo" && config.data_source.fundamentals_provider != "none") {
        error_message = "data_source.fundamentals_provider must be yahoo or none";
        return false;
    }
    if (config.data_source.http_timeout_seconds < 1 || config.data_source.http_retries < 1 ||
        config.data_source.http_retry_delay_ms < 0) {
        error_message = "data_source HTTP timeout and retries must be >= 1";
        return false;
    }
    if (config.data_source.universe_cache_ttl_hours < 0) {
        error_message = "data_source.universe_cache_ttl_hours must be >= 0";
        return false;
    }

    // Logging
    if (config.logging.poll_interval_ms < 1) {
        error_message = "logging.poll_interval_ms must be >= 1";
        return false;
    }

    return true;
}
