#include "screening_orchestrator.hpp"
#include "scanner/analysis/entry_signals.hpp"
#include "scanner/analysis/indicators.hpp"
#include "scanner/analysis/market_direction.hpp"
#include "scanner/analysis/relative_strength.hpp"
#include "scanner/analysis/trend_analyzer.hpp"
#include "scanner/canslim/canslim_evaluator.hpp"
#include "scanner/data/price_series_normalizer.hpp"
#include "scanner/errors/scan_errors.hpp"
#include "logging/logs/scan_logs.hpp"
#include "threads/scan_worker_pool.hpp"
#include <algorithm>
#include <future>
#include <iomanip>
#include <sstream>

namespace CanslimScanner {
namespace Core {

using CanslimScanner::Logging::ScanLogs;

namespace {
    std::string format_threshold(double value) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << value;
        return oss.str();
    }
}

ScreeningOrchestrator::ScreeningOrchestrator(const SystemConfig& system_config,
                                             const CanslimScanner::API::PriceDataProviderInterface& price_data_provider,
                                             const CanslimScanner::API::FundamentalsProviderInterface& fundamentals_data_provider)
    : config(system_config), price_provider(price_data_provider), fundamentals_provider(fundamentals_data_provider) {}

PriceSeries ScreeningOrchestrator::fetch_price_series(const std::string& symbol) const {
    RawPriceTable raw_table = price_provider.get_history(symbol, config.screening.history_lookback_days);
    if (raw_table.symbol.empty()) {
        raw_table.symbol = symbol;
    }
    PriceSeriesNormalizer normalizer(config);
    return normalizer.normalize(raw_table);
}

BenchmarkContext ScreeningOrchestrator::prepare_benchmark() const {
    BenchmarkContext benchmark_context;
    const std::string& benchmark_symbol = config.screening.benchmark_symbol;

    try {
        PriceSeries benchmark_series = fetch_price_series(benchmark_symbol);
        benchmark_context.series = benchmark_series;
        IndicatorSet benchmark_indicators = compute_indicator_set(benchmark_series, config.indicators);
        benchmark_context.market_trend = evaluate_market_direction(benchmark_series, benchmark_indicators, config);
    } catch (const ScannerError& benchmark_error) {
        benchmark_context.unavailable_reason = benchmark_error.what();
        benchmark_context.market_trend = fallback_market_trend(benchmark_symbol, config);
        ScanLogs::log_benchmark_fallback(benchmark_symbol, benchmark_error.what());
    }
    return benchmark_context;
}

SymbolResult ScreeningOrchestrator::run_symbol_pipeline(const std::string& symbol, const BenchmarkContext& benchmark_context) const {
    SymbolResult symbol_result;
    symbol_result.symbol = symbol;

    PriceSeries price_series = fetch_price_series(symbol);
    IndicatorSet indicator_set = compute_indicator_set(price_series, config.indicators);
    symbol_result.state = SymbolState::VALIDATED;

    const size_t latest_index = price_series.size() - 1;
    symbol_result.latest_close = price_series.bars[latest_index].close_price;

    if (benchmark_context.series) {
        try {
            symbol_result.rs_score = calculate_relative_strength(price_series, *benchmark_context.series, config.relative_strength);
        } catch (const BenchmarkDataInsufficientError& rs_error) {
            symbol_result.rs_unscored_reason = rs_error.what();
        } catch (const InsufficientHistoryError& rs_error) {
            symbol_result.rs_unscored_reason = rs_error.what();
        }
    } else {
        symbol_result.rs_unscored_reason = "benchmark unavailable: " + benchmark_context.unavailable_reason;
    }

    symbol_result.trend_score = analyze_trend(price_series, indicator_set, config.trend);
    symbol_result.entry_signals = detect_entry_signals(price_series, indicator_set, config.pullback);

    CanslimInputs canslim_inputs;
    try {
        canslim_inputs.fundamentals = fundamentals_provider.get_fundamentals(symbol);
    } catch (const DataUnavailableError& fundamentals_error) {
        ScanLogs::log_fundamentals_unavailable(symbol, fundamentals_error.what());
    }
    canslim_inputs.rs_score = symbol_result.rs_score;
    canslim_inputs.supply_demand = extract_supply_demand_inputs(price_series, indicator_set, config.canslim);
    if (canslim_inputs.supply_demand.proximity_to_high > 0.0) {
        canslim_inputs.proximity_to_high = canslim_inputs.supply_demand.proximity_to_high;
        symbol_result.proximity_to_high = canslim_inputs.supply_demand.proximity_to_high;
    }

    symbol_result.composite = evaluate_canslim(symbol, canslim_inputs, benchmark_context.market_trend, config.canslim);
    symbol_result.state = SymbolState::SCORED;

    apply_acceptance(symbol_result, canslim_inputs.fundamentals.market_cap);
    return symbol_result;
}

SymbolResult ScreeningOrchestrator::screen_symbol(const std::string& symbol, const BenchmarkContext& benchmark_context) const {
    SymbolResult symbol_result;
    try {
        symbol_result = run_symbol_pipeline(symbol, benchmark_context);
    } catch (const ScannerError& scan_error) {
        symbol_result = SymbolResult();
        symbol_result.symbol = symbol;
        symbol_result.state = SymbolState::FAILED;
        symbol_result.reason = scan_error.what();
    } catch (const std::exception& unexpected_error) {
        symbol_result = SymbolResult();
        symbol_result.symbol = symbol;
        symbol_result.state = SymbolState::FAILED;
        symbol_result.reason = std::string("unexpected error: ") + unexpected_error.what();
    }

    if (symbol_result.state == SymbolState::FAILED) {
        ScanLogs::log_symbol_failed(symbol, symbol_result.reason);
    } else if (config.logging.debug) {
        ScanLogs::log_symbol_detail(symbol_result);
    }
    return symbol_result;
}

void ScreeningOrchestrator::apply_acceptance(SymbolResult& symbol_result, const std::optional<double>& market_cap) const {
    const Config::ScreeningConfig& screening = config.screening;
    std::vector<std::string> rejection_reasons;

    if (!symbol_result.composite || symbol_result.composite->total < screening.minimum_canslim_score) {
        rejection_reasons.push_back("CANSLIM " + format_threshold(symbol_result.composite ? symbol_result.composite->total : 0.0) +
                                    " < " + format_threshold(screening.minimum_canslim_score));
    }
    if (!symbol_result.rs_score) {
        rejection_reasons.push_back("RS unscored");
    } else if (symbol_result.rs_score->value < screening.minimum_rs_score) {
        rejection_reasons.push_back("RS " + format_threshold(symbol_result.rs_score->value) + " < " + format_threshold(screening.minimum_rs_score));
    }
    if (market_cap && *market_cap < screening.minimum_market_cap) {
        rejection_reasons.push_back("market cap below minimum");
    }

    if (rejection_reasons.empty()) {
        symbol_result.state = SymbolState::ACCEPTED;
        symbol_result.reason.clear();
        return;
    }

    symbol_result.state = SymbolState::REJECTED;
    std::string joined_reason;
    for (const std::string& rejection_reason : rejection_reasons) {
        joined_reason += (joined_reason.empty() ? "" : "; ") + rejection_reason;
    }
    symbol_result.reason = joined_reason;
}

void ScreeningOrchestrator::assign_rs_ratings(std::vector<SymbolResult>& results, const Config::RelativeStrengthConfig& rs_config) {
    std::vector<size_t> rated_indices;
    std::vector<double> rs_values;
    for (size_t result_index = 0; result_index < results.size(); ++result_index) {
        const SymbolResult& symbol_result = results[result_index];
        const bool scored = symbol_result.state == SymbolState::ACCEPTED || symbol_result.state == SymbolState::REJECTED;
        if (scored && symbol_result.rs_score) {
            rated_indices.push_back(result_index);
            rs_values.push_back(symbol_result.rs_score->value);
        }
    }

    std::vector<int> ratings = calculate_rs_percentile_ratings(rs_values, rs_config);
    for (size_t rated_position = 0; rated_position < rated_indices.size(); ++rated_position) {
        results[rated_indices[rated_position]].rs_rating = ratings[rated_position];
    }
}

void ScreeningOrchestrator::rank_results(std::vector<SymbolResult>& results) {
    std::sort(results.begin(), results.end(), [](const SymbolResult& left, const SymbolResult& right) {
        const double left_total = left.composite ? left.composite->total : 0.0;
        const double right_total = right.composite ? right.composite->total : 0.0;
        if (left_total != right_total) return left_total > right_total;
        const double left_rs = left.rs_score ? left.rs_score->value : 0.0;
        const double right_rs = right.rs_score ? right.rs_score->value : 0.0;
        if (left_rs != right_rs) return left_rs > right_rs;
        return left.symbol < right.symbol;
    });
}

ScanReport ScreeningOrchestrator::run_scan(const std::vector<std::string>& symbols) const {
    ScanReport scan_report;
    const int worker_count = std::max(1, std::min(config.screening.max_workers, static_cast<int>(std::max<size_t>(symbols.size(), 1))));
    ScanLogs::log_scan_start(symbols.size(), worker_count, config.screening.benchmark_symbol);

    const BenchmarkContext benchmark_context = prepare_benchmark();
    scan_report.market_trend = benchmark_context.market_trend;
    ScanLogs::log_market_trend(scan_report.market_trend);

    CanslimScanner::Logging::LoggingContext* logging_context =
        CanslimScanner::Logging::has_logging_context() ? CanslimScanner::Logging::get_logging_context() : nullptr;

    std::vector<std::future<SymbolResult>> result_futures;
    result_futures.reserve(symbols.size());
    {
        CanslimScanner::Threads::ScanWorkerPool worker_pool(worker_count, logging_context);
        for (const std::string& symbol : symbols) {
            result_futures.push_back(worker_pool.submit([this, symbol, &benchmark_context]() {
                return screen_symbol(symbol, benchmark_context);
            }));
        }
        worker_pool.shutdown();
    }

    // Single join point; results keep universe order.
    for (size_t symbol_index = 0; symbol_index < result_futures.size(); ++symbol_index) {
        SymbolResult symbol_result;
        try {
            symbol_result = result_futures[symbol_index].get();
        } catch (const std::exception& task_error) {
            symbol_result.symbol = symbols[symbol_index];
            symbol_result.state = SymbolState::FAILED;
            symbol_result.reason = std::string("task error: ") + task_error.what();
        }
        scan_report.all_results.push_back(std::move(symbol_result));
    }

    assign_rs_ratings(scan_report.all_results, config.relative_strength);

    scan_report.analyzed = static_cast<int>(scan_report.all_results.size());
    for (const SymbolResult& symbol_result : scan_report.all_results) {
        if (symbol_result.state == SymbolState::FAILED) {
            scan_report.failed++;
        } else if (symbol_result.state == SymbolState::ACCEPTED) {
            scan_report.accepted++;
            scan_report.ranked_results.push_back(symbol_result);
        } else if (symbol_result.state == SymbolState::REJECTED) {
            scan_report.rejected++;
        }
    }
    rank_results(scan_report.ranked_results);

    return scan_report;
}

} // namespace Core
} // namespace CanslimScanner
