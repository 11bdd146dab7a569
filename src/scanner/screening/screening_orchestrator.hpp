#ifndef SCREENING_ORCHESTRATOR_HPP
#define SCREENING_ORCHESTRATOR_HPP

#include "api/general/fundamentals_provider_interface.hpp"
#include "api/general/price_data_provider_interface.hpp"
#include "configs/system_config.hpp"
#include "scanner/data_structures/data_structures.hpp"
#include <optional>
#include <string>
#include <vector>

namespace CanslimScanner {
namespace Core {

using CanslimScanner::Config::SystemConfig;

// Benchmark data shared read-only by every symbol task of one scan.
struct BenchmarkContext {
    std::optional<PriceSeries> series;
    std::string unavailable_reason;
    MarketTrend market_trend;
};

/**
 * Runs the per-symbol pipeline over a bounded worker pool:
 * PENDING -> VALIDATED (history normalized, indicators computed) -> SCORED -> ACCEPTED | REJECTED,
 * or FAILED when data retrieval, normalization or indicators fail.
 * Ranking and RS percentile ratings are applied after all tasks have joined.
 */
class ScreeningOrchestrator {
public:
    ScreeningOrchestrator(const SystemConfig& config,
                          const CanslimScanner::API::PriceDataProviderInterface& price_provider,
                          const CanslimScanner::API::FundamentalsProviderInterface& fundamentals_provider);

    ScanReport run_scan(const std::vector<std::string>& symbols) const;

    // Fetches the benchmark once; on failure the market trend is the degraded fallback.
    BenchmarkContext prepare_benchmark() const;

    // Never throws: every error becomes a FAILED result.
    SymbolResult screen_symbol(const std::string& symbol, const BenchmarkContext& benchmark_context) const;

    // Sets ACCEPTED or REJECTED (with reason) on a SCORED result.
    void apply_acceptance(SymbolResult& symbol_result, const std::optional<double>& market_cap) const;

    // Composite desc, RS desc, symbol asc.
    static void rank_results(std::vector<SymbolResult>& results);
    static void assign_rs_ratings(std::vector<SymbolResult>& results, const CanslimScanner::Config::RelativeStrengthConfig& rs_config);

private:
    const SystemConfig& config;
    const CanslimScanner::API::PriceDataProviderInterface& price_provider;
    const CanslimScanner::API::FundamentalsProviderInterface& fundamentals_provider;

    PriceSeries fetch_price_series(const std::string& symbol) const;
    SymbolResult run_symbol_pipeline(const std::string& symbol, const BenchmarkContext& benchmark_context) const;
};

} // namespace Core
} // namespace CanslimScanner

#endif // SCREENING_ORCHESTRATOR_HPP
