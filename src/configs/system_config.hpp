#ifndef SYSTEM_CONFIG_HPP
#define SYSTEM_CONFIG_HPP

#include "screening_config.hpp"
#include "indicator_config.hpp"
#include "relative_strength_config.hpp"
#include "trend_config.hpp"
#include "canslim_config.hpp"
#include "data_source_config.hpp"
#include "logging_config.hpp"

namespace CanslimScanner {
namespace Config {

/**
 * Complete scanner configuration.
 * Every field carries a working default; CSV files under the config directory override them.
 */
struct SystemConfig {
    ScreeningConfig screening;             // Acceptance thresholds, worker count, benchmark, universe
    IndicatorConfig indicators;            // EMA/RSI periods and lookbacks
    RelativeStrengthConfig relative_strength; // RS period and quarter weights
    TrendConfig trend;                     // Trend adherence window and thresholds
    PullbackConfig pullback;               // Entry signal bands and windows
    CanslimConfig canslim;                 // Sub-scorer parameters and composite weights
    DataSourceConfig data_source;          // Providers, HTTP, universe cache, export
    LoggingConfig logging;                 // Log folder and verbosity
};

} // namespace Config
} // namespace CanslimScanner

#endif // SYSTEM_CONFIG_HPP
