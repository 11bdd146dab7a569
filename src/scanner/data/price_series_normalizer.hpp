#ifndef PRICE_SERIES_NORMALIZER_HPP
#define PRICE_SERIES_NORMALIZER_HPP

#include "configs/system_config.hpp"
#include "scanner/data_structures/data_structures.hpp"
#include <string>
#include <vector>

namespace CanslimScanner {
namespace Core {

using CanslimScanner::Config::SystemConfig;

/**
 * Converts provider tables into canonical PriceSeries.
 * Column names are matched case-insensitively with spaces, underscores and dashes ignored,
 * so "Adj Close", "adj_close" and "adjclose" resolve to the same field.
 */
class PriceSeriesNormalizer {
public:
    explicit PriceSeriesNormalizer(const SystemConfig& config);

    // Throws DataUnavailableError when OHLC columns are missing or too few bars survive cleaning.
    PriceSeries normalize(const RawPriceTable& raw_table) const;

    // Index of the first column matching one of the aliases, or -1.
    static int resolve_column_index(const std::vector<std::string>& column_names, const std::vector<std::string>& aliases);
    static bool is_iso_date(const std::string& date_string);

    // Bars with a NaN adjusted close take the adjusted-to-close ratio of the nearest earlier bar that
    // has one (the first known ratio for leading bars). With no adjusted values at all, adjusted close = close.
    static void fill_missing_adjusted_closes(std::vector<PriceBar>& price_bars);

private:
    const SystemConfig& config;

    static std::string canonical_column_name(const std::string& column_name);
};

} // namespace Core
} // namespace CanslimScanner

#endif // PRICE_SERIES_NORMALIZER_HPP
