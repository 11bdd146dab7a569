#ifndef CSV_PRICE_DATA_PROVIDER_HPP
#define CSV_PRICE_DATA_PROVIDER_HPP

#include "api/general/price_data_provider_interface.hpp"
#include <string>

namespace CanslimScanner {
namespace API {

/**
 * Offline price source reading <directory>/<SYMBOL>.csv.
 * The header row names the columns; the "date" column (or the first column) holds YYYY-MM-DD.
 * The lookback window is measured back from the latest date in the file.
 */
class CsvPriceDataProvider : public PriceDataProviderInterface {
public:
    explicit CsvPriceDataProvider(const std::string& price_data_directory);

    Core::RawPriceTable get_history(const std::string& symbol, int lookback_days) const override;
    std::string get_provider_name() const override { return "csv"; }

    // Parses CSV text already in memory. lookback_days <= 0 keeps every row.
    static Core::RawPriceTable parse_price_csv(const std::string& symbol, const std::string& csv_content, int lookback_days);

private:
    std::string directory;
};

} // namespace API
} // namespace CanslimScanner

#endif // CSV_PRICE_DATA_PROVIDER_HPP
