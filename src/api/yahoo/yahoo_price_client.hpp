#ifndef YAHOO_PRICE_CLIENT_HPP
#define YAHOO_PRICE_CLIENT_HPP

#include "api/general/price_data_provider_interface.hpp"
#include "api/general/http_client_interface.hpp"
#include "configs/data_source_config.hpp"
#include <string>

namespace CanslimScanner {
namespace API {

/**
 * Daily history from the Yahoo chart endpoint.
 * Produces columns open, high, low, close, volume and adjclose; JSON nulls become NaN.
 */
class YahooPriceClient : public PriceDataProviderInterface {
public:
    YahooPriceClient(const Config::DataSourceConfig& data_source_config, HttpClientPtr http_client);

    Core::RawPriceTable get_history(const std::string& symbol, int lookback_days) const override;
    std::string get_provider_name() const override { return "yahoo"; }

    std::string build_history_url(const std::string& symbol, int lookback_days) const;

    // Throws Core::DataUnavailableError when the payload is an error or lacks quote data.
    static Core::RawPriceTable parse_chart_response(const std::string& symbol, const std::string& response_body);

private:
    const Config::DataSourceConfig& config;
    HttpClientPtr http_client;
};

} // namespace API
} // namespace CanslimScanner

#endif // YAHOO_PRICE_CLIENT_HPP
