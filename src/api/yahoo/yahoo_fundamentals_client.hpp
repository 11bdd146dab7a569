#ifndef YAHOO_FUNDAMENTALS_CLIENT_HPP
#define YAHOO_FUNDAMENTALS_CLIENT_HPP

#include "api/general/fundamentals_provider_interface.hpp"
#include "api/general/http_client_interface.hpp"
#include "configs/data_source_config.hpp"
#include <string>
#include <vector>

namespace CanslimScanner {
namespace API {

/**
 * Fundamentals from the Yahoo quoteSummary endpoint.
 * Reads financialData, defaultKeyStatistics, summaryDetail, price and earnings modules.
 * Fields missing from the payload stay empty in the returned record.
 */
class YahooFundamentalsClient : public FundamentalsProviderInterface {
public:
    YahooFundamentalsClient(const Config::DataSourceConfig& data_source_config, HttpClientPtr http_client);

    Core::Fundamentals get_fundamentals(const std::string& symbol) const override;
    std::string get_provider_name() const override { return "yahoo"; }

    static Core::Fundamentals parse_quote_summary_response(const std::string& symbol, const std::string& response_body);

    // Year-over-year growth for consecutive annual values (oldest first), most recent growth first.
    // Pairs with a zero prior value are skipped.
    static std::vector<double> annual_growth_from_yearly_values(const std::vector<double>& yearly_values);

private:
    const Config::DataSourceConfig& config;
    HttpClientPtr http_client;
};

} // namespace API
} // namespace CanslimScanner

#endif // YAHOO_FUNDAMENTALS_CLIENT_HPP
