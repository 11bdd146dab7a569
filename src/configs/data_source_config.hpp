#ifndef DATA_SOURCE_CONFIG_HPP
#define DATA_SOURCE_CONFIG_HPP

#include <string>

namespace CanslimScanner {
namespace Config {

struct DataSourceConfig {
    // Price and fundamentals providers
    std::string price_provider = "yahoo";            // yahoo or csv
    std::string price_data_directory = "data/prices"; // <SYMBOL>.csv files read by the csv provider
    std::string fundamentals_provider = "yahoo";     // yahoo or none
    std::string yahoo_chart_url = "https://query1.finance.yahoo.com/v8/finance/chart/{symbol}";
    std::string yahoo_quote_summary_url = "https://query2.finance.yahoo.com/v10/finance/quoteSummary/{symbol}";
    std::string user_agent = "Mozilla/5.0 (X11; Linux x86_64) canslim-scanner";

    // HTTP behaviour
    int http_timeout_seconds = 20;
    int http_retries = 3;
    int http_retry_delay_ms = 500;
    bool enable_ssl_verification = true;

    // Ticker universe
    std::string sp500_constituents_url = "https://www.ishares.com/us/products/239726/ishares-core-sp-500-etf/1467271812596.ajax?fileType=csv&fileName=IVV_holdings&dataType=fund";
    std::string nasdaq100_constituents_url = "https://www.invesco.com/us/financial-products/etfs/holdings/main/holdings/0?audienceType=Investor&action=download&ticker=QQQ";
    std::string russell2000_constituents_url = "https://www.ishares.com/us/products/239710/ishares-russell-2000-etf/1467271812596.ajax?fileType=csv&fileName=IWM_holdings&dataType=fund";
    std::string universe_cache_file = "cache/ticker_universe.json";
    int universe_cache_ttl_hours = 24;

    // Result export
    std::string export_directory = "exports";
    bool export_enabled = true;
};

} // namespace Config
} // namespace CanslimScanner

#endif // DATA_SOURCE_CONFIG_HPP
