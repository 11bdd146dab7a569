#ifndef INDEX_TICKER_FETCHER_HPP
#define INDEX_TICKER_FETCHER_HPP

#include "api/general/ticker_universe_interface.hpp"
#include "api/general/http_client_interface.hpp"
#include "api/universe/ticker_cache.hpp"
#include "configs/data_source_config.hpp"
#include <string>
#include <vector>

namespace CanslimScanner {
namespace API {

/**
 * Resolves universe selectors to symbols.
 * Index constituents come from holdings CSV downloads cached per index for the configured TTL.
 * A failed download falls back to the cached list whatever its age.
 */
class IndexTickerFetcher : public TickerUniverseInterface {
public:
    IndexTickerFetcher(const Config::DataSourceConfig& data_source_config, HttpClientPtr http_client, TickerCachePtr ticker_cache);

    std::vector<std::string> get_universe(const Config::UniverseSelection& selection) override;

    // Tickers for one index ("sp500", "nasdaq100", "russell2000"). Throws Core::DataUnavailableError
    // when neither a download nor a cached entry is available.
    std::vector<std::string> get_index_tickers(const std::string& index_key);

    // Locates the header row and ticker column, keeps equity rows, maps '.' to '-'.
    // Throws Core::DataUnavailableError when no ticker column exists.
    static std::vector<std::string> parse_index_csv(const std::string& csv_content);
    // Comma, whitespace or newline separated symbols; '#' starts a comment line.
    static std::vector<std::string> parse_symbol_list(const std::string& symbol_list);
    static std::string normalize_symbol(const std::string& raw_symbol);

private:
    const Config::DataSourceConfig& config;
    HttpClientPtr http_client;
    TickerCachePtr cache;

    std::string get_index_url(const std::string& index_key) const;
    std::vector<std::string> read_symbol_file(const std::string& file_path) const;
};

} // namespace API
} // namespace CanslimScanner

#endif // INDEX_TICKER_FETCHER_HPP
