#ifndef TICKER_CACHE_HPP
#define TICKER_CACHE_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace CanslimScanner {
namespace API {

struct CachedTickerList {
    std::vector<std::string> tickers;
    long long fetched_at_epoch;

    CachedTickerList() : tickers(), fetched_at_epoch(0) {}
    CachedTickerList(std::vector<std::string> ticker_list, long long fetched_at)
        : tickers(std::move(ticker_list)), fetched_at_epoch(fetched_at) {}
};

// True while now_epoch is less than ttl_hours after fetched_at_epoch.
bool is_cache_fresh(long long fetched_at_epoch, long long now_epoch, int ttl_hours);

class TickerCacheInterface {
public:
    virtual ~TickerCacheInterface() = default;

    // Entry for a universe key regardless of age, or empty when never stored.
    virtual std::optional<CachedTickerList> load(const std::string& universe_key) const = 0;
    // Throws std::runtime_error when the entry cannot be persisted.
    virtual void store(const std::string& universe_key, const CachedTickerList& entry) = 0;
};

using TickerCachePtr = std::shared_ptr<TickerCacheInterface>;

/**
 * One JSON document holding every universe:
 * {"sp500": {"fetched_at": 1718000000, "tickers": ["AAPL", ...]}, ...}
 */
class JsonFileTickerCache : public TickerCacheInterface {
public:
    explicit JsonFileTickerCache(const std::string& cache_file_path);

    std::optional<CachedTickerList> load(const std::string& universe_key) const override;
    void store(const std::string& universe_key, const CachedTickerList& entry) override;

    const std::string& get_file_path() const { return file_path; }

private:
    std::string file_path;
};

} // namespace API
} // namespace CanslimScanner

#endif // TICKER_CACHE_HPP
