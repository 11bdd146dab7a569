#ifndef CANSLIM_TEST_HELPERS_HPP
#define CANSLIM_TEST_HELPERS_HPP

#include <atomic>
#include <cmath>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "api/general/fundamentals_provider_interface.hpp"
#include "api/general/http_client_interface.hpp"
#include "api/general/price_data_provider_interface.hpp"
#include "scanner/data_structures/data_structures.hpp"
#include "scanner/errors/scan_errors.hpp"
#include "utils/time_utils.hpp"

namespace TestHelpers {

using CanslimScanner::Core::PriceBar;
using CanslimScanner::Core::PriceSeries;
using CanslimScanner::Core::RawPriceTable;

// Consecutive calendar dates starting at start_date.
inline std::vector<std::string> make_dates(size_t count, const std::string& start_date = "2023-01-02") {
    std::vector<std::string> dates;
    dates.reserve(count);
    for (size_t day_index = 0; day_index < count; ++day_index) {
        dates.push_back(TimeUtils::add_calendar_days(start_date, static_cast<long long>(day_index)));
    }
    return dates;
}

// Closes compounding at daily_growth per bar.
inline std::vector<double> geometric_closes(size_t count, double start_price, double daily_growth) {
    std::vector<double> closes;
    closes.reserve(count);
    double price = start_price;
    for (size_t bar_index = 0; bar_index < count; ++bar_index) {
        closes.push_back(price);
        price *= (1.0 + daily_growth);
    }
    return closes;
}

// Bars with open at the close, high and low 1% either side, constant volume.
inline PriceSeries make_series(const std::string& symbol, const std::vector<double>& closes, double volume = 1000000.0) {
    PriceSeries price_series;
    price_series.symbol = symbol;
    price_series.has_volume = volume > 0.0;
    price_series.has_adjusted_close = true;
    std::vector<std::string> dates = make_dates(closes.size());
    for (size_t bar_index = 0; bar_index < closes.size(); ++bar_index) {
        PriceBar price_bar;
        price_bar.date = dates[bar_index];
        price_bar.open_price = closes[bar_index];
        price_bar.high_price = closes[bar_index] * 1.01;
        price_bar.low_price = closes[bar_index] * 0.99;
        price_bar.close_price = closes[bar_index];
        price_bar.volume = volume;
        price_bar.adjusted_close = closes[bar_index];
        price_series.bars.push_back(price_bar);
    }
    return price_series;
}

inline RawPriceTable make_raw_table(const PriceSeries& price_series) {
    RawPriceTable raw_table;
    raw_table.symbol = price_series.symbol;
    raw_table.column_names = {"Open", "High", "Low", "Close", "Volume", "Adj Close"};
    for (const PriceBar& price_bar : price_series.bars) {
        raw_table.dates.push_back(price_bar.date);
        raw_table.rows.push_back({price_bar.open_price, price_bar.high_price, price_bar.low_price,
                                  price_bar.close_price, price_bar.volume, price_bar.adjusted_close});
    }
    return raw_table;
}

class FakePriceDataProvider : public CanslimScanner::API::PriceDataProviderInterface {
public:
    void add_series(const PriceSeries& price_series) { tables[price_series.symbol] = make_raw_table(price_series); }
    void add_table(const RawPriceTable& raw_table) { tables[raw_table.symbol] = raw_table; }
    void fail_symbol(const std::string& symbol) { failing_symbols.insert(symbol); }

    RawPriceTable get_history(const std::string& symbol, int) const override {
        if (failing_symbols.count(symbol) > 0) {
            throw CanslimScanner::Core::DataUnavailableError(symbol + ": simulated provider failure");
        }
        auto table_iterator = tables.find(symbol);
        if (table_iterator == tables.end()) {
            throw CanslimScanner::Core::DataUnavailableError(symbol + ": no history");
        }
        return table_iterator->second;
    }

    std::string get_provider_name() const override { return "fake"; }

private:
    std::map<std::string, RawPriceTable> tables;
    std::set<std::string> failing_symbols;
};

class FakeFundamentalsProvider : public CanslimScanner::API::FundamentalsProviderInterface {
public:
    void set_fundamentals(const std::string& symbol, const CanslimScanner::Core::Fundamentals& fundamentals) {
        records[symbol] = fundamentals;
    }
    void fail_symbol(const std::string& symbol) { failing_symbols.insert(symbol); }

    CanslimScanner::Core::Fundamentals get_fundamentals(const std::string& symbol) const override {
        if (failing_symbols.count(symbol) > 0) {
            throw CanslimScanner::Core::DataUnavailableError(symbol + ": simulated fundamentals failure");
        }
        auto record_iterator = records.find(symbol);
        return record_iterator == records.end() ? CanslimScanner::Core::Fundamentals() : record_iterator->second;
    }

    std::string get_provider_name() const override { return "fake"; }

private:
    std::map<std::string, CanslimScanner::Core::Fundamentals> records;
    std::set<std::string> failing_symbols;
};

// Serves canned bodies by URL and counts requests.
class FakeHttpClient : public CanslimScanner::API::HttpClientInterface {
public:
    void set_response(const std::string& url, const std::string& body) { responses[url] = body; }
    void set_failing(bool should_fail) { failing = should_fail; }
    int get_call_count() const { return call_count.load(); }

    std::string get(const CanslimScanner::API::HttpRequest& http_request) const override {
        call_count++;
        if (failing) {
            throw std::runtime_error("simulated network failure for " + http_request.url);
        }
        auto response_iterator = responses.find(http_request.url);
        if (response_iterator == responses.end()) {
            throw std::runtime_error("HTTP 404 for " + http_request.url);
        }
        return response_iterator->second;
    }

private:
    std::map<std::string, std::string> responses;
    bool failing = false;
    mutable std::atomic<int> call_count{0};
};

} // namespace TestHelpers

#endif // CANSLIM_TEST_HELPERS_HPP
