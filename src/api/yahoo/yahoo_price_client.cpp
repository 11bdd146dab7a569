#include "yahoo_price_client.hpp"
#include "scanner/errors/scan_errors.hpp"
#include "utils/http_utils.hpp"
#include "utils/time_utils.hpp"
#include <nlohmann/json.hpp>
#include <limits>

using json = nlohmann::json;

namespace CanslimScanner {
namespace API {

namespace {
    const double NOT_A_NUMBER = std::numeric_limits<double>::quiet_NaN();

    double number_or_nan(const json& values_array, size_t value_index) {
        if (!values_array.is_array() || value_index >= values_array.size()) return NOT_A_NUMBER;
        const json& value_json = values_array[value_index];
        return value_json.is_number() ? value_json.get<double>() : NOT_A_NUMBER;
    }
}

YahooPriceClient::YahooPriceClient(const Config::DataSourceConfig& data_source_config, HttpClientPtr client)
    : config(data_source_config), http_client(std::move(client)) {
    if (!http_client) {
        throw std::runtime_error("YahooPriceClient requires an HTTP client");
    }
}

std::string YahooPriceClient::build_history_url(const std::string& symbol, int lookback_days) const {
    const long long period_end = TimeUtils::get_current_epoch_seconds();
    const long long period_start = period_end - static_cast<long long>(lookback_days) * TimeUtils::SECONDS_PER_DAY;
    return replace_url_placeholder(config.yahoo_chart_url, symbol) +
           "?period1=" + std::to_string(period_start) +
           "&period2=" + std::to_string(period_end) +
           "&interval=1d&includeAdjustedClose=true";
}

Core::RawPriceTable YahooPriceClient::get_history(const std::string& symbol, int lookback_days) const {
    if (symbol.empty()) {
        throw Core::DataUnavailableError("Symbol is required for price history request");
    }

    HttpRequest http_request(build_history_url(symbol, lookback_days), config.http_retries, config.http_timeout_seconds,
                             config.http_retry_delay_ms, config.enable_ssl_verification);
    http_request.user_agent = config.user_agent;

    std::string response_body;
    try {
        response_body = http_client->get(http_request);
    } catch (const std::runtime_error& http_error) {
        throw Core::DataUnavailableError(symbol + ": price history request failed: " + http_error.what());
    }
    return parse_chart_response(symbol, response_body);
}

Core::RawPriceTable YahooPriceClient::parse_chart_response(const std::string& symbol, const std::string& response_body) {
    Core::RawPriceTable raw_table;
    raw_table.symbol = symbol;
    raw_table.column_names = {"open", "high", "low", "close", "volume", "adjclose"};

    try {
        json response_json = json::parse(response_body);

        if (!response_json.contains("chart") || !response_json["chart"].is_object()) {
            throw Core::DataUnavailableError(symbol + ": invalid response format from Yahoo chart API");
        }
        const json& chart_json = response_json["chart"];
        if (chart_json.contains("error") && !chart_json["error"].is_null()) {
            std::string error_description = chart_json["error"].value("description", std::string("unknown error"));
            throw Core::DataUnavailableError(symbol + ": Yahoo chart API error: " + error_description);
        }
        if (!chart_json.contains("result") || !chart_json["result"].is_array() || chart_json["result"].empty()) {
            throw Core::DataUnavailableError(symbol + ": Yahoo chart API returned no result");
        }

        const json& result_json = chart_json["result"][0];
        if (!result_json.contains("timestamp") || !result_json["timestamp"].is_array()) {
            throw Core::DataUnavailableError(symbol + ": Yahoo chart result has no timestamps");
        }
        if (!result_json.contains("indicators") || !result_json["indicators"].contains("quote") ||
            !result_json["indicators"]["quote"].is_array() || result_json["indicators"]["quote"].empty()) {
            throw Core::DataUnavailableError(symbol + ": Yahoo chart result has no quote data");
        }

        long long gmt_offset_seconds = 0;
        if (result_json.contains("meta") && result_json["meta"].contains("gmtoffset") &&
            result_json["meta"]["gmtoffset"].is_number_integer()) {
            gmt_offset_seconds = result_json["meta"]["gmtoffset"].get<long long>();
        }

        const json& timestamps_json = result_json["timestamp"];
        const json& quote_json = result_json["indicators"]["quote"][0];
        const json empty_array = json::array();
        const json& adjusted_close_json = (result_json["indicators"].contains("adjclose") &&
                                           result_json["indicators"]["adjclose"].is_array() &&
                                           !result_json["indicators"]["adjclose"].empty() &&
                                           result_json["indicators"]["adjclose"][0].contains("adjclose"))
                                              ? result_json["indicators"]["adjclose"][0]["adjclose"]
                                              : empty_array;
        const json& open_json = quote_json.contains("open") ? quote_json["open"] : empty_array;
        const json& high_json = quote_json.contains("high") ? quote_json["high"] : empty_array;
        const json& low_json = quote_json.contains("low") ? quote_json["low"] : empty_array;
        const json& close_json = quote_json.contains("close") ? quote_json["close"] : empty_array;
        const json& volume_json = quote_json.contains("volume") ? quote_json["volume"] : empty_array;

        raw_table.dates.reserve(timestamps_json.size());
        raw_table.rows.reserve(timestamps_json.size());
        for (size_t bar_index = 0; bar_index < timestamps_json.size(); ++bar_index) {
            if (!timestamps_json[bar_index].is_number()) continue;
            long long bar_epoch_seconds = timestamps_json[bar_index].get<long long>();
            raw_table.dates.push_back(TimeUtils::epoch_seconds_to_iso_date(bar_epoch_seconds, gmt_offset_seconds));
            raw_table.rows.push_back({
                number_or_nan(open_json, bar_index),
                number_or_nan(high_json, bar_index),
                number_or_nan(low_json, bar_index),
                number_or_nan(close_json, bar_index),
                number_or_nan(volume_json, bar_index),
                number_or_nan(adjusted_close_json, bar_index)
            });
        }
    } catch (const json::exception& json_error) {
        throw Core::DataUnavailableError(symbol + ": failed to parse Yahoo chart response: " + std::string(json_error.what()));
    }

    return raw_table;
}

} // namespace API
} // namespace CanslimScanner
