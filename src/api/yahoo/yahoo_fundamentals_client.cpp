#include "yahoo_fundamentals_client.hpp"
#include "scanner/errors/scan_errors.hpp"
#include "utils/http_utils.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <optional>

using json = nlohmann::json;

namespace CanslimScanner {
namespace API {

namespace {
    const char* QUOTE_SUMMARY_MODULES = "financialData,defaultKeyStatistics,summaryDetail,price,earnings";

    // Yahoo wraps numbers as {"raw": 0.12, "fmt": "12%"}; an empty object means not reported.
    std::optional<double> extract_raw_value(const json& module_json, const char* field_name) {
        if (!module_json.is_object() || !module_json.contains(field_name)) return std::nullopt;
        const json& field_json = module_json[field_name];
        if (field_json.is_number()) return field_json.get<double>();
        if (field_json.is_object() && field_json.contains("raw") && field_json["raw"].is_number()) {
            return field_json["raw"].get<double>();
        }
        return std::nullopt;
    }

    const json& module_or_empty(const json& result_json, const char* module_name, const json& empty_object) {
        if (result_json.contains(module_name) && result_json[module_name].is_object()) {
            return result_json[module_name];
        }
        return empty_object;
    }
}

YahooFundamentalsClient::YahooFundamentalsClient(const Config::DataSourceConfig& data_source_config, HttpClientPtr client)
    : config(data_source_config), http_client(std::move(client)) {
    if (!http_client) {
        throw std::runtime_error("YahooFundamentalsClient requires an HTTP client");
    }
}

Core::Fundamentals YahooFundamentalsClient::get_fundamentals(const std::string& symbol) const {
    std::string request_url = replace_url_placeholder(config.yahoo_quote_summary_url, symbol) +
                              "?modules=" + QUOTE_SUMMARY_MODULES;
    HttpRequest http_request(request_url, config.http_retries, config.http_timeout_seconds,
                             config.http_retry_delay_ms, config.enable_ssl_verification);
    http_request.user_agent = config.user_agent;

    std::string response_body;
    try {
        response_body = http_client->get(http_request);
    } catch (const std::runtime_error& http_error) {
        throw Core::DataUnavailableError(symbol + ": fundamentals request failed: " + http_error.what());
    }
    return parse_quote_summary_response(symbol, response_body);
}

std::vector<double> YahooFundamentalsClient::annual_growth_from_yearly_values(const std::vector<double>& yearly_values) {
    std::vector<double> growth_history;
    for (size_t year_index = yearly_values.size(); year_index-- > 1;) {
        const double previous_value = yearly_values[year_index - 1];
        if (previous_value == 0.0 || !std::isfinite(previous_value) || !std::isfinite(yearly_values[year_index])) continue;
        growth_history.push_back((yearly_values[year_index] - previous_value) / std::fabs(previous_value));
    }
    return growth_history;
}

Core::Fundamentals YahooFundamentalsClient::parse_quote_summary_response(const std::string& symbol, const std::string& response_body) {
    Core::Fundamentals fundamentals;

    try {
        json response_json = json::parse(response_body);

        if (!response_json.contains("quoteSummary") || !response_json["quoteSummary"].is_object()) {
            throw Core::DataUnavailableError(symbol + ": invalid response format from Yahoo quoteSummary API");
        }
        const json& summary_json = response_json["quoteSummary"];
        if (summary_json.contains("error") && !summary_json["error"].is_null()) {
            std::string error_description = summary_json["error"].value("description", std::string("unknown error"));
            throw Core::DataUnavailableError(symbol + ": Yahoo quoteSummary API error: " + error_description);
        }
        if (!summary_json.contains("result") || !summary_json["result"].is_array() || summary_json["result"].empty()) {
            throw Core::DataUnavailableError(symbol + ": Yahoo quoteSummary API returned no result");
        }

        const json& result_json = summary_json["result"][0];
        const json empty_object = json::object();
        const json& financial_data = module_or_empty(result_json, "financialData", empty_object);
        const json& key_statistics = module_or_empty(result_json, "defaultKeyStatistics", empty_object);
        const json& summary_detail = module_or_empty(result_json, "summaryDetail", empty_object);
        const json& price_module = module_or_empty(result_json, "price", empty_object);
        const json& earnings_module = module_or_empty(result_json, "earnings", empty_object);

        fundamentals.quarterly_eps_growth = extract_raw_value(financial_data, "earningsGrowth");
        fundamentals.revenue_growth = extract_raw_value(financial_data, "revenueGrowth");
        fundamentals.return_on_equity = extract_raw_value(financial_data, "returnOnEquity");
        fundamentals.institutional_ownership_pct = extract_raw_value(key_statistics, "heldPercentInstitutions");
        fundamentals.shares_outstanding = extract_raw_value(key_statistics, "sharesOutstanding");
        fundamentals.avg_volume_50d = extract_raw_value(summary_detail, "averageVolume");

        fundamentals.market_cap = extract_raw_value(price_module, "marketCap");
        if (!fundamentals.market_cap) {
            fundamentals.market_cap = extract_raw_value(summary_detail, "marketCap");
        }

        if (earnings_module.contains("financialsChart") && earnings_module["financialsChart"].contains("yearly") &&
            earnings_module["financialsChart"]["yearly"].is_array()) {
            std::vector<double> yearly_earnings;
            for (const json& year_json : earnings_module["financialsChart"]["yearly"]) {
                std::optional<double> year_earnings = extract_raw_value(year_json, "earnings");
                if (year_earnings) {
                    yearly_earnings.push_back(*year_earnings);
                }
            }
            fundamentals.annual_eps_growth_history = annual_growth_from_yearly_values(yearly_earnings);
            if (!fundamentals.annual_eps_growth_history.empty()) {
                fundamentals.annual_eps_growth = fundamentals.annual_eps_growth_history.front();
            }
        }
    } catch (const json::exception& json_error) {
        throw Core::DataUnavailableError(symbol + ": failed to parse Yahoo quoteSummary response: " + std::string(json_error.what()));
    }

    return fundamentals;
}

} // namespace API
} // namespace CanslimScanner
