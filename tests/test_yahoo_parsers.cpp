// =============================================================================
// Yahoo Client Unit Tests
// Chart and quoteSummary payload parsing, request URLs and error mapping
// =============================================================================

#include <gtest/gtest.h>
#include <cmath>
#include <memory>
#include "api/yahoo/yahoo_fundamentals_client.hpp"
#include "api/yahoo/yahoo_price_client.hpp"
#include "test_helpers.hpp"

using CanslimScanner::API::YahooFundamentalsClient;
using CanslimScanner::API::YahooPriceClient;
using CanslimScanner::Config::DataSourceConfig;
using CanslimScanner::Core::DataUnavailableError;
using CanslimScanner::Core::Fundamentals;
using CanslimScanner::Core::RawPriceTable;

namespace {

const char* CHART_RESPONSE = R"({
  "chart": {
    "result": [{
      "meta": {"symbol": "AAPL", "gmtoffset": -18000},
      "timestamp": [1704205800, 1704292200, 1704378600],
      "indicators": {
        "quote": [{
          "open":   [187.15, 184.22, 182.15],
          "high":   [188.44, 185.88, 183.09],
          "low":    [183.89, 183.43, 180.88],
          "close":  [185.64, 184.25, null],
          "volume": [82488700, 58414500, 71983600]
        }],
        "adjclose": [{"adjclose": [184.73, 183.35, null]}]
      }
    }],
    "error": null
  }
})";

const char* QUOTE_SUMMARY_RESPONSE = R"({
  "quoteSummary": {
    "result": [{
      "financialData": {
        "earningsGrowth": {"raw": 0.32, "fmt": "32.00%"},
        "revenueGrowth": {"raw": 0.21, "fmt": "21.00%"},
        "returnOnEquity": {"raw": 0.45, "fmt": "45.00%"}
      },
      "defaultKeyStatistics": {
        "heldPercentInstitutions": {"raw": 0.62},
        "sharesOutstanding": {"raw": 15000000000}
      },
      "summaryDetail": {
        "averageVolume": {"raw": 55000000},
        "marketCap": {"raw": 1}
      },
      "price": {"marketCap": {"raw": 3000000000000}},
      "earnings": {
        "financialsChart": {
          "yearly": [
            {"date": 2021, "earnings": {"raw": 100}},
            {"date": 2022, "earnings": {"raw": 120}},
            {"date": 2023, "earnings": {"raw": 150}}
          ]
        }
      }
    }],
    "error": null
  }
})";

} // namespace

// -----------------------------------------------------------------------------
// ParseChartResponse_ValidPayload_BuildsTable
// -----------------------------------------------------------------------------
TEST(YahooParsersTest, ParseChartResponse_ValidPayload_BuildsTable) {
    RawPriceTable raw_table = YahooPriceClient::parse_chart_response("AAPL", CHART_RESPONSE);

    EXPECT_EQ(raw_table.symbol, "AAPL");
    ASSERT_EQ(raw_table.column_names.size(), 6u);
    EXPECT_EQ(raw_table.column_names[3], "close");
    EXPECT_EQ(raw_table.column_names[5], "adjclose");

    ASSERT_EQ(raw_table.dates.size(), 3u);
    EXPECT_EQ(raw_table.dates[0], "2024-01-02");
    EXPECT_EQ(raw_table.dates[2], "2024-01-04");

    ASSERT_EQ(raw_table.rows.size(), 3u);
    EXPECT_DOUBLE_EQ(raw_table.rows[0][3], 185.64);
    EXPECT_DOUBLE_EQ(raw_table.rows[1][4], 58414500.0);
    EXPECT_DOUBLE_EQ(raw_table.rows[1][5], 183.35);
}

// -----------------------------------------------------------------------------
// ParseChartResponse_NullValues_BecomeNaN
// -----------------------------------------------------------------------------
TEST(YahooParsersTest, ParseChartResponse_NullValues_BecomeNaN) {
    RawPriceTable raw_table = YahooPriceClient::parse_chart_response("AAPL", CHART_RESPONSE);

    ASSERT_EQ(raw_table.rows.size(), 3u);
    EXPECT_TRUE(std::isnan(raw_table.rows[2][3]));
    EXPECT_TRUE(std::isnan(raw_table.rows[2][5]));
    EXPECT_DOUBLE_EQ(raw_table.rows[2][0], 182.15);
}

// -----------------------------------------------------------------------------
// ParseChartResponse_ApiError_ThrowsDataUnavailable
// -----------------------------------------------------------------------------
TEST(YahooParsersTest, ParseChartResponse_ApiError_ThrowsDataUnavailable) {
    const std::string error_response =
        R"({"chart": {"result": null, "error": {"code": "Not Found", "description": "No data found, symbol may be delisted"}}})";

    EXPECT_THROW(YahooPriceClient::parse_chart_response("GONE", error_response), DataUnavailableError);
}

// -----------------------------------------------------------------------------
// ParseChartResponse_MalformedPayloads_ThrowDataUnavailable
// -----------------------------------------------------------------------------
TEST(YahooParsersTest, ParseChartResponse_MalformedPayloads_ThrowDataUnavailable) {
    EXPECT_THROW(YahooPriceClient::parse_chart_response("AAPL", "<html>rate limited</html>"), DataUnavailableError);
    EXPECT_THROW(YahooPriceClient::parse_chart_response("AAPL", R"({"chart": {"result": [], "error": null}})"),
                 DataUnavailableError);
    EXPECT_THROW(YahooPriceClient::parse_chart_response("AAPL",
                     R"({"chart": {"result": [{"indicators": {"quote": [{}]}}], "error": null}})"),
                 DataUnavailableError);
    EXPECT_THROW(YahooPriceClient::parse_chart_response("AAPL",
                     R"({"chart": {"result": [{"timestamp": [1704205800], "indicators": {}}], "error": null}})"),
                 DataUnavailableError);
}

// -----------------------------------------------------------------------------
// BuildHistoryUrl_SubstitutesSymbolAndRange
// -----------------------------------------------------------------------------
TEST(YahooParsersTest, BuildHistoryUrl_SubstitutesSymbolAndRange) {
    DataSourceConfig config;
    YahooPriceClient price_client(config, std::make_shared<TestHelpers::FakeHttpClient>());

    std::string history_url = price_client.build_history_url("BRK-B", 400);

    EXPECT_EQ(history_url.find("https://query1.finance.yahoo.com/v8/finance/chart/BRK-B?period1="), 0u);
    EXPECT_NE(history_url.find("&interval=1d&includeAdjustedClose=true"), std::string::npos);
}

// -----------------------------------------------------------------------------
// GetHistory_HttpFailure_ThrowsDataUnavailable
// -----------------------------------------------------------------------------
TEST(YahooParsersTest, GetHistory_HttpFailure_ThrowsDataUnavailable) {
    DataSourceConfig config;
    auto http_client = std::make_shared<TestHelpers::FakeHttpClient>();
    http_client->set_failing(true);
    YahooPriceClient price_client(config, http_client);

    EXPECT_THROW(price_client.get_history("AAPL", 400), DataUnavailableError);
    EXPECT_GE(http_client->get_call_count(), 1);
}

// -----------------------------------------------------------------------------
// ParseQuoteSummaryResponse_ValidPayload_ExtractsFields
// -----------------------------------------------------------------------------
TEST(YahooParsersTest, ParseQuoteSummaryResponse_ValidPayload_ExtractsFields) {
    Fundamentals fundamentals = YahooFundamentalsClient::parse_quote_summary_response("AAPL", QUOTE_SUMMARY_RESPONSE);

    ASSERT_TRUE(fundamentals.quarterly_eps_growth.has_value());
    EXPECT_DOUBLE_EQ(*fundamentals.quarterly_eps_growth, 0.32);
    EXPECT_DOUBLE_EQ(*fundamentals.revenue_growth, 0.21);
    EXPECT_DOUBLE_EQ(*fundamentals.return_on_equity, 0.45);
    EXPECT_DOUBLE_EQ(*fundamentals.institutional_ownership_pct, 0.62);
    EXPECT_DOUBLE_EQ(*fundamentals.shares_outstanding, 15000000000.0);
    EXPECT_DOUBLE_EQ(*fundamentals.avg_volume_50d, 55000000.0);
    EXPECT_DOUBLE_EQ(*fundamentals.market_cap, 3000000000000.0);

    ASSERT_EQ(fundamentals.annual_eps_growth_history.size(), 2u);
    EXPECT_NEAR(fundamentals.annual_eps_growth_history[0], 0.25, 1e-12);
    EXPECT_NEAR(fundamentals.annual_eps_growth_history[1], 0.20, 1e-12);
    ASSERT_TRUE(fundamentals.annual_eps_growth.has_value());
    EXPECT_NEAR(*fundamentals.annual_eps_growth, 0.25, 1e-12);
}

// -----------------------------------------------------------------------------
// ParseQuoteSummaryResponse_SparsePayload_LeavesFieldsEmpty
// -----------------------------------------------------------------------------
TEST(YahooParsersTest, ParseQuoteSummaryResponse_SparsePayload_LeavesFieldsEmpty) {
    const std::string sparse_response = R"({
      "quoteSummary": {
        "result": [{
          "financialData": {"earningsGrowth": {}, "revenueGrowth": 0.08},
          "summaryDetail": {"marketCap": {"raw": 2500000000}}
        }],
        "error": null
      }
    })";

    Fundamentals fundamentals = YahooFundamentalsClient::parse_quote_summary_response("MID", sparse_response);

    EXPECT_FALSE(fundamentals.quarterly_eps_growth.has_value());
    ASSERT_TRUE(fundamentals.revenue_growth.has_value());
    EXPECT_DOUBLE_EQ(*fundamentals.revenue_growth, 0.08);
    ASSERT_TRUE(fundamentals.market_cap.has_value());
    EXPECT_DOUBLE_EQ(*fundamentals.market_cap, 2500000000.0);
    EXPECT_FALSE(fundamentals.institutional_ownership_pct.has_value());
    EXPECT_FALSE(fundamentals.annual_eps_growth.has_value());
    EXPECT_TRUE(fundamentals.annual_eps_growth_history.empty());
}

// -----------------------------------------------------------------------------
// ParseQuoteSummaryResponse_ErrorOrEmpty_ThrowsDataUnavailable
// -----------------------------------------------------------------------------
TEST(YahooParsersTest, ParseQuoteSummaryResponse_ErrorOrEmpty_ThrowsDataUnavailable) {
    EXPECT_THROW(YahooFundamentalsClient::parse_quote_summary_response("GONE",
                     R"({"quoteSummary": {"result": null, "error": {"code": "Not Found", "description": "Quote not found"}}})"),
                 DataUnavailableError);
    EXPECT_THROW(YahooFundamentalsClient::parse_quote_summary_response("AAPL", R"({"quoteSummary": {"result": []}})"),
                 DataUnavailableError);
    EXPECT_THROW(YahooFundamentalsClient::parse_quote_summary_response("AAPL", "{not json"), DataUnavailableError);
}

// -----------------------------------------------------------------------------
// AnnualGrowthFromYearlyValues_MostRecentFirst_SkipsZeroBase
// -----------------------------------------------------------------------------
TEST(YahooParsersTest, AnnualGrowthFromYearlyValues_MostRecentFirst_SkipsZeroBase) {
    std::vector<double> growth_history = YahooFundamentalsClient::annual_growth_from_yearly_values({-50.0, 0.0, 40.0, 60.0});

    // 0 -> 40 has no base
    ASSERT_EQ(growth_history.size(), 2u);
    EXPECT_NEAR(growth_history[0], 0.5, 1e-12);
    EXPECT_NEAR(growth_history[1], 1.0, 1e-12);

    EXPECT_TRUE(YahooFundamentalsClient::annual_growth_from_yearly_values({}).empty());
    EXPECT_TRUE(YahooFundamentalsClient::annual_growth_from_yearly_values({10.0}).empty());
}

// -----------------------------------------------------------------------------
// GetFundamentals_RequestsQuoteSummaryModules
// -----------------------------------------------------------------------------
TEST(YahooParsersTest, GetFundamentals_RequestsQuoteSummaryModules) {
    DataSourceConfig config;
    auto http_client = std::make_shared<TestHelpers::FakeHttpClient>();
    http_client->set_response("https://query2.finance.yahoo.com/v10/finance/quoteSummary/AAPL"
                              "?modules=financialData,defaultKeyStatistics,summaryDetail,price,earnings",
                              QUOTE_SUMMARY_RESPONSE);
    YahooFundamentalsClient fundamentals_client(config, http_client);

    Fundamentals fundamentals = fundamentals_client.get_fundamentals("AAPL");

    EXPECT_EQ(http_client->get_call_count(), 1);
    ASSERT_TRUE(fundamentals.market_cap.has_value());
    EXPECT_DOUBLE_EQ(*fundamentals.market_cap, 3000000000000.0);
    EXPECT_THROW(fundamentals_client.get_fundamentals("MSFT"), DataUnavailableError);
}

// -----------------------------------------------------------------------------
// Constructors_NullHttpClient_Throw
// -----------------------------------------------------------------------------
TEST(YahooParsersTest, Constructors_NullHttpClient_Throw) {
    DataSourceConfig config;

    EXPECT_THROW(YahooPriceClient price_client(config, nullptr), std::runtime_error);
    EXPECT_THROW(YahooFundamentalsClient fundamentals_client(config, nullptr), std::runtime_error);
}
