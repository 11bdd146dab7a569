// =============================================================================
// CSV Price Data Provider Unit Tests
// Offline history files, column layout and lookback trimming
// =============================================================================

#include <gtest/gtest.h>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "api/csv/csv_price_data_provider.hpp"
#include "scanner/data/price_series_normalizer.hpp"
#include "test_helpers.hpp"

using CanslimScanner::API::CsvPriceDataProvider;
using CanslimScanner::Core::DataUnavailableError;
using CanslimScanner::Core::PriceSeries;
using CanslimScanner::Core::PriceSeriesNormalizer;
using CanslimScanner::Core::RawPriceTable;

namespace {

const char* TEN_DAY_CSV =
    "Date,Open,High,Low,Close,Volume\n"
    "2024-01-01,10,11,9,10.5,1000\n"
    "2024-01-02,10,11,9,10.6,1000\n"
    "2024-01-03,10,11,9,10.7,1000\n"
    "2024-01-04,10,11,9,10.8,1000\n"
    "2024-01-05,10,11,9,10.9,1000\n"
    "2024-01-06,10,11,9,11.0,1000\n"
    "2024-01-07,10,11,9,11.1,1000\n"
    "2024-01-08,10,11,9,11.2,1000\n"
    "2024-01-09,10,11,9,11.3,1000\n"
    "2024-01-10,10,11,9,11.4,1000\n";

class CsvPriceDataProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_directory = std::filesystem::temp_directory_path() /
                         ("canslim_csv_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(temp_directory);
        std::filesystem::create_directories(temp_directory);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_directory);
    }

    void write_price_file(const std::string& symbol, const std::string& content) {
        std::ofstream file_stream(temp_directory / (symbol + ".csv"));
        file_stream << content;
    }

    std::filesystem::path temp_directory;
};

} // namespace

// -----------------------------------------------------------------------------
// ParsePriceCsv_DateColumnAnywhere_ExcludedFromValues
// -----------------------------------------------------------------------------
TEST_F(CsvPriceDataProviderTest, ParsePriceCsv_DateColumnAnywhere_ExcludedFromValues) {
    RawPriceTable raw_table = CsvPriceDataProvider::parse_price_csv("AAPL",
        "Close,Volume,date,Adj Close\n"
        "185.64,82488700,2024-01-02,184.73\n"
        "184.25,58414500,2024-01-03,183.35\n",
        0);

    EXPECT_EQ(raw_table.symbol, "AAPL");
    EXPECT_EQ(raw_table.column_names, std::vector<std::string>({"Close", "Volume", "Adj Close"}));
    EXPECT_EQ(raw_table.dates, std::vector<std::string>({"2024-01-02", "2024-01-03"}));
    ASSERT_EQ(raw_table.rows.size(), 2u);
    EXPECT_DOUBLE_EQ(raw_table.rows[1][0], 184.25);
    EXPECT_DOUBLE_EQ(raw_table.rows[1][2], 183.35);
}

// -----------------------------------------------------------------------------
// ParsePriceCsv_NonNumericAndMissingCells_BecomeNaN
// -----------------------------------------------------------------------------
TEST_F(CsvPriceDataProviderTest, ParsePriceCsv_NonNumericAndMissingCells_BecomeNaN) {
    RawPriceTable raw_table = CsvPriceDataProvider::parse_price_csv("AAPL",
        "Date,Close,Volume\r\n"
        "2024-01-02,null,1000\r\n"
        "\r\n"
        "2024-01-03,12.5x,\r\n"
        "2024-01-04,13.0\r\n",
        0);

    ASSERT_EQ(raw_table.rows.size(), 3u);
    EXPECT_TRUE(std::isnan(raw_table.rows[0][0]));
    EXPECT_DOUBLE_EQ(raw_table.rows[0][1], 1000.0);
    EXPECT_TRUE(std::isnan(raw_table.rows[1][0]));
    EXPECT_TRUE(std::isnan(raw_table.rows[1][1]));
    EXPECT_DOUBLE_EQ(raw_table.rows[2][0], 13.0);
    EXPECT_TRUE(std::isnan(raw_table.rows[2][1]));
}

// -----------------------------------------------------------------------------
// ParsePriceCsv_Lookback_MeasuredFromLatestDate
// -----------------------------------------------------------------------------
TEST_F(CsvPriceDataProviderTest, ParsePriceCsv_Lookback_MeasuredFromLatestDate) {
    RawPriceTable trimmed_table = CsvPriceDataProvider::parse_price_csv("AAPL", TEN_DAY_CSV, 3);
    RawPriceTable full_table = CsvPriceDataProvider::parse_price_csv("AAPL", TEN_DAY_CSV, 0);

    EXPECT_EQ(trimmed_table.dates, std::vector<std::string>({"2024-01-07", "2024-01-08", "2024-01-09", "2024-01-10"}));
    EXPECT_EQ(full_table.dates.size(), 10u);
}

// -----------------------------------------------------------------------------
// ParsePriceCsv_EmptyContent_ThrowsDataUnavailable
// -----------------------------------------------------------------------------
TEST_F(CsvPriceDataProviderTest, ParsePriceCsv_EmptyContent_ThrowsDataUnavailable) {
    EXPECT_THROW(CsvPriceDataProvider::parse_price_csv("AAPL", "", 400), DataUnavailableError);
}

// -----------------------------------------------------------------------------
// GetHistory_MissingFile_ThrowsDataUnavailable
// -----------------------------------------------------------------------------
TEST_F(CsvPriceDataProviderTest, GetHistory_MissingFile_ThrowsDataUnavailable) {
    CsvPriceDataProvider price_provider(temp_directory.string());

    EXPECT_THROW(price_provider.get_history("NOPE", 400), DataUnavailableError);
}

// -----------------------------------------------------------------------------
// GetHistory_FileThroughNormalizer_ProducesSeries
// -----------------------------------------------------------------------------
TEST_F(CsvPriceDataProviderTest, GetHistory_FileThroughNormalizer_ProducesSeries) {
    std::vector<std::string> dates = TestHelpers::make_dates(250);
    std::ostringstream csv_content;
    csv_content << "Date,Open,High,Low,Close,Adj Close,Volume\n";
    for (size_t bar_index = 0; bar_index < dates.size(); ++bar_index) {
        double close_price = 50.0 + static_cast<double>(bar_index) * 0.1;
        csv_content << dates[bar_index] << "," << close_price << "," << close_price + 1.0 << ","
                    << close_price - 1.0 << "," << close_price << "," << close_price << ",250000\n";
    }
    write_price_file("MSFT", csv_content.str());
    CsvPriceDataProvider price_provider(temp_directory.string());
    CanslimScanner::Config::SystemConfig config;

    RawPriceTable raw_table = price_provider.get_history("MSFT", 0);
    PriceSeries price_series = PriceSeriesNormalizer(config).normalize(raw_table);

    EXPECT_EQ(price_provider.get_provider_name(), "csv");
    ASSERT_EQ(price_series.size(), 250u);
    EXPECT_EQ(price_series.symbol, "MSFT");
    EXPECT_TRUE(price_series.has_volume);
    EXPECT_TRUE(price_series.has_adjusted_close);
    EXPECT_EQ(price_series.bars.front().date, dates.front());
    EXPECT_NEAR(price_series.bars.back().close_price, 74.9, 1e-9);
}
