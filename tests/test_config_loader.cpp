// =============================================================================
// Configuration Unit Tests
// CSV loading, key validation, cross-field rules and command line overrides
// =============================================================================

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "scanner/config_loader/config_loader.hpp"
#include "scanner/errors/scan_errors.hpp"
#include "system/system_manager.hpp"

using CanslimScanner::Config::SystemConfig;
using CanslimScanner::Core::ConfigurationError;

namespace {

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_directory = std::filesystem::temp_directory_path() /
                         ("canslim_config_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(temp_directory);
        std::filesystem::create_directories(temp_directory);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_directory);
    }

    std::string write_file(const std::string& file_name, const std::string& content) {
        std::filesystem::path file_path = temp_directory / file_name;
        std::ofstream file_stream(file_path);
        file_stream << content;
        return file_path.string();
    }

    std::filesystem::path temp_directory;
};

} // namespace

// -----------------------------------------------------------------------------
// DefaultConfig_PassesValidation
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, DefaultConfig_PassesValidation) {
    SystemConfig config;
    std::string error_message;

    EXPECT_TRUE(validate_config(config, error_message)) << error_message;
    EXPECT_NEAR(config.canslim.weights.sum(), 1.0, 1e-9);
}

// -----------------------------------------------------------------------------
// ShippedConfigDirectory_LoadsAndValidates
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, ShippedConfigDirectory_LoadsAndValidates) {
    SystemConfig config;

    EXPECT_NO_THROW(load_system_config(config, std::string(CANSLIM_SOURCE_DIR) + "/config"));
    EXPECT_EQ(config.screening.benchmark_symbol, "SPY");
    EXPECT_DOUBLE_EQ(config.screening.minimum_canslim_score, 70.0);
}

// -----------------------------------------------------------------------------
// LoadConfigFromCsv_CommentsAndWhitespace_AppliesValues
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, LoadConfigFromCsv_CommentsAndWhitespace_AppliesValues) {
    SystemConfig config;
    std::string csv_path = write_file("scanner_config.csv",
                                      "# thresholds\n"
                                      "\n"
                                      "screening.minimum_rs_score , 12.5\n"
                                      "screening.max_workers,8\n"
                                      "screening.universe,list:AAPL,MSFT\n"
                                      "logging.debug,yes\n");

    ASSERT_TRUE(load_config_from_csv(config, csv_path));

    EXPECT_DOUBLE_EQ(config.screening.minimum_rs_score, 12.5);
    EXPECT_EQ(config.screening.max_workers, 8);
    EXPECT_EQ(config.screening.universe, "list:AAPL,MSFT");
    EXPECT_TRUE(config.logging.debug);
}

// -----------------------------------------------------------------------------
// LoadConfigFromCsv_MissingFile_ReturnsFalse
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, LoadConfigFromCsv_MissingFile_ReturnsFalse) {
    SystemConfig config;

    EXPECT_FALSE(load_config_from_csv(config, (temp_directory / "absent.csv").string()));
}

// -----------------------------------------------------------------------------
// LoadConfigFromCsv_UnknownKey_ThrowsConfigurationError
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, LoadConfigFromCsv_UnknownKey_ThrowsConfigurationError) {
    SystemConfig config;
    std::string csv_path = write_file("bad.csv", "screening.minimum_rs_scor,5\n");

    EXPECT_THROW(load_config_from_csv(config, csv_path), ConfigurationError);
}

// -----------------------------------------------------------------------------
// ApplyConfigValue_UnparsableValues_ThrowConfigurationError
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, ApplyConfigValue_UnparsableValues_ThrowConfigurationError) {
    SystemConfig config;

    EXPECT_THROW(apply_config_value(config, "screening.max_workers", "three"), ConfigurationError);
    EXPECT_THROW(apply_config_value(config, "screening.max_workers", "3.5"), ConfigurationError);
    EXPECT_THROW(apply_config_value(config, "weights.c", "abc"), ConfigurationError);
    EXPECT_THROW(apply_config_value(config, "data_source.export_enabled", "maybe"), ConfigurationError);
}

// -----------------------------------------------------------------------------
// ValidateConfig_WeightsNotSummingToOne_Fails
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, ValidateConfig_WeightsNotSummingToOne_Fails) {
    SystemConfig config;
    config.canslim.weights.current_earnings = 0.30;
    std::string error_message;

    EXPECT_FALSE(validate_config(config, error_message));
    EXPECT_NE(error_message.find("sum to 1.0"), std::string::npos);
}

// -----------------------------------------------------------------------------
// ValidateConfig_InvalidFields_Fail
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, ValidateConfig_InvalidFields_Fail) {
    std::string error_message;

    SystemConfig worker_config;
    worker_config.screening.max_workers = 0;
    EXPECT_FALSE(validate_config(worker_config, error_message));

    SystemConfig universe_config;
    universe_config.screening.universe = "dow30";
    EXPECT_FALSE(validate_config(universe_config, error_message));

    SystemConfig ema_config;
    ema_config.indicators.ema_short_period = 30;
    EXPECT_FALSE(validate_config(ema_config, error_message));

    SystemConfig rs_config;
    rs_config.relative_strength.q1_weight = 0.5;
    EXPECT_FALSE(validate_config(rs_config, error_message));

    SystemConfig provider_config;
    provider_config.data_source.price_provider = "bloomberg";
    EXPECT_FALSE(validate_config(provider_config, error_message));

    SystemConfig trend_config;
    trend_config.trend.window_bars = 30;
    EXPECT_FALSE(validate_config(trend_config, error_message));
}

// -----------------------------------------------------------------------------
// LoadSystemConfig_MissingDirectory_ThrowsConfigurationError
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, LoadSystemConfig_MissingDirectory_ThrowsConfigurationError) {
    SystemConfig config;

    EXPECT_THROW(load_system_config(config, (temp_directory / "nowhere").string()), ConfigurationError);
}

// -----------------------------------------------------------------------------
// ParseCommandLine_AllFlags_Parsed
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, ParseCommandLine_AllFlags_Parsed) {
    const char* argv[] = {"canslim_scanner", "--config-dir", "cfg", "--universe", "list:NVDA", "--export-dir", "out",
                          "--max-workers", "6", "--debug"};

    CanslimScanner::System::CommandLineOptions options = CanslimScanner::System::parse_command_line(10, argv);

    EXPECT_EQ(options.config_directory, "cfg");
    ASSERT_TRUE(options.universe.has_value());
    EXPECT_EQ(*options.universe, "list:NVDA");
    EXPECT_EQ(*options.export_directory, "out");
    EXPECT_EQ(*options.max_workers, 6);
    EXPECT_TRUE(options.debug);
    EXPECT_FALSE(options.show_help);
}

// -----------------------------------------------------------------------------
// ParseCommandLine_BadArguments_ThrowConfigurationError
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, ParseCommandLine_BadArguments_ThrowConfigurationError) {
    const char* unknown_argv[] = {"canslim_scanner", "--fast"};
    const char* missing_value_argv[] = {"canslim_scanner", "--universe"};
    const char* bad_number_argv[] = {"canslim_scanner", "--max-workers", "4x"};

    EXPECT_THROW(CanslimScanner::System::parse_command_line(2, unknown_argv), ConfigurationError);
    EXPECT_THROW(CanslimScanner::System::parse_command_line(2, missing_value_argv), ConfigurationError);
    EXPECT_THROW(CanslimScanner::System::parse_command_line(3, bad_number_argv), ConfigurationError);
}

// -----------------------------------------------------------------------------
// ApplyCommandLineOverrides_InvalidWorkerCount_ThrowsConfigurationError
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, ApplyCommandLineOverrides_InvalidWorkerCount_ThrowsConfigurationError) {
    SystemConfig config;
    CanslimScanner::System::CommandLineOptions options;
    options.universe = std::string("nasdaq100");
    options.max_workers = 4;

    CanslimScanner::System::apply_command_line_overrides(config, options);
    EXPECT_EQ(config.screening.universe, "nasdaq100");
    EXPECT_EQ(config.screening.max_workers, 4);

    options.max_workers = 64;
    EXPECT_THROW(CanslimScanner::System::apply_command_line_overrides(config, options), ConfigurationError);
}

// -----------------------------------------------------------------------------
// CreateScannerModules_ProviderSettings_SelectImplementations
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, CreateScannerModules_ProviderSettings_SelectImplementations) {
    SystemConfig offline_config;
    offline_config.data_source.price_provider = "csv";
    offline_config.data_source.fundamentals_provider = "none";
    SystemConfig online_config;

    CanslimScanner::System::SystemModules offline_modules = CanslimScanner::System::create_scanner_modules(offline_config);
    CanslimScanner::System::SystemModules online_modules = CanslimScanner::System::create_scanner_modules(online_config);

    ASSERT_TRUE(offline_modules.price_provider && offline_modules.fundamentals_provider && offline_modules.ticker_universe);
    EXPECT_EQ(offline_modules.price_provider->get_provider_name(), "csv");
    EXPECT_EQ(offline_modules.fundamentals_provider->get_provider_name(), "none");
    ASSERT_TRUE(online_modules.price_provider && online_modules.fundamentals_provider && online_modules.ticker_universe);
    EXPECT_EQ(online_modules.price_provider->get_provider_name(), "yahoo");
    EXPECT_EQ(online_modules.fundamentals_provider->get_provider_name(), "yahoo");
    EXPECT_TRUE(online_modules.http_client);
}
