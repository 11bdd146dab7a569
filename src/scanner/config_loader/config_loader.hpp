#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include <string>
#include <vector>
#include "configs/system_config.hpp"

// Configuration files read by load_system_config, in load order.
const std::vector<std::string>& get_config_file_names();

// Applies one key,value pair. Throws ConfigurationError for unknown keys or unparsable values.
void apply_config_value(CanslimScanner::Config::SystemConfig& cfg, const std::string& config_key_string, const std::string& config_value_string);

// Returns false when the file cannot be opened. Invalid content throws ConfigurationError.
bool load_config_from_csv(CanslimScanner::Config::SystemConfig& cfg, const std::string& csv_path);

// Loads every configuration file under config_directory and validates the result.
// Throws ConfigurationError on any failure.
void load_system_config(CanslimScanner::Config::SystemConfig& config, const std::string& config_directory);

bool validate_config(const CanslimScanner::Config::SystemConfig& config, std::string& error_message);

#endif // CONFIG_LOADER_HPP
