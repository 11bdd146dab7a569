#ifndef STARTUP_LOGS_HPP
#define STARTUP_LOGS_HPP

#include "configs/system_config.hpp"
#include <string>
#include <vector>

namespace CanslimScanner {
namespace Logging {

class StartupLogs {
public:
    static void log_application_header(const std::string& config_directory, const std::string& log_file_path);
    static void log_configuration_summary(const CanslimScanner::Config::SystemConfig& config);
    static void log_data_sources(const std::string& price_provider_name, const std::string& fundamentals_provider_name);
    static void log_universe_resolved(const std::string& universe_selector, const std::vector<std::string>& symbols);
};

} // namespace Logging
} // namespace CanslimScanner

#endif // STARTUP_LOGS_HPP
