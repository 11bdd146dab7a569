#include "system_logs.hpp"
#include "logging/logger/async_logger.hpp"

namespace CanslimScanner {
namespace Logging {

void SystemLogs::log_fatal_error(const std::string& error_message) {
    log_message(std::string("FATAL: ") + error_message, "");
}

void SystemLogs::log_configuration_error(const std::string& error_message) {
    log_message(std::string("FATAL: Configuration error: ") + error_message, "");
}

void SystemLogs::log_system_warning(const std::string& warning_message) {
    log_message(std::string("WARNING: ") + warning_message, "");
}

void SystemLogs::log_configuration_validated(bool valid, const std::string& error_message) {
    if (valid) {
        log_message("CONFIG_VALIDATION: Configuration validated successfully", "");
    } else {
        log_message("CONFIG_VALIDATION: Configuration validation FAILED - " + error_message, "");
    }
}

void SystemLogs::log_shutdown(int exit_code) {
    log_message("SYSTEM_SHUTDOWN: Scanner exiting with code " + std::to_string(exit_code), "");
}

} // namespace Logging
} // namespace CanslimScanner
