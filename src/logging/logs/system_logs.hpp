#ifndef SYSTEM_LOGS_HPP
#define SYSTEM_LOGS_HPP

#include <string>

namespace CanslimScanner {
namespace Logging {

/**
 * System-level messages: fatal errors, warnings and lifecycle events.
 */
class SystemLogs {
public:
    static void log_fatal_error(const std::string& error_message);
    static void log_configuration_error(const std::string& error_message);
    static void log_system_warning(const std::string& warning_message);
    static void log_configuration_validated(bool valid, const std::string& error_message);
    static void log_shutdown(int exit_code);
};

} // namespace Logging
} // namespace CanslimScanner

#endif // SYSTEM_LOGS_HPP
