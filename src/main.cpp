// main.cpp
#include "system/system_manager.hpp"
#include "logging/logs/system_logs.hpp"
#include "scanner/errors/scan_errors.hpp"
#include "utils/http_utils.hpp"
#include <iostream>
#include <memory>

using namespace CanslimScanner::System;
using CanslimScanner::Logging::SystemLogs;

int main(int argc, char** argv) {
    CommandLineOptions options;
    try {
        options = parse_command_line(argc, argv);
    } catch (const CanslimScanner::Core::ConfigurationError& argument_error) {
        std::cerr << argument_error.what() << "\n" << get_usage_text();
        return 1;
    }
    if (options.show_help) {
        std::cout << get_usage_text();
        return 0;
    }

    // libcurl global state must exist before any worker thread issues a request
    CanslimScanner::API::CurlGlobalInitializer curl_global_initializer;

    std::unique_ptr<SystemState> system_state;
    int exit_code = 1;
    try {
        system_state = initialize(options);
        exit_code = run(*system_state);
    } catch (const CanslimScanner::Core::ConfigurationError& configuration_error) {
        if (system_state) {
            SystemLogs::log_configuration_error(configuration_error.what());
        }
        exit_code = 1;
    } catch (const std::exception& exception_error) {
        if (system_state) {
            SystemLogs::log_fatal_error(exception_error.what());
        } else {
            std::cerr << "Fatal error: " << exception_error.what() << std::endl;
        }
        exit_code = 1;
    }

    if (system_state) {
        SystemLogs::log_shutdown(exit_code);
        shutdown(*system_state);
    }
    return exit_code;
}
