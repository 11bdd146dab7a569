#ifndef SCAN_ERRORS_HPP
#define SCAN_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace CanslimScanner {
namespace Core {

// Base class for every error raised by the scoring pipeline.
class ScannerError : public std::runtime_error {
public:
    explicit ScannerError(const std::string& error_message) : std::runtime_error(error_message) {}
};

// A provider could not supply data, or the data lacks required fields.
class DataUnavailableError : public ScannerError {
public:
    explicit DataUnavailableError(const std::string& error_message) : ScannerError(error_message) {}
};

// The series is shorter than the longest lookback an indicator needs.
class InsufficientHistoryError : public ScannerError {
public:
    InsufficientHistoryError(const std::string& error_message, int available_bars_count, int required_bars_count)
        : ScannerError(error_message + " (have " + std::to_string(available_bars_count) +
                       " bars, need " + std::to_string(required_bars_count) + ")"),
          available_bars(available_bars_count), required_bars(required_bars_count) {}

    int get_available_bars() const { return available_bars; }
    int get_required_bars() const { return required_bars; }

private:
    int available_bars;
    int required_bars;
};

// The benchmark series cannot cover the relative strength period.
class BenchmarkDataInsufficientError : public ScannerError {
public:
    explicit BenchmarkDataInsufficientError(const std::string& error_message) : ScannerError(error_message) {}
};

// Invalid or unknown configuration. Fatal at startup.
class ConfigurationError : public ScannerError {
public:
    explicit ConfigurationError(const std::string& error_message) : ScannerError(error_message) {}
};

} // namespace Core
} // namespace CanslimScanner

#endif // SCAN_ERRORS_HPP
